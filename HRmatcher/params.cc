/***********[params.cc]
Copyright (c) 2014, Fahiem Bacchus

Permission is hereby granted, free of charge, to any person obtaining a
copy of this software and associated documentation files (the
"Software"), to deal in the Software without restriction, including
without limitation the rights to use, copy, modify, merge, publish,
distribute, sublicense, and/or sell copies of the Software, and to
permit persons to whom the Software is furnished to do so, subject to
the following conditions:

The above copyright notice and this permission notice shall be included
in all copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS
OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

***********/

#include "params.h"

#include <iostream>
#include <string>
#include "damatcher.h"
#include "minisat/utils/Options.h"

using Minisat::BoolOption;
using Minisat::IntOption;
using Minisat::IntRange;
using Minisat::StringOption;

Params params;

static const char* cat = "HR";

static IntOption opt_verb(cat, "verb", "Verbosity level (0=silent, 1=some, 2=more).", 0, IntRange(0, 2));
static BoolOption opt_clean(cat, "clean",
                            "Remove invalid preferences and hospitals from the game before solving.\n",
                            false);
static StringOption opt_optimal(cat, "optimal",
                                "Whose optimal stable matching to find (resident, hospital).\n",
                                "resident");
static BoolOption opt_stats(cat, "stats", "Print summary stats of the final match.\n", true);

bool Params::readOptions() {
  verbosity = opt_verb;
  clean = opt_clean;
  stats = opt_stats;
  const char* o = opt_optimal;
  if(!parseOrientation(o ? o : "", optimal)) {
    std::cout << "#ERROR: -optimal must be \"resident\" or \"hospital\", not \""
              << (o ? o : "") << "\"\n";
    return false;
  }
  return true;
}
