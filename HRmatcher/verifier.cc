/***********[verifier.cc]
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

#include <iostream>
#include <string>
#include "game.h"
#include "reader.h"
#include "minisat/utils/Options.h"

using std::cout;

using Minisat::setUsageHelp;
using Minisat::IntOption;
using Minisat::IntRange;
using Minisat::BoolOption;
using Minisat::parseOptions;
using Minisat::printUsageAndExit;

int verbosity {};

int main(int argc, char** argv) {
  setUsageHelp("usage: %s [options] <hospital_resident_problem_file> <match_spec_file>\n");
  IntOption verb("MAIN", "verb", "Verbosity level (0=silent, 1=some, 2=more).", 0, IntRange(0,2));
  BoolOption clean("MAIN", "clean", "Clean the problem before checking (as hrmatch -clean).\n", false);
  parseOptions(argc, argv, true);
  if(argc != 3)
    printUsageAndExit(argc, argv);
  verbosity = verb;

  ProblemReader reader {};
  MatchReader matchRd {};

  if(!reader.readProblem(argv[1])) {
    cout << "Problems reading problem file: \"" << argv[1] << "\"\n";
    cout << reader.getError();
    return 1;
  }
  Game game {reader.makeGame(clean)};
  if(!game.ok()) {
    cout << "Problems building game from: \"" << argv[1] << "\"\n";
    cout << game.getError();
    return 1;
  }
  if(!matchRd.readMatch(argv[2])) {
    cout << "Problems reading match file: \"" << argv[2] << "\"\n";
    cout << matchRd.getError();
    return 1;
  }
  if(!game.setMatching(matchRd.assignment())) {
    cout << "Problems with match file: \"" << argv[2] << "\"\n";
    cout << game.getError();
    return 1;
  }

  if(verbosity > 0) {
    for(const auto& w : game.diagnostics().warnings())
      cout << w << "\n";
    cout << "Inputed problem:\n";
    cout << game;
    cout << "Match:\n";
    game.printMatch(cout);
  }

  if(matchRd.noMatch()) {
    cout << "No match found.\n";
    return 0;
  }

  auto validity = game.checkValidity();
  bool stable = game.checkStability();
  if(!validity.ok()) {
    cout << "ERROR: Invalid Match.\n";
    cout << validity.error();
  }
  if(!stable) {
    cout << "ERROR: Unstable Match.\n";
    for(const auto& bp : game.blockingPairNames())
      cout << "ERROR: Resident " << bp.first << " and hospital " << bp.second
           << " would both rather be matched to each other\n";
  }
  if(!validity.ok() || !stable)
    return 1;

  cout << "Match ok.\n";
  game.printMatchStats(cout);
  return 0;
}
