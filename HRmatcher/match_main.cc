/***********[match_main.cc]
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
#include <exception>
#include <signal.h>
#include <sys/resource.h>
#include <unistd.h>
#include <limits>
#include <memory>
#include <new>
#include "game.h"
#include "damatcher.h"
#include "reader.h"
#include "minisat/utils/Options.h"
#include "params.h"

using Minisat::setUsageHelp;
using Minisat::printUsageAndExit;
using Minisat::BoolOption;
using Minisat::IntOption;
using Minisat::IntRange;
using Minisat::parseOptions;
using std::cout;
using std::cerr;

static int vnumMajor {1};
static int vnumMinor {0};

static DAmatcher* dam{};

static void SIGINT_exit(int signum) {
    if (dam) {
        cout << "#ERROR: Caught Signal\n";
        dam->printStatsAndExit(signum, 1);
    } else {
        cout.flush();
        cerr.flush();
        _exit(0);
    }
}

int main(int argc, char** argv) {
  std::unique_ptr<DAmatcher> matcher {};
  try{
    setUsageHelp("usage: %s [options] <hospital_resident_problem_file>\n");
    BoolOption version("MAIN", "version", "Print verision number and exit\n", false);
    IntOption cpu_lim("MAIN", "cpu-lim",
		      "Limit on CPU time allowed in seconds (-1 no limit).\n",
		      -1,
		      IntRange(-1, std::numeric_limits<int>::max()));
    IntOption mem_lim("MAIN", "mem-lim",
		      "Limit on memory usage in megabytes (-1 no limit)\n",
		      -1,
		      IntRange(-1, std::numeric_limits<int>::max()));

    parseOptions(argc, argv, true);
    if(version) {
      cout << "hrmatch " << vnumMajor << "." << vnumMinor << "\n";
      return(0);
    }
    if (cpu_lim >= 0){
      rlimit rl;
      getrlimit(RLIMIT_CPU, &rl);
      if (rl.rlim_max == RLIM_INFINITY || (rlim_t)cpu_lim < rl.rlim_max){
	rl.rlim_cur = cpu_lim;
	if (setrlimit(RLIMIT_CPU, &rl) == -1)
	  cout <<"# WARNING! Could not set resource limit: CPU-time.\n";
      }
    }
    if (mem_lim >= 0){
      rlim_t new_mem_lim = (rlim_t)mem_lim * 1024*1024;
      rlimit rl;
      getrlimit(RLIMIT_AS, &rl);
      if (rl.rlim_max == RLIM_INFINITY || new_mem_lim < rl.rlim_max){
	rl.rlim_cur = new_mem_lim;
	if (setrlimit(RLIMIT_AS, &rl) == -1)
	  cout << "# WARNING! Could not set resource limit: Virtual memory.\n";
      }
    }
    if(!params.readOptions())
      return 1;
    cout << "#hrmatch " << vnumMajor << "." << vnumMinor << "\n";
    if(params.optimal == Orientation::Resident)
      cout << "#hrmatch using resident-oriented deferred acceptance\n";
    else
      cout << "#hrmatch using hospital-oriented deferred acceptance\n";

    if(argc != 2)
      printUsageAndExit(argc, argv);

    signal(SIGINT, SIGINT_exit);
    signal(SIGXCPU, SIGINT_exit);
    signal(SIGTERM, SIGINT_exit);

    ProblemReader reader {};
    if(!reader.readProblem(argv[1])) {
      cout << "Problems reading input file: \"" << argv[1] << "\"\n";
      cout << reader.getError();
      return 1;
    }
    Game game {reader.makeGame(params.clean)};
    if(!game.ok()) {
      cout << "Problems building game from: \"" << argv[1] << "\"\n";
      cout << game.getError();
      return 1;
    }
    if(params.verbosity > 0) {
      cout << "#Problem Read:\n";
      for(const auto& w : game.diagnostics().warnings())
        cout << w << "\n";
      if(params.verbosity > 1)
	cout << game;
    }

    matcher.reset(newMatcher(params.optimal));
    dam = matcher.get();
    game.setMatching(dam->match(game));
    dam->printStats(cout);
    cout << "#Final Match\n";
    game.printMatch(cout);
    if(params.stats)
      game.printMatchStats(cout);
  }
  catch(const std::bad_alloc&) {
    cout << "#ERROR: could not allocate memory\n";
    if(dam)
      dam->printStatsAndExit(100, 1);
    return 1;
  }
  catch(const std::exception& e) {
    cout << "#ERROR: " << e.what() << "\n";
    if(dam)
      dam->printStatsAndExit(100, 1);
    return 1;
  }
  cout.flush();
  cerr.flush();
  return 0;
}
