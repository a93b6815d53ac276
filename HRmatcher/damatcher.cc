/***********[damatcher.cc]
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

#include "damatcher.h"

#include <algorithm>
#include <unistd.h>

using std::vector;
using std::cout;
using std::cerr;

void DAmatcher::printStats(std::ostream& os) const {
  os << "#Matcher: " << name() << " deferred acceptance\n";
  os << "#Rounds: " << rounds << "\n";
  os << "#Proposals: " << proposals << "\n";
  os << "#Rejections: " << rejections << "\n";
}

void DAmatcher::printStatsAndExit(int signum, int exitcode) const {
  cout << "#Interrupted by signal " << signum << "\n";
  printStats(cout);
  cout.flush();
  cerr.flush();
  _exit(exitcode);
}

Matching DAmatcher::toMatching(const Game& game, const vector<vector<RID>>& accepted) {
  Matching m {};
  for(auto pid : game.Hosp()) {
    const Hospital& h = game.ithHosp(pid);
    vector<RID> residents (accepted[pid]);
    auto ranking = [&h](RID r1, RID r2){ return h.prefers(r1, r2); };
    std::stable_sort(residents.begin(), residents.end(), ranking);
    m.assign(pid, residents);
  }
  return m;
}

Matching ResidentDAmatcher::match(const Game& game) {
  resetStats();
  vector<size_t> next (game.nResidents(), 0);  //next hospital each resident proposes to
  vector<vector<RID>> accepted (game.nHospitals());

  vector<RID> free {};
  for(auto rid : game.Res())
    if(!game.ithRes(rid).ROL().empty())
      free.push_back(rid);

  while(!free.empty()) {
    ++rounds;
    vector<vector<RID>> offers (game.nHospitals());
    vector<PID> offered {};
    for(auto rid : free) {
      PID pid = game.ithRes(rid).ROL()[next[rid]];
      if(offers[pid].empty())
        offered.push_back(pid);
      offers[pid].push_back(rid);
      ++proposals;
    }

    //Each hospital pools its new proposals with the residents it holds
    //and keeps the best it has room for.
    vector<RID> rejected {};
    for(auto pid : offered) {
      const Hospital& h = game.ithHosp(pid);
      vector<RID> pool (accepted[pid]);
      for(auto rid : offers[pid]) {
        if(h.isRanked(rid))
          pool.push_back(rid);
        else
          rejected.push_back(rid);
      }
      auto ranking = [&h](RID r1, RID r2){ return h.prefers(r1, r2); };
      std::stable_sort(pool.begin(), pool.end(), ranking);
      size_t keep = h.CAPACITY() > 0 ? h.CAPACITY() : 0;
      if(pool.size() > keep) {
        rejected.insert(rejected.end(), pool.begin() + keep, pool.end());
        pool.resize(keep);
      }
      accepted[pid] = pool;
    }

    free.clear();
    for(auto rid : rejected) {
      ++rejections;
      if(++next[rid] < game.ithRes(rid).ROL().size())
        free.push_back(rid);
    }
  }
  return toMatching(game, accepted);
}

Matching HospitalDAmatcher::match(const Game& game) {
  resetStats();
  vector<size_t> next (game.nHospitals(), 0);  //next resident each hospital proposes to
  vector<vector<RID>> accepted (game.nHospitals());
  vector<PID> held (game.nResidents(), nilPID);

  auto spare = [&](PID pid) {
    int s = game.ithHosp(pid).CAPACITY() - static_cast<int>(accepted[pid].size());
    return s > 0 ? s : 0;
  };
  auto canPropose = [&](PID pid) {
    return spare(pid) > 0 && next[pid] < game.ithHosp(pid).ROL().size();
  };

  vector<PID> free {};
  for(auto pid : game.Hosp())
    if(canPropose(pid))
      free.push_back(pid);

  while(!free.empty()) {
    ++rounds;
    vector<vector<PID>> offers (game.nResidents());
    vector<RID> offered {};
    for(auto pid : free) {
      const auto& rol = game.ithHosp(pid).ROL();
      for(int s = spare(pid); s > 0 && next[pid] < rol.size(); --s) {
        RID rid = rol[next[pid]++];
        if(offers[rid].empty())
          offered.push_back(rid);
        offers[rid].push_back(pid);
        ++proposals;
      }
    }

    //Each resident holds on to the best offer seen so far; a held offer
    //is only given up for one the resident strictly prefers.
    for(auto rid : offered) {
      const Resident& r = game.ithRes(rid);
      PID best = held[rid];
      for(auto pid : offers[rid])
        if(r.isRanked(pid) && r.prefers(pid, best))
          best = pid;
      for(auto pid : offers[rid])
        if(pid != best)
          ++rejections;
      if(best != held[rid]) {
        if(held[rid] != nilPID) {
          auto& a = accepted[held[rid]];
          a.erase(std::find(a.begin(), a.end(), rid));
          ++rejections;
        }
        held[rid] = best;
        accepted[best].push_back(rid);
      }
    }

    free.clear();
    for(auto pid : game.Hosp())
      if(canPropose(pid))
        free.push_back(pid);
  }
  return toMatching(game, accepted);
}

DAmatcher* newMatcher(Orientation optimal) {
  switch(optimal) {
  case Orientation::Hospital:
    return new HospitalDAmatcher {};
  case Orientation::Resident:
    break;
  }
  return new ResidentDAmatcher {};
}

bool parseOrientation(const std::string& s, Orientation& optimal) {
  if(s == "resident") {
    optimal = Orientation::Resident;
    return true;
  }
  if(s == "hospital") {
    optimal = Orientation::Hospital;
    return true;
  }
  return false;
}
