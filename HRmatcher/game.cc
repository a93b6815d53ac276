/***********[game.cc]
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

#include "game.h"

#include <algorithm>
#include <memory>
#include "damatcher.h"
#include "sanitizer.h"
#include "stability.h"

using std::vector;
using std::string;
using std::ostream;
using std::pair;

void Resident::setROL(vector<PID> prefs, size_t nHospitals) {
  rol = std::move(prefs);
  rank.assign(nHospitals, std::numeric_limits<int>::max());
  for(size_t i = 0; i < rol.size(); i++)
    if(rol[i] < nHospitals && rank[rol[i]] == std::numeric_limits<int>::max())
      rank[rol[i]] = i;  //first occurrence wins
}

void Resident::forget(PID p) {
  vector<PID> prefs {};
  for(auto x : rol)
    if(x != p)
      prefs.push_back(x);
  setROL(prefs, rank.size());
}

void Hospital::setROL(vector<RID> prefs, size_t nResidents) {
  rol = std::move(prefs);
  rank.assign(nResidents, std::numeric_limits<int>::max());
  for(size_t i = 0; i < rol.size(); i++)
    if(rol[i] < nResidents && rank[rol[i]] == std::numeric_limits<int>::max())
      rank[rol[i]] = i;
}

void Hospital::forget(RID r) {
  vector<RID> prefs {};
  for(auto x : rol)
    if(x != r)
      prefs.push_back(x);
  setROL(prefs, rank.size());
}

void Hospital::match(RID r) {
  accepted.push_back(r);
  sort_accept();
}

void Hospital::unmatch(RID r) {
  auto it = std::find(accepted.begin(), accepted.end(), r);
  if(it != accepted.end())
    accepted.erase(it);
}

void Hospital::sort_accept() {
  auto ranking = [this](RID r1, RID r2){ return prefers(r1, r2); };
  std::stable_sort(accepted.begin(), accepted.end(), ranking);
}

ostream& operator<<(ostream& os, const Resident& r) {
  os << "Resident " << r.name() << " (" << r.id << "). ";
  os << " match = " << r.matchedTo() << "\n";
  os << "ROL = " << r.ROL() << "\n";
  return os;
}

ostream& operator<<(ostream& os, const Hospital& h) {
  os << "Hospital " << h.name() << " (" << h.id << "). ";
  os << "capacity = " << h.CAPACITY() << "\n";
  os << "accepted  = " << h.ACCEPTED() << "\n";
  os << "ROL = " << h.ROL() << "\n\n";
  return os;
}

Game::Game(const vector<ResidentSpec>& res, const vector<HospitalSpec>& hosp, bool clean) :
  residents {}, hospitals {}, resIDs {}, hospIDs {}, resMember {}, hospMember {},
  resByName {}, hospByName {}, cln {clean}, diags {}, mtch {}, blocking {},
  errMsg {}, probOK {true}
{
  //Members of both parties get created first so that they occupy the
  //low IDs; resolving preferences afterwards may append outsiders.
  vector<const ResidentSpec*> keptRes {};
  for(const auto& r : res) {
    if(resByName.count(r.name)) {
      postError("Input ERROR: Duplicate resident \"" + r.name + "\" in resident specs.\n");
      continue;
    }
    addResident(r.name, true);
    keptRes.push_back(&r);
  }
  vector<const HospitalSpec*> keptHosp {};
  for(const auto& h : hosp) {
    if(hospByName.count(h.name)) {
      postError("Input ERROR: Duplicate hospital \"" + h.name + "\" in hospital specs.\n");
      continue;
    }
    addHospital(h.name, h.capacity, true);
    keptHosp.push_back(&h);
  }

  for(size_t i = 0; i < keptRes.size(); i++) {
    vector<PID> prefs {};
    for(const auto& name : keptRes[i]->prefs)
      prefs.push_back(resolveHospital(name));
    residents[i].rol = prefs;
  }
  for(size_t i = 0; i < keptHosp.size(); i++) {
    vector<RID> prefs {};
    for(const auto& name : keptHosp[i]->prefs)
      prefs.push_back(resolveResident(name));
    hospitals[i].rol = prefs;
  }
  reindex();
  sanitize();
}

Game Game::fromPreferenceMaps(const PrefMap& residentPrefs,
                              const PrefMap& hospitalPrefs,
                              const CapacityMap& capacities,
                              bool clean) {
  vector<ResidentSpec> res {};
  for(const auto& kv : residentPrefs)
    res.push_back(ResidentSpec {kv.first, kv.second});

  vector<HospitalSpec> hosp {};
  vector<string> noCapacity {};
  for(const auto& kv : hospitalPrefs) {
    int capacity {0};
    auto it = capacities.find(kv.first);
    if(it == capacities.end())
      noCapacity.push_back(kv.first);
    else
      capacity = it->second;
    hosp.push_back(HospitalSpec {kv.first, capacity, kv.second});
  }

  Game game {res, hosp, clean};
  for(const auto& name : noCapacity)
    game.postError("Input ERROR: No capacity given for hospital \"" + name + "\".\n");
  return game;
}

RID Game::addResident(const string& name, bool member) {
  RID id {static_cast<int>(residents.size())};
  residents.push_back(Resident(id, name, {}));
  resMember.push_back(member);
  resByName[name] = id.id;
  if(member)
    resIDs.push_back(id);
  return id;
}

PID Game::addHospital(const string& name, int capacity, bool member) {
  PID id {static_cast<int>(hospitals.size())};
  hospitals.push_back(Hospital(id, name, capacity, {}));
  hospMember.push_back(member);
  hospByName[name] = id.id;
  if(member)
    hospIDs.push_back(id);
  return id;
}

RID Game::resolveResident(const string& name) {
  auto it = resByName.find(name);
  if(it != resByName.end())
    return it->second;
  return addResident(name, false);
}

PID Game::resolveHospital(const string& name) {
  auto it = hospByName.find(name);
  if(it != hospByName.end())
    return it->second;
  return addHospital(name, 0, false);
}

void Game::reindex() {
  for(auto& r : residents)
    r.setROL(r.rol, hospitals.size());
  for(auto& h : hospitals)
    h.setROL(h.rol, residents.size());
}

void Game::removeHospital(PID p) {
  if(!inGame(p))
    return;
  hospMember[p] = false;
  hospIDs.erase(std::find(hospIDs.begin(), hospIDs.end(), p));
  for(auto& r : residents) {
    if(r.isRanked(p))
      r.forget(p);
    if(r.matchedTo() == p)
      r.unmatch();
  }
  hospitals[p].unmatchAll();
}

RID Game::findResident(const string& name) const {
  auto it = resByName.find(name);
  return it == resByName.end() ? nilRID : RID {it->second};
}

PID Game::findHospital(const string& name) const {
  auto it = hospByName.find(name);
  return it == hospByName.end() ? nilPID : PID {it->second};
}

void Game::sanitize() {
  Sanitizer sanitizer {*this, diags, cln};
  sanitizer.run();
}

Matching Game::solve(Orientation optimal) {
  std::unique_ptr<DAmatcher> dam {newMatcher(optimal)};
  setMatching(dam->match(*this));
  return mtch;
}

void Game::setMatching(const Matching& m) {
  Matching in {m};  //m may be our own matching
  for(auto& r : residents)
    r.unmatch();
  for(auto& h : hospitals)
    h.unmatchAll();
  blocking.clear();

  for(auto p : in.hospitals())
    for(auto r : in[p]) {
      residents[r].match(p);
      hospitals[p].match(r);
    }

  mtch.clear();
  for(auto p : in.hospitals())
    mtch.assign(p, hospitals[p].ACCEPTED());
}

bool Game::setMatching(const NamedMatching& named) {
  bool allFound {true};
  Matching m {};
  for(const auto& kv : named) {
    auto p = findHospital(kv.first);
    if(!inGame(p)) {
      postError("Match ERROR: \"" + kv.first + "\" is not a hospital in the game.\n");
      allFound = false;
      continue;
    }
    m.assign(p, {});
    for(const auto& name : kv.second) {
      auto r = findResident(name);
      if(!inGame(r)) {
        postError("Match ERROR: \"" + name + "\" is not a resident in the game.\n");
        allFound = false;
        continue;
      }
      m.add(p, r);
    }
  }
  setMatching(m);
  return allFound;
}

NamedMatching Game::matchingByName() const {
  NamedMatching named {};
  for(auto p : mtch.hospitals()) {
    auto& names = named[ithHosp(p).name()];
    for(auto r : mtch[p])
      names.push_back(ithRes(r).name());
  }
  return named;
}

ValidityResult Game::checkValidity() const {
  ValidityChk chk {*this};
  return chk.check();
}

bool Game::checkStability() {
  StabilityChk chk {*this};
  bool stable = chk.check();
  blocking = chk.blockingPairs();
  return stable;
}

vector<pair<string, string>> Game::blockingPairNames() const {
  vector<pair<string, string>> names {};
  for(const auto& bp : blocking)
    names.push_back({ithRes(bp.first).name(), ithHosp(bp.second).name()});
  return names;
}

void Game::printMatch(ostream& os) const {
  os << "m 1\n";
  for(auto rid : resIDs) {
    const auto& r = ithRes(rid);
    os << "r " << r.name();
    if(r.isMatched())
      os << " " << ithHosp(r.matchedTo()).name();
    os << "\n";
  }
}

void Game::printMatchStats(ostream& os) const {
  int resNotMatched {0};
  int hospSpareCap {0};
  int resGotTopRank {0};
  int hospGotTopRank {0};

  int resRanked {0};
  double resAveRank {0};
  double hospAveRank {0};

  for(auto rid : resIDs) {
    const auto& r = ithRes(rid);
    if(!r.isMatched()) {
      ++resNotMatched;
      continue;
    }
    if(r.isRanked(r.matchedTo())) {
      resAveRank += r.rankOf(r.matchedTo());
      ++resRanked;
    }
    if(r.rankOf(r.matchedTo()) == 0)
      ++resGotTopRank;
  }

  int matchedHosps {0};
  for(auto pid : hospIDs) {
    const auto& h = ithHosp(pid);
    if(h.CAPACITY() > h.nmatched())
      hospSpareCap += h.CAPACITY() - h.nmatched();
    double aveRank {0};
    int ranked {0};
    for(auto res : h.ACCEPTED()) {
      if(h.isRanked(res)) {
        aveRank += h.rankOf(res);
        ++ranked;
      }
      if(h.rankOf(res) == 0)
        ++hospGotTopRank;
    }
    if(ranked > 0) {
      hospAveRank += aveRank/ranked;
      ++matchedHosps;
    }
  }

  os << "#Matching Summary Stats:\n";
  os << "#Unmatched Residents: " << resNotMatched << "\n";
  os << "#Unmatched Hospital slots: " << hospSpareCap << "\n";
  if(resRanked > 0)
    os << "#Ave Resident Rank of their matching = "
       << resAveRank/resRanked << "\n";
  os << "#Num Residents getting their top rank = "
     << resGotTopRank << "\n";
  if(matchedHosps > 0)
    os << "#Ave Hospital Rank of their matched residents "
       << hospAveRank/matchedHosps << "\n";
  os << "#Num Hospitals getting their top rank = "
     << hospGotTopRank << "\n";
}

ostream& operator<<(ostream& os, const Game& game) {
  os << "Problem Spec\nResidents:\n";
  for(auto r : game.resIDs)
    os << game.ithRes(r);
  os << "\nHospitals:\n";
  for(auto p : game.hospIDs)
    os << game.ithHosp(p);
  return os;
}
