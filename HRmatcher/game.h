/***********[game.h]
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

#ifndef HRMATCH_GAME_H
#define HRMATCH_GAME_H

#include <iostream>
#include <limits>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "diagnostics.h"
#include "ids.h"
#include "matching.h"
#include "players.h"
#include "validity.h"

class Game;
class Sanitizer;

//Classes
class Resident {
 public:
  RID id;
  Resident(RID ident, std::string name, std::vector<PID> rankedHospitals) :
    id {ident},
    nm {std::move(name)},
    rol {std::move(rankedHospitals)},
    rank {},
    m {nilPID}
  { }

  operator RID() const { return id; }
  const std::string& name() const { return nm; }

  //nilPID (unmatched) ranks just below the last ranked hospital;
  //hospitals not ranked at all rank below that.
  int rankOf(PID p) const {
    if(p == nilPID)
      return rol.size();
    if(p >= rank.size())
      return std::numeric_limits<int>::max();
    return rank[p];
  }

  bool prefers(PID p1, PID p2) const { return rankOf(p1) < rankOf(p2); }
  bool isRanked(PID p) const { return p != nilPID && rankOf(p) < static_cast<int>(rol.size()); }

  PID matchedTo() const { return m; }
  bool isMatched() const { return m != nilPID; }
  void match(PID prog) { m = prog; } //does not check ranking
  void unmatch() { match(nilPID); }

  const std::vector<PID>& ROL() const { return rol; }

  friend class Game;
  friend class Sanitizer;

 private:
  std::string nm;
  std::vector<PID> rol;
  std::vector<int> rank;  //indexed by PID
  PID m;

  void setROL(std::vector<PID> prefs, size_t nHospitals);
  void forget(PID p);
};

class Hospital {
public:
  PID id;
  Hospital(PID ident, std::string name, int capacity, std::vector<RID> rankedResidents) :
    id {ident},
    nm {std::move(name)},
    q {capacity},
    rol {std::move(rankedResidents)},
    rank {},
    accepted {}
  {}

  operator PID() const { return id; }
  const std::string& name() const { return nm; }

  //least preferred resident held, or nilRID when not yet full
  RID minRes() const { return (q > 0 && nmatched() >= q) ? accepted.back() : nilRID; }

  int rankOf(RID r) const {
    if(r == nilRID)
      return rol.size();
    if(r >= rank.size())
      return std::numeric_limits<int>::max();
    return rank[r];
  }

  bool prefers(RID r1, RID r2) const { return rankOf(r1) < rankOf(r2); }
  bool isRanked(RID r) const { return r != nilRID && rankOf(r) < static_cast<int>(rol.size()); }

  int nmatched() const { return accepted.size(); }
  bool isFull() const { return nmatched() >= q; }
  bool isOversubscribed() const { return nmatched() > q; }

  void match(RID r);  //does not check ranking or capacity
  void unmatch(RID r);
  void unmatchAll() { accepted.clear(); }

  int CAPACITY() const { return q; }
  const std::vector<RID>& ACCEPTED() const { return accepted; }
  const std::vector<RID>& ROL() const { return rol; }

  friend class Game;
  friend class Sanitizer;

private:
  std::string nm;
  int q;
  std::vector<RID> rol;
  std::vector<int> rank;  //indexed by RID
  std::vector<RID> accepted;

  void setROL(std::vector<RID> prefs, size_t nResidents);
  void forget(RID r);
  void sort_accept();
};

std::ostream& operator<<(std::ostream& os, const Resident& r);
std::ostream& operator<<(std::ostream& os, const Hospital& h);

//A Hospital/Resident game. The game owns every participant: the
//residents and hospitals given to it are copied into an arena and
//addressed from then on by RID/PID. Names ranked by a participant that
//are not part of the opposite party get an "outsider" arena entry so the
//preference can still be represented (and reported by the sanitizer).
class Game {
public:
  Game(const std::vector<ResidentSpec>& residents,
       const std::vector<HospitalSpec>& hospitals,
       bool clean = false);

  static Game fromPreferenceMaps(const PrefMap& residentPrefs,
                                 const PrefMap& hospitalPrefs,
                                 const CapacityMap& capacities,
                                 bool clean = false);

  Resident& ithRes(RID id) { return residents[id]; }
  Hospital& ithHosp(PID id) { return hospitals[id]; }
  const Resident& ithRes(RID id) const { return residents[id]; }
  const Hospital& ithHosp(PID id) const { return hospitals[id]; }

  //members of the game, in input order
  const std::vector<RID>& Res() const { return resIDs; }
  const std::vector<PID>& Hosp() const { return hospIDs; }

  bool inGame(RID r) const { return r != nilRID && r < resMember.size() && resMember[r]; }
  bool inGame(PID p) const { return p != nilPID && p < hospMember.size() && hospMember[p]; }

  //arena sizes (members and outsiders)
  size_t nResidents() const { return residents.size(); }
  size_t nHospitals() const { return hospitals.size(); }

  RID findResident(const std::string& name) const;
  PID findHospital(const std::string& name) const;

  bool clean() const { return cln; }
  void sanitize();
  const Diagnostics& diagnostics() const { return diags; }

  //Solving and checking
  //returns a snapshot; later solves or setMatching calls do not change it
  Matching solve(Orientation optimal = Orientation::Resident);
  void setMatching(const Matching& m);
  bool setMatching(const NamedMatching& m);
  const Matching& matching() const { return mtch; }
  NamedMatching matchingByName() const;

  ValidityResult checkValidity() const;
  bool checkStability();
  const std::vector<BlockingPair>& blockingPairs() const { return blocking; }
  std::vector<std::pair<std::string, std::string>> blockingPairNames() const;

  //Error processing
  void postError(std::string msg) {
    errMsg += msg;
    probOK = false;
  }
  bool ok() const { return probOK; }
  const std::string& getError() const { return errMsg; }

  void printMatch(std::ostream& os) const;
  void printMatchStats(std::ostream& os) const;
  friend std::ostream& operator<<(std::ostream& os, const Game& game);

  friend class Sanitizer;

private:
  std::vector<Resident> residents;
  std::vector<Hospital> hospitals;
  std::vector<RID> resIDs;
  std::vector<PID> hospIDs;
  std::vector<bool> resMember;
  std::vector<bool> hospMember;
  std::unordered_map<std::string, int> resByName;
  std::unordered_map<std::string, int> hospByName;
  bool cln;
  Diagnostics diags;
  Matching mtch;
  std::vector<BlockingPair> blocking;
  std::string errMsg;
  bool probOK;

  RID addResident(const std::string& name, bool member);
  PID addHospital(const std::string& name, int capacity, bool member);
  RID resolveResident(const std::string& name);
  PID resolveHospital(const std::string& name);
  void removeHospital(PID p);
  void reindex();
};

#endif
