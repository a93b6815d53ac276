/***********[damatcher.h]
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

#ifndef HRMATCH_DAMATCHER_H
#define HRMATCH_DAMATCHER_H

#include <iostream>
#include <string>
#include <vector>
#include "game.h"
#include "matching.h"

//Capacitated deferred acceptance. A matcher reads the (sanitized)
//preferences of a game and returns a new Matching; the game itself is
//never modified, so a game can be solved repeatedly.
//
//Proposals are made in rounds. Every receiver sees all proposals of a
//round before it decides, and the rejections of a round only take effect
//in the next round.
class DAmatcher {
public:
  DAmatcher() : rounds {0}, proposals {0}, rejections {0} {}
  virtual ~DAmatcher() {}

  virtual Matching match(const Game& game) = 0;
  virtual const char* name() const = 0;

  int nRounds() const { return rounds; }
  int nProposals() const { return proposals; }
  int nRejections() const { return rejections; }

  void printStats(std::ostream& os) const;
  void printStatsAndExit(int signum, int exitcode) const;

protected:
  int rounds;
  int proposals;
  int rejections;

  void resetStats() { rounds = proposals = rejections = 0; }
  //one entry per member hospital, residents in the hospital's order
  static Matching toMatching(const Game& game, const std::vector<std::vector<RID>>& accepted);
};

//Residents propose; yields the resident-optimal stable matching.
class ResidentDAmatcher : public DAmatcher {
public:
  Matching match(const Game& game) override;
  const char* name() const override { return "resident-oriented"; }
};

//Hospitals propose; yields the hospital-optimal stable matching.
class HospitalDAmatcher : public DAmatcher {
public:
  Matching match(const Game& game) override;
  const char* name() const override { return "hospital-oriented"; }
};

DAmatcher* newMatcher(Orientation optimal);
bool parseOrientation(const std::string& s, Orientation& optimal);

#endif
