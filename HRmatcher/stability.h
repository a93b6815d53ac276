/***********[stability.h]
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

#ifndef HRMATCH_STABILITY_H
#define HRMATCH_STABILITY_H

#include <vector>
#include "game.h"

//Scans the current matching of a game for blocking pairs. A resident r
//and hospital h block the matching when
//  - they rank each other;
//  - r is unmatched or prefers h to its current match; and
//  - h is under capacity or prefers r to one of its current matches.
//The matching is stable iff there are no blocking pairs.
class StabilityChk {
public:
  explicit StabilityChk(const Game& g) : game (g), blocking {} {}

  bool check();
  const std::vector<BlockingPair>& blockingPairs() const { return blocking; }

  static bool mutualPreference(const Resident& r, const Hospital& h);
  static bool residentUnhappy(const Resident& r, const Hospital& h);
  static bool hospitalUnhappy(const Resident& r, const Hospital& h);

private:
  const Game& game;
  std::vector<BlockingPair> blocking;
};

#endif
