/***********[stability.cc]
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

#include "stability.h"

bool StabilityChk::mutualPreference(const Resident& r, const Hospital& h) {
  return h.isRanked(r) && r.isRanked(h);
}

bool StabilityChk::residentUnhappy(const Resident& r, const Hospital& h) {
  return !r.isMatched() || r.prefers(h, r.matchedTo());
}

bool StabilityChk::hospitalUnhappy(const Resident& r, const Hospital& h) {
  if(!h.isFull())
    return true;
  RID worst = h.minRes();
  return worst != nilRID && h.prefers(r, worst);
}

bool StabilityChk::check() {
  blocking.clear();
  for(auto rid : game.Res()) {
    const Resident& r = game.ithRes(rid);
    for(auto pid : game.Hosp()) {
      const Hospital& h = game.ithHosp(pid);
      if(mutualPreference(r, h) && residentUnhappy(r, h) && hospitalUnhappy(r, h))
        blocking.push_back({rid, pid});
    }
  }
  return blocking.empty();
}
