/***********[validity.cc]
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

#include "validity.h"

#include <sstream>
#include "game.h"

using std::ostringstream;
using std::string;
using std::vector;

ValidityResult ValidityChk::check() const {
  ValidityError err {};
  err.unacceptableMatches = unacceptableMatches(Party::Residents);
  auto hospIssues = unacceptableMatches(Party::Hospitals);
  err.unacceptableMatches.insert(err.unacceptableMatches.end(),
                                 hospIssues.begin(), hospIssues.end());
  err.oversubscribedHospitals = oversubscribedHospitals();
  if(err.empty())
    return ValidityResult {};
  return ValidityResult {err};
}

//Being unmatched is always acceptable.
vector<string> ValidityChk::unacceptableMatches(Party party) const {
  vector<string> issues {};
  switch(party) {
  case Party::Residents:
    for(auto rid : game.Res()) {
      const Resident& r = game.ithRes(rid);
      if(!r.isMatched() || r.isRanked(r.matchedTo()))
        continue;
      ostringstream oss {};
      oss << r.name() << " is matched to " << game.ithHosp(r.matchedTo()).name()
          << " but they do not appear in their preference list: [";
      for(auto p : r.ROL())
        oss << " " << game.ithHosp(p).name();
      oss << " ].";
      issues.push_back(oss.str());
    }
    break;
  case Party::Hospitals:
    for(auto pid : game.Hosp()) {
      const Hospital& h = game.ithHosp(pid);
      for(auto rid : h.ACCEPTED()) {
        if(h.isRanked(rid))
          continue;
        ostringstream oss {};
        oss << h.name() << " is matched to " << game.ithRes(rid).name()
            << " but they do not appear in their preference list: [";
        for(auto r : h.ROL())
          oss << " " << game.ithRes(r).name();
        oss << " ].";
        issues.push_back(oss.str());
      }
    }
    break;
  }
  return issues;
}

vector<string> ValidityChk::oversubscribedHospitals() const {
  vector<string> issues {};
  for(auto pid : game.Hosp()) {
    const Hospital& h = game.ithHosp(pid);
    if(!h.isOversubscribed())
      continue;
    ostringstream oss {};
    oss << h.name() << " is matched to [";
    for(auto r : h.ACCEPTED())
      oss << " " << game.ithRes(r).name();
    oss << " ] which is over their capacity of " << h.CAPACITY() << ".";
    issues.push_back(oss.str());
  }
  return issues;
}

std::ostream& operator<<(std::ostream& os, const ValidityError& e) {
  for(const auto& msg : e.unacceptableMatches)
    os << "ERROR: Unacceptable match. " << msg << "\n";
  for(const auto& msg : e.oversubscribedHospitals)
    os << "ERROR: Oversubscribed. " << msg << "\n";
  return os;
}
