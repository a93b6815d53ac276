/***********[matching.cc]
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

#include "matching.h"

namespace {
const std::vector<RID> noResidents {};
}

void Matching::ensure(PID p) {
  if(accepted.size() <= p)
    accepted.resize(p+1);
  if(!contains(p))
    hosps.push_back(p);
}

void Matching::add(PID p, RID r) {
  if(p == nilPID || r == nilRID)
    return;
  ensure(p);
  accepted[p].push_back(r);
}

void Matching::assign(PID p, const std::vector<RID>& residents) {
  if(p == nilPID)
    return;
  ensure(p);
  accepted[p] = residents;
}

bool Matching::contains(PID p) const {
  for(auto h : hosps)
    if(h == p)
      return true;
  return false;
}

const std::vector<RID>& Matching::operator[](PID p) const {
  if(p == nilPID || p >= accepted.size())
    return noResidents;
  return accepted[p];
}

int Matching::nmatched() const {
  int n {0};
  for(const auto& a : accepted)
    n += a.size();
  return n;
}

std::ostream& operator<<(std::ostream& os, const Matching& m) {
  for(auto p : m.hospitals())
    os << "Hospital " << p << " accepted = " << m[p] << "\n";
  return os;
}
