/***********[ids.h]
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

#ifndef HRMATCH_IDS_H
#define HRMATCH_IDS_H

#include <cstddef>
#include <iostream>
#include <utility>
#include <vector>

//Use integer IDs to refer to residents/hospitals.
//IDs index into the arena vectors held by a Game, so they are
//only meaningful with respect to the game that issued them.

class RID {
public:
  int id;
  operator size_t() const { return static_cast<size_t>(id); }
  RID(int i) : id {i} {}
  RID() : id {-1} {}
};

class PID {
public:
  int id;
  operator size_t() const { return static_cast<size_t>(id); }
  PID(int i) : id {i} {}
  PID() : id {-1} {}
};

const RID nilRID {-1};
const PID nilPID {-1};

typedef std::pair<RID, PID> BlockingPair;

//Which side of the game a check is applied to.
enum class Party { Residents, Hospitals };

inline std::ostream& operator<<(std::ostream& os, const RID& r) {
  os << r.id;
  return os;
}

inline std::ostream& operator<<(std::ostream& os, const PID& p) {
  os << p.id;
  return os;
}

//Generic Output specializations
template<typename T>
std::ostream& operator<<(std::ostream& os, const std::vector<T>& v) {
  os << "[ ";
  for(const auto& i : v)
    os << i << " ";
  os << "] (" << v.size() << ")";
  return os;
}

template<typename T, typename U>
std::ostream& operator<<(std::ostream& os, const std::pair<T, U>& p) {
  os << "(" << p.first << ", " << p.second << ")";
  return os;
}

#endif
