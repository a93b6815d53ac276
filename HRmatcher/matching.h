/***********[matching.h]
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

#ifndef HRMATCH_MATCHING_H
#define HRMATCH_MATCHING_H

#include <vector>
#include "ids.h"

//Whose proposals drive deferred acceptance, and so which side receives
//its optimal stable matching.
enum class Orientation { Resident, Hospital };

//A hospital --> residents assignment, expressed in the IDs of the game
//that produced it. Hospitals are kept in the order they were first
//assigned; each hospital's residents in the order they were added.
class Matching {
public:
  Matching() : hosps {}, accepted {} {}

  void add(PID p, RID r);
  void assign(PID p, const std::vector<RID>& residents);

  bool contains(PID p) const;
  const std::vector<RID>& operator[](PID p) const;
  const std::vector<PID>& hospitals() const { return hosps; }

  int nmatched() const;
  bool empty() const { return nmatched() == 0; }
  void clear() { hosps.clear(); accepted.clear(); }

private:
  std::vector<PID> hosps;
  std::vector<std::vector<RID>> accepted;  //indexed by PID
  void ensure(PID p);
};

std::ostream& operator<<(std::ostream& os, const Matching& m);

#endif
