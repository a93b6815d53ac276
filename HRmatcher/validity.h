/***********[validity.h]
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

#ifndef HRMATCH_VALIDITY_H
#define HRMATCH_VALIDITY_H

#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include "ids.h"

class Game;

//Structural problems with a matching, independent of its stability.
struct ValidityError {
  std::vector<std::string> unacceptableMatches;
  std::vector<std::string> oversubscribedHospitals;

  bool empty() const {
    return unacceptableMatches.empty() && oversubscribedHospitals.empty();
  }
};

class ValidityResult {
public:
  ValidityResult() : err {}, failed {false} {}
  explicit ValidityResult(ValidityError e) : err (std::move(e)), failed {!err.empty()} {}

  bool ok() const { return !failed; }
  explicit operator bool() const { return ok(); }
  const ValidityError& error() const { return err; }

private:
  ValidityError err;
  bool failed;
};

//Checks that no participant is matched to someone they did not rank and
//that no hospital holds more residents than its capacity.
class ValidityChk {
public:
  explicit ValidityChk(const Game& g) : game (g) {}

  ValidityResult check() const;
  std::vector<std::string> unacceptableMatches(Party party) const;
  std::vector<std::string> oversubscribedHospitals() const;

private:
  const Game& game;
};

std::ostream& operator<<(std::ostream& os, const ValidityError& e);

#endif
