/***********[diagnostics.h]
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

#ifndef HRMATCH_DIAGNOSTICS_H
#define HRMATCH_DIAGNOSTICS_H

#include <iostream>
#include <string>
#include <utility>
#include <vector>

enum class WarningKind {
  PreferencesChanged,  //a preference list was (or would be) altered
  PlayerExcluded       //a participant cannot take part in the matching
};

struct Warning {
  WarningKind kind;
  std::string msg;
};

const char* kindName(WarningKind k);

//Collects the advisory warnings produced while a game is built and
//sanitized. Warnings never stop processing.
class Diagnostics {
public:
  Diagnostics() : warns {} {}

  void warn(WarningKind k, std::string msg) {
    warns.push_back(Warning {k, std::move(msg)});
  }

  const std::vector<Warning>& warnings() const { return warns; }
  size_t size() const { return warns.size(); }
  bool empty() const { return warns.empty(); }
  size_t count(WarningKind k) const;
  void clear() { warns.clear(); }

private:
  std::vector<Warning> warns;
};

std::ostream& operator<<(std::ostream& os, const Warning& w);

#endif
