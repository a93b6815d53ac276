/***********[diagnostics.cc]
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

#include "diagnostics.h"

#include <algorithm>

const char* kindName(WarningKind k) {
  switch(k) {
  case WarningKind::PreferencesChanged:
    return "PreferencesChanged";
  case WarningKind::PlayerExcluded:
    return "PlayerExcluded";
  }
  return "Unknown";
}

size_t Diagnostics::count(WarningKind k) const {
  return std::count_if(warns.begin(), warns.end(),
                       [k](const Warning& w) { return w.kind == k; });
}

std::ostream& operator<<(std::ostream& os, const Warning& w) {
  os << "#WARNING " << kindName(w.kind) << ": " << w.msg;
  return os;
}
