/***********[players.h]
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

#ifndef HRMATCH_PLAYERS_H
#define HRMATCH_PLAYERS_H

#include <map>
#include <string>
#include <vector>

//Name keyed descriptions of the participants, as supplied by a caller.
//A Game takes its own copy of these on construction and never refers
//back to them.

struct ResidentSpec {
  std::string name;
  std::vector<std::string> prefs;  //hospital names, most preferred first
};

struct HospitalSpec {
  std::string name;
  int capacity;
  std::vector<std::string> prefs;  //resident names, most preferred first
};

typedef std::map<std::string, std::vector<std::string>> PrefMap;
typedef std::map<std::string, int> CapacityMap;

//hospital name --> names of the residents matched to it
typedef std::map<std::string, std::vector<std::string>> NamedMatching;

#endif
