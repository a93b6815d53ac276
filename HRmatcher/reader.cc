/***********[reader.cc]
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

#include "reader.h"

#include <fstream>
#include <sstream>
#include <vector>

using std::string;
using std::vector;
using std::istringstream;

namespace {
vector<string> readLines(std::istream& in) {
  vector<string> ilines;
  string line;
  while(getline(in, line))
    ilines.push_back(line);
  return ilines;
}
}

bool ProblemReader::readProblem(const string& filename) {
  std::ifstream in {filename};
  if(!in) {
    postError("Input ERROR: could not open \"" + filename + "\"\n");
    return false;
  }
  return readProblem(in);
}

bool ProblemReader::readProblem(std::istream& in) {
  for(const auto& l : readLines(in)) {
    if(l.size() == 0)
      continue;
    switch( l[0] ) {
    case ' ':
      break;
    case '#':
      break;
    case 'r':
      readResident(l);
      break;
    case 'h':
      readHospital(l);
      break;
    default:
      postError("Input ERROR: line \"" + l + "\" from input is invalid\n");
    }
  }
  return ok();
}

void ProblemReader::readResident(const string& l) {
  //Format:
  //"r <resident> <rol>"
  //Where rol is a sequence of hospital names most prefered first.
  istringstream iss {l};
  char c;
  string name, hosp;
  vector<string> prefs;

  iss >> c >> name;
  while(iss >> hosp)
    prefs.push_back(hosp);

  if(name.empty()) {
    postError("Input ERROR: missing resident name in resident spec.\n");
    return;
  }
  if(!resNames.insert(name).second) {
    postError("Input ERROR: Duplicate resident \"" + name + "\" in resident specs.\n");
    return;
  }
  residentPrefs[name] = prefs;
}

void ProblemReader::readHospital(const string& l) {
  //Format
  //"h <hospital> <capacity> <rol>"
  istringstream iss {l};
  char c;
  string name, res;
  string capTok;
  int capacity {0};
  vector<string> prefs;

  iss >> c >> name;
  if(name.empty()) {
    postError("Input ERROR: missing hospital name in hospital spec.\n");
    return;
  }
  //the whole token must be the integer: "2abc" is not a capacity
  iss >> capTok;
  istringstream capIss {capTok};
  if(capTok.empty() || !(capIss >> capacity) || !capIss.eof()) {
    postError("Input ERROR: missing or non-integer capacity for hospital \"" + name + "\".\n");
    return;
  }
  while(iss >> res)
    prefs.push_back(res);

  if(!hospNames.insert(name).second) {
    postError("Input ERROR: Duplicate hospital \"" + name + "\" in hospital specs.\n");
    return;
  }
  hospitalPrefs[name] = prefs;
  capacities[name] = capacity;
}

Game ProblemReader::makeGame(bool clean) const {
  return Game::fromPreferenceMaps(residentPrefs, hospitalPrefs, capacities, clean);
}

bool MatchReader::readMatch(const string& filename) {
  std::ifstream in {filename};
  if(!in) {
    postError("Input ERROR: could not open \"" + filename + "\"\n");
    return false;
  }
  return readMatch(in);
}

bool MatchReader::readMatch(std::istream& in) {
  for(const auto& l : readLines(in)) {
    if(l.size() == 0)
      continue;
    switch( l[0] ) {
    case ' ':
      break;
    case '#':
      break;
    case 'r':
      readResident(l);
      break;
    case 'm':
      readValid(l);
      break;
    default:
      postError("Input ERROR: line \"" + l + "\" from input is invalid\n");
    }
  }
  return ok();
}

void MatchReader::readResident(const string& l) {
  //Format:
  //"r <resident> [<hospital>]"
  //Where resident is matched to hospital, or unmatched if none is given.
  istringstream iss {l};
  char c;
  string res, hosp;

  iss >> c >> res >> hosp;
  if(res.empty()) {
    postError("Input ERROR: missing resident name in match spec.\n");
    return;
  }
  if(!resNames.insert(res).second) {
    postError("Input ERROR: resident \"" + res + "\" matched more than once.\n");
    return;
  }
  if(!hosp.empty())
    assigned[hosp].push_back(res);
}

void MatchReader::readValid(const string& l) {
  //Format:
  //"m [0/1]"
  //0 indicates that no match was found. 1 a match that has to be checked.
  istringstream iss {l};
  char c;
  int m {0};
  iss >> c >> m;
  nomatch = (m != 1);
}
