/***********[reader.h]
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

#ifndef HRMATCH_READER_H
#define HRMATCH_READER_H

#include <iostream>
#include <string>
#include <unordered_set>
#include "game.h"
#include "players.h"

//Reads a problem specification. Format, one participant per line:
//  r <resident> <hospital>...             ranked most preferred first
//  h <hospital> <capacity> <resident>...  ranked most preferred first
//Empty lines and lines starting with ' ' or '#' are ignored.
class ProblemReader {
public:
  ProblemReader() : residentPrefs {}, hospitalPrefs {}, capacities {},
                    errMsg {}, probOK {true}, resNames {}, hospNames {} {}

  bool readProblem(const std::string& filename);
  bool readProblem(std::istream& in);
  void readResident(const std::string& l);
  void readHospital(const std::string& l);

  Game makeGame(bool clean) const;

  const PrefMap& ResidentPrefs() const { return residentPrefs; }
  const PrefMap& HospitalPrefs() const { return hospitalPrefs; }
  const CapacityMap& Capacities() const { return capacities; }

  void postError(std::string msg) {
    errMsg += msg;
    probOK = false;
  }
  bool ok() const { return probOK; }
  const std::string& getError() const { return errMsg; }

private:
  PrefMap residentPrefs;
  PrefMap hospitalPrefs;
  CapacityMap capacities;
  std::string errMsg;
  bool probOK;
  std::unordered_set<std::string> resNames;
  std::unordered_set<std::string> hospNames;
};

//Reads a match specification. Format:
//  m [0/1]                     0: no match was found; 1: a match to check
//  r <resident> [<hospital>]   resident matched to hospital, or unmatched
class MatchReader {
public:
  MatchReader() : assigned {}, errMsg {}, readOK {true}, nomatch {true}, resNames {} {}

  bool readMatch(const std::string& filename);
  bool readMatch(std::istream& in);
  void readResident(const std::string& l);
  void readValid(const std::string& l);

  const NamedMatching& assignment() const { return assigned; }
  bool noMatch() const { return nomatch; }

  void postError(std::string msg) {
    errMsg += msg;
    readOK = false;
  }
  bool ok() const { return readOK; }
  const std::string& getError() const { return errMsg; }

private:
  NamedMatching assigned;
  std::string errMsg;
  bool readOK;
  bool nomatch;
  std::unordered_set<std::string> resNames;
};

#endif
