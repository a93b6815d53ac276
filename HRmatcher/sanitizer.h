/***********[sanitizer.h]
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

#ifndef HRMATCH_SANITIZER_H
#define HRMATCH_SANITIZER_H

#include <string>
#include "diagnostics.h"
#include "game.h"

//Validates the preferences and capacities of a game before it is
//solved. Every defect found is reported as a warning. In clean mode the
//defect is also removed from the game; otherwise the game is left as is.
//On an already cleaned game the checks change nothing.
class Sanitizer {
public:
  Sanitizer(Game& g, Diagnostics& d, bool clean) : game (g), diags (d), cln {clean} {}

  //All checks, in order
  void run();

  //Nobody ranks the same participant twice
  void checkPrefsUnique(Party party);
  //Nobody ranks someone outside the opposite party
  void checkPrefsAllInParty(Party party);
  //Hospitals rank only residents that rank them
  void checkPrefsAllReciprocated();
  //Hospitals rank every resident that ranks them
  void checkReciprocatedAllPrefs();
  //Hospitals have a capacity of at least one
  void checkCapacity();
  //Detection only: participants that rank nobody
  void checkPrefsNonempty(Party party);

private:
  Game& game;
  Diagnostics& diags;
  bool cln;

  template<typename Player, typename NameOf>
  void uniquePrefs(Player& player, NameOf nameOf);
  template<typename Player, typename InParty, typename NameOf>
  void prefsInParty(Player& player, InParty inParty, NameOf nameOf, const std::string& otherParty);

  void prefsChanged(const std::string& msg) { diags.warn(WarningKind::PreferencesChanged, msg); }
  void playerExcluded(const std::string& msg) { diags.warn(WarningKind::PlayerExcluded, msg); }
};

#endif
