/***********[sanitizer.cc]
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

#include "sanitizer.h"

#include <algorithm>

using std::string;
using std::to_string;
using std::vector;

void Sanitizer::run() {
  checkPrefsUnique(Party::Residents);
  checkPrefsUnique(Party::Hospitals);

  checkPrefsAllInParty(Party::Residents);
  checkPrefsAllInParty(Party::Hospitals);

  checkPrefsAllReciprocated();
  checkReciprocatedAllPrefs();

  checkCapacity();

  checkPrefsNonempty(Party::Residents);
  checkPrefsNonempty(Party::Hospitals);
}

template<typename Player, typename NameOf>
void Sanitizer::uniquePrefs(Player& player, NameOf nameOf) {
  decltype(player.rol) unique {};
  for(auto other : player.rol) {
    if(std::find(unique.begin(), unique.end(), other) != unique.end())
      prefsChanged(player.name() + " has ranked " + nameOf(other) + " multiple times.");
    else
      unique.push_back(other);
  }
  if(cln && unique.size() != player.rol.size())
    player.setROL(unique, player.rank.size());
}

template<typename Player, typename InParty, typename NameOf>
void Sanitizer::prefsInParty(Player& player, InParty inParty, NameOf nameOf,
                             const string& otherParty) {
  auto prefs = player.rol;
  for(auto other : prefs) {
    if(inParty(other))
      continue;
    string msg = player.name() + " has ranked a non-" + otherParty + ": " + nameOf(other) + ".";
    if(cln) {
      msg += " Removed " + nameOf(other) + " from the preferences of " + player.name() + ".";
      player.forget(other);
    }
    prefsChanged(msg);
  }
}

void Sanitizer::checkPrefsUnique(Party party) {
  switch(party) {
  case Party::Residents:
    for(auto rid : game.Res())
      uniquePrefs(game.ithRes(rid),
                  [this](PID p) { return game.ithHosp(p).name(); });
    break;
  case Party::Hospitals:
    for(auto pid : game.Hosp())
      uniquePrefs(game.ithHosp(pid),
                  [this](RID r) { return game.ithRes(r).name(); });
    break;
  }
}

void Sanitizer::checkPrefsAllInParty(Party party) {
  switch(party) {
  case Party::Residents:
    for(auto rid : game.Res())
      prefsInParty(game.ithRes(rid),
                   [this](PID p) { return game.inGame(p); },
                   [this](PID p) { return game.ithHosp(p).name(); },
                   "hospital");
    break;
  case Party::Hospitals:
    for(auto pid : game.Hosp())
      prefsInParty(game.ithHosp(pid),
                   [this](RID r) { return game.inGame(r); },
                   [this](RID r) { return game.ithRes(r).name(); },
                   "resident");
    break;
  }
}

void Sanitizer::checkPrefsAllReciprocated() {
  for(auto pid : game.Hosp()) {
    Hospital& h = game.ithHosp(pid);
    auto prefs = h.rol;
    for(auto rid : prefs) {
      const Resident& r = game.ithRes(rid);
      if(r.isRanked(pid))
        continue;
      string msg = h.name() + " ranked " + r.name() + " but they did not.";
      if(cln) {
        msg += " Removed " + r.name() + " from the preferences of " + h.name() + ".";
        h.forget(rid);
      }
      prefsChanged(msg);
    }
  }
}

void Sanitizer::checkReciprocatedAllPrefs() {
  for(auto pid : game.Hosp()) {
    const Hospital& h = game.ithHosp(pid);
    for(auto rid : game.Res()) {
      Resident& r = game.ithRes(rid);
      if(!r.isRanked(pid) || h.isRanked(rid))
        continue;
      string msg = r.name() + " ranked " + h.name() + " but they did not.";
      if(cln) {
        msg += " Removed " + h.name() + " from the preferences of " + r.name() + ".";
        r.forget(pid);
      }
      prefsChanged(msg);
    }
  }
}

void Sanitizer::checkCapacity() {
  vector<PID> hosps (game.Hosp());  //removal edits the member list
  for(auto pid : hosps) {
    const Hospital& h = game.ithHosp(pid);
    if(h.CAPACITY() >= 1)
      continue;
    string msg = h.name() + " has a capacity of " + to_string(h.CAPACITY()) + " (less than 1).";
    if(cln) {
      msg += " Removed " + h.name() + " from the game.";
      game.removeHospital(pid);
    }
    playerExcluded(msg);
  }
}

void Sanitizer::checkPrefsNonempty(Party party) {
  switch(party) {
  case Party::Residents:
    for(auto rid : game.Res())
      if(game.ithRes(rid).ROL().empty())
        playerExcluded(game.ithRes(rid).name() + " has an empty preference list.");
    break;
  case Party::Hospitals:
    for(auto pid : game.Hosp())
      if(game.ithHosp(pid).ROL().empty())
        playerExcluded(game.ithHosp(pid).name() + " has an empty preference list.");
    break;
  }
}
