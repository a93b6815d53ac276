#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "game.h"
#include "sanitizer.h"
#include "test_games.h"

namespace {

typedef std::vector<std::string> Names;

bool hasWarning(const Game& game, WarningKind kind, const std::string& text) {
  for(const auto& w : game.diagnostics().warnings())
    if(w.kind == kind && w.msg.find(text) != std::string::npos)
      return true;
  return false;
}

//Every kind of defect at once:
//  R1 ranks H1 twice and ranks H9, which is not a hospital;
//  H1 ranks R7, which is not a resident;
//  R2 ranks H1 and H2 ranks R3, neither ranked back;
//  H3 has no capacity.
Game messyGame(bool clean) {
  return Game {{{"R1", {"H1", "H1", "H2", "H9"}},
                {"R2", {"H2", "H1"}},
                {"R3", {"H1", "H3"}}},
               {{"H1", 2, {"R1", "R3", "R7"}},
                {"H2", 1, {"R2", "R1", "R3"}},
                {"H3", 0, {"R3"}}},
               clean};
}

TEST(SanitizerTest, CleanGameHasNoWarnings) {
  Game game {twoByTwo(true)};
  EXPECT_TRUE(game.diagnostics().empty());
  EXPECT_EQ(residentROL(game, "R1"), (Names {"H1", "H2"}));
  EXPECT_EQ(hospitalROL(game, "H1"), (Names {"R2", "R1"}));
}

TEST(SanitizerTest, WarnsWithoutChangingWhenNotCleaning) {
  Game game {messyGame(false)};
  EXPECT_EQ(game.diagnostics().count(WarningKind::PreferencesChanged), 6u);
  EXPECT_EQ(game.diagnostics().count(WarningKind::PlayerExcluded), 1u);

  EXPECT_EQ(residentROL(game, "R1"), (Names {"H1", "H1", "H2", "H9"}));
  EXPECT_EQ(residentROL(game, "R2"), (Names {"H2", "H1"}));
  EXPECT_EQ(residentROL(game, "R3"), (Names {"H1", "H3"}));
  EXPECT_EQ(hospitalROL(game, "H1"), (Names {"R1", "R3", "R7"}));
  EXPECT_EQ(hospitalROL(game, "H2"), (Names {"R2", "R1", "R3"}));
  EXPECT_EQ(game.Hosp().size(), 3u);
}

TEST(SanitizerTest, RepairsEverythingWhenCleaning) {
  Game game {messyGame(true)};
  EXPECT_EQ(game.diagnostics().count(WarningKind::PreferencesChanged), 5u);
  EXPECT_EQ(game.diagnostics().count(WarningKind::PlayerExcluded), 1u);

  EXPECT_EQ(residentROL(game, "R1"), (Names {"H1", "H2"}));
  EXPECT_EQ(residentROL(game, "R2"), (Names {"H2"}));
  EXPECT_EQ(residentROL(game, "R3"), (Names {"H1"}));
  EXPECT_EQ(hospitalROL(game, "H1"), (Names {"R1", "R3"}));
  EXPECT_EQ(hospitalROL(game, "H2"), (Names {"R2", "R1"}));
  EXPECT_FALSE(game.inGame(game.findHospital("H3")));
  EXPECT_EQ(game.Hosp().size(), 2u);
}

TEST(SanitizerTest, DuplicatesKeepFirstOccurrence) {
  Game game {{{"R1", {"H2", "H1", "H2", "H1"}}},
             {{"H1", 1, {"R1"}}, {"H2", 1, {"R1", "R1"}}},
             true};
  EXPECT_EQ(residentROL(game, "R1"), (Names {"H2", "H1"}));
  EXPECT_EQ(hospitalROL(game, "H2"), (Names {"R1"}));
  EXPECT_TRUE(hasWarning(game, WarningKind::PreferencesChanged, "R1 has ranked H2 multiple times."));
  EXPECT_TRUE(hasWarning(game, WarningKind::PreferencesChanged, "R1 has ranked H1 multiple times."));
  EXPECT_TRUE(hasWarning(game, WarningKind::PreferencesChanged, "H2 has ranked R1 multiple times."));
  EXPECT_EQ(game.diagnostics().size(), 3u);
}

TEST(SanitizerTest, DuplicatesRankByFirstOccurrence) {
  Game game {{{"R1", {"H2", "H1", "H2"}}},
             {{"H1", 1, {"R1"}}, {"H2", 1, {"R1"}}}};
  const Resident& r1 = game.ithRes(game.findResident("R1"));
  EXPECT_EQ(r1.rankOf(game.findHospital("H2")), 0);
  EXPECT_EQ(r1.rankOf(game.findHospital("H1")), 1);
}

TEST(SanitizerTest, PreferencesOutsideTheParty) {
  Game game {{{"R1", {"H9", "H1"}}}, {{"H1", 1, {"R1", "R7"}}}, true};
  EXPECT_TRUE(hasWarning(game, WarningKind::PreferencesChanged, "R1 has ranked a non-hospital: H9."));
  EXPECT_TRUE(hasWarning(game, WarningKind::PreferencesChanged, "H1 has ranked a non-resident: R7."));
  EXPECT_EQ(residentROL(game, "R1"), (Names {"H1"}));
  EXPECT_EQ(hospitalROL(game, "H1"), (Names {"R1"}));
}

TEST(SanitizerTest, HospitalRankingUnreciprocatedResident) {
  Game game {{{"R1", {"H1"}}, {"R2", {}}}, {{"H1", 1, {"R2", "R1"}}}, true};
  EXPECT_TRUE(hasWarning(game, WarningKind::PreferencesChanged, "H1 ranked R2 but they did not."));
  EXPECT_TRUE(hasWarning(game, WarningKind::PreferencesChanged, "Removed R2 from the preferences of H1."));
  EXPECT_EQ(hospitalROL(game, "H1"), (Names {"R1"}));
  EXPECT_TRUE(residentROL(game, "R2").empty());
}

TEST(SanitizerTest, ResidentRankingUnreciprocatedHospital) {
  Game game {{{"R1", {"H1", "H2"}}}, {{"H1", 1, {"R1"}}, {"H2", 1, {}}}, true};
  EXPECT_TRUE(hasWarning(game, WarningKind::PreferencesChanged, "R1 ranked H2 but they did not."));
  EXPECT_TRUE(hasWarning(game, WarningKind::PreferencesChanged, "Removed H2 from the preferences of R1."));
  EXPECT_EQ(residentROL(game, "R1"), (Names {"H1"}));
  EXPECT_TRUE(hospitalROL(game, "H2").empty());
}

TEST(SanitizerTest, UnreciprocatedPreferencesKeptWhenNotCleaning) {
  Game game {{{"R1", {"H1", "H2"}}}, {{"H1", 1, {"R1"}}, {"H2", 1, {}}}};
  EXPECT_TRUE(hasWarning(game, WarningKind::PreferencesChanged, "R1 ranked H2 but they did not."));
  EXPECT_FALSE(hasWarning(game, WarningKind::PreferencesChanged, "Removed"));
  EXPECT_EQ(residentROL(game, "R1"), (Names {"H1", "H2"}));
}

TEST(SanitizerTest, ExcludesHospitalsWithoutCapacity) {
  Game game {{{"R1", {"H1", "H2"}}, {"R2", {"H2"}}},
             {{"H1", 1, {"R1"}}, {"H2", -1, {"R1", "R2"}}},
             true};
  EXPECT_TRUE(hasWarning(game, WarningKind::PlayerExcluded, "H2 has a capacity of -1 (less than 1)."));
  EXPECT_FALSE(game.inGame(game.findHospital("H2")));
  EXPECT_EQ(game.Hosp().size(), 1u);
  EXPECT_EQ(residentROL(game, "R1"), (Names {"H1"}));
  EXPECT_TRUE(residentROL(game, "R2").empty());
  //R2 is left ranking nobody
  EXPECT_TRUE(hasWarning(game, WarningKind::PlayerExcluded, "R2 has an empty preference list."));
  EXPECT_EQ(game.diagnostics().count(WarningKind::PlayerExcluded), 2u);
}

TEST(SanitizerTest, KeepsHospitalsWithoutCapacityWhenNotCleaning) {
  Game game {{{"R1", {"H1"}}}, {{"H1", 0, {"R1"}}}};
  EXPECT_TRUE(hasWarning(game, WarningKind::PlayerExcluded, "H1 has a capacity of 0 (less than 1)."));
  EXPECT_TRUE(game.inGame(game.findHospital("H1")));
  game.solve();
  EXPECT_EQ(matchOf(game, "R1"), "");
}

TEST(SanitizerTest, EmptyListsAreOnlyReported) {
  Game game {{{"R1", {}}, {"R2", {"H1"}}}, {{"H1", 1, {"R2"}}, {"H2", 1, {}}}, true};
  EXPECT_TRUE(hasWarning(game, WarningKind::PlayerExcluded, "R1 has an empty preference list."));
  EXPECT_TRUE(hasWarning(game, WarningKind::PlayerExcluded, "H2 has an empty preference list."));
  EXPECT_EQ(game.Res().size(), 2u);
  EXPECT_EQ(game.Hosp().size(), 2u);
}

TEST(SanitizerTest, CleaningTwiceChangesNothing) {
  Game game {messyGame(true)};
  size_t nWarnings = game.diagnostics().size();
  std::vector<Names> resROLs, hospROLs;
  for(const auto& name : {"R1", "R2", "R3"})
    resROLs.push_back(residentROL(game, name));
  for(const auto& name : {"H1", "H2"})
    hospROLs.push_back(hospitalROL(game, name));

  game.sanitize();

  EXPECT_EQ(game.diagnostics().size(), nWarnings);
  EXPECT_EQ(game.Hosp().size(), 2u);
  std::vector<Names> resAfter, hospAfter;
  for(const auto& name : {"R1", "R2", "R3"})
    resAfter.push_back(residentROL(game, name));
  for(const auto& name : {"H1", "H2"})
    hospAfter.push_back(hospitalROL(game, name));
  EXPECT_EQ(resAfter, resROLs);
  EXPECT_EQ(hospAfter, hospROLs);
}

TEST(SanitizerTest, SecondPassOnlyRepeatsEmptyListReports) {
  Game game {{{"R1", {"H1"}}, {"R2", {"H2"}}},
             {{"H1", 1, {"R1"}}, {"H2", 0, {"R2"}}},
             true};
  Diagnostics again;
  Sanitizer sanitizer {game, again, true};
  sanitizer.run();
  ASSERT_EQ(again.size(), 1u);
  EXPECT_EQ(again.warnings()[0].kind, WarningKind::PlayerExcluded);
  EXPECT_EQ(again.warnings()[0].msg, "R2 has an empty preference list.");
  EXPECT_EQ(residentROL(game, "R1"), (Names {"H1"}));
}

TEST(SanitizerTest, SingleChecksCanRunOnTheirOwn) {
  Game game {{{"R1", {"H1", "H1"}}}, {{"H1", 1, {"R1"}}}};
  Diagnostics diags;
  Sanitizer sanitizer {game, diags, true};
  sanitizer.checkPrefsUnique(Party::Hospitals);
  EXPECT_TRUE(diags.empty());
  sanitizer.checkPrefsUnique(Party::Residents);
  EXPECT_EQ(diags.count(WarningKind::PreferencesChanged), 1u);
  EXPECT_EQ(residentROL(game, "R1"), (Names {"H1"}));
}

}  // namespace
