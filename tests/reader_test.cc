#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "game.h"
#include "reader.h"
#include "test_games.h"

namespace {

typedef std::vector<std::string> Names;

TEST(ProblemReaderTest, ReadsResidentsAndHospitals) {
  std::istringstream in {
    "# two residents, two hospitals\n"
    "r R1 H1 H2\n"
    "r R2 H1 H2\n"
    "\n"
    "h H1 1 R2 R1\n"
    "h H2 1 R1 R2\n"
    " indented lines are comments too\n"};
  ProblemReader reader {};
  ASSERT_TRUE(reader.readProblem(in));
  EXPECT_EQ(reader.ResidentPrefs().at("R1"), (Names {"H1", "H2"}));
  EXPECT_EQ(reader.HospitalPrefs().at("H1"), (Names {"R2", "R1"}));
  EXPECT_EQ(reader.Capacities().at("H2"), 1);

  Game game {reader.makeGame(false)};
  ASSERT_TRUE(game.ok());
  game.solve();
  EXPECT_EQ(game.matchingByName(), (NamedMatching {{"H1", {"R2"}}, {"H2", {"R1"}}}));
}

TEST(ProblemReaderTest, EmptyPreferenceLists) {
  std::istringstream in {"r R1\nh H1 3\n"};
  ProblemReader reader {};
  ASSERT_TRUE(reader.readProblem(in));
  EXPECT_TRUE(reader.ResidentPrefs().at("R1").empty());
  EXPECT_TRUE(reader.HospitalPrefs().at("H1").empty());
  EXPECT_EQ(reader.Capacities().at("H1"), 3);
}

TEST(ProblemReaderTest, RejectsUnknownLines) {
  std::istringstream in {"r R1 H1\nx H1 1 R1\n"};
  ProblemReader reader {};
  EXPECT_FALSE(reader.readProblem(in));
  EXPECT_NE(reader.getError().find("line \"x H1 1 R1\" from input is invalid"), std::string::npos);
}

TEST(ProblemReaderTest, RejectsBadCapacity) {
  std::istringstream in {"h H1 many R1\nh H2\n"};
  ProblemReader reader {};
  EXPECT_FALSE(reader.readProblem(in));
  EXPECT_NE(reader.getError().find("capacity for hospital \"H1\""), std::string::npos);
  EXPECT_NE(reader.getError().find("capacity for hospital \"H2\""), std::string::npos);
  EXPECT_TRUE(reader.HospitalPrefs().empty());
}

TEST(ProblemReaderTest, CapacityMustBeAWholeToken) {
  std::istringstream in {"h H1 2abc R1\nh H2 1.5 R1\nh H3 -1 R1\nh H4 +2 R1\n"};
  ProblemReader reader {};
  EXPECT_FALSE(reader.readProblem(in));
  EXPECT_NE(reader.getError().find("capacity for hospital \"H1\""), std::string::npos);
  EXPECT_NE(reader.getError().find("capacity for hospital \"H2\""), std::string::npos);
  EXPECT_EQ(reader.HospitalPrefs().count("H1"), 0u);
  EXPECT_EQ(reader.HospitalPrefs().count("H2"), 0u);
  //signed integers are capacities; the sanitizer judges their value
  EXPECT_EQ(reader.Capacities().at("H3"), -1);
  EXPECT_EQ(reader.Capacities().at("H4"), 2);
  EXPECT_EQ(reader.HospitalPrefs().at("H3"), (Names {"R1"}));
}

TEST(ProblemReaderTest, RejectsDuplicates) {
  std::istringstream in {"r R1 H1\nr R1 H2\nh H1 1 R1\nh H1 2 R1\n"};
  ProblemReader reader {};
  EXPECT_FALSE(reader.readProblem(in));
  EXPECT_NE(reader.getError().find("Duplicate resident \"R1\""), std::string::npos);
  EXPECT_NE(reader.getError().find("Duplicate hospital \"H1\""), std::string::npos);
  //the first line for a name is kept
  EXPECT_EQ(reader.ResidentPrefs().at("R1"), (Names {"H1"}));
  EXPECT_EQ(reader.Capacities().at("H1"), 1);
}

TEST(ProblemReaderTest, RejectsMissingNames) {
  std::istringstream in {"r\nh\n"};
  ProblemReader reader {};
  EXPECT_FALSE(reader.readProblem(in));
  EXPECT_NE(reader.getError().find("missing resident name"), std::string::npos);
  EXPECT_NE(reader.getError().find("missing hospital name"), std::string::npos);
}

TEST(ProblemReaderTest, MissingFile) {
  ProblemReader reader {};
  EXPECT_FALSE(reader.readProblem(std::string {"/nonexistent/problem.txt"}));
  EXPECT_NE(reader.getError().find("could not open"), std::string::npos);
}

TEST(ProblemReaderTest, CleanGameFromFile) {
  std::istringstream in {"r R1 H1 H9\nr R2 H1\nh H1 1 R1\nh H2 0\n"};
  ProblemReader reader {};
  ASSERT_TRUE(reader.readProblem(in));
  Game game {reader.makeGame(true)};
  EXPECT_EQ(residentROL(game, "R1"), (Names {"H1"}));
  EXPECT_TRUE(residentROL(game, "R2").empty());
  EXPECT_FALSE(game.inGame(game.findHospital("H2")));
}

TEST(MatchReaderTest, ReadsAssignment) {
  std::istringstream in {"m 1\nr R1 H2\nr R2 H1\nr R3\nr R4 H1\n"};
  MatchReader reader {};
  ASSERT_TRUE(reader.readMatch(in));
  EXPECT_FALSE(reader.noMatch());
  EXPECT_EQ(reader.assignment(), (NamedMatching {{"H1", {"R2", "R4"}}, {"H2", {"R1"}}}));
}

TEST(MatchReaderTest, NoMatchFlag) {
  std::istringstream in {"m 0\n"};
  MatchReader reader {};
  ASSERT_TRUE(reader.readMatch(in));
  EXPECT_TRUE(reader.noMatch());
  EXPECT_TRUE(reader.assignment().empty());

  std::istringstream none {"r R1 H1\n"};
  MatchReader noHeader {};
  ASSERT_TRUE(noHeader.readMatch(none));
  EXPECT_TRUE(noHeader.noMatch());
}

TEST(MatchReaderTest, RejectsResidentMatchedTwice) {
  std::istringstream in {"m 1\nr R1 H1\nr R1 H2\n"};
  MatchReader reader {};
  EXPECT_FALSE(reader.readMatch(in));
  EXPECT_NE(reader.getError().find("resident \"R1\" matched more than once"), std::string::npos);
  EXPECT_EQ(reader.assignment(), (NamedMatching {{"H1", {"R1"}}}));
}

TEST(MatchReaderTest, RejectsUnknownLines) {
  std::istringstream in {"m 1\nh H1 R1\n"};
  MatchReader reader {};
  EXPECT_FALSE(reader.readMatch(in));
}

TEST(MatchReaderTest, AssignmentFeedsTheGame) {
  std::istringstream in {"m 1\nr R1 H1\nr R2\n"};
  MatchReader reader {};
  ASSERT_TRUE(reader.readMatch(in));
  Game game {twoByTwo()};
  ASSERT_TRUE(game.setMatching(reader.assignment()));
  EXPECT_TRUE(game.checkValidity().ok());
  EXPECT_FALSE(game.checkStability());
}

}  // namespace
