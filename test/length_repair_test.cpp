#include <gtest/gtest.h>

#include "duckdb/common/exception.hpp"

#include "pcode/admin_level.hpp"
#include "pcode/admin_level_set.hpp"
#include "pcode/length_repair.hpp"
#include "pcode_fixtures.hpp"

namespace {

using pcode::AdminLevel;
using pcode::AdminLevelSet;
using pcode::PcodeMatch;

const char *const kCountryMethod = "pcode length conversion-country";
const char *const kSimpleMethod = "pcode length conversion";

std::string AdminsMethod(const std::string &levels) {
	return "pcode length conversion-admins " + levels;
}

struct RepairCase {
	const char *country;
	const char *input;
	const char *pcode; // nullptr when nothing should match
	std::string method;
};

void ExpectCases(AdminLevel &admin, const std::vector<RepairCase> &cases) {
	for (const auto &c : cases) {
		const PcodeMatch match = admin.Resolve(c.country, c.input);
		if (c.pcode == nullptr) {
			EXPECT_FALSE(match.found) << c.input << " -> " << match.pcode;
			EXPECT_TRUE(match.exact) << c.input;
			continue;
		}
		EXPECT_TRUE(match.found) << c.input;
		EXPECT_EQ(match.pcode, c.pcode) << c.input;
		EXPECT_TRUE(match.exact) << c.input;
		EXPECT_EQ(match.method, c.method) << c.input;
	}
}

class Admin2RepairTest : public ::testing::Test {
protected:
	Admin2RepairTest() : admin(pcode::AdminConfig(), 2) {
		admin.Setup(pcode_test::Admin2Rows());
	}

	AdminLevel admin;
};

TEST_F(Admin2RepairTest, NothingIsRepairedWithoutFormats) {
	const PcodeMatch match = admin.Resolve("YEM", "YE03001");
	EXPECT_FALSE(match.found);
	EXPECT_TRUE(match.exact);
	EXPECT_TRUE(match.method.empty());
}

TEST_F(Admin2RepairTest, RegisteredPcodesAreReturnedUppercased) {
	const PcodeMatch match = admin.Resolve("NGA", "ng015001");
	EXPECT_TRUE(match.found);
	EXPECT_EQ(match.pcode, "NG015001");
	EXPECT_TRUE(match.exact);
	EXPECT_TRUE(match.method.empty());
}

TEST_F(Admin2RepairTest, RepairsWithSegmentLengths) {
	admin.LoadPcodeFormats(pcode_test::Formats());
	ExpectCases(admin, {
	                       {"YEM", "YEM03001", "YE3001", AdminsMethod("1")},
	                       {"YEM", "YE301", "YE3001", AdminsMethod("2")},
	                       {"YEM", "YEM30001", "YE3001", AdminsMethod("2")},
	                       {"YEM", "YEM030001", "YE3001", AdminsMethod("1, 2")},
	                       {"YEM", "YEM3001", "YE3001", kCountryMethod},
	                       {"NGA", "NG15001", "NG015001", AdminsMethod("1")},
	                       {"NGA", "NGA015001", "NG015001", kCountryMethod},
	                       {"NGA", "NG1501", "NG015001", AdminsMethod("1, 2")},
	                       {"NGA", "NG3614", "NG036014", AdminsMethod("1, 2")},
	                       {"NER", "NE04009", "NER004009", AdminsMethod("1")},
	                       {"DZA", "DZ0090009", "DZ009009", AdminsMethod("2")},
	                   });
}

TEST_F(Admin2RepairTest, AmbiguousInputsStayUnresolved) {
	admin.LoadPcodeFormats(pcode_test::Formats());
	ExpectCases(admin, {
	                       {"NGA", "NG01501", nullptr, ""},
	                       {"NGA", "NG0151", nullptr, ""},
	                       {"NGA", "NG151", nullptr, ""},
	                       {"NER", "NE00409", nullptr, ""},
	                       {"COL", "CO080849", nullptr, ""},
	                   });
}

TEST_F(Admin2RepairTest, CountryWithoutCodesIsAnError) {
	admin.LoadPcodeFormats(pcode_test::Formats());
	const PcodeMatch match = admin.Resolve("XYZ", "XYZ123", true, "test");
	EXPECT_FALSE(match.found);
	EXPECT_TRUE(match.exact);
	EXPECT_EQ(admin.OutputErrors(), std::vector<std::string> {"test - Could not find XYZ in map names!"});
}

TEST(AdminLevelSetRepairTest, ParentCodesDisambiguateZeroChanges) {
	AdminLevelSet levels;
	levels.Setup(pcode_test::LeveledRows(), pcode_test::Formats());
	EXPECT_EQ(levels.MaxLevel(), 2u);

	ExpectCases(*levels.GetLevel(2), {
	                                     {"NER", "NE00409", "NER004009", AdminsMethod("2")},
	                                     {"COL", "CO080849", "CO08849", AdminsMethod("2")},
	                                     {"YEM", "YEM03001", "YE3001", AdminsMethod("1")},
	                                     {"NGA", "NG1501", "NG015001", AdminsMethod("1, 2")},
	                                 });

	const PcodeMatch match = levels.Resolve(2, "NER", "NE00409");
	EXPECT_EQ(match.pcode, "NER004009");
	EXPECT_THROW(levels.Resolve(3, "NER", "NE00409"), duckdb::InvalidInputException);
}

TEST(Admin1RepairTest, UsesSegmentLengthsWhenLoaded) {
	AdminLevel admin(pcode::AdminConfig(), 1);
	admin.Setup(pcode_test::Admin1Rows());
	admin.LoadPcodeFormats(pcode_test::Formats());
	ExpectCases(admin, {
	                       {"YEM", "YEM30", "YE30", kCountryMethod},
	                       {"YEM", "YEM030", "YE30", AdminsMethod("1")},
	                       {"NGA", "NG15", "NG015", AdminsMethod("1")},
	                       {"NGA", "NGA015", "NG015", kCountryMethod},
	                       {"NER", "NE04", "NER004", AdminsMethod("1")},
	                       {"NER", "NE004", "NER004", kCountryMethod},
	                   });
}

TEST(Admin1RepairTest, FallsBackToSimpleLengthHeuristic) {
	AdminLevel admin(pcode::AdminConfig(), 1);
	admin.Setup(pcode_test::Admin1Rows());
	ExpectCases(admin, {
	                       {"YEM", "YEM30", "YE30", kSimpleMethod},
	                       {"YEM", "YEM030", "YE30", kSimpleMethod},
	                       {"NGA", "NG15", "NG015", kSimpleMethod},
	                       {"NGA", "NGA015", "NG015", kSimpleMethod},
	                       {"NER", "NE04", "NER004", kSimpleMethod},
	                       {"NER", "NE004", "NER004", kSimpleMethod},
	                   });
	// Not pcode shaped: handled as a name, which does not exist.
	const PcodeMatch match = admin.ConvertAdminPcodeLength("YEM", "YEME123");
	EXPECT_FALSE(match.found);
}

TEST(Admin1RepairTest, RepairsAreLoggedOncePerPcode) {
	AdminLevel admin(pcode::AdminConfig(), 1);
	admin.Setup(pcode_test::Admin1Rows());
	admin.Resolve("YEM", "YEM30", true, "test");
	admin.Resolve("YEM", "YEM030", true, "test");
	EXPECT_EQ(admin.OutputMatches(),
	          std::vector<std::string> {"test - YEM: Matching (pcode length conversion) YE30 to Ad Dali on map"});
}

TEST(RepairFunctionTest, SimpleLengthRules) {
	pcode::Registry registry;
	for (const auto &row : pcode_test::Admin1Rows()) {
		registry.Register(row);
	}
	const pcode::RepairResult yem = pcode::RepairSimpleLength(registry, "YEM", "YE", "YEM30");
	EXPECT_TRUE(yem.found);
	EXPECT_EQ(yem.pcode, "YE30");
	EXPECT_EQ(yem.method, kSimpleMethod);

	EXPECT_EQ(pcode::RepairSimpleLength(registry, "NGA", "NG", "NG15").pcode, "NG015");
	EXPECT_EQ(pcode::RepairSimpleLength(registry, "NER", "NE", "NE04").pcode, "NER004");
	// Already the right length, too short, too long, unknown country.
	EXPECT_FALSE(pcode::RepairSimpleLength(registry, "YEM", "YE", "YE31").found);
	EXPECT_FALSE(pcode::RepairSimpleLength(registry, "YEM", "YE", "YE3").found);
	EXPECT_FALSE(pcode::RepairSimpleLength(registry, "YEM", "YE", "YEM0030").found);
	EXPECT_FALSE(pcode::RepairSimpleLength(registry, "XYZ", "XY", "XYZ30").found);
}

TEST(RepairFunctionTest, GrammarNeedsEnoughLevels) {
	pcode::Registry registry;
	for (const auto &row : pcode_test::Admin2Rows()) {
		registry.Register(row);
	}
	pcode::CodeGrammar grammar({2, 2});
	grammar.AddZeroPositions("YE3001");
	const pcode::RepairResult result =
	    pcode::RepairWithGrammar(registry, grammar, pcode::ParentRegistries(), "YEM", "YE", 2, "YEM03001");
	EXPECT_FALSE(result.found);
	EXPECT_FALSE(pcode::RepairWithGrammar(registry, grammar, pcode::ParentRegistries(), "YEM", "YE", 1, "Ad Dali")
	                 .found);
}

// Admin 3 pcodes with a {2, 2, 2, 3} grammar: TS + admin1 + admin2 + admin3.
class Admin3RepairTest : public ::testing::Test {
protected:
	Admin3RepairTest() : grammar({2, 2, 2, 3}) {
		admin3.Register({"TST", "TS0102001", "Alpha", "TS0102"});
		admin3.Register({"TST", "TS0120001", "Beta", "TS0120"});
		for (const auto &code : admin3.Pcodes()) {
			grammar.AddZeroPositions(code);
		}
		admin1.Register({"TST", "TS01", "One", ""});
		admin2_0102.Register({"TST", "TS0102", "One Two", "TS01"});
		admin2_0120.Register({"TST", "TS0120", "One Twenty", "TS01"});
	}

	pcode::RepairResult Repair(const pcode::ParentRegistries &parents, const std::string &input) const {
		return pcode::RepairWithGrammar(admin3, grammar, parents, "TST", "TS", 3, input);
	}

	pcode::Registry admin3;
	pcode::Registry admin1;
	pcode::Registry admin2_0102;
	pcode::Registry admin2_0120;
	pcode::CodeGrammar grammar;
};

TEST_F(Admin3RepairTest, MissingZeroAtLevelTwoFollowsTheAdmin2Registry) {
	pcode::RepairResult result = Repair({&admin1, &admin2_0102}, "TS012001");
	ASSERT_TRUE(result.found);
	EXPECT_EQ(result.pcode, "TS0102001");
	EXPECT_EQ(result.method, AdminsMethod("2"));

	// Without TS0102 the level 2 zero is rejected and admin 3 is padded instead.
	result = Repair({&admin1, &admin2_0120}, "TS012001");
	ASSERT_TRUE(result.found);
	EXPECT_EQ(result.pcode, "TS0120001");
	EXPECT_EQ(result.method, AdminsMethod("3"));

	// A null registry skips the check for its level.
	result = Repair({&admin1, nullptr}, "TS012001");
	ASSERT_TRUE(result.found);
	EXPECT_EQ(result.pcode, "TS0102001");

	// Without parents the zero goes to admin 1 and nothing is registered there.
	EXPECT_FALSE(Repair(pcode::ParentRegistries(), "TS012001").found);
}

TEST_F(Admin3RepairTest, ExtraZeroAtLevelTwoFollowsTheAdmin2Registry) {
	pcode::RepairResult result = Repair({&admin1, &admin2_0120}, "TS01020001");
	ASSERT_TRUE(result.found);
	EXPECT_EQ(result.pcode, "TS0120001");
	EXPECT_EQ(result.method, AdminsMethod("2"));

	result = Repair({&admin1, &admin2_0102}, "TS01020001");
	ASSERT_TRUE(result.found);
	EXPECT_EQ(result.pcode, "TS0102001");
	EXPECT_EQ(result.method, AdminsMethod("3"));

	EXPECT_FALSE(Repair(pcode::ParentRegistries(), "TS01020001").found);
}

TEST(AdminLevelSetRepairTest, ThirdLevelUsesBothParentLevels) {
	const std::vector<pcode::LeveledAdminRow> rows {
	    {1, {"TST", "TS01", "One", ""}},
	    {2, {"TST", "TS0102", "One Two", "TS01"}},
	    {3, {"TST", "TS0102001", "Alpha", "TS0102"}},
	    {3, {"TST", "TS0120001", "Beta", "TS0120"}},
	};
	AdminLevelSet levels;
	levels.Setup(rows, {{"TST", {2, 2, 2, 3}}});
	ASSERT_EQ(levels.MaxLevel(), 3u);

	PcodeMatch match = levels.Resolve(3, "TST", "TS012001");
	EXPECT_TRUE(match.found);
	EXPECT_EQ(match.pcode, "TS0102001");
	EXPECT_EQ(match.method, AdminsMethod("2"));

	match = levels.Resolve(3, "TST", "TS01020001");
	EXPECT_TRUE(match.found);
	EXPECT_EQ(match.pcode, "TS0102001");
	EXPECT_EQ(match.method, AdminsMethod("3"));
}

} // namespace
