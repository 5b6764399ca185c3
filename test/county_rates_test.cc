#include "gtest/gtest.h"
#include "core/CountyRates.hpp"
#include "io/CountyTables.hpp"

#include <sstream>

class CountyRatesTest : public testing::Test {
public:
  static CsvTable table(const std::string &text) {
    std::istringstream in(text);
    return CsvTable::parse(in);
  }
};

TEST_F(CountyRatesTest, KeysAndNames) {
  EXPECT_EQ(county_key("  Lewis and CLARK "), "lewis and clark");
  EXPECT_EQ(title_case("lewis and clark"), "Lewis And Clark");
  EXPECT_EQ(title_case("o'neil-big horn"), "O'Neil-Big Horn");
}

TEST_F(CountyRatesTest, CountsJoinCaseInsensitively) {
  CsvTable crashes = table("ID,COUNTY\n1,Gallatin\n2, gallatin \n3,\n4,Park\n");
  CountyCounts counts = county_crashes_from_table(crashes);
  EXPECT_EQ(counts.size(), 2u);
  EXPECT_EQ(counts.at("gallatin"), 2);
  EXPECT_EQ(counts.at("park"), 1);

  CsvTable census =
      table("COUNTY,TOT_POP\nGALLATIN,100000\nPark,17000\nPetroleum,abc\n");
  CountyPopulations pops = county_populations_from_table(census);
  EXPECT_EQ(pops.at("gallatin"), 100000);
  EXPECT_EQ(pops.at("petroleum"), 0);
}

TEST_F(CountyRatesTest, RankingByRateDescending) {
  CountyCounts counts{{"gallatin", 50}, {"park", 34}, {"nowhere", 3}};
  CountyPopulations pops{{"gallatin", 100000}, {"park", 17000},
                         {"garfield", 1200}, {"petroleum", 0}};
  std::vector<CountyRate> rows = rank_counties(counts, pops);
  ASSERT_EQ(rows.size(), 5u);

  EXPECT_EQ(rows[0].county, "Park");
  EXPECT_DOUBLE_EQ(*rows[0].per_100k, 200.0);
  EXPECT_EQ(rows[1].county, "Gallatin");
  EXPECT_DOUBLE_EQ(*rows[1].per_100k, 50.0);
  // census-only county, no crashes
  EXPECT_EQ(rows[2].county, "Garfield");
  EXPECT_EQ(rows[2].total_crashes, 0);
  EXPECT_DOUBLE_EQ(*rows[2].per_100k, 0.0);
  // no usable population: last, by name
  EXPECT_EQ(rows[3].county, "Nowhere");
  EXPECT_FALSE(rows[3].per_100k.has_value());
  EXPECT_EQ(rows[4].county, "Petroleum");
}

TEST_F(CountyRatesTest, RankingCsv) {
  std::vector<CountyRate> rows{{"Park", 34, 200.0},
                               {"Lewis And Clark", 1, 1.0 / 3.0},
                               {"Nowhere", 3, std::nullopt}};
  std::ostringstream out;
  write_county_ranking(rows, out);
  EXPECT_EQ(out.str(), "county,totalAccidents,accidentsPer100kResidents\n"
                       "Park,34,200.00\n"
                       "Lewis And Clark,1,0.33\n"
                       "Nowhere,3,\n");
}

TEST_F(CountyRatesTest, MissingColumnsThrow) {
  EXPECT_THROW(county_crashes_from_table(table("ID\n1\n")), std::runtime_error);
  EXPECT_THROW(county_populations_from_table(table("COUNTY\nPark\n")),
               std::runtime_error);
}
