#include "gtest/gtest.h"
#include "io/CsvTable.hpp"
#include "io/GeoJsonIO.hpp"
#include "io/RecordReader.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

class IoTest : public testing::Test {
public:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("roadrisk_io_" +
           std::string(testing::UnitTest::GetInstance()
                           ->current_test_info()
                           ->name()));
    fs::remove_all(dir);
  }
  void TearDown() override { fs::remove_all(dir); }

  static CsvTable table(const std::string &text) {
    std::istringstream in(text);
    return CsvTable::parse(in);
  }

  fs::path dir;
};

TEST_F(IoTest, CsvHeaderAndCells) {
  CsvTable t = table("\xEF\xBB\xBF" "CORR_ID, CORR_MP ,X\r\n"
                     "C1,000+0.0,\"a, \"\"quoted\"\" b\"\r\n"
                     "\r\n"
                     "C2,001+0.5\n");
  ASSERT_EQ(t.header().size(), 3u);
  EXPECT_EQ(t.header()[0], "CORR_ID");
  EXPECT_TRUE(t.hasColumn("CORR_MP"));
  EXPECT_EQ(t.rowCount(), 2u);
  EXPECT_EQ(t.get(0, "X"), "a, \"quoted\" b");
  EXPECT_EQ(t.get(1, "CORR_MP"), "001+0.5");
  // short row and unknown column
  EXPECT_EQ(t.get(1, "X"), "");
  EXPECT_EQ(t.get(0, "NOPE"), "");
  EXPECT_EQ(t.get(7, "CORR_ID"), "");
}

TEST_F(IoTest, QuotedFieldsSpanLines) {
  CsvTable t = table("CORRIDOR,NOTES,REF_POINT\r\n"
                     "C1,\"first line\r\nsecond, \"\"quoted\"\"\",005+0.0\r\n"
                     "C2,plain,006+0.0\n");
  ASSERT_EQ(t.rowCount(), 2u);
  EXPECT_EQ(t.get(0, "NOTES"), "first line\nsecond, \"quoted\"");
  EXPECT_EQ(t.get(0, "REF_POINT"), "005+0.0");
  EXPECT_EQ(t.get(1, "CORRIDOR"), "C2");

  auto crashes = crashes_from_table(t);
  ASSERT_EQ(crashes.size(), 2u);
  EXPECT_EQ(crashes[1].ref_point, "006+0.0");
}

TEST_F(IoTest, UnterminatedQuoteRunsToEnd) {
  CsvTable t = table("A,B\n1,\"open\n2,3\n");
  ASSERT_EQ(t.rowCount(), 1u);
  EXPECT_EQ(t.get(0, "B"), "open\n2,3");
}

TEST_F(IoTest, EmptyCsv) {
  CsvTable t = table("");
  EXPECT_TRUE(t.header().empty());
  EXPECT_EQ(t.rowCount(), 0u);
}

TEST_F(IoTest, RequireColumnsNamesTheMissingOne) {
  CsvTable t = table("CORRIDOR\nC1\n");
  try {
    t.requireColumns({"CORRIDOR", "REF_POINT"});
    FAIL() << "expected a missing column error";
  } catch (const std::runtime_error &e) {
    EXPECT_NE(std::string(e.what()).find("REF_POINT"), std::string::npos);
  }
  EXPECT_THROW(crashes_from_table(t), std::runtime_error);
}

TEST_F(IoTest, LoadMissingCsvThrows) {
  EXPECT_THROW(CsvTable::load((dir / "absent.csv").string()),
               std::runtime_error);
}

TEST_F(IoTest, WriteCsvRowQuotesWhenNeeded) {
  std::ostringstream out;
  write_csv_row(out, {"plain", "a,b", "say \"hi\"", ""});
  EXPECT_EQ(out.str(), "plain,\"a,b\",\"say \"\"hi\"\"\",\n");
  EXPECT_EQ(CsvTable::splitLine("plain,\"a,b\",\"say \"\"hi\"\"\","),
            (std::vector<std::string>{"plain", "a,b", "say \"hi\"", ""}));
}

TEST_F(IoTest, SegmentsFromTable) {
  CsvTable t = table("CORR_ID,CORR_MP,CORR_ENDMP,DEPT_ID,TYC_AADT,SEC_LNT_MI\n"
                     " c1 ,000+0.0,010+0.0,n-1a,1200,10\n"
                     "C2,bad,001+0.0,N-2,,\n");
  auto segs = segments_from_table(t);
  ASSERT_EQ(segs.size(), 2u);
  EXPECT_EQ(segs[0].key.corridor, "C1");
  EXPECT_EQ(segs[0].key.dept_id, "N-1A");
  EXPECT_DOUBLE_EQ(*segs[0].end_mp, 10.0);
  EXPECT_DOUBLE_EQ(*segs[0].aadt, 1200.0);
  EXPECT_DOUBLE_EQ(*segs[0].length_mi, 10.0);
  EXPECT_FALSE(segs[1].start_mp.has_value());
  EXPECT_FALSE(segs[1].aadt.has_value());
  EXPECT_EQ(segs[1].years_with_data, 0);
}

TEST_F(IoTest, RoutePairsFromTable) {
  CsvTable t = table("DEPARTMENTAL ROUTE,SIGNED ROUTE\nN-1A,US 93\nN-2,\n");
  auto pairs = route_pairs_from_table(t);
  ASSERT_EQ(pairs.size(), 2u);
  EXPECT_EQ(pairs[0].first, "N-1A");
  EXPECT_EQ(pairs[1].second, "");
}

TEST_F(IoTest, RecordsFromJson) {
  Json segs = Json::parse(R"([{"CORR_ID":"C1","CORR_MP":"0+0.0",
      "CORR_ENDMP":"1+0.0","DEPT_ID":"N-1","TYC_AADT":500}, 7])");
  auto recs = segments_from_json(segs);
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_DOUBLE_EQ(*recs[0].aadt, 500.0);
  EXPECT_THROW(segments_from_json(Json::object()), std::runtime_error);

  auto crashes = crashes_from_json(
      Json::parse(R"([{"CORRIDOR":"C1","REF_POINT":"0+0.5"}])"));
  ASSERT_EQ(crashes.size(), 1u);
  EXPECT_EQ(crashes[0].ref_point, "0+0.5");
}

TEST_F(IoTest, FeatureCollectionSaveAndLoad) {
  FeatureCollection fc;
  Feature f;
  f.geometry.type = "LineString";
  f.geometry.raw = Json{{"type", "LineString"},
                        {"coordinates", {{1.0, 2.0}, {3.0, 4.0}}}};
  f.properties = Json{{"SIGNED_ROUTE", "US 93"}, {"TOTAL_CRASHES", 3}};
  fc.features.push_back(f);

  const std::string path = (dir / "nested" / "out.geojson").string();
  save_feature_collection(fc, path);
  ASSERT_TRUE(fs::exists(path));

  std::ifstream in(path);
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  EXPECT_EQ(text.find('\n'), std::string::npos);

  FeatureCollection back = load_feature_collection(path);
  ASSERT_EQ(back.features.size(), 1u);
  EXPECT_EQ(back.features[0].geometry.type, "LineString");
  EXPECT_EQ(back.features[0].properties, f.properties);
}

TEST_F(IoTest, MalformedGeoJsonReportsPosition) {
  fs::create_directories(dir);
  const std::string path = (dir / "bad.geojson").string();
  {
    std::ofstream out(path);
    out << "{\n  \"type\": \"FeatureCollection\",\n  \"features\": [,]\n}";
  }
  try {
    load_feature_collection(path);
    FAIL() << "expected a parse error";
  } catch (const std::runtime_error &e) {
    EXPECT_NE(std::string(e.what()).find(path + ":3:"), std::string::npos)
        << e.what();
  }
  EXPECT_THROW(load_feature_collection((dir / "none.geojson").string()),
               std::runtime_error);
}

TEST_F(IoTest, LineColFromByteOffset) {
  const std::string s = "ab\ncd\nef";
  EXPECT_EQ(calc_line_col(s, 0), (std::pair<std::size_t, std::size_t>(1, 1)));
  EXPECT_EQ(calc_line_col(s, 4), (std::pair<std::size_t, std::size_t>(2, 2)));
  EXPECT_EQ(calc_line_col(s, 100).first, 3u);
}

TEST_F(IoTest, PropertiesCsv) {
  FeatureCollection fc;
  Feature f;
  f.properties = Json{{"A", "x,y"}, {"B", 2}};
  fc.features.push_back(f);
  std::ostringstream out;
  write_properties_csv(fc, {"A", "B", "C"}, out);
  EXPECT_EQ(out.str(), "A,B,C\n\"x,y\",2,\n");
}
