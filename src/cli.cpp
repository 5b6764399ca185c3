// roadrisk_cli: batch front end over the engine.
//
//   roadrisk_cli merge  --segments TYC_2023.csv [--year-table TYC_2022.csv]...
//                       --crashes crashes.csv [--geometry TYC_2023.json]...
//                       [--routes on_system_routes.csv] [--out-dir DIR]
//   roadrisk_cli dedup  --merged merged.geojson --candidates hwys.geojson
//                       [--out mini.json]
//   roadrisk_cli groups --in merged.geojson [--routes-list US-2,I-90]
//                       [--out-dir DIR]
//   roadrisk_cli rates  --in merged.geojson
//   roadrisk_cli counties --crashes crashes.csv --census census.csv
//                       [--out ranking_by_county.csv]
//
// Every command also takes --config <settings.json>.

#include "core/CountyRates.hpp"
#include "core/MergePipeline.hpp"
#include "core/RouteGroups.hpp"
#include "core/TrafficAggregator.hpp"
#include "io/CountyTables.hpp"
#include "io/CsvTable.hpp"
#include "io/GeoJsonIO.hpp"
#include "io/RecordReader.hpp"
#include "models/params.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// ultra-light arg parser
struct Options {
  std::string command;
  std::string config = "config/settings.json"; // --config
  // merge
  std::string segments;                  // --segments base year table
  std::vector<std::string> year_tables;  // --year-table (repeatable)
  std::string crashes;                   // --crashes
  std::vector<std::string> geometry;     // --geometry (repeatable)
  std::string routes;                    // --routes on-system routes table
  std::string out_dir;                   // --out-dir, per-command default
  // dedup
  std::string merged;     // --merged
  std::string candidates; // --candidates
  std::string out; // --out, per-command default
  // groups / rates
  std::string input;       // --in
  std::string routes_list; // --routes-list a,b,c
  // counties
  std::string census; // --census
};

static Options parse(int argc, char **argv) {
  Options o;
  if (argc > 1)
    o.command = argv[1];
  for (int i = 2; i < argc; i++) {
    std::string a(argv[i]);
    auto nexts = [&](std::string &tgt) {
      if (i + 1 < argc)
        tgt = argv[++i];
      else
        throw std::runtime_error("missing value after " + a);
    };
    auto nextv = [&](std::vector<std::string> &tgt) {
      std::string v;
      nexts(v);
      tgt.push_back(v);
    };
    if (a == "--config")
      nexts(o.config);
    else if (a == "--segments")
      nexts(o.segments);
    else if (a == "--year-table")
      nextv(o.year_tables);
    else if (a == "--crashes")
      nexts(o.crashes);
    else if (a == "--geometry")
      nextv(o.geometry);
    else if (a == "--routes")
      nexts(o.routes);
    else if (a == "--out-dir")
      nexts(o.out_dir);
    else if (a == "--merged")
      nexts(o.merged);
    else if (a == "--candidates")
      nexts(o.candidates);
    else if (a == "--out")
      nexts(o.out);
    else if (a == "--in")
      nexts(o.input);
    else if (a == "--routes-list")
      nexts(o.routes_list);
    else if (a == "--census")
      nexts(o.census);
    else
      std::cerr << "[warn] unknown arg: " << a << " (ignored)\n";
  }
  if (o.out_dir.empty())
    o.out_dir = (o.command == "groups") ? "output/individual_roads"
                                        : "output/merged_data";
  if (o.out.empty())
    o.out = (o.command == "counties")
                ? "output/ranking-by-county/ranking_by_county.csv"
                : "output/mini_highways/mini_mt_highways.json";
  return o;
}

static void require(const std::string &value, const char *flag) {
  if (value.empty())
    throw std::runtime_error(std::string("missing required ") + flag);
}

static Settings load_settings(const std::string &path) {
  if (!fs::exists(path)) {
    std::cerr << "[warn] " << path << " not found, using defaults\n";
    return Settings{};
  }
  return Settings::load(path);
}

static std::vector<std::string> split_list(const std::string &csv) {
  std::vector<std::string> out;
  for (auto &s : CsvTable::splitLine(csv)) {
    if (!s.empty())
      out.push_back(s);
  }
  return out;
}

static int run_merge(const Options &o, const Settings &settings) {
  require(o.segments, "--segments");
  require(o.crashes, "--crashes");

  MergeInputs in;
  in.base_year = segments_from_table(CsvTable::load(o.segments));
  for (const auto &path : o.year_tables) {
    if (!fs::exists(path)) {
      std::cerr << "[warn] yearly table " << path << " not found (skipped)\n";
      continue;
    }
    in.other_years.push_back(segments_from_table(CsvTable::load(path)));
  }
  in.crashes = crashes_from_table(CsvTable::load(o.crashes));
  for (const auto &path : o.geometry) {
    if (!fs::exists(path)) {
      std::cerr << "[warn] geometry file " << path << " not found (skipped)\n";
      continue;
    }
    in.geometry_sources.push_back(load_feature_collection(path));
  }
  if (!o.routes.empty()) {
    if (fs::exists(o.routes))
      in.signed_routes = build_signed_route_map(
          route_pairs_from_table(CsvTable::load(o.routes)));
    else
      std::cerr << "[warn] routes table " << o.routes << " not found\n";
  }

  MergePipeline pipeline(settings.rates);
  MergeOutputs out = pipeline.run(in);

  fs::create_directories(o.out_dir);
  const std::string geo_path =
      (fs::path(o.out_dir) / "merged_traffic_lines.geojson").string();
  save_feature_collection(out.lines, geo_path);
  if (!out.lines.features.empty()) {
    const std::string csv_path =
        (fs::path(o.out_dir) / "merged_traffic_lines.csv").string();
    std::ofstream csv(csv_path);
    if (!csv)
      throw std::runtime_error("Cannot write " + csv_path);
    write_properties_csv(out.lines, merged_columns(), csv);
  }

  std::cout << "Crashes matched: " << out.crash_summary.matched
            << ", unmatched: " << out.crash_summary.unmatched << "\n";
  std::cout << "Wrote " << out.lines.features.size() << " lines to "
            << o.out_dir << "\n";
  return 0;
}

static int run_dedup(const Options &o, const Settings &settings) {
  require(o.merged, "--merged");
  require(o.candidates, "--candidates");
  const FeatureCollection merged = load_feature_collection(o.merged);
  const FeatureCollection candidates = load_feature_collection(o.candidates);

  DedupResult result = deduplicate_lines(merged, candidates, settings.matching);
  const std::size_t kept = result.kept.size();
  save_feature_collection(FeatureCollection{std::move(result.kept)}, o.out);

  std::cout << "Total candidate features: " << candidates.features.size()
            << "\n";
  std::cout << "Removed (matched) features: " << result.removed << "\n";
  std::cout << "Kept (unmatched) features: " << kept << "\n";
  std::error_code ec;
  const auto in_size = fs::file_size(o.candidates, ec);
  const auto out_size = ec ? 0 : fs::file_size(o.out, ec);
  if (!ec) {
    std::cout << std::fixed << std::setprecision(2)
              << "Input file size: " << in_size / 1024.0 / 1024.0 << " MB\n"
              << "Output file size: " << out_size / 1024.0 / 1024.0
              << " MB\n";
  }
  return 0;
}

static int run_groups(const Options &o, const Settings &settings) {
  require(o.input, "--in");
  const FeatureCollection merged = load_feature_collection(o.input);
  SignedRouteIndex index(merged.features);

  const auto routes = split_list(o.routes_list);
  const auto outputs = routes.empty()
                           ? build_route_groups(index, settings.route_groups)
                           : build_route_files(index, routes);
  for (const auto &g : outputs) {
    const std::string path = (fs::path(o.out_dir) / g.file_name).string();
    save_feature_collection(g.features, path);
    std::cout << "Wrote " << g.features.features.size() << " features for \""
              << g.name << "\" to " << path << "\n";
  }
  return 0;
}

static void print_summary(const char *title, const RateSummary &s) {
  std::cout << "\n" << title << "\n"
            << "  Number of segments: " << s.segments << "\n"
            << "  Total accidents: " << s.total_crashes << "\n"
            << std::fixed << std::setprecision(0)
            << "  Total daily miles: " << s.daily_vmt << "\n"
            << std::setprecision(2)
            << "  Total road miles: " << s.total_length_mi << "\n"
            << "  Weighted avg crash rate: " << s.weighted_rate
            << " per 100M VMT\n";
  if (s.miles_per_crash > 0)
    std::cout << std::setprecision(0)
              << "  Expected miles per crash: " << s.miles_per_crash
              << " miles\n";
  else
    std::cout << "  Expected miles per crash: N/A (no crashes)\n";
}

static int run_rates(const Options &o) {
  require(o.input, "--in");
  const FeatureCollection merged = load_feature_collection(o.input);
  const CategoryRates r = weighted_rates(merged.features);
  print_summary("All roads", r.all);
  print_summary("Interstates", r.interstate);
  print_summary("Non-interstates", r.non_interstate);
  if (r.interstate.weighted_rate > 0 && r.non_interstate.weighted_rate > 0)
    std::cout << std::setprecision(2)
              << "\nCrash rate ratio (non-interstate/interstate): "
              << r.non_interstate.weighted_rate / r.interstate.weighted_rate
              << "x\n";
  return 0;
}

static int run_counties(const Options &o) {
  require(o.crashes, "--crashes");
  require(o.census, "--census");
  const CountyPopulations pops =
      county_populations_from_table(CsvTable::load(o.census));
  const CountyCounts counts =
      county_crashes_from_table(CsvTable::load(o.crashes));
  const auto ranking = rank_counties(counts, pops);

  const fs::path out_path(o.out);
  if (out_path.has_parent_path())
    fs::create_directories(out_path.parent_path());
  std::ofstream csv(o.out);
  if (!csv)
    throw std::runtime_error("Cannot write " + o.out);
  write_county_ranking(ranking, csv);
  std::cout << "Wrote ranking CSV to: " << o.out << "\n";
  return 0;
}

int main(int argc, char **argv) {
  try {
    const Options opt = parse(argc, argv);
    const Settings settings = load_settings(opt.config);
    if (opt.command == "merge")
      return run_merge(opt, settings);
    if (opt.command == "dedup")
      return run_dedup(opt, settings);
    if (opt.command == "groups")
      return run_groups(opt, settings);
    if (opt.command == "rates")
      return run_rates(opt);
    if (opt.command == "counties")
      return run_counties(opt);
    std::cerr << "Usage: roadrisk_cli <merge|dedup|groups|rates|counties> "
                 "[options]\n";
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
}
