#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include <swa/analysis.hpp>
#include <swa/config.hpp>
#include <swa/io.hpp>
#include <swa/log.hpp>
#include <swa/report.hpp>

using namespace swa;

int main(int argc, char** argv) {
  cxxopts::Options options("swim_analyze", "Per-lap metrics from a captured swim race");
  options.add_options()
    ("events", "Race events CSV (type,time)", cxxopts::value<std::string>())
    ("r,race", "Race details, e.g. \"Men's 200 IM\"", cxxopts::value<std::string>())
    ("s,swimmer", "Swimmer name", cxxopts::value<std::string>()->default_value(""))
    ("session", "Session label", cxxopts::value<std::string>()->default_value(""))
    ("relay", "Relay split", cxxopts::value<bool>()->default_value("false"))
    ("m,manual", "Manual measurements CSV", cxxopts::value<std::string>())
    ("c,config", "Analysis config CSV (key,value)", cxxopts::value<std::string>())
    ("o,out", "Output prefix for <prefix>_laps.csv and <prefix>_report.json",
     cxxopts::value<std::string>())
    ("v,verbose", "Debug logging")
    ("h,help", "Print usage");
  options.parse_positional({"events"});
  options.positional_help("<events.csv>");

  cxxopts::ParseResult args;
  try {
    args = options.parse(argc, argv);
  } catch (const std::exception& e) {  // cxxopts parse errors
    std::cerr << e.what() << "\n" << options.help() << "\n";
    return 2;
  }
  if (args.count("help") || !args.count("events") || !args.count("race")) {
    std::cout << options.help() << "\n";
    return args.count("help") ? 0 : 2;
  }

  AnalysisConfig cfg;
  Logger log = Logger::to_stderr(cfg.log_level);
  if (args.count("config")) {
    const auto path = args["config"].as<std::string>();
    auto loaded = load_config_csv(path, log);
    if (!loaded) {
      log.error("cannot open config file '%s'", path.c_str());
      return 1;
    }
    cfg = *loaded;
  }
  if (args.count("verbose")) cfg.log_level = LogLevel::Debug;
  log = Logger::to_stderr(cfg.log_level);

  auto ctx = parse_race_details(args["race"].as<std::string>());
  if (!ctx) {
    log.error("invalid race details '%s' (expected e.g. \"Men's 50 Freestyle\")",
              args["race"].as<std::string>().c_str());
    return 2;
  }
  ctx->swimmer = args["swimmer"].as<std::string>();
  ctx->session = args["session"].as<std::string>();
  ctx->relay = args["relay"].as<bool>();

  const auto events_path = args["events"].as<std::string>();
  const auto events = load_events_csv(events_path, log);
  if (!events) {
    log.error("cannot open events file '%s'", events_path.c_str());
    return 1;
  }

  std::optional<ManualMeasurements> manual;
  if (args.count("manual")) {
    const auto path = args["manual"].as<std::string>();
    manual = load_manual_csv(path, log);
    if (!manual) {
      log.error("cannot open manual measurements file '%s'", path.c_str());
      return 1;
    }
  }

  RaceAnalysis analysis;
  try {
    analysis = analyze_race(*events, *ctx, manual ? &*manual : nullptr, cfg, log);
  } catch (const RaceDataError& e) {
    log.error("%s (in '%s'); no report written", e.what(), events_path.c_str());
    return 1;
  }

  std::cout << "\n========================================\n"
            << "Race Summary\n"
            << "========================================\n"
            << summary_string(analysis);

  if (args.count("out")) {
    const auto prefix = args["out"].as<std::string>();
    const std::string laps_path = prefix + "_laps.csv";
    const std::string json_path = prefix + "_report.json";
    std::ofstream lf(laps_path, std::ios::binary);
    std::ofstream jf(json_path, std::ios::binary);
    if (!lf || !jf) {
      log.error("cannot write report files with prefix '%s'", prefix.c_str());
      return 1;
    }
    write_lap_stats_csv(lf, analysis.laps);
    write_report_json(jf, analysis);
    log.info("report written: %s, %s", laps_path.c_str(), json_path.c_str());
  }
  return 0;
}
