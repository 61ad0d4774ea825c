#include "util/config.h"

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <filesystem>
#include <format>
#include <fstream>
#include <glaze/glaze.hpp>
#include <iostream>

namespace fs = std::filesystem;

template <typename T>
T read(const std::string& path, bool dump) {
  T t{};

  if (!fs::exists(path)) {
    spdlog::info("[config] {} missing, using defaults", path);
  } else {
    auto ec = glz::read_file_json<glz::opts{.error_on_unknown_keys = false}>(
        t, path, std::string{});
    if (ec) {
      auto msg = glz::format_error(ec);
      std::cerr << std::format("[config] {} error {}\n", path, msg);
      spdlog::error("[config] {} error {}", path, msg);
      t = T{};
    }
  }

  if (T::debug && dump) {
    std::ofstream log{"logs/configs.log", std::ios::app};
    std::string buffer;
    auto _ = glz::write<glz::opts{.prettify = true}>(t, buffer);
    log << std::format("\"{}\": {}\n", T::name, buffer);
  }

  return t;
}

void Config::update() {
  if (debug_en)
    fs::remove("logs/configs.log");

  auto path = [this](const char* file) {
    return (fs::path{config_dir} / file).string();
  };

  api_config = read<APIConfig>(path("api.json"), debug_en);
  scan_config = read<ScanConfig>(path("scan.json"), debug_en);
  history_config = read<HistoryConfig>(path("history.json"), debug_en);

  engine.ind_config = read<IndicatorsConfig>(path("indicators.json"), debug_en);
  engine.stop_high_config =
      read<StopHighConfig>(path("stop_high.json"), debug_en);
  engine.turnaround_config =
      read<TurnaroundConfig>(path("turnaround.json"), debug_en);
  engine.legacy_config = read<LegacyConfig>(path("legacy.json"), debug_en);
  engine.sig_config = read<SignalConfig>(path("signal.json"), debug_en);
  engine.risk_config = read<RiskConfig>(path("risk.json"), debug_en);

  if (!delay_en) {
    scan_config.early_delay_ms = 0;
    scan_config.mid_delay_ms = 0;
    scan_config.late_delay_ms = 0;
  }
}

void Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("harvest");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug");

  program.add_argument("-n", "--no-delay")
      .default_value(false)
      .implicit_value(true)
      .help("Disable pacing between provider requests");

  program.add_argument("-c", "--config-dir")
      .help("Directory holding the json configs")
      .default_value(std::string{"config"});

  program.add_argument("-i", "--input")
      .help("Snapshot file to scan instead of the quote api")
      .default_value(std::string{""});

  program.add_argument("-o", "--output")
      .help("Where to write the generated signals")
      .default_value(std::string{"data/signals.json"});

  program.add_argument("symbols")
      .help("Symbols to scan, defaults to every symbol in the input")
      .remaining();

  program.add_argument("--nthreads")
      .help("Max number of concurrent scans")
      .default_value(size_t{0})
      .scan<'u', size_t>();

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    std::exit(1);
  }

  debug_en = program.get<bool>("--debug");
  delay_en = !program.get<bool>("--no-delay");
  config_dir = program.get<std::string>("--config-dir");
  input_path = program.get<std::string>("--input");
  output_path = program.get<std::string>("--output");

  if (program.is_used("symbols"))
    symbols = program.get<std::vector<std::string>>("symbols");

  update();

  auto n_threads = program.get<size_t>("--nthreads");
  if (n_threads > 0)
    scan_config.concurrency = n_threads;
}
