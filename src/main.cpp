#include "core/calendar.h"
#include "core/history.h"
#include "core/provider.h"
#include "core/scanner.h"
#include "core/serialization.h"
#include "sig/integrator.h"
#include "sig/signal_log.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

inline void init_logging() {
  auto pwd = fs::current_path().generic_string();
  auto log_name = std::format("{}/logs/{:%F_%R}.log", pwd, SysClock::now());
  auto link_name = pwd + "/logs/output.log";

  fs::remove(link_name);
  fs::create_symlink(log_name, link_name);

  auto file_logger = spdlog::basic_logger_mt("file_logger", log_name);
  spdlog::set_default_logger(file_logger);

  auto level = config.debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (fs::exists(path))
      continue;
    if (fs::create_directories(path))
      std::cout << "Created: " << dir << '\n';
    else
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

inline void print_summary(const ScanReport& report) {
  std::cout << std::format("scanned {} symbols in {:.1f}s, {} failed\n",
                           report.n_requested, report.elapsed_ms / 1000,
                           report.failures.size());

  for (auto& sig : report.signals) {
    if (sig.action == Action::Error)
      continue;

    std::vector<std::string> patterns;
    for (auto& d : sig.detections)
      if (d.detected())
        patterns.push_back(to_str(d.pattern));

    std::cout << std::format(
        "{:<8} {:<11} {:>6.1f}  entry {:>10.1f}  target {:>10.1f}  stop "
        "{:>10.1f}  {:>6} sh  {}{}\n",
        sig.symbol, to_str(sig.action), sig.strength, sig.entry_price,
        sig.profit_target, sig.stop_loss, group_thousands(sig.position.shares),
        join(patterns), sig.executable ? " *" : "");
  }

  for (auto& f : report.failures)
    std::cout << std::format("{:<8} failed: {}\n", f.symbol, f.reason);
}

int main(int argc, char* argv[]) {
  ensure_directories_exist({"logs", "data"});
  config.read_args(argc, argv);
  init_logging();

  std::unique_ptr<MarketDataProvider> source;
  std::vector<std::string> symbols = config.symbols;

  if (!config.input_path.empty()) {
    auto file = std::make_unique<SnapshotFileProvider>(config.input_path);
    if (symbols.empty())
      symbols = file->symbols();
    source = std::move(file);
  } else {
    if (config.api_config.base_url.empty()) {
      std::cerr << "no --input file and no api base_url configured\n";
      return 1;
    }
    source = std::make_unique<QuoteApi>(config.api_config);
  }

  if (symbols.empty()) {
    std::cerr << "nothing to scan\n";
    return 1;
  }

  CachedProvider provider{*source, config.scan_config};
  Calendar calendar{"data/calendar.csv"};
  FileHistoryStore history{config.history_config.path,
                           config.history_config.capacity};

  auto& sig_config = config.engine.sig_config;
  SignalLog log{sig_config.log_capacity, hours{sig_config.active_hours}};
  SignalIntegrator integrator{history, log};

  Scanner scanner{provider, integrator, calendar, config.engine,
                  config.scan_config};
  auto report = scanner.scan(std::move(symbols));

  if (!write_signals_json(config.output_path, report.signals))
    std::cerr << "failed to write " << config.output_path << '\n';

  print_summary(report);

  spdlog::info("[exit] {} signals logged, {} active", log.total_signals(),
               log.active_signals(now_jp_time()).size());
  std::cout << "[exit] main" << std::endl;
  return report.interrupted ? 130 : 0;
}
