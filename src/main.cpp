// src/main.cpp
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/config/Config.hpp"
#include "core/manifest/InitDb.hpp"
#include "core/manifest/ManifestStore.hpp"
#include "core/pipeline/RadarPublisher.hpp"
#include "core/scheduler/Scheduler.hpp"
#include "core/storage/OutputStore.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

// Configured path first, then CWD (the build copies it there), then the source tree.
std::string findSchemaPath(const rpub::Config& cfg) {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::path(cfg.storage.schema_path),
    fs::current_path() / "schema.sql",
    fs::path("src/core/manifest/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in " + cfg.storage.schema_path +
                           ", the working directory and src/core/manifest)");
}

void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

void setupLogging(const rpub::Config& cfg) {
  auto logger = spdlog::stdout_color_mt("rpub");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e %^%l%$ [%n] %v");
  spdlog::set_level(spdlog::level::from_str(cfg.logging.level));
}

rpub::Config loadConfig(int argc, char** argv) {
  std::string path = get_env_or("RPUB_CONFIG", "");
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") path = argv[i + 1];
  }
  rpub::Config cfg = path.empty() ? rpub::defaultConfig() : rpub::loadConfigFile(path);
  rpub::applyEnvOverrides(cfg);
  rpub::validateConfig(cfg);
  return cfg;
}

// Directories and schema; safe to run on every start.
void bootstrap(const rpub::Config& cfg) {
  namespace fs = std::filesystem;
  for (rpub::Stream s : {rpub::Stream::Current, rpub::Stream::Forecast}) {
    fs::create_directories(cfg.dataDir(s));
    fs::create_directories(cfg.outputDir(s));
  }
  ensure_dirs_for(cfg.storage.db_path);
  rpub::initDatabase(cfg.storage.db_path, findSchemaPath(cfg));
}

bool hasFlag(int argc, char** argv, const char* flag) {
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == flag) return true;
  }
  return false;
}

void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init  [--config FILE]   # create directories and SQLite schema\n"
            << "  " << argv0 << " --once  [--config FILE]   # run one publishing cycle and exit\n"
            << "  " << argv0 << " --serve [--config FILE]   # scheduler + HTTP server until SIGINT/SIGTERM\n";
}

int serve(const rpub::Config& cfg, rpub::RadarPublisher& publisher) {
  using namespace std::chrono;

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  rpub::Scheduler scheduler(seconds(cfg.schedule.interval_seconds), [&publisher] {
    publisher.runCycle();
  });

  rpub::HttpServer http(cfg, publisher);
  std::thread http_thread;
  if (cfg.server.enabled) {
    http_thread = std::thread([&] {
      if (!http.listen(cfg.server.host, cfg.server.port)) g_stop.store(true);
    });
  }

  scheduler.start();
  while (!g_stop.load()) std::this_thread::sleep_for(milliseconds(200));

  spdlog::info("Shutdown requested; waiting up to {} s for the running cycle",
               cfg.schedule.shutdown_grace_seconds);
  const milliseconds grace = seconds(cfg.schedule.shutdown_grace_seconds);
  const auto deadline = steady_clock::now() + grace;
  const bool cycle_done = scheduler.stop(grace);
  const auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
  const bool jobs_done = publisher.shutdown(std::max(left, milliseconds(0)));

  if (cfg.server.enabled) {
    http.stop();
    if (http_thread.joinable()) http_thread.join();
  }
  spdlog::info("Stopped after {} cycles ({} failed, {} ticks skipped)",
               scheduler.completedCycles(), scheduler.failedCycles(), scheduler.skippedTicks());
  if (!cycle_done || !jobs_done) {
    // Abandoned threads still reference the publisher, manifest and output
    // store; leave without running their destructors.
    spdlog::error("Unfinished work abandoned after {} s grace; exiting without cleanup",
                  cfg.schedule.shutdown_grace_seconds);
    spdlog::default_logger()->flush();
    std::cout.flush();
    std::_Exit(3);
  }
  return 0;
}

} // namespace

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const bool init = hasFlag(argc, argv, "--init");
    const bool once = hasFlag(argc, argv, "--once");
    const bool serving = hasFlag(argc, argv, "--serve");
    if (!init && !once && !serving) {
      print_usage(argv[0]);
      return 1;
    }

    const rpub::Config cfg = loadConfig(argc, argv);
    setupLogging(cfg);
    bootstrap(cfg);

    if (init) {
      std::cout << "DB initialized at: " << cfg.storage.db_path << "\n";
      return 0;
    }

    rpub::ManifestStore manifest(cfg.storage.db_path);
    rpub::OutputStore output(cfg.storage.output_root);
    rpub::RadarPublisher publisher(cfg, manifest, output);

    if (once) {
      const rpub::CycleSummary summary = publisher.runCycle();
      const bool clean = publisher.shutdown(std::chrono::seconds(cfg.schedule.shutdown_grace_seconds));
      for (const auto& err : summary.stream_errors) std::cerr << "Stream error: " << err << "\n";
      return clean ? 0 : 3;
    }

    return serve(cfg, publisher);
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
