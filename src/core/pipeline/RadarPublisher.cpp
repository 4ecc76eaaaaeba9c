#include "RadarPublisher.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>
#include <map>
#include <set>
#include <tuple>

#include "core/errors/Errors.hpp"
#include "core/manifest/ManifestStore.hpp"
#include "core/naming/Naming.hpp"
#include "core/render/ColorTable.hpp"

namespace rpub {

RadarPublisher::RadarPublisher(const Config& cfg, ManifestStore& manifest, OutputStore& output)
  : cfg_(cfg), output_(output),
    pool_(static_cast<size_t>(cfg.workers.pool_size)),
    downloader_(cfg, manifest),
    orchestrator_(cfg, manifest, output, pool_),
    forecast_(cfg, manifest, output, orchestrator_) {
  for (Stream s : cfg_.enabledStreams()) output_.clearStaging(s);
}

RadarPublisher::~RadarPublisher() {
  std::unique_lock<std::mutex> lock(cycle_mu_);
  if (running_cycles_ > 0 || pool_.active_threads() > 0) {
    spdlog::warn("waiting for abandoned work before releasing the pipeline");
  }
  cycle_cv_.wait(lock, [this] { return running_cycles_ == 0; });
  lock.unlock();
  pool_.wait_idle();
}

CycleSummary RadarPublisher::runCycle() {
  {
    std::lock_guard<std::mutex> lock(cycle_mu_);
    ++running_cycles_;
  }
  struct CycleGuard {
    RadarPublisher& p;
    ~CycleGuard() {
      {
        std::lock_guard<std::mutex> lock(p.cycle_mu_);
        --p.running_cycles_;
      }
      p.cycle_cv_.notify_all();
    }
  } guard{*this};

  CycleSummary summary;
  summary.cycle = ++cycles_;
  summary.started_at = std::time(nullptr);

  for (Stream stream : cfg_.enabledStreams()) {
    if (stopping_.load()) {
      spdlog::info("cycle {}: shutdown requested, skipping {} stream", summary.cycle, streamName(stream));
      break;
    }
    try {
      const auto delta = downloader_.discover(stream);
      const auto fetched = downloader_.fetchAll(delta);
      CycleReport report = stream == Stream::Current
          ? orchestrator_.process(stream, fetched)
          : forecast_.process(fetched);
      report.delta = delta.size();
      spdlog::info("cycle {} {}: delta={} published={} failed={} quarantined={} skipped={} incomplete={}",
                   summary.cycle, streamName(stream), report.delta,
                   report.count(JobStatus::Published), report.count(JobStatus::Failed),
                   report.count(JobStatus::Quarantined), report.count(JobStatus::Skipped),
                   report.count(JobStatus::Incomplete));
      summary.reports.push_back(std::move(report));
    } catch (const PipelineError& e) {
      // listing failed after retries; last published artifacts stay served
      spdlog::error("cycle {} {} stream failed at {}: {}", summary.cycle, streamName(stream),
                    stageName(e.stage()), e.what());
      summary.stream_errors.push_back(std::string(streamName(stream)) + ": " + e.what());
    }
  }
  return summary;
}

std::vector<PublishedArtifact> RadarPublisher::latestArtifacts(Stream stream) const {
  auto all = output_.list(stream);
  if (all.empty()) return all;

  std::set<std::tuple<int, std::string, int>> expected;
  const std::vector<int> leads = stream == Stream::Forecast ? cfg_.forecast.lead_minutes : std::vector<int>{0};
  for (int lead : leads) {
    for (const ColorTable* table : ColorTable::all()) {
      for (int scale : cfg_.output.scales) expected.emplace(lead, table->name(), scale);
    }
  }

  std::map<std::time_t, std::set<std::tuple<int, std::string, int>>, std::greater<std::time_t>> present;
  for (const auto& a : all) present[a.key.timestamp].emplace(a.key.lead_minutes, a.key.variant, a.key.scale);

  std::time_t chosen = present.begin()->first;
  for (const auto& [ts, keys] : present) {
    if (std::includes(keys.begin(), keys.end(), expected.begin(), expected.end())) {
      chosen = ts;
      break;
    }
  }
  if (chosen != present.begin()->first) {
    spdlog::debug("{} listing serves {}; {} is still partial", streamName(stream), formatUtc(chosen),
                  formatUtc(present.begin()->first));
  }

  std::vector<PublishedArtifact> out;
  for (auto& a : all) {
    if (a.key.timestamp == chosen) out.push_back(std::move(a));
  }
  return out;
}

bool RadarPublisher::shutdown(std::chrono::milliseconds grace) {
  stopping_.store(true);
  const bool clean = pool_.shutdown(grace);
  if (!clean) spdlog::warn("render jobs did not finish within {} ms", grace.count());
  return clean;
}

} // namespace rpub
