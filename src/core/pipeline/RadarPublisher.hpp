#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

#include "core/config/Config.hpp"
#include "core/net/Downloader.hpp"
#include "core/storage/OutputStore.hpp"
#include "ForecastProcessor.hpp"
#include "PipelineOrchestrator.hpp"
#include "WorkerPool.hpp"

namespace rpub {

class ManifestStore;

struct CycleSummary {
  uint64_t cycle = 0;
  std::time_t started_at = 0;
  std::vector<CycleReport> reports;   // one per enabled stream that ran
  std::vector<std::string> stream_errors;
};

// What the entry point and the scheduler drive: discover + fetch + render
// for every enabled stream.
class RadarPublisher {
public:
  RadarPublisher(const Config& cfg, ManifestStore& manifest, OutputStore& output);
  // Blocks until no cycle and no render job is running, including work a
  // timed-out shutdown left behind; jobs hold references into this object.
  ~RadarPublisher();

  // One pass over all enabled streams. A failure in one stream is logged
  // and recorded; the other streams still run.
  CycleSummary runCycle();

  // Published artifacts of the newest timestamp (issuance for forecasts)
  // whose full variant x scale set, and for forecasts every configured lead,
  // is on disk. Falls back to the newest timestamp when none is complete.
  std::vector<PublishedArtifact> latestArtifacts(Stream stream) const;

  // Stops new work and gives dispatched jobs up to grace to finish.
  bool shutdown(std::chrono::milliseconds grace);

  Downloader& downloader() { return downloader_; }
  PipelineOrchestrator& orchestrator() { return orchestrator_; }
  ForecastProcessor& forecast() { return forecast_; }
  WorkerPool& pool() { return pool_; }

private:
  const Config& cfg_;
  OutputStore& output_;
  WorkerPool pool_;
  Downloader downloader_;
  PipelineOrchestrator orchestrator_;
  ForecastProcessor forecast_;
  std::atomic<bool> stopping_{false};
  std::atomic<uint64_t> cycles_{0};

  std::mutex cycle_mu_;
  std::condition_variable cycle_cv_;
  int running_cycles_ = 0;
};

} // namespace rpub
