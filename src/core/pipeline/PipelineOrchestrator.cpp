#include "PipelineOrchestrator.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <future>
#include <map>

#include "core/manifest/ManifestStore.hpp"
#include "core/naming/Naming.hpp"
#include "core/storage/OutputStore.hpp"
#include "WorkerPool.hpp"

using nlohmann::json;

namespace rpub {

namespace fs = std::filesystem;

const char* jobStatusName(JobStatus s) {
  switch (s) {
    case JobStatus::Published:   return "published";
    case JobStatus::Failed:      return "failed";
    case JobStatus::Quarantined: return "quarantined";
    case JobStatus::Skipped:     return "skipped";
    case JobStatus::Incomplete:  return "incomplete";
  }
  return "failed";
}

size_t CycleReport::count(JobStatus s) const {
  return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                           [s](const JobOutcome& o) { return o.status == s; }));
}

PipelineOrchestrator::PipelineOrchestrator(const Config& cfg, ManifestStore& manifest,
                                           OutputStore& output, WorkerPool& pool)
  : cfg_(cfg), manifest_(manifest), output_(output), pool_(pool),
    decoder_(cfg.product), png_(cfg.output.png_compression) {}

bool PipelineOrchestrator::claim(const std::string& key) {
  std::lock_guard<std::mutex> lock(inflight_mu_);
  return inflight_.insert(key).second;
}

void PipelineOrchestrator::release(const std::string& key) {
  std::lock_guard<std::mutex> lock(inflight_mu_);
  inflight_.erase(key);
}

bool PipelineOrchestrator::isInFlight(const std::string& key) const {
  std::lock_guard<std::mutex> lock(inflight_mu_);
  return inflight_.count(key) > 0;
}

JobOutcome PipelineOrchestrator::execute(const RenderJob& job) const {
  JobOutcome out;
  out.identifier = job.identifier;
  out.key = renderKey(job.stream, job.timestamp, job.lead_minutes);
  out.stage = Stage::Decode;

  try {
    ReflectivityGrid grid = decoder_.decodeFile(job.input_path);
    grid.lead_minutes = job.lead_minutes;

    // Observations are named by the container's nominal time; forecast
    // members by their bundle's issuance.
    std::time_t stamp = job.timestamp;
    if (job.stream == Stream::Current && grid.timestamp != job.timestamp) {
      spdlog::warn("{}: /what time {} differs from file name time {}; naming artifacts by /what",
                   job.identifier, formatUtc(grid.timestamp), formatUtc(job.timestamp));
      stamp = grid.timestamp;
    }

    std::vector<std::string> publish_errors;
    for (const ColorTable* table : ColorTable::all()) {
      for (int scale : cfg_.output.scales) {
        out.stage = Stage::Render;
        const std::vector<uint8_t> png = png_.encode(renderer_.render(grid, *table, scale));

        ArtifactKey key;
        key.stream = job.stream;
        key.timestamp = stamp;
        key.lead_minutes = job.lead_minutes;
        key.variant = table->name();
        key.scale = scale;

        out.stage = Stage::Publish;
        try {
          out.artifacts.push_back(output_.publish(
              key, std::string_view(reinterpret_cast<const char*>(png.data()), png.size())));
        } catch (const FilesystemError& e) {
          // only this artifact is lost; keep going with the rest
          spdlog::error("publish {} failed: {}", artifactFilename(key), e.what());
          publish_errors.push_back(e.what());
        }
      }
    }

    if (!publish_errors.empty()) {
      out.status = JobStatus::Failed;
      out.stage = Stage::Publish;
      out.error = publish_errors.front();
      return out;
    }
    out.status = JobStatus::Published;
    spdlog::info("{} rendered into {} artifacts", out.key, out.artifacts.size());
  } catch (const PipelineError& e) {
    out.status = e.permanent() ? JobStatus::Quarantined : JobStatus::Failed;
    out.stage = e.stage();
    out.error = e.what();
  } catch (const std::exception& e) {
    out.status = JobStatus::Failed;
    out.error = e.what();
  }
  if (out.status != JobStatus::Published) {
    spdlog::error("{} ({}) failed at {}: {}", out.key, job.identifier, stageName(out.stage), out.error);
  }
  return out;
}

std::vector<JobOutcome> PipelineOrchestrator::runJobs(const std::vector<RenderJob>& jobs) {
  struct Pending {
    std::string key;
    std::string identifier;
    std::future<JobOutcome> future;
  };

  std::vector<JobOutcome> outcomes;
  std::vector<Pending> pending;
  for (const RenderJob& job : jobs) {
    const std::string key = renderKey(job.stream, job.timestamp, job.lead_minutes);
    if (!claim(key)) {
      spdlog::info("{} already in flight, not duplicating", key);
      JobOutcome skipped;
      skipped.identifier = job.identifier;
      skipped.key = key;
      skipped.status = JobStatus::Skipped;
      outcomes.push_back(std::move(skipped));
      continue;
    }
    pending.push_back({key, job.identifier, pool_.submit([this, job] { return execute(job); })});
  }

  for (Pending& p : pending) {
    JobOutcome outcome;
    try {
      outcome = p.future.get();
    } catch (const ShutdownError& e) {
      outcome.identifier = p.identifier;
      outcome.key = p.key;
      outcome.status = JobStatus::Incomplete;
      outcome.stage = Stage::Cycle;
      outcome.error = e.what();
      spdlog::warn("{} not rendered: {}", p.key, e.what());
    } catch (const std::exception& e) {
      outcome.identifier = p.identifier;
      outcome.key = p.key;
      outcome.status = JobStatus::Failed;
      outcome.stage = Stage::Cycle;
      outcome.error = e.what();
    }
    release(p.key);
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

CycleReport PipelineOrchestrator::process(Stream stream, const std::vector<SourceFile>& files) {
  CycleReport report;
  report.stream = stream;
  report.delta = files.size();
  if (files.empty()) return report;

  std::vector<RenderJob> jobs;
  jobs.reserve(files.size());
  for (const SourceFile& f : files) {
    RenderJob job;
    job.identifier = f.name;
    job.input_path = f.local_path;
    job.stream = stream;
    job.timestamp = f.timestamp;
    jobs.push_back(std::move(job));
  }
  spdlog::info("Processing {} {} files on {} workers", jobs.size(), streamName(stream), pool_.worker_count());
  report.outcomes = runJobs(jobs);

  const int64_t now = static_cast<int64_t>(std::time(nullptr));
  for (const JobOutcome& o : report.outcomes) {
    switch (o.status) {
      case JobStatus::Published:
        manifest_.markProcessed(o.identifier, now);
        manifest_.appendHistory(o.identifier, "PUBLISHED", json({{"artifacts", o.artifacts}}).dump(), now);
        break;
      case JobStatus::Quarantined:
        manifest_.markQuarantined(o.identifier, stageName(o.stage), o.error, now);
        manifest_.appendHistory(o.identifier, "QUARANTINED",
                                json({{"stage", stageName(o.stage)}, {"error", o.error}}).dump(), now);
        break;
      case JobStatus::Failed:
        manifest_.markFailed(o.identifier, stageName(o.stage), o.error, 0, now);
        manifest_.appendHistory(o.identifier, "FAILED",
                                json({{"stage", stageName(o.stage)}, {"error", o.error}}).dump(), now);
        break;
      case JobStatus::Skipped:
      case JobStatus::Incomplete:
        break; // stays fetched; picked up again next cycle
    }
  }

  if (stream == Stream::Current) pruneRetention();
  return report;
}

void PipelineOrchestrator::pruneRetention() {
  const int limit = cfg_.storage.retained_timestamps;
  if (limit <= 0) return;

  const auto artifacts = output_.list(Stream::Current);
  std::set<std::time_t> stamps;
  for (const auto& a : artifacts) stamps.insert(a.key.timestamp);
  if (stamps.size() <= static_cast<size_t>(limit)) return;

  auto cutoff_it = stamps.end();
  std::advance(cutoff_it, -limit);
  const std::time_t oldest_kept = *cutoff_it;

  size_t removed = 0;
  for (const auto& a : artifacts) {
    if (a.key.timestamp >= oldest_kept) continue;
    try {
      output_.remove(a.key);
      ++removed;
    } catch (const FilesystemError& e) {
      spdlog::warn("retention: {}", e.what());
    }
  }

  std::error_code ec;
  for (fs::directory_iterator it(cfg_.dataDir(Stream::Current), ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    auto ts = extractTimestamp(name);
    if (ts && *ts < oldest_kept) {
      std::error_code rm;
      fs::remove(it->path(), rm);
    }
  }
  // retained_timestamps >= listing_window, so these names are past the
  // listing window and will not be discovered again
  const size_t forgotten = manifest_.forgetBefore(streamName(Stream::Current), oldest_kept);
  if (removed > 0 || forgotten > 0) {
    spdlog::info("retention: removed {} artifacts and {} manifest records older than {}",
                 removed, forgotten, formatUtc(oldest_kept));
  }
}

} // namespace rpub
