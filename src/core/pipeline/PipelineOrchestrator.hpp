#pragma once
#include <ctime>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "core/config/Config.hpp"
#include "core/decode/OdimDecoder.hpp"
#include "core/errors/Errors.hpp"
#include "core/net/Downloader.hpp"
#include "core/render/PngCodec.hpp"
#include "core/render/RadarRenderer.hpp"

namespace rpub {

class ManifestStore;
class OutputStore;
class WorkerPool;

// Immutable description of one decode + render + publish unit.
struct RenderJob {
  std::string identifier;   // source name used in logs and outcomes
  std::string input_path;   // local ODIM file
  Stream      stream = Stream::Current;
  std::time_t timestamp = 0;  // artifact timestamp (observation or issuance)
  int         lead_minutes = 0;
};

enum class JobStatus { Published, Failed, Quarantined, Skipped, Incomplete };
const char* jobStatusName(JobStatus s);

struct JobOutcome {
  std::string identifier;
  std::string key;
  JobStatus   status = JobStatus::Failed;
  Stage       stage = Stage::Decode;
  std::string error;
  std::vector<std::string> artifacts;   // published paths
};

struct CycleReport {
  Stream stream = Stream::Current;
  size_t delta = 0;
  std::vector<JobOutcome> outcomes;

  size_t count(JobStatus s) const;
};

// Fans render jobs for the current stream out over the worker pool. At most
// one job per (stream, timestamp, lead) runs at a time; a failed job never
// affects its siblings.
class PipelineOrchestrator {
public:
  PipelineOrchestrator(const Config& cfg, ManifestStore& manifest, OutputStore& output, WorkerPool& pool);

  // Decodes, renders and publishes every file, then records each outcome in
  // the manifest and applies output retention.
  CycleReport process(Stream stream, const std::vector<SourceFile>& files);

  // Dispatches jobs and waits for all of them. Jobs whose key is already in
  // flight come back as Skipped; jobs dropped at shutdown as Incomplete.
  std::vector<JobOutcome> runJobs(const std::vector<RenderJob>& jobs);

  // Decode + render + publish on the calling thread. Never throws.
  JobOutcome execute(const RenderJob& job) const;

  // Keeps the newest storage.retained_timestamps timestamps of the current
  // stream and deletes older artifacts and local source files.
  void pruneRetention();

  bool isInFlight(const std::string& key) const;

  const OutputStore& output() const { return output_; }

private:
  bool claim(const std::string& key);
  void release(const std::string& key);

  const Config& cfg_;
  ManifestStore& manifest_;
  OutputStore& output_;
  WorkerPool& pool_;
  OdimDecoder decoder_;
  RadarRenderer renderer_;
  PngCodec png_;

  mutable std::mutex inflight_mu_;
  std::set<std::string> inflight_;
};

} // namespace rpub
