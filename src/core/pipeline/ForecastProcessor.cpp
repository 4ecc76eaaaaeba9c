#include "ForecastProcessor.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <set>

#include "core/errors/Errors.hpp"
#include "core/manifest/ManifestStore.hpp"
#include "core/naming/Naming.hpp"
#include "core/render/ColorTable.hpp"
#include "core/storage/OutputStore.hpp"
#include "TarReader.hpp"

using nlohmann::json;

namespace rpub {

namespace fs = std::filesystem;

namespace {

bool endsWithHdf(const std::string& name) {
  return name.size() > 4 && name.compare(name.size() - 4, 4, ".hdf") == 0;
}

} // namespace

ForecastProcessor::ForecastProcessor(const Config& cfg, ManifestStore& manifest, OutputStore& output,
                                     PipelineOrchestrator& orchestrator)
  : cfg_(cfg), manifest_(manifest), output_(output), orchestrator_(orchestrator) {}

std::string ForecastProcessor::issuanceDir(std::time_t issuance) const {
  return (fs::path(cfg_.dataDir(Stream::Forecast)) / timestampStub(issuance)).string();
}

std::vector<ForecastMember> ForecastProcessor::extract(const SourceFile& bundle) const {
  spdlog::info("Extracting forecast bundle {}", bundle.name);
  const auto paths = extractTar(bundle.local_path, issuanceDir(bundle.timestamp), endsWithHdf);
  const std::set<int> wanted(cfg_.forecast.lead_minutes.begin(), cfg_.forecast.lead_minutes.end());

  std::vector<ForecastMember> members;
  for (const std::string& path : paths) {
    const std::string name = fs::path(path).filename().string();
    auto valid = extractTimestamp(name);
    if (!valid) {
      spdlog::debug("Skipping forecast member {} (missing timestamp)", name);
      continue;
    }
    const int lead = static_cast<int>(std::lround(std::difftime(*valid, bundle.timestamp) / 60.0));
    if (lead < 0) {
      spdlog::debug("Skipping forecast member {} (precedes issuance {})", name, formatUtc(bundle.timestamp));
      continue;
    }
    if (auto label = extractLeadLabel(name); label && *label != lead) {
      spdlog::debug("Forecast member {} label ft{} disagrees with timestamp offset {}", name, *label, lead);
    }
    if (!wanted.count(lead)) {
      spdlog::debug("Ignoring forecast member {} (lead {} not configured)", name, lead);
      continue;
    }
    members.push_back({path, lead});
  }
  std::sort(members.begin(), members.end(),
            [](const ForecastMember& a, const ForecastMember& b) { return a.lead_minutes < b.lead_minutes; });
  return members;
}

bool ForecastProcessor::leadPublished(std::time_t issuance, int lead) const {
  for (const ColorTable* table : ColorTable::all()) {
    for (int scale : cfg_.output.scales) {
      ArtifactKey key;
      key.stream = Stream::Forecast;
      key.timestamp = issuance;
      key.lead_minutes = lead;
      key.variant = table->name();
      key.scale = scale;
      if (!output_.exists(key)) return false;
    }
  }
  return true;
}

bool ForecastProcessor::isIssuanceComplete(std::time_t issuance) const {
  return std::all_of(cfg_.forecast.lead_minutes.begin(), cfg_.forecast.lead_minutes.end(),
                     [&](int lead) { return leadPublished(issuance, lead); });
}

CycleReport ForecastProcessor::process(const std::vector<SourceFile>& bundles) {
  CycleReport total;
  total.stream = Stream::Forecast;
  total.delta = bundles.size();
  for (const SourceFile& b : bundles) {
    CycleReport r = processBundle(b);
    total.outcomes.insert(total.outcomes.end(), r.outcomes.begin(), r.outcomes.end());
  }
  return total;
}

CycleReport ForecastProcessor::processBundle(const SourceFile& bundle) {
  CycleReport report;
  report.stream = Stream::Forecast;
  report.delta = 1;
  const std::time_t issuance = bundle.timestamp;
  const int64_t now = static_cast<int64_t>(std::time(nullptr));

  std::vector<ForecastMember> members;
  try {
    members = extract(bundle);
  } catch (const PipelineError& e) {
    spdlog::error("forecast bundle {} unusable: {}", bundle.name, e.what());
    if (e.permanent()) {
      manifest_.markQuarantined(bundle.name, "extract", e.what(), now);
    } else {
      manifest_.markFailed(bundle.name, "extract", e.what(), 0, now);
    }
    JobOutcome o;
    o.identifier = bundle.name;
    o.key = renderKey(Stream::Forecast, issuance, 0);
    o.status = e.permanent() ? JobStatus::Quarantined : JobStatus::Failed;
    o.stage = e.stage();
    o.error = e.what();
    report.outcomes.push_back(std::move(o));
    return report;
  }

  std::vector<RenderJob> jobs;
  std::set<int> present;
  for (const ForecastMember& m : members) {
    present.insert(m.lead_minutes);
    if (leadPublished(issuance, m.lead_minutes)) {
      spdlog::debug("Forecast {} ft{} already published", timestampStub(issuance), m.lead_minutes);
      continue;
    }
    RenderJob job;
    job.identifier = fs::path(m.path).filename().string();
    job.input_path = m.path;
    job.stream = Stream::Forecast;
    job.timestamp = issuance;
    job.lead_minutes = m.lead_minutes;
    jobs.push_back(std::move(job));
  }
  for (int lead : cfg_.forecast.lead_minutes) {
    if (!present.count(lead)) spdlog::warn("Forecast bundle {} has no member for lead {}", bundle.name, lead);
  }

  if (!jobs.empty()) {
    spdlog::info("Processing {} forecast leads for issuance {}", jobs.size(), formatUtc(issuance));
    report.outcomes = orchestrator_.runJobs(jobs);
  }

  if (isIssuanceComplete(issuance)) {
    manifest_.markProcessed(bundle.name, now);
    manifest_.appendHistory(bundle.name, "PUBLISHED",
                            json({{"issuance", formatUtc(issuance)},
                                  {"leads", cfg_.forecast.lead_minutes}}).dump(), now);
    spdlog::info("Forecast bundle {} processed", bundle.name);
    prune(issuance);
    return report;
  }

  // Incomplete: retry next cycle unless nothing left could ever succeed.
  const bool retryable = std::any_of(report.outcomes.begin(), report.outcomes.end(), [](const JobOutcome& o) {
    return o.status == JobStatus::Failed || o.status == JobStatus::Incomplete || o.status == JobStatus::Skipped;
  });
  std::string summary = "issuance " + formatUtc(issuance) + " incomplete";
  for (const JobOutcome& o : report.outcomes) {
    if (o.status != JobStatus::Published) summary += "; " + o.key + ": " + o.error;
  }
  if (retryable) {
    manifest_.markFailed(bundle.name, "render", summary, 0, now);
  } else {
    manifest_.markQuarantined(bundle.name, "render", summary, now);
  }
  manifest_.appendHistory(bundle.name, retryable ? "FAILED" : "QUARANTINED",
                          json({{"error", summary}}).dump(), now);
  spdlog::warn("Forecast bundle {}: {}", bundle.name, summary);
  return report;
}

size_t ForecastProcessor::prune(std::time_t complete) {
  if (!isIssuanceComplete(complete)) {
    spdlog::debug("not pruning: issuance {} is incomplete", formatUtc(complete));
    return 0;
  }

  const auto artifacts = output_.list(Stream::Forecast);
  std::set<std::time_t, std::greater<std::time_t>> older;
  for (const auto& a : artifacts) {
    if (a.key.timestamp < complete) older.insert(a.key.timestamp);
  }

  std::set<std::time_t> doomed;
  std::time_t oldest_kept = complete;
  int kept = 0;
  for (std::time_t t : older) {
    if (kept < cfg_.forecast.keep_issuances) {
      ++kept;
      oldest_kept = t;
      continue;
    }
    doomed.insert(t);
  }

  size_t removed = 0;
  for (const auto& a : artifacts) {
    if (!doomed.count(a.key.timestamp)) continue;
    try {
      output_.remove(a.key);
      ++removed;
    } catch (const FilesystemError& e) {
      spdlog::warn("forecast prune: {}", e.what());
    }
  }

  std::error_code ec;
  for (std::time_t t : doomed) {
    fs::remove_all(issuanceDir(t), ec);
  }
  for (fs::directory_iterator it(cfg_.dataDir(Stream::Forecast), ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    auto issued = extractIssuance(name);
    if (issued && *issued < oldest_kept && it->is_regular_file()) {
      std::error_code rm;
      fs::remove(it->path(), rm);
    }
  }

  // Only the newest bundle is ever listed, so older names are not rediscovered.
  const size_t forgotten = manifest_.forgetBefore(streamName(Stream::Forecast), oldest_kept);

  if (!doomed.empty() || forgotten > 0) {
    spdlog::info("Pruned {} forecast artifacts from {} superseded issuance(s); {} manifest records dropped",
                 removed, doomed.size(), forgotten);
  }
  return removed;
}

} // namespace rpub
