#pragma once
#include <ctime>
#include <string>
#include <vector>

#include "core/config/Config.hpp"
#include "core/net/Downloader.hpp"
#include "PipelineOrchestrator.hpp"

namespace rpub {

class ManifestStore;
class OutputStore;

struct ForecastMember {
  std::string path;
  int lead_minutes = 0;
};

// Forecast stream lifecycle. Every issuance arrives as a TAR bundle of
// ODIM files, one per lead time; each (issuance, lead) is rendered as an
// independent job. Older issuances are pruned only once every configured
// lead of a newer issuance is fully published, so a lead that was available
// never disappears from the output directory.
class ForecastProcessor {
public:
  ForecastProcessor(const Config& cfg, ManifestStore& manifest, OutputStore& output,
                    PipelineOrchestrator& orchestrator);

  CycleReport process(const std::vector<SourceFile>& bundles);
  CycleReport processBundle(const SourceFile& bundle);

  // Members of the bundle with their lead times, restricted to the
  // configured lead set, sorted by lead.
  std::vector<ForecastMember> extract(const SourceFile& bundle) const;

  // Every lead x variant x scale of the issuance is published.
  bool isIssuanceComplete(std::time_t issuance) const;

  // Deletes artifacts and extracted members of issuances older than
  // `complete`, keeping forecast.keep_issuances of them. No-op unless
  // `complete` itself is complete.
  size_t prune(std::time_t complete);

private:
  bool leadPublished(std::time_t issuance, int lead) const;
  std::string issuanceDir(std::time_t issuance) const;

  const Config& cfg_;
  ManifestStore& manifest_;
  OutputStore& output_;
  PipelineOrchestrator& orchestrator_;
};

} // namespace rpub
