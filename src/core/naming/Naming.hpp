#pragma once
#include <ctime>
#include <optional>
#include <string>

#include "core/config/Config.hpp"

namespace rpub {

// Identifies one published artifact file.
struct ArtifactKey {
  Stream stream = Stream::Current;
  std::time_t timestamp = 0;   // observation time, or issuance for forecasts
  int lead_minutes = 0;
  std::string variant;         // colour map name
  int scale = 1;
};

// "YYYYMMDDhhmmss" anywhere in a source name (current files, forecast members).
std::optional<std::time_t> extractTimestamp(const std::string& name);

// "YYYYMMDD.hhmm" in a forecast bundle name, e.g. T_PABV23_C_OKPR_20250928.2225.ft60s10.tar
std::optional<std::time_t> extractIssuance(const std::string& name);

// Trailing "_ftNN" label of a forecast member, e.g. ..._ft30.hdf -> 30
std::optional<int> extractLeadLabel(const std::string& name);

// Product code of "T_<code>_C_<centre>_..." names, empty if absent.
std::string extractProductCode(const std::string& name);

std::string timestampStub(std::time_t t);      // YYYYMMDD_HHMM
std::string formatUtc(std::time_t t);          // 2025-09-13T16:25:00Z
std::time_t makeUtc(int year, int month, int day, int hour, int minute, int second);

// <stub>[_ft<LL>]_<variant>[_<s>x].png
std::string artifactFilename(const ArtifactKey& key);
std::optional<ArtifactKey> parseArtifactFilename(Stream stream, const std::string& filename);

// In-flight guard key: one render job per (stream, timestamp, lead).
std::string renderKey(Stream stream, std::time_t timestamp, int lead_minutes);

} // namespace rpub
