#include "Naming.hpp"

#include <cstdio>
#include <regex>

namespace rpub {

namespace {

const std::regex kTimestamp(R"((\d{4})(\d{2})(\d{2})(\d{2})(\d{2})(\d{2}))");
const std::regex kIssuance(R"((\d{4})(\d{2})(\d{2})\.(\d{2})(\d{2}))");
const std::regex kLeadLabel(R"(_ft(\d{1,3})(?:\.[A-Za-z0-9]+)?$)");
const std::regex kProduct(R"(^T_([A-Z0-9]+)_C_)");
const std::regex kArtifact(
    R"(^(\d{8})_(\d{4})(?:_ft(\d{2,3}))?_([a-z][a-z0-9]*)(?:_(\d)x)?\.png$)");

std::optional<std::time_t> build(const std::smatch& m, bool with_seconds) {
  const int y  = std::stoi(m[1]);
  const int mo = std::stoi(m[2]);
  const int d  = std::stoi(m[3]);
  const int h  = std::stoi(m[4]);
  const int mi = std::stoi(m[5]);
  const int s  = with_seconds ? std::stoi(m[6]) : 0;
  if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s > 60) return std::nullopt;
  return makeUtc(y, mo, d, h, mi, s);
}

} // namespace

std::time_t makeUtc(int year, int month, int day, int hour, int minute, int second) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;
  return timegm(&tm);
}

std::optional<std::time_t> extractTimestamp(const std::string& name) {
  std::smatch m;
  if (!std::regex_search(name, m, kTimestamp)) return std::nullopt;
  return build(m, true);
}

std::optional<std::time_t> extractIssuance(const std::string& name) {
  std::smatch m;
  if (!std::regex_search(name, m, kIssuance)) return std::nullopt;
  return build(m, false);
}

std::optional<int> extractLeadLabel(const std::string& name) {
  std::smatch m;
  if (!std::regex_search(name, m, kLeadLabel)) return std::nullopt;
  return std::stoi(m[1]);
}

std::string extractProductCode(const std::string& name) {
  std::smatch m;
  if (!std::regex_search(name, m, kProduct)) return {};
  return m[1];
}

std::string timestampStub(std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M", &tm);
  return buf;
}

std::string formatUtc(std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::string artifactFilename(const ArtifactKey& key) {
  std::string out = timestampStub(key.timestamp);
  if (key.stream == Stream::Forecast) {
    char lead[16];
    std::snprintf(lead, sizeof(lead), "_ft%02d", key.lead_minutes);
    out += lead;
  }
  out += "_" + key.variant;
  if (key.scale > 1) out += "_" + std::to_string(key.scale) + "x";
  return out + ".png";
}

std::optional<ArtifactKey> parseArtifactFilename(Stream stream, const std::string& filename) {
  std::smatch m;
  if (!std::regex_match(filename, m, kArtifact)) return std::nullopt;
  const bool has_lead = m[3].matched;
  if (has_lead != (stream == Stream::Forecast)) return std::nullopt;

  const std::string day = m[1];
  const std::string hm  = m[2];
  const int y = std::stoi(day.substr(0, 4)), mo = std::stoi(day.substr(4, 2)),
            d = std::stoi(day.substr(6, 2));
  const int h = std::stoi(hm.substr(0, 2)), mi = std::stoi(hm.substr(2, 2));
  if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59) return std::nullopt;

  ArtifactKey key;
  key.stream = stream;
  key.timestamp = makeUtc(y, mo, d, h, mi, 0);
  key.lead_minutes = has_lead ? std::stoi(m[3]) : 0;
  key.variant = m[4];
  key.scale = m[5].matched ? std::stoi(m[5]) : 1;
  if (key.scale < 2 && m[5].matched) return std::nullopt;
  return key;
}

std::string renderKey(Stream stream, std::time_t timestamp, int lead_minutes) {
  std::string k = std::string(streamName(stream)) + "/" + timestampStub(timestamp);
  if (stream == Stream::Forecast) k += "/ft" + std::to_string(lead_minutes);
  return k;
}

} // namespace rpub
