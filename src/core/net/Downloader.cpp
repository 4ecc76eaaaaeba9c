#include "Downloader.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <regex>
#include <thread>

#include "core/errors/Errors.hpp"
#include "core/manifest/ManifestStore.hpp"
#include "core/naming/Naming.hpp"

using nlohmann::json;

namespace rpub {

namespace fs = std::filesystem;

namespace {

struct UrlParts {
  std::string origin; // scheme://host[:port]
  std::string path;
};

UrlParts splitUrl(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) throw NetworkError("not an absolute URL: " + url);
  const auto path_start = url.find('/', scheme_end + 3);
  if (path_start == std::string::npos) return {url, "/"};
  return {url.substr(0, path_start), url.substr(path_start)};
}

httplib::Client makeClient(const std::string& origin, int timeout_seconds) {
  httplib::Client cli(origin);
  if (!cli.is_valid()) throw NetworkError("cannot create HTTP client for " + origin);
  cli.set_connection_timeout(timeout_seconds, 0);
  cli.set_read_timeout(timeout_seconds, 0);
  cli.set_follow_location(true);
  return cli;
}

void throwForStatus(int status, const std::string& url) {
  if (status == 200) return;
  if (status >= 500 || status == 408 || status == 429) {
    throw NetworkError("HTTP " + std::to_string(status) + " for " + url, status);
  }
  throw NotFoundError("HTTP " + std::to_string(status) + " for " + url);
}

bool hasSuffix(const std::string& name, const std::string& suffix) {
  if (name.size() < suffix.size()) return false;
  return std::equal(suffix.rbegin(), suffix.rend(), name.rbegin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
}

int64_t nowSeconds() {
  return static_cast<int64_t>(std::time(nullptr));
}

} // namespace

Downloader::Downloader(const Config& cfg, ManifestStore& manifest)
  : cfg_(cfg), manifest_(manifest),
    sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

std::chrono::milliseconds Downloader::backoffDelay(int attempt) const {
  int64_t delay = cfg_.retry.backoff_base_ms;
  for (int i = 1; i < attempt && delay < cfg_.retry.backoff_max_ms; ++i) delay *= 2;
  return std::chrono::milliseconds(std::min<int64_t>(delay, cfg_.retry.backoff_max_ms));
}

template <typename Fn>
auto Downloader::withRetry(const std::string& url, Fn&& fn) const -> decltype(fn()) {
  std::exception_ptr last;
  for (int attempt = 1; attempt <= cfg_.retry.attempts; ++attempt) {
    try {
      return fn();
    } catch (const NetworkError& e) {
      last = std::current_exception();
      spdlog::warn("Request failed for {} (attempt {}/{}): {}", url, attempt, cfg_.retry.attempts, e.what());
    } catch (const PartialWriteError& e) {
      last = std::current_exception();
      spdlog::warn("Truncated download of {} (attempt {}/{}): {}", url, attempt, cfg_.retry.attempts, e.what());
    }
    if (attempt < cfg_.retry.attempts) sleep_(backoffDelay(attempt));
  }
  spdlog::error("Giving up on {} after {} attempts", url, cfg_.retry.attempts);
  std::rethrow_exception(last);
}

std::vector<std::string> Downloader::parseListing(const std::string& html) {
  static const std::regex href(R"(href\s*=\s*"([^"]+)")", std::regex::icase);
  std::vector<std::string> entries;
  for (auto it = std::sregex_iterator(html.begin(), html.end(), href); it != std::sregex_iterator(); ++it) {
    std::string target = (*it)[1];
    const auto q = target.find_first_of("?#");
    if (q != std::string::npos) target.erase(q);
    const auto slash = target.rfind('/');
    std::string name = slash == std::string::npos ? target : target.substr(slash + 1);
    if (hasSuffix(name, ".hdf") || hasSuffix(name, ".tar")) entries.push_back(std::move(name));
  }
  std::sort(entries.begin(), entries.end(), std::greater<std::string>());
  entries.erase(std::unique(entries.begin(), entries.end()), entries.end());
  return entries;
}

std::string Downloader::getText(const std::string& url) const {
  const UrlParts parts = splitUrl(url);
  auto cli = makeClient(parts.origin, cfg_.retry.timeout_seconds);
  auto res = cli.Get(parts.path);
  if (!res) throw NetworkError("GET " + url + " failed: " + httplib::to_string(res.error()));
  throwForStatus(res->status, url);
  return res->body;
}

std::vector<std::string> Downloader::listRemote(Stream stream) const {
  const std::string& url = cfg_.source(stream).base_url;
  spdlog::debug("Listing remote files from {}", url);
  std::vector<std::string> entries = withRetry(url, [&] { return parseListing(getText(url)); });

  const std::string suffix = stream == Stream::Current ? ".hdf" : ".tar";
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&](const std::string& n) { return !hasSuffix(n, suffix); }),
                entries.end());
  return entries;
}

std::vector<SourceFile> Downloader::discover(Stream stream) {
  std::vector<std::string> entries = listRemote(stream);
  const size_t window = stream == Stream::Current
      ? static_cast<size_t>(cfg_.storage.listing_window) : 1; // newest forecast bundle only
  if (entries.size() > window) entries.resize(window);

  const int64_t now = nowSeconds();
  std::vector<SourceFile> delta;
  for (const std::string& name : entries) {
    auto ts = stream == Stream::Current ? extractTimestamp(name) : extractIssuance(name);
    if (!ts) {
      spdlog::debug("Skipping unrecognized {} filename {}", streamName(stream), name);
      continue;
    }
    if (manifest_.isSettled(name, now)) continue;

    SourceFile f;
    f.name = name;
    f.stream = stream;
    f.product = extractProductCode(name);
    f.timestamp = *ts;

    SourceRecord rec;
    rec.name = name;
    rec.stream = streamName(stream);
    rec.product = f.product;
    rec.timestamp = static_cast<int64_t>(*ts);
    rec.created_at = now;
    rec.updated_at = now;
    manifest_.upsertSource(rec);
    delta.push_back(std::move(f));
  }
  std::sort(delta.begin(), delta.end(), [](const SourceFile& a, const SourceFile& b) {
    return a.timestamp != b.timestamp ? a.timestamp < b.timestamp : a.name < b.name;
  });
  if (!delta.empty()) {
    spdlog::info("{} stream: {} new of {} listed", streamName(stream), delta.size(), entries.size());
  }
  return delta;
}

void Downloader::downloadOnce(const std::string& url, const std::string& destination) const {
  const UrlParts parts = splitUrl(url);
  const fs::path part = destination + ".part";
  auto cli = makeClient(parts.origin, cfg_.retry.timeout_seconds);

  std::ofstream out(part, std::ios::binary | std::ios::trunc);
  if (!out) throw FilesystemError("cannot open " + part.string());

  int status = 0;
  int64_t expected = -1;
  int64_t received = 0;
  auto res = cli.Get(parts.path,
    [&](const httplib::Response& r) {
      status = r.status;
      if (r.has_header("Content-Length")) {
        try { expected = std::stoll(r.get_header_value("Content-Length")); }
        catch (const std::exception&) { expected = -1; }
      }
      return true;
    },
    [&](const char* data, size_t len) {
      if (status != 200) return true; // error body, discarded
      out.write(data, static_cast<std::streamsize>(len));
      received += static_cast<int64_t>(len);
      return static_cast<bool>(out);
    });
  out.close();

  auto discard = [&] {
    std::error_code ec;
    fs::remove(part, ec);
  };

  if (!res) {
    discard();
    if (status == 200 && received > 0) {
      throw PartialWriteError("transfer of " + url + " interrupted after " +
                              std::to_string(received) + " bytes: " + httplib::to_string(res.error()));
    }
    throw NetworkError("GET " + url + " failed: " + httplib::to_string(res.error()));
  }
  if (status != 200) {
    discard();
    throwForStatus(status, url);
  }
  if (!out) {
    discard();
    throw FilesystemError("write failed for " + part.string());
  }
  if (expected >= 0 && received != expected) {
    discard();
    throw PartialWriteError(url + ": received " + std::to_string(received) + " of " +
                            std::to_string(expected) + " bytes");
  }

  std::error_code ec;
  fs::rename(part, destination, ec);
  if (ec) {
    discard();
    throw FilesystemError("cannot move " + part.string() + " into place: " + ec.message());
  }
}

SourceFile Downloader::fetch(const SourceFile& file) const {
  const fs::path dir = cfg_.dataDir(file.stream);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw FilesystemError("cannot create " + dir.string() + ": " + ec.message());

  SourceFile out = file;
  out.local_path = (dir / file.name).string();
  if (fs::is_regular_file(out.local_path, ec)) {
    spdlog::debug("Reusing local copy {}", out.local_path);
    return out;
  }

  const std::string url = cfg_.source(file.stream).base_url + file.name;
  spdlog::info("Downloading {}", url);
  withRetry(url, [&] { downloadOnce(url, out.local_path); return 0; });
  return out;
}

std::vector<SourceFile> Downloader::fetchAll(const std::vector<SourceFile>& files) {
  std::vector<SourceFile> fetched;
  for (const SourceFile& f : files) {
    try {
      SourceFile got = fetch(f);
      const int64_t now = nowSeconds();
      manifest_.markFetched(got.name, got.local_path, now);
      manifest_.appendHistory(got.name, "FETCHED", json({{"path", got.local_path}}).dump(), now);
      fetched.push_back(std::move(got));
    } catch (const NotFoundError& e) {
      const int64_t now = nowSeconds();
      spdlog::warn("{} not available, cooling down for {}s: {}", f.name, cfg_.retry.cooldown_seconds, e.what());
      manifest_.markFailed(f.name, stageName(e.stage()), e.what(), now + cfg_.retry.cooldown_seconds, now);
      manifest_.appendHistory(f.name, "NOT_FOUND", json({{"error", e.what()}}).dump(), now);
    } catch (const PipelineError& e) {
      const int64_t now = nowSeconds();
      spdlog::error("fetch of {} failed: {}", f.name, e.what());
      manifest_.markFailed(f.name, stageName(e.stage()), e.what(), 0, now);
      manifest_.appendHistory(f.name, "FETCH_FAILED", json({{"error", e.what()}}).dump(), now);
    }
  }
  return fetched;
}

} // namespace rpub
