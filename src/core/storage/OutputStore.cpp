#include "OutputStore.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>
#include <tuple>

#include "core/errors/Errors.hpp"

namespace rpub {

namespace fs = std::filesystem;

std::string OutputStore::dir(Stream stream) const {
  return (fs::path(root_) / streamName(stream)).string();
}

// Same filesystem as dir(), so the publishing rename stays atomic.
std::string OutputStore::stagingDir(Stream stream) const {
  return (fs::path(root_) / ".staging" / streamName(stream)).string();
}

std::string OutputStore::pathFor(const ArtifactKey& key) const {
  return (fs::path(dir(key.stream)) / artifactFilename(key)).string();
}

std::string OutputStore::publish(const ArtifactKey& key, std::string_view bytes) {
  const fs::path final_path = pathFor(key);
  const fs::path staging = stagingDir(key.stream);

  std::error_code ec;
  fs::create_directories(staging, ec);
  if (ec) throw FilesystemError("cannot create " + staging.string() + ": " + ec.message());

  // unique per writer so two jobs never share a staging file
  const size_t tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
  const fs::path tmp = staging / (final_path.filename().string() + "." +
                                  std::to_string(tid) + "." + std::to_string(seq_++) + ".tmp");
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw FilesystemError("cannot open " + tmp.string());
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      os.close();
      fs::remove(tmp, ec);
      throw FilesystemError("write failed for " + tmp.string());
    }
  }

  fs::rename(tmp, final_path, ec);
  if (ec) {
    std::error_code ignore;
    fs::remove(tmp, ignore);
    throw FilesystemError("cannot publish " + final_path.string() + ": " + ec.message());
  }
  spdlog::debug("published {} ({} bytes)", final_path.string(), bytes.size());
  return final_path.string();
}

bool OutputStore::exists(const ArtifactKey& key) const {
  std::error_code ec;
  return fs::is_regular_file(pathFor(key), ec);
}

void OutputStore::remove(const ArtifactKey& key) {
  std::error_code ec;
  fs::remove(pathFor(key), ec);
  if (ec) throw FilesystemError("cannot remove " + pathFor(key) + ": " + ec.message());
}

std::vector<PublishedArtifact> OutputStore::list(Stream stream) const {
  std::vector<PublishedArtifact> out;
  std::error_code ec;
  fs::directory_iterator it(dir(stream), ec);
  if (ec) return out; // nothing published yet

  for (const auto& entry : it) {
    if (!entry.is_regular_file(ec)) continue;
    auto key = parseArtifactFilename(stream, entry.path().filename().string());
    if (!key) continue;
    PublishedArtifact a;
    a.key = *key;
    a.path = entry.path().string();
    a.bytes = static_cast<int64_t>(entry.file_size(ec));
    out.push_back(std::move(a));
  }
  std::sort(out.begin(), out.end(), [](const PublishedArtifact& a, const PublishedArtifact& b) {
    return std::tie(a.key.timestamp, a.key.lead_minutes, a.key.variant, a.key.scale) <
           std::tie(b.key.timestamp, b.key.lead_minutes, b.key.variant, b.key.scale);
  });
  return out;
}

void OutputStore::clearStaging(Stream stream) {
  const fs::path staging = stagingDir(stream);
  std::error_code ec;
  const auto removed = fs::remove_all(staging, ec);
  if (ec) throw FilesystemError("cannot clear " + staging.string() + ": " + ec.message());
  if (removed > 1) spdlog::info("removed {} stale staging files in {}", removed - 1, staging.string());
}

} // namespace rpub
