#pragma once
#include <chrono>
#include <ctime>
#include <functional>
#include <string>
#include <vector>

#include "core/config/Config.hpp"

namespace rpub {

class ManifestStore;

// A remote source file known to the manifest.
struct SourceFile {
  std::string name;          // remote file name, also the manifest key
  Stream      stream = Stream::Current;
  std::string product;
  std::time_t timestamp = 0; // observation time, or issuance for forecast bundles
  std::string local_path;    // set once fetched
};

// Discovers new files on a stream's listing endpoint and retrieves them.
class Downloader {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  Downloader(const Config& cfg, ManifestStore& manifest);

  // Remote listing, newest first. Throws NetworkError / NotFoundError.
  std::vector<std::string> listRemote(Stream stream) const;

  // Listed files that are not processed, quarantined or cooling down,
  // oldest first. New names are registered in the manifest as pending.
  std::vector<SourceFile> discover(Stream stream);

  // Retrieves one file into the stream's data directory, retrying transient
  // failures. Throws NetworkError, NotFoundError or PartialWriteError once
  // retries are exhausted; the manifest is not touched.
  SourceFile fetch(const SourceFile& file) const;

  // fetch() for each file; failures are recorded in the manifest and
  // logged, successes are returned.
  std::vector<SourceFile> fetchAll(const std::vector<SourceFile>& files);

  std::chrono::milliseconds backoffDelay(int attempt) const;
  void setSleeper(Sleeper sleeper) { sleep_ = std::move(sleeper); }

  // href targets ending in .hdf or .tar, basename only, newest (descending) first.
  static std::vector<std::string> parseListing(const std::string& html);

private:
  std::string getText(const std::string& url) const;
  void downloadOnce(const std::string& url, const std::string& destination) const;
  template <typename Fn> auto withRetry(const std::string& url, Fn&& fn) const -> decltype(fn());

  const Config& cfg_;
  ManifestStore& manifest_;
  Sleeper sleep_;
};

} // namespace rpub
