#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/naming/Naming.hpp"

namespace rpub {

struct PublishedArtifact {
  ArtifactKey key;
  std::string path;
  int64_t     bytes = 0;
};

// Output directories read by the static server. Every write goes to
// <root>/.staging/<stream> first, outside the served directories, and is
// renamed into place, so a reader sees either the previous file or the
// complete new one.
class OutputStore {
public:
  explicit OutputStore(std::string root) : root_(std::move(root)) {}

  // Writes bytes for key and atomically replaces any published file with the
  // same name; returns the published path. Throws FilesystemError.
  std::string publish(const ArtifactKey& key, std::string_view bytes);

  bool exists(const ArtifactKey& key) const;
  // Deletes a published file; missing files are not an error.
  void remove(const ArtifactKey& key);

  // Published artifacts of a stream, oldest timestamp first.
  std::vector<PublishedArtifact> list(Stream stream) const;

  // Removes staging leftovers from an interrupted run.
  void clearStaging(Stream stream);

  std::string dir(Stream stream) const;
  std::string stagingDir(Stream stream) const;
  std::string pathFor(const ArtifactKey& key) const;

private:
  std::string root_;
  std::atomic<uint64_t> seq_{0};
};

} // namespace rpub
