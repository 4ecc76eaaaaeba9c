#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rpub {

enum class SourceState { Pending, Fetched, Processed, Failed, Quarantined };

const char* sourceStateName(SourceState s);
SourceState parseSourceState(const std::string& s);

struct SourceRecord {
  std::string name;
  std::string stream;
  std::string product;
  int64_t     timestamp = 0;
  std::string local_path;
  SourceState state = SourceState::Pending;
  int         attempts = 0;
  std::string last_stage;
  std::string last_error;
  int64_t     cooldown_until = 0;
  int64_t     created_at = 0;
  int64_t     updated_at = 0;
};

// SQLite-backed record of every source file seen. Safe to share between
// worker threads; calls are serialized internally.
class ManifestStore {
public:
  explicit ManifestStore(const std::string& dbPath);
  ~ManifestStore();
  ManifestStore(const ManifestStore&) = delete;
  ManifestStore& operator=(const ManifestStore&) = delete;

  // Inserts a pending record; an existing record keeps its state.
  void upsertSource(const SourceRecord& r);
  void markFetched(const std::string& name, const std::string& local_path, int64_t now);
  void markProcessed(const std::string& name, int64_t now);
  void markFailed(const std::string& name, const std::string& stage,
                  const std::string& error, int64_t cooldown_until, int64_t now);
  void markQuarantined(const std::string& name, const std::string& stage,
                       const std::string& error, int64_t now);

  std::optional<SourceRecord> lookup(const std::string& name);
  std::vector<SourceRecord> listByState(const std::string& stream, SourceState state);

  // True when the file must not be fetched this cycle: processed,
  // quarantined, or failed with an unexpired cool-down.
  bool isSettled(const std::string& name, int64_t now);

  void appendHistory(const std::string& name,
                     const std::string& event,
                     const std::string& details_json,
                     int64_t at);
  // Drops a source and its history.
  void forget(const std::string& name);
  // Drops every source of the stream older than cutoff, with its history.
  // Returns the number of sources removed.
  size_t forgetBefore(const std::string& stream, int64_t cutoff);

private:
  void setState(const std::string& name, SourceState state, int64_t now);

  void* db_; // sqlite3*
  std::mutex mu_;
};

} // namespace rpub
