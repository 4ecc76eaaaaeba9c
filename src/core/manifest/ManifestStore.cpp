#include "ManifestStore.hpp"
#include <stdexcept>
#include <sqlite3.h>

namespace rpub {

namespace {

sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("prepare failed: " + err);
  }
  return st;
}

void stepDone(sqlite3* db, sqlite3_stmt* st, const char* what) {
  if (sqlite3_step(st) != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error(std::string(what) + " failed: " + err);
  }
  sqlite3_finalize(st);
}

std::string text(sqlite3_stmt* st, int col) {
  const unsigned char* p = sqlite3_column_text(st, col);
  return p ? reinterpret_cast<const char*>(p) : std::string();
}

SourceRecord readRow(sqlite3_stmt* st) {
  SourceRecord r;
  int i = 0;
  r.name           = text(st, i++);
  r.stream         = text(st, i++);
  r.product        = text(st, i++);
  r.timestamp      = sqlite3_column_int64(st, i++);
  r.local_path     = text(st, i++);
  r.state          = parseSourceState(text(st, i++));
  r.attempts       = sqlite3_column_int(st, i++);
  r.last_stage     = text(st, i++);
  r.last_error     = text(st, i++);
  r.cooldown_until = sqlite3_column_int64(st, i++);
  r.created_at     = sqlite3_column_int64(st, i++);
  r.updated_at     = sqlite3_column_int64(st, i++);
  return r;
}

const char* kColumns =
  "name, stream, product, timestamp, local_path, state, attempts, "
  "last_stage, last_error, cooldown_until, created_at, updated_at";

} // namespace

const char* sourceStateName(SourceState s) {
  switch (s) {
    case SourceState::Pending:     return "pending";
    case SourceState::Fetched:     return "fetched";
    case SourceState::Processed:   return "processed";
    case SourceState::Failed:      return "failed";
    case SourceState::Quarantined: return "quarantined";
  }
  return "pending";
}

SourceState parseSourceState(const std::string& s) {
  if (s == "fetched")     return SourceState::Fetched;
  if (s == "processed")   return SourceState::Processed;
  if (s == "failed")      return SourceState::Failed;
  if (s == "quarantined") return SourceState::Quarantined;
  return SourceState::Pending;
}

ManifestStore::ManifestStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db=nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr)!=SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("failed to open manifest db: " + dbPath);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

ManifestStore::~ManifestStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void ManifestStore::upsertSource(const SourceRecord& r) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO source_files
      (name, stream, product, timestamp, local_path, state, attempts,
       last_stage, last_error, cooldown_until, created_at, updated_at)
    VALUES (?,?,?,?,?,?,0,'','',0,?,?)
    ON CONFLICT(name) DO UPDATE SET
      product = excluded.product,
      timestamp = excluded.timestamp,
      updated_at = excluded.updated_at
  )SQL";
  sqlite3_stmt* st = prepare(db, sql);
  int i=1;
  sqlite3_bind_text(st, i++, r.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, r.stream.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, r.product.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, i++, r.timestamp);
  sqlite3_bind_text(st, i++, r.local_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, sourceStateName(r.state), -1, SQLITE_STATIC);
  sqlite3_bind_int64(st, i++, r.created_at);
  sqlite3_bind_int64(st, i++, r.updated_at);
  stepDone(db, st, "upsertSource");
}

void ManifestStore::markFetched(const std::string& name, const std::string& local_path, int64_t now) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    UPDATE source_files
       SET state = 'fetched', local_path = ?, updated_at = ?
     WHERE name = ? AND state NOT IN ('processed','quarantined')
  )SQL";
  sqlite3_stmt* st = prepare(db, sql);
  sqlite3_bind_text(st, 1, local_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, 2, now);
  sqlite3_bind_text(st, 3, name.c_str(), -1, SQLITE_TRANSIENT);
  stepDone(db, st, "markFetched");
}

void ManifestStore::markProcessed(const std::string& name, int64_t now) {
  std::lock_guard<std::mutex> lock(mu_);
  setState(name, SourceState::Processed, now);
}

void ManifestStore::markFailed(const std::string& name, const std::string& stage,
                               const std::string& error, int64_t cooldown_until, int64_t now) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    UPDATE source_files
       SET state = 'failed', attempts = attempts + 1, last_stage = ?, last_error = ?,
           cooldown_until = ?, updated_at = ?
     WHERE name = ?
  )SQL";
  sqlite3_stmt* st = prepare(db, sql);
  sqlite3_bind_text(st, 1, stage.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 2, error.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, 3, cooldown_until);
  sqlite3_bind_int64(st, 4, now);
  sqlite3_bind_text(st, 5, name.c_str(), -1, SQLITE_TRANSIENT);
  stepDone(db, st, "markFailed");
}

void ManifestStore::markQuarantined(const std::string& name, const std::string& stage,
                                    const std::string& error, int64_t now) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    UPDATE source_files
       SET state = 'quarantined', attempts = attempts + 1, last_stage = ?, last_error = ?,
           updated_at = ?
     WHERE name = ?
  )SQL";
  sqlite3_stmt* st = prepare(db, sql);
  sqlite3_bind_text(st, 1, stage.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 2, error.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, 3, now);
  sqlite3_bind_text(st, 4, name.c_str(), -1, SQLITE_TRANSIENT);
  stepDone(db, st, "markQuarantined");
}

std::optional<SourceRecord> ManifestStore::lookup(const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kColumns + " FROM source_files WHERE name = ?";
  sqlite3_stmt* st = prepare(db, sql.c_str());
  sqlite3_bind_text(st, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  std::optional<SourceRecord> out;
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) {
    out = readRow(st);
  } else if (rc != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("lookup failed: " + err);
  }
  sqlite3_finalize(st);
  return out;
}

std::vector<SourceRecord> ManifestStore::listByState(const std::string& stream, SourceState state) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kColumns +
      " FROM source_files WHERE stream = ? AND state = ? ORDER BY timestamp, name";
  sqlite3_stmt* st = prepare(db, sql.c_str());
  sqlite3_bind_text(st, 1, stream.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 2, sourceStateName(state), -1, SQLITE_STATIC);
  std::vector<SourceRecord> out;
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) out.push_back(readRow(st));
  if (rc != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("listByState failed: " + err);
  }
  sqlite3_finalize(st);
  return out;
}

bool ManifestStore::isSettled(const std::string& name, int64_t now) {
  auto rec = lookup(name);
  if (!rec) return false;
  switch (rec->state) {
    case SourceState::Processed:
    case SourceState::Quarantined:
      return true;
    case SourceState::Failed:
      return rec->cooldown_until > now;
    default:
      return false;
  }
}

void ManifestStore::appendHistory(const std::string& name,
                                  const std::string& event,
                                  const std::string& details_json,
                                  int64_t at) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO source_history (name, event, details, at)
    VALUES (?,?,?,?)
  )SQL";
  sqlite3_stmt* st = prepare(db, sql);
  sqlite3_bind_text(st, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 2, event.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 3, details_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, 4, at);
  stepDone(db, st, "appendHistory");
}

void ManifestStore::forget(const std::string& name) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st = prepare(db, "DELETE FROM source_history WHERE name = ?");
  sqlite3_bind_text(st, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  stepDone(db, st, "forget history");
  st = prepare(db, "DELETE FROM source_files WHERE name = ?");
  sqlite3_bind_text(st, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  stepDone(db, st, "forget");
}

size_t ManifestStore::forgetBefore(const std::string& stream, int64_t cutoff) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  if (sqlite3_exec(db, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("forgetBefore: cannot begin: ") + sqlite3_errmsg(db));
  }
  try {
    sqlite3_stmt* st = prepare(db, R"SQL(
      DELETE FROM source_history WHERE name IN
        (SELECT name FROM source_files WHERE stream = ? AND timestamp < ?)
    )SQL");
    sqlite3_bind_text(st, 1, stream.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st, 2, cutoff);
    stepDone(db, st, "forgetBefore history");

    st = prepare(db, "DELETE FROM source_files WHERE stream = ? AND timestamp < ?");
    sqlite3_bind_text(st, 1, stream.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st, 2, cutoff);
    stepDone(db, st, "forgetBefore");
    const size_t removed = static_cast<size_t>(sqlite3_changes(db));

    if (sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("forgetBefore: commit failed: ") + sqlite3_errmsg(db));
    }
    return removed;
  } catch (const std::exception&) {
    sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
    throw;
  }
}

void ManifestStore::setState(const std::string& name, SourceState state, int64_t now) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    UPDATE source_files SET state = ?, cooldown_until = 0, updated_at = ? WHERE name = ?
  )SQL";
  sqlite3_stmt* st = prepare(db, sql);
  sqlite3_bind_text(st, 1, sourceStateName(state), -1, SQLITE_STATIC);
  sqlite3_bind_int64(st, 2, now);
  sqlite3_bind_text(st, 3, name.c_str(), -1, SQLITE_TRANSIENT);
  stepDone(db, st, "setState");
}

} // namespace rpub
