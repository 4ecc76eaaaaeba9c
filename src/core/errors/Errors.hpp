#pragma once
#include <stdexcept>
#include <string>

namespace rpub {

// Pipeline stage a failure is attributed to.
enum class Stage { Fetch, Decode, Render, Publish, Prune, Cycle };

inline const char* stageName(Stage s) {
  switch (s) {
    case Stage::Fetch:   return "fetch";
    case Stage::Decode:  return "decode";
    case Stage::Render:  return "render";
    case Stage::Publish: return "publish";
    case Stage::Prune:   return "prune";
    case Stage::Cycle:   return "cycle";
  }
  return "unknown";
}

class PipelineError : public std::runtime_error {
public:
  PipelineError(Stage stage, const std::string& what)
    : std::runtime_error(what), stage_(stage) {}
  Stage stage() const { return stage_; }
  // Permanent errors quarantine the source file instead of retrying it.
  virtual bool permanent() const { return false; }
private:
  Stage stage_;
};

// Timeout, connection failure or 5xx. Retried with backoff.
class NetworkError : public PipelineError {
public:
  explicit NetworkError(const std::string& what, int status = 0)
    : PipelineError(Stage::Fetch, what), status_(status) {}
  int status() const { return status_; }
private:
  int status_;
};

// 404 (or another 4xx). Skipped for a cool-down window.
class NotFoundError : public PipelineError {
public:
  explicit NotFoundError(const std::string& what)
    : PipelineError(Stage::Fetch, what) {}
};

// Body shorter than Content-Length, or truncated transfer.
class PartialWriteError : public PipelineError {
public:
  explicit PartialWriteError(const std::string& what)
    : PipelineError(Stage::Fetch, what) {}
};

// Container readable but not the expected product layout.
class FormatError : public PipelineError {
public:
  explicit FormatError(const std::string& what)
    : PipelineError(Stage::Decode, what) {}
  bool permanent() const override { return true; }
};

// Container itself unreadable.
class CorruptDataError : public PipelineError {
public:
  explicit CorruptDataError(const std::string& what)
    : PipelineError(Stage::Decode, what) {}
  bool permanent() const override { return true; }
};

class RenderError : public PipelineError {
public:
  explicit RenderError(const std::string& what)
    : PipelineError(Stage::Render, what) {}
};

class FilesystemError : public PipelineError {
public:
  explicit FilesystemError(const std::string& what)
    : PipelineError(Stage::Publish, what) {}
};

// Job dropped from the worker queue during shutdown.
class ShutdownError : public PipelineError {
public:
  explicit ShutdownError(const std::string& what)
    : PipelineError(Stage::Cycle, what) {}
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace rpub
