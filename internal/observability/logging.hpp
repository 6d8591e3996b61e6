#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace signoff::runtime::config {
class RuntimeConfig;
}

namespace signoff::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);

/*
  Report run the calling thread is working for.

  While a ScopedRunContext is alive every log line written on its thread
  carries run_id= (and pipeline= when set), and spans started on the
  thread are tagged with the run id. Scopes nest; the destructor restores
  the enclosing run and pipeline. Pipeline worker threads open their own
  scope since the context is per thread.
*/
class ScopedRunContext {
 public:
  explicit ScopedRunContext(std::string run_id, std::string pipeline = {});
  ~ScopedRunContext();

  ScopedRunContext(const ScopedRunContext&)            = delete;
  ScopedRunContext& operator=(const ScopedRunContext&) = delete;

 private:
  std::string previous_run_id_;
  std::string previous_pipeline_;
};

// Empty outside any ScopedRunContext.
const std::string& CurrentRunId();
const std::string& CurrentPipeline();

// "<message> run_id=.. pipeline=.. key=value ...". Values containing
// whitespace or quotes are double-quoted.
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

void InitializeLogging(const signoff::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace signoff::observability

#define SIGNOFF_LOG_DEBUG(message, ...) ::signoff::observability::LogDebug((message), ##__VA_ARGS__)
#define SIGNOFF_LOG_INFO(message, ...) ::signoff::observability::LogInfo((message), ##__VA_ARGS__)
#define SIGNOFF_LOG_WARN(message, ...) ::signoff::observability::LogWarn((message), ##__VA_ARGS__)
#define SIGNOFF_LOG_ERROR(message, ...) ::signoff::observability::LogError((message), ##__VA_ARGS__)
