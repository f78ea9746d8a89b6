#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <lineidx/job_lock.hpp>
#include <lineidx/json_codec.hpp>
#include <lineidx/line_reader.hpp>
#include <lineidx/progress_store.hpp>

namespace lineidx {

class LineIndex;

struct BatchOptions {
  // по умолчанию <файл>.progress рядом с источником
  std::optional<std::filesystem::path> progress_path;
  bool as_json = true;
  RecordDecoder decoder; // пусто => parse_json
  bool lock = false;     // держать JobLock на время сессии
};

struct BatchItem {
  uint64_t line_number = 0;
  std::string text;
  Json::Value record; // null при as_json == false
};

enum class BatchState : uint8_t { NotStarted, Active, Exhausted, Committed };

const char *to_string(BatchState s);

// Read-only view of a stored job.
struct JobInfo {
  std::string job_id;
  uint64_t position = 0;
  JobStatus status = JobStatus::InProgress;
  uint64_t total_lines = 0;
  double progress_pct = 0.0;
  std::string created_at;
  std::string last_checkpoint_at;
  std::optional<std::string> completed_at;
  bool is_stale = false;
};

// Resumable pass over one LineIndex under a job id.
//
//   auto batch = index.batch_processor("job");
//   batch.enter();
//   while (auto item = batch.next()) { process(*item); batch.checkpoint(); }
//   batch.exit();
//
// Progress becomes durable only at checkpoint(); anything consumed after the
// last checkpoint is replayed on the next run (at-least-once).
//
// One writer per job id: the processor does no locking of its own unless
// BatchOptions::lock is set, and concurrent sessions on the same job id are
// undefined behaviour.
class BatchProcessor {
public:
  BatchProcessor(const LineIndex &index, std::string job_id,
                 BatchOptions opts = {});
  ~BatchProcessor();

  BatchProcessor(const BatchProcessor &) = delete;
  BatchProcessor &operator=(const BatchProcessor &) = delete;

  // Loads or creates the cursor. Throws StaleCheckpointError,
  // InvalidCheckpointError, SourceNotFoundError, JobLockedError.
  void enter();

  // Next (line, record) from the resumed position.
  std::optional<BatchItem> next();

  // Persist the current position.
  void checkpoint();

  // Normal exit: a drained sequence marks the job completed.
  void exit();

  // Drop the stored cursor; the next enter() starts from 0.
  void reset();

  uint64_t position() const { return position_; }
  uint64_t total_lines() const;
  double progress() const;
  const std::string &job_id() const { return job_id_; }
  BatchState state() const { return state_; }
  const std::filesystem::path &progress_path() const { return progress_path_; }
  const std::optional<JobCursor> &cursor() const { return job_; }

private:
  bool in_session() const {
    return state_ == BatchState::Active || state_ == BatchState::Exhausted;
  }
  void close_session();

  const LineIndex &index_;
  std::string job_id_;
  BatchOptions opts_;
  std::filesystem::path progress_path_;

  std::optional<JobCursor> job_;
  uint64_t position_ = 0;
  BatchState state_ = BatchState::NotStarted;
  bool completed_on_enter_ = false;
  int uncaught_on_enter_ = 0;

  std::optional<LineCursor> lines_;
  JobLock lock_;
};

} // namespace lineidx
