#include <lineidx/batch.hpp>
#include <lineidx/errors.hpp>
#include <lineidx/index.hpp>
#include <lineidx/util.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace lineidx {

const char *to_string(BatchState s) {
  switch (s) {
  case BatchState::NotStarted:
    return "not-started";
  case BatchState::Active:
    return "active";
  case BatchState::Exhausted:
    return "exhausted";
  case BatchState::Committed:
    return "committed";
  }
  return "not-started";
}

BatchProcessor::BatchProcessor(const LineIndex &index, std::string job_id,
                               BatchOptions opts)
    : index_(index), job_id_(std::move(job_id)), opts_(std::move(opts)) {
  progress_path_ = opts_.progress_path ? *opts_.progress_path
                                       : index_.default_progress_path();
  if (opts_.as_json && !opts_.decoder)
    opts_.decoder = json_decoder();
}

BatchProcessor::~BatchProcessor() {
  if (!in_session())
    return;
  if (std::uncaught_exceptions() > uncaught_on_enter_) {
    // выход по исключению: статус не трогаем, действует последний checkpoint
    spdlog::debug("[job={}] unwinding at position {}; keeping last checkpoint",
                  job_id_, position_);
    close_session();
    state_ = BatchState::NotStarted;
    return;
  }
  try {
    exit();
  } catch (const std::exception &e) {
    spdlog::error("[job={}] finalize failed: {}", job_id_, e.what());
  }
}

uint64_t BatchProcessor::total_lines() const { return index_.total_lines(); }

double BatchProcessor::progress() const {
  const uint64_t total = total_lines();
  if (total == 0)
    return 100.0;
  return static_cast<double>(position_) / static_cast<double>(total) * 100.0;
}

void BatchProcessor::enter() {
  if (in_session())
    throw UsageError("batch for job '" + job_id_ + "' is already entered");

  const Fingerprint live = index_.current_fingerprint();

  JobLock lock;
  if (opts_.lock)
    lock.acquire(progress_path_);

  std::optional<JobCursor> found;
  if (auto jobs = ProgressStore::load(progress_path_)) {
    auto it = jobs->find(job_id_);
    if (it != jobs->end())
      found = it->second;
  }

  if (found) {
    if (found->fingerprint() != live)
      throw StaleCheckpointError(job_id_, found->fingerprint(), live);
    if (found->position > index_.total_lines())
      throw InvalidCheckpointError(job_id_, found->position,
                                   index_.total_lines());
    spdlog::info("[job={}] resuming at line {} of {}", job_id_,
                 found->position, index_.total_lines());
  } else {
    const std::string now = iso8601_now();
    JobCursor j;
    j.job_id = job_id_;
    j.position = 0;
    j.file_size = live.size;
    j.file_mtime = live.mtime;
    j.status = JobStatus::InProgress;
    j.created_at = now;
    j.last_checkpoint_at = now;
    // id занят сразу, ещё до первого checkpoint
    ProgressStore::update_one(progress_path_, j);
    spdlog::info("[job={}] created", job_id_);
    found = std::move(j);
  }

  job_ = std::move(found);
  position_ = job_->position;
  completed_on_enter_ = job_->status == JobStatus::Completed;
  lines_.reset();
  lock_ = std::move(lock);
  uncaught_on_enter_ = std::uncaught_exceptions();
  state_ = BatchState::Active;
}

std::optional<BatchItem> BatchProcessor::next() {
  if (!in_session())
    throw UsageError("batch for job '" + job_id_ +
                     "' must be entered before iterating");
  if (state_ == BatchState::Exhausted)
    return std::nullopt;

  if (completed_on_enter_) {
    state_ = BatchState::Exhausted;
    return std::nullopt;
  }

  if (!lines_)
    lines_ = index_.iterate_from(static_cast<int64_t>(position_));

  auto text = lines_->next();
  if (!text) {
    lines_.reset();
    state_ = BatchState::Exhausted;
    return std::nullopt;
  }

  BatchItem item;
  item.line_number = position_;
  item.text = std::move(*text);
  ++position_;

  if (opts_.as_json) {
    try {
      item.record = opts_.decoder(item.text);
    } catch (const DecodeError &e) {
      throw e.with_line(item.line_number);
    }
  }
  return item;
}

void BatchProcessor::checkpoint() {
  if (!in_session() || !job_)
    throw UsageError("cannot checkpoint job '" + job_id_ +
                     "' outside of an active batch");
  // задание уже было завершено: файл прогресса не трогаем
  if (completed_on_enter_)
    return;
  job_->position = position_;
  job_->last_checkpoint_at = iso8601_now();
  ProgressStore::update_one(progress_path_, *job_);
  spdlog::debug("[job={}] checkpoint at {}", job_id_, position_);
}

void BatchProcessor::exit() {
  if (!in_session())
    return;

  if (state_ == BatchState::Exhausted) {
    if (!completed_on_enter_) {
      const std::string now = iso8601_now();
      job_->position = position_;
      job_->status = JobStatus::Completed;
      job_->completed_at = now;
      job_->last_checkpoint_at = now;
      ProgressStore::update_one(progress_path_, *job_);
      spdlog::info("[job={}] completed ({} lines)", job_id_, position_);
    }
    close_session();
    state_ = BatchState::Committed;
    return;
  }

  // ранний выход: durable остаётся последний checkpoint
  close_session();
  state_ = BatchState::NotStarted;
}

void BatchProcessor::reset() {
  (void)ProgressStore::delete_one(progress_path_, job_id_);
  close_session();
  job_.reset();
  position_ = 0;
  completed_on_enter_ = false;
  state_ = BatchState::NotStarted;
}

void BatchProcessor::close_session() {
  lines_.reset();
  lock_.release();
}

} // namespace lineidx
