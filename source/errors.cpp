#include <lineidx/errors.hpp>
#include <lineidx/fingerprint.hpp>

#include <fmt/format.h>

namespace lineidx {

SourceNotFoundError::SourceNotFoundError(const std::filesystem::path &p)
    : Error(fmt::format("source file not found: {}", p.string())), path_(p) {}

ShrunkFileError::ShrunkFileError(const std::filesystem::path &p,
                                 uint64_t indexed_size, uint64_t current_size)
    : Error(fmt::format("file shrunk from {} to {} bytes: {}; use rebuild()",
                        indexed_size, current_size, p.string())),
      indexed_size_(indexed_size), current_size_(current_size) {}

static std::string range_message(int64_t line, uint64_t total) {
  if (total == 0)
    return fmt::format("line {} out of range (index is empty)", line);
  return fmt::format("line {} out of range (0-{})", line, total - 1);
}

OutOfRangeError::OutOfRangeError(int64_t line, uint64_t total_lines)
    : Error(range_message(line, total_lines)), line_(line) {}

CorruptedLineError::CorruptedLineError(uint64_t line, uint64_t expected,
                                       uint64_t got)
    : Error(fmt::format("line {}: expected {} bytes, got {} (file changed "
                        "without reindexing?)",
                        line, expected, got)),
      line_(line) {}

CorruptedLineError::CorruptedLineError(uint64_t line, uint64_t begin,
                                       uint64_t end, uint64_t eof)
    : Error(fmt::format("line {}: indexed bytes [{}, {}) but file ends at {} "
                        "(file changed without reindexing?)",
                        line, begin, end, eof)),
      line_(line) {}

StaleCheckpointError::StaleCheckpointError(const std::string &job_id,
                                           const Fingerprint &stored,
                                           const Fingerprint &live)
    : Error(fmt::format(
          "file has changed since last checkpoint for job '{}': expected "
          "size={}, mtime={:.6f}; got size={}, mtime={:.6f}; reset the job "
          "to restart from the beginning",
          job_id, stored.size, stored.mtime, live.size, live.mtime)),
      job_id_(job_id) {}

InvalidCheckpointError::InvalidCheckpointError(const std::string &job_id,
                                               uint64_t position,
                                               uint64_t total_lines)
    : Error(fmt::format(
          "checkpoint position {} exceeds total lines {} for job '{}'",
          position, total_lines, job_id)),
      job_id_(job_id) {}

static std::string decode_message(const std::optional<uint64_t> &line,
                                  const std::string &reason) {
  if (line)
    return fmt::format("invalid record at line {}: {}", *line, reason);
  return fmt::format("invalid record: {}", reason);
}

DecodeError::DecodeError(std::optional<uint64_t> line,
                         const std::string &reason)
    : Error(decode_message(line, reason)), line_(line), reason_(reason) {}

DecodeError DecodeError::with_line(uint64_t line) const {
  return DecodeError(line, reason_);
}

JobLockedError::JobLockedError(const std::filesystem::path &lock_path)
    : Error(fmt::format("job progress is locked by another process: {}",
                        lock_path.string())) {}

} // namespace lineidx
