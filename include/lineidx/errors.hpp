#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace lineidx {

struct Fingerprint;

// Общий корень для всех ошибок библиотеки.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class SourceNotFoundError : public Error {
public:
  explicit SourceNotFoundError(const std::filesystem::path &p);
  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

// extend() on a file smaller than the indexed size; only rebuild() recovers.
class ShrunkFileError : public Error {
public:
  ShrunkFileError(const std::filesystem::path &p, uint64_t indexed_size,
                  uint64_t current_size);
  uint64_t indexed_size() const { return indexed_size_; }
  uint64_t current_size() const { return current_size_; }

private:
  uint64_t indexed_size_;
  uint64_t current_size_;
};

class OutOfRangeError : public Error {
public:
  OutOfRangeError(int64_t line, uint64_t total_lines);
  int64_t line() const { return line_; }

private:
  int64_t line_;
};

// Fewer bytes on disk than the index promised.
class CorruptedLineError : public Error {
public:
  CorruptedLineError(uint64_t line, uint64_t expected, uint64_t got);
  // Sequential read: the indexed range [begin, end) ended on disk at eof.
  CorruptedLineError(uint64_t line, uint64_t begin, uint64_t end,
                     uint64_t eof);
  uint64_t line() const { return line_; }

private:
  uint64_t line_;
};

class StaleCheckpointError : public Error {
public:
  StaleCheckpointError(const std::string &job_id, const Fingerprint &stored,
                       const Fingerprint &live);
  const std::string &job_id() const { return job_id_; }

private:
  std::string job_id_;
};

class InvalidCheckpointError : public Error {
public:
  InvalidCheckpointError(const std::string &job_id, uint64_t position,
                         uint64_t total_lines);
  const std::string &job_id() const { return job_id_; }

private:
  std::string job_id_;
};

class DecodeError : public Error {
public:
  DecodeError(std::optional<uint64_t> line, const std::string &reason);
  const std::optional<uint64_t> &line() const { return line_; }
  DecodeError with_line(uint64_t line) const;

private:
  std::optional<uint64_t> line_;
  std::string reason_;
};

class UsageError : public Error {
public:
  using Error::Error;
};

class JobLockedError : public Error {
public:
  explicit JobLockedError(const std::filesystem::path &lock_path);
};

} // namespace lineidx
