#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <lineidx/fingerprint.hpp>

namespace lineidx {

inline constexpr const char *kProgressFormatVersion = "1.0";

enum class JobStatus : uint8_t { InProgress, Completed };

const char *to_string(JobStatus s);
std::optional<JobStatus> parse_job_status(std::string_view s);

// Курсор задания: position = следующая необработанная строка.
struct JobCursor {
  std::string job_id;
  uint64_t position = 0;
  uint64_t file_size = 0;
  double file_mtime = 0.0;
  JobStatus status = JobStatus::InProgress;
  std::string created_at;
  std::string last_checkpoint_at;
  std::optional<std::string> completed_at;

  Fingerprint fingerprint() const { return {file_size, file_mtime}; }

  bool operator==(const JobCursor &) const = default;
};

using JobMap = std::map<std::string, JobCursor>;

// Progress file:
//   {"format_version":"1.0","jobs":{"<id>":{"position",...,"completed_at"}}}
//
// Read-modify-write without locking: one writer per progress file, or take
// a JobLock around the session.
struct ProgressStore {
  static void save(const std::filesystem::path &p, const JobMap &jobs);

  // nullopt for a missing, unparsable or foreign-version file.
  static std::optional<JobMap> load(const std::filesystem::path &p);

  // load (or start empty), replace one cursor, save
  static void update_one(const std::filesystem::path &p,
                         const JobCursor &job);

  // true iff the job existed
  static bool delete_one(const std::filesystem::path &p,
                         const std::string &job_id);
};

} // namespace lineidx
