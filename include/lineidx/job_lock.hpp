#pragma once
#include <filesystem>

namespace lineidx {

// Advisory exclusive flock on "<progress>.lock". The OS drops it when the
// process dies, so a crashed worker never leaves the job locked.
class JobLock {
public:
  JobLock() = default;
  ~JobLock();

  JobLock(const JobLock &) = delete;
  JobLock &operator=(const JobLock &) = delete;
  JobLock(JobLock &&o) noexcept;
  JobLock &operator=(JobLock &&o) noexcept;

  // Throws JobLockedError if another descriptor holds it.
  void acquire(const std::filesystem::path &progress_path);
  void release();

  bool held() const { return fd_ >= 0; }
  const std::filesystem::path &lock_path() const { return lock_path_; }

  static std::filesystem::path lock_path_for(const std::filesystem::path &progress_path);

private:
  int fd_ = -1;
  std::filesystem::path lock_path_;
};

} // namespace lineidx
