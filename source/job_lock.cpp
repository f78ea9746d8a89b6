#include <lineidx/errors.hpp>
#include <lineidx/job_lock.hpp>

#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace lineidx {

fs::path JobLock::lock_path_for(const fs::path &progress_path) {
  fs::path p = progress_path;
  p += ".lock";
  return p;
}

JobLock::~JobLock() { release(); }

JobLock::JobLock(JobLock &&o) noexcept
    : fd_(o.fd_), lock_path_(std::move(o.lock_path_)) {
  o.fd_ = -1;
}

JobLock &JobLock::operator=(JobLock &&o) noexcept {
  if (this != &o) {
    release();
    fd_ = o.fd_;
    lock_path_ = std::move(o.lock_path_);
    o.fd_ = -1;
  }
  return *this;
}

void JobLock::acquire(const fs::path &progress_path) {
  release();
  const fs::path lp = lock_path_for(progress_path);
  int fd = ::open(lp.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
  if (fd < 0)
    throw std::system_error(errno, std::generic_category(),
                            "open: " + lp.string());
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int e = errno;
    ::close(fd);
    if (e == EWOULDBLOCK)
      throw JobLockedError(lp);
    throw std::system_error(e, std::generic_category(),
                            "flock: " + lp.string());
  }
  fd_ = fd;
  lock_path_ = lp;
}

void JobLock::release() {
  if (fd_ >= 0) {
    (void)::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
  fd_ = -1;
}

} // namespace lineidx
