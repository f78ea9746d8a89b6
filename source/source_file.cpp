#include <lineidx/errors.hpp>
#include <lineidx/source_file.hpp>

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace lineidx {

SourceFile::SourceFile(const std::filesystem::path &p) : path_(p) {
  fd_ = ::open(p.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    if (errno == ENOENT)
      throw SourceNotFoundError(p);
    throw std::system_error(errno, std::generic_category(),
                            "open: " + p.string());
  }
}

SourceFile::~SourceFile() { close(); }

SourceFile::SourceFile(SourceFile &&o) noexcept
    : fd_(o.fd_), path_(std::move(o.path_)) {
  o.fd_ = -1;
}

SourceFile &SourceFile::operator=(SourceFile &&o) noexcept {
  if (this != &o) {
    close();
    fd_ = o.fd_;
    path_ = std::move(o.path_);
    o.fd_ = -1;
  }
  return *this;
}

void SourceFile::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

size_t SourceFile::read_at(void *buf, size_t len, uint64_t off) const {
  auto *p = static_cast<char *>(buf);
  size_t done = 0;
  while (done < len) {
    ssize_t r = ::pread(fd_, p + done, len - done,
                        static_cast<off_t>(off + done));
    if (r < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(),
                              "pread: " + path_.string());
    }
    if (r == 0)
      break; // EOF
    done += static_cast<size_t>(r);
  }
  return done;
}

static double mtime_seconds(const struct stat &st) {
  return static_cast<double>(st.st_mtim.tv_sec) +
         static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
}

Fingerprint SourceFile::fingerprint() const {
  struct stat st {};
  if (::fstat(fd_, &st) != 0)
    throw std::system_error(errno, std::generic_category(),
                            "fstat: " + path_.string());
  return Fingerprint{static_cast<uint64_t>(st.st_size), mtime_seconds(st)};
}

std::optional<Fingerprint> stat_fingerprint(const std::filesystem::path &p) {
  struct stat st {};
  if (::stat(p.c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR)
      return std::nullopt;
    throw std::system_error(errno, std::generic_category(),
                            "stat: " + p.string());
  }
  return Fingerprint{static_cast<uint64_t>(st.st_size), mtime_seconds(st)};
}

Fingerprint require_fingerprint(const std::filesystem::path &p) {
  auto fp = stat_fingerprint(p);
  if (!fp)
    throw SourceNotFoundError(p);
  return *fp;
}

} // namespace lineidx
