#include <lineidx/util.hpp>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace lineidx {

std::string iso8601_now() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto t = system_clock::to_time_t(now);
  const auto us =
      duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[96];
  std::snprintf(out, sizeof(out), "%s.%06lld+00:00", buf,
                static_cast<long long>(us));
  return std::string(out);
}

static void fsync_dir_path(const fs::path &dir) {
  int dfd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd >= 0) {
    (void)::fsync(dfd);
    ::close(dfd);
  }
}

[[noreturn]] static void throw_errno(const std::string &what,
                                     const fs::path &p) {
  throw std::system_error(errno, std::generic_category(),
                          what + ": " + p.string());
}

void write_file_atomic(const fs::path &p, std::string_view data) {
  fs::path tmp = p;
  tmp += ".tmp";

  int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0)
    throw_errno("open", tmp);

  size_t done = 0;
  while (done < data.size()) {
    ssize_t w = ::write(fd, data.data() + done, data.size() - done);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      const int e = errno;
      ::close(fd);
      ::unlink(tmp.c_str());
      errno = e;
      throw_errno("write", tmp);
    }
    done += static_cast<size_t>(w);
  }

  // гарантируем запись содержимого файла
  if (::fsync(fd) != 0) {
    const int e = errno;
    ::close(fd);
    ::unlink(tmp.c_str());
    errno = e;
    throw_errno("fsync", tmp);
  }
  ::close(fd);

  // атомарная переклейка имени
  if (::rename(tmp.c_str(), p.c_str()) != 0) {
    const int e = errno;
    ::unlink(tmp.c_str());
    errno = e;
    throw_errno("rename", p);
  }

  fsync_dir_path(p.parent_path());
}

std::optional<std::string> read_file(const fs::path &p) {
  std::ifstream f(p, std::ios::binary);
  if (!f.is_open())
    return std::nullopt;
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

fs::path companion_path(const fs::path &source, std::string_view ext) {
  fs::path out = source;
  out.replace_extension(fs::path(std::string(ext)));
  return out;
}

} // namespace lineidx
