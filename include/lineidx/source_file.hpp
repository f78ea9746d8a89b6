#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>

#include <lineidx/fingerprint.hpp>

namespace lineidx {

// Read-only descriptor over the indexed file. All reads are positioned
// (pread), so one instance may be shared by concurrent readers.
class SourceFile {
public:
  SourceFile() = default;
  explicit SourceFile(const std::filesystem::path &p);
  ~SourceFile();

  SourceFile(const SourceFile &) = delete;
  SourceFile &operator=(const SourceFile &) = delete;
  SourceFile(SourceFile &&o) noexcept;
  SourceFile &operator=(SourceFile &&o) noexcept;

  bool good() const { return fd_ >= 0; }
  int fd() const { return fd_; }
  const std::filesystem::path &path() const { return path_; }

  // Reads up to len bytes at off; short only at EOF.
  size_t read_at(void *buf, size_t len, uint64_t off) const;

  Fingerprint fingerprint() const;

  void close();

private:
  int fd_ = -1;
  std::filesystem::path path_;
};

} // namespace lineidx
