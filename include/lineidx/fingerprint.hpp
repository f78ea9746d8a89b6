#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>

namespace lineidx {

class SourceFile;

// (size, mtime): по нему решаем, соответствует ли индекс/чекпоинт файлу.
struct Fingerprint {
  uint64_t size = 0;
  double mtime = 0.0; // секунды от эпохи, с наносекундной частью

  bool operator==(const Fingerprint &) const = default;
};

// nullopt, если файла нет.
std::optional<Fingerprint> stat_fingerprint(const std::filesystem::path &p);

// Throws SourceNotFoundError when the file is missing.
Fingerprint require_fingerprint(const std::filesystem::path &p);

// Head/tail window size used by edge_hash().
inline constexpr uint64_t kEdgeWindowBytes = 4096;

// XXH64 over the first and last kEdgeWindowBytes of [0, size).
// A file shorter than `size` hashes what is there, so the result won't match.
uint64_t edge_hash(const SourceFile &f, uint64_t size);

} // namespace lineidx
