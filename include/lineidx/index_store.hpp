#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include <lineidx/fingerprint.hpp>
#include <lineidx/line_table.hpp>

namespace lineidx {

inline constexpr const char *kIndexFormatVersion = "1.0";
inline constexpr const char *kIndexMetaVersion = "1.0";

struct IndexMeta {
  std::string file_path;
  uint64_t file_size = 0;
  double file_mtime = 0.0;
  uint64_t total_lines = 0;
  uint32_t checkpoint_interval = 100;
  std::map<uint64_t, uint64_t> checkpoints; // line -> offset, разреженно
  std::string indexed_at;
  std::string version = kIndexMetaVersion;
  std::optional<uint64_t> edge_hash; // XXH64 головы/хвоста, см. edge_hash()

  Fingerprint fingerprint() const { return {file_size, file_mtime}; }
  bool is_fresh(const Fingerprint &live) const { return fingerprint() == live; }

  bool operator==(const IndexMeta &) const = default;
};

struct LoadedIndex {
  IndexMeta meta;
  LineTable lines;
};

// On-disk layout (JSON):
//   {"format_version":"1.0",
//    "meta":{"file_path",...,"checkpoints":{"0":0,...},...},
//    "lines":[[offset,length],...]}       // позиция в массиве == номер строки
struct IndexStore {
  // Полная перезапись, атомарно. Throws std::system_error.
  static void save(const std::filesystem::path &p, const IndexMeta &meta,
                   const LineTable &lines);

  // nullopt for a missing, unparsable, foreign-version or inconsistent file.
  static std::optional<LoadedIndex> load(const std::filesystem::path &p);
};

} // namespace lineidx
