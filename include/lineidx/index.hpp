#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <lineidx/batch.hpp>
#include <lineidx/index_store.hpp>
#include <lineidx/json_codec.hpp>
#include <lineidx/line_reader.hpp>
#include <lineidx/line_table.hpp>
#include <lineidx/source_file.hpp>

namespace lineidx {

struct IndexOptions {
  uint32_t checkpoint_interval = 100;
  // по умолчанию <файл>.idx рядом с источником
  std::optional<std::filesystem::path> index_path;
  bool auto_save = true;
  // держать дескриптор открытым между чтениями
  bool keep_open = false;
  size_t read_chunk_bytes = 1u << 20;
  // сверять edge_hash при загрузке и перед extend()
  bool verify_edges = true;
};

// Byte-offset index over a line-delimited file: O(1) access to any line.
//
// Loads <file>.idx when its fingerprint (and edge hash) match the live file,
// otherwise scans the file once and saves a fresh index.
//
// Reads (lookup/read_*/iterate_from/sample) do not mutate the index and may
// run concurrently. extend(), rebuild() and save() are single-writer: callers
// serialize them against everything else.
class LineIndex {
public:
  explicit LineIndex(const std::filesystem::path &file,
                     IndexOptions opts = {});
  ~LineIndex();

  LineIndex(const LineIndex &) = delete;
  LineIndex &operator=(const LineIndex &) = delete;

  uint64_t total_lines() const { return meta_.total_lines; }
  uint64_t file_size() const { return meta_.file_size; }
  const std::filesystem::path &file_path() const { return file_; }
  const std::filesystem::path &index_path() const { return index_path_; }
  const IndexMeta &meta() const { return meta_; }
  const LineTable &lines() const { return lines_; }
  const IndexOptions &options() const { return opts_; }

  // (offset, length). Throws OutOfRangeError.
  std::pair<uint64_t, uint64_t> lookup(int64_t line) const;

  std::string read_line(int64_t line) const;
  // Same, over a caller-held handle.
  std::string read_line(const SourceFile &f, int64_t line) const;
  Json::Value read_json(int64_t line) const;

  // Caller order is preserved; the file is opened once.
  std::vector<std::string> read_many(const std::vector<int64_t> &lines) const;
  std::vector<Json::Value>
  read_json_many(const std::vector<int64_t> &lines) const;

  LineCursor iterate_from(int64_t start_line = 0) const;
  RecordCursor iterate_json_from(int64_t start_line = 0,
                                 RecordDecoder decoder = {}) const;

  // n distinct lines in random order; same seed => same result.
  std::vector<std::string>
  sample_lines(size_t n, std::optional<uint64_t> seed = std::nullopt) const;
  std::vector<Json::Value>
  sample(size_t n, std::optional<uint64_t> seed = std::nullopt) const;

  // Shared handle with keep_open, a fresh one otherwise.
  std::shared_ptr<const SourceFile> open() const;
  void close();

  // Live (size, mtime). Throws SourceNotFoundError.
  Fingerprint current_fingerprint() const;

  void rebuild();
  // Indexes bytes appended since the last build/extend; returns new lines.
  // Throws ShrunkFileError.
  uint64_t extend();
  uint64_t update() { return extend(); }
  void save() const;

  // ---- batch processing ----
  BatchProcessor batch_processor(std::string job_id,
                                 BatchOptions opts = {}) const;
  std::filesystem::path default_progress_path() const;

  std::vector<JobInfo>
  list_jobs(const std::optional<std::filesystem::path> &progress = {}) const;
  std::optional<JobInfo>
  get_job(const std::string &job_id,
          const std::optional<std::filesystem::path> &progress = {}) const;
  bool reset_job(const std::string &job_id,
                 const std::optional<std::filesystem::path> &progress = {}) const;
  bool delete_job(const std::string &job_id,
                  const std::optional<std::filesystem::path> &progress = {}) const;
  size_t delete_completed_jobs(
      const std::optional<std::filesystem::path> &progress = {}) const;

private:
  void load_or_build();
  void build();
  bool edges_match(const SourceFile &f, const IndexMeta &m) const;
  std::vector<uint64_t> draw_sample(size_t n,
                                    std::optional<uint64_t> seed) const;
  std::vector<std::string>
  read_in_offset_order(const std::vector<uint64_t> &numbers) const;
  const LineEntry &entry(int64_t line) const;
  std::string read_entry(const SourceFile &f, const LineEntry &e) const;
  std::filesystem::path
  resolve_progress(const std::optional<std::filesystem::path> &p) const;
  JobInfo to_info(const JobCursor &job, const Fingerprint &live) const;

  std::filesystem::path file_;
  std::filesystem::path index_path_;
  IndexOptions opts_;

  IndexMeta meta_;
  LineTable lines_;

  std::shared_ptr<const SourceFile> handle_; // keep_open
};

} // namespace lineidx
