#include <lineidx/errors.hpp>
#include <lineidx/index.hpp>
#include <lineidx/util.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <numeric>
#include <random>
#include <unordered_set>

namespace fs = std::filesystem;

namespace lineidx {

static constexpr uint64_t kToEof = std::numeric_limits<uint64_t>::max();

// Дописывает строки из [from, limit) в lines/checkpoints; limit == kToEof:
// до конца файла. Возвращает позицию, на которой остановились.
static uint64_t scan_lines(const SourceFile &f, uint64_t from, uint64_t limit,
                           size_t chunk, uint32_t interval, LineTable &lines,
                           std::map<uint64_t, uint64_t> &checkpoints) {
  auto add_line = [&](uint64_t off, uint64_t len) {
    const uint64_t n = lines.size();
    if (n % interval == 0)
      checkpoints[n] = off;
    lines.append(off, len);
  };

  std::vector<char> buf(std::max<size_t>(chunk, 1));
  uint64_t pos = from;
  uint64_t line_start = from;
  for (;;) {
    size_t want = buf.size();
    if (limit != kToEof) {
      if (pos >= limit)
        break;
      want = static_cast<size_t>(std::min<uint64_t>(want, limit - pos));
    }
    const size_t got = f.read_at(buf.data(), want, pos);
    if (got == 0)
      break;

    const char *p = buf.data();
    const char *e = p + got;
    while (const void *hit = std::memchr(p, '\n', static_cast<size_t>(e - p))) {
      const char *nl = static_cast<const char *>(hit);
      const uint64_t end_off = pos + static_cast<uint64_t>(nl - buf.data()) + 1;
      add_line(line_start, end_off - line_start);
      line_start = end_off;
      p = nl + 1;
    }
    pos += got;
    if (got < want)
      break; // EOF
  }
  // хвост без '\n' тоже строка
  if (pos > line_start)
    add_line(line_start, pos - line_start);
  return pos;
}

LineIndex::LineIndex(const fs::path &file, IndexOptions opts)
    : file_(fs::weakly_canonical(fs::absolute(file))), opts_(std::move(opts)) {
  if (opts_.checkpoint_interval == 0)
    throw UsageError("checkpoint_interval must be positive");
  index_path_ =
      opts_.index_path ? *opts_.index_path : companion_path(file_, ".idx");
  load_or_build();
  if (opts_.keep_open)
    handle_ = std::make_shared<const SourceFile>(file_);
}

LineIndex::~LineIndex() = default;

bool LineIndex::edges_match(const SourceFile &f, const IndexMeta &m) const {
  if (!opts_.verify_edges || !m.edge_hash)
    return true;
  return edge_hash(f, m.file_size) == *m.edge_hash;
}

void LineIndex::load_or_build() {
  const auto live = stat_fingerprint(file_);
  if (!live)
    throw SourceNotFoundError(file_);

  if (auto loaded = IndexStore::load(index_path_)) {
    if (loaded->meta.is_fresh(*live)) {
      SourceFile f(file_);
      if (edges_match(f, loaded->meta)) {
        meta_ = std::move(loaded->meta);
        lines_ = std::move(loaded->lines);
        spdlog::debug("index {}: loaded {} lines", index_path_.string(),
                      meta_.total_lines);
        return;
      }
      spdlog::warn("index {}: fingerprint matches but content differs; "
                   "rebuilding",
                   index_path_.string());
    } else {
      spdlog::info("index {}: stale (size {} -> {}); rebuilding",
                   index_path_.string(), loaded->meta.file_size, live->size);
    }
  }

  build();
  if (opts_.auto_save)
    save();
}

void LineIndex::build() {
  SourceFile f(file_);

  IndexMeta m;
  m.file_path = file_.string();
  m.checkpoint_interval = opts_.checkpoint_interval;
  LineTable t;
  const uint64_t end = scan_lines(f, 0, kToEof, opts_.read_chunk_bytes,
                                  m.checkpoint_interval, t, m.checkpoints);

  const Fingerprint after = f.fingerprint();
  if (after.size != end)
    spdlog::warn("{}: size changed during scan ({} scanned, {} now)",
                 file_.string(), end, after.size);

  m.file_size = end;
  m.file_mtime = after.mtime;
  m.total_lines = t.size();
  m.indexed_at = iso8601_now();
  m.edge_hash = edge_hash(f, end);

  meta_ = std::move(m);
  lines_ = std::move(t);
  spdlog::info("indexed {}: {} lines, {} bytes", file_.string(),
               meta_.total_lines, meta_.file_size);
}

void LineIndex::rebuild() {
  build();
  if (handle_)
    handle_ = std::make_shared<const SourceFile>(file_);
  if (opts_.auto_save)
    save();
}

uint64_t LineIndex::extend() {
  const Fingerprint live = current_fingerprint();
  const uint64_t old_size = meta_.file_size;
  const uint64_t old_total = meta_.total_lines;

  if (live.size == old_size)
    return 0;
  if (live.size < old_size)
    throw ShrunkFileError(file_, old_size, live.size);

  SourceFile f(file_);
  if (!edges_match(f, meta_)) {
    spdlog::warn("{}: indexed prefix was rewritten; full rebuild",
                 file_.string());
    rebuild();
    return meta_.total_lines > old_total ? meta_.total_lines - old_total : 0;
  }

  uint64_t end = 0;
  try {
    end = scan_lines(f, old_size, live.size, opts_.read_chunk_bytes,
                     meta_.checkpoint_interval, lines_, meta_.checkpoints);
  } catch (...) {
    // откат: индекс остаётся как до extend()
    lines_.truncate(static_cast<size_t>(old_total));
    meta_.checkpoints.erase(meta_.checkpoints.lower_bound(old_total),
                            meta_.checkpoints.end());
    throw;
  }

  meta_.file_size = end;
  meta_.file_mtime = f.fingerprint().mtime;
  meta_.total_lines = lines_.size();
  meta_.edge_hash = edge_hash(f, end);

  const uint64_t added = meta_.total_lines - old_total;
  spdlog::info("index {}: +{} lines ({} -> {} bytes)", file_.string(), added,
               old_size, end);
  if (opts_.auto_save)
    save();
  return added;
}

void LineIndex::save() const { IndexStore::save(index_path_, meta_, lines_); }

Fingerprint LineIndex::current_fingerprint() const {
  return require_fingerprint(file_);
}

std::shared_ptr<const SourceFile> LineIndex::open() const {
  if (handle_)
    return handle_;
  return std::make_shared<const SourceFile>(file_);
}

void LineIndex::close() { handle_.reset(); }

const LineEntry &LineIndex::entry(int64_t line) const {
  if (line < 0 || static_cast<uint64_t>(line) >= lines_.size())
    throw OutOfRangeError(line, lines_.size());
  return lines_[static_cast<size_t>(line)];
}

std::pair<uint64_t, uint64_t> LineIndex::lookup(int64_t line) const {
  const auto &e = entry(line);
  return {e.offset, e.length};
}

std::string LineIndex::read_entry(const SourceFile &f,
                                  const LineEntry &e) const {
  std::string buf(static_cast<size_t>(e.length), '\0');
  const size_t got = f.read_at(buf.data(), buf.size(), e.offset);
  if (got < e.length)
    throw CorruptedLineError(e.line_number, e.length, got);
  strip_terminator(buf);
  return buf;
}

std::string LineIndex::read_line(const SourceFile &f, int64_t line) const {
  return read_entry(f, entry(line));
}

std::string LineIndex::read_line(int64_t line) const {
  const auto &e = entry(line);
  return read_entry(*open(), e);
}

Json::Value LineIndex::read_json(int64_t line) const {
  auto text = read_line(line);
  try {
    return parse_json(text);
  } catch (const DecodeError &e) {
    throw e.with_line(static_cast<uint64_t>(line));
  }
}

std::vector<std::string>
LineIndex::read_many(const std::vector<int64_t> &lines) const {
  std::vector<std::string> out;
  out.reserve(lines.size());
  if (lines.empty())
    return out;
  // диапазон проверяем до открытия файла
  for (auto n : lines)
    (void)entry(n);
  const auto f = open();
  for (auto n : lines)
    out.push_back(read_entry(*f, entry(n)));
  return out;
}

std::vector<Json::Value>
LineIndex::read_json_many(const std::vector<int64_t> &lines) const {
  auto texts = read_many(lines);
  std::vector<Json::Value> out;
  out.reserve(texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    try {
      out.push_back(parse_json(texts[i]));
    } catch (const DecodeError &e) {
      throw e.with_line(static_cast<uint64_t>(lines[i]));
    }
  }
  return out;
}

LineCursor LineIndex::iterate_from(int64_t start_line) const {
  if (start_line < 0)
    start_line = 0;
  if (static_cast<uint64_t>(start_line) >= lines_.size())
    return LineCursor{};
  const auto &e = lines_[static_cast<size_t>(start_line)];
  return LineCursor(open(), e.line_number, e.offset, lines_.end_offset(),
                    opts_.read_chunk_bytes);
}

RecordCursor LineIndex::iterate_json_from(int64_t start_line,
                                          RecordDecoder decoder) const {
  return RecordCursor(iterate_from(start_line), std::move(decoder));
}

std::vector<uint64_t>
LineIndex::draw_sample(size_t n, std::optional<uint64_t> seed) const {
  const uint64_t total = lines_.size();
  n = static_cast<size_t>(std::min<uint64_t>(n, total));
  std::vector<uint64_t> picks;
  if (n == 0)
    return picks;

  std::mt19937_64 rng(seed ? *seed : std::random_device{}());
  picks.reserve(n);
  if (n * 4 >= total) {
    // плотная выборка: частичный Fisher-Yates
    std::vector<uint64_t> pool(static_cast<size_t>(total));
    std::iota(pool.begin(), pool.end(), uint64_t{0});
    for (size_t i = 0; i < n; ++i) {
      std::uniform_int_distribution<uint64_t> d(i, total - 1);
      std::swap(pool[i], pool[static_cast<size_t>(d(rng))]);
    }
    picks.assign(pool.begin(), pool.begin() + static_cast<std::ptrdiff_t>(n));
  } else {
    std::uniform_int_distribution<uint64_t> d(0, total - 1);
    std::unordered_set<uint64_t> seen;
    seen.reserve(n * 2);
    while (picks.size() < n) {
      const uint64_t x = d(rng);
      if (seen.insert(x).second)
        picks.push_back(x);
    }
  }
  return picks;
}

std::vector<std::string>
LineIndex::read_in_offset_order(const std::vector<uint64_t> &numbers) const {
  // читаем по возрастанию смещения, возвращаем в порядке выборки
  std::vector<size_t> order(numbers.size());
  std::iota(order.begin(), order.end(), size_t{0});
  std::sort(order.begin(), order.end(),
            [&](size_t a, size_t b) { return numbers[a] < numbers[b]; });

  std::vector<int64_t> sorted;
  sorted.reserve(order.size());
  for (auto i : order)
    sorted.push_back(static_cast<int64_t>(numbers[i]));
  auto texts = read_many(sorted);

  std::vector<std::string> out(numbers.size());
  for (size_t k = 0; k < order.size(); ++k)
    out[order[k]] = std::move(texts[k]);
  return out;
}

std::vector<std::string>
LineIndex::sample_lines(size_t n, std::optional<uint64_t> seed) const {
  return read_in_offset_order(draw_sample(n, seed));
}

std::vector<Json::Value> LineIndex::sample(size_t n,
                                           std::optional<uint64_t> seed) const {
  const auto numbers = draw_sample(n, seed);
  auto texts = read_in_offset_order(numbers);
  std::vector<Json::Value> out;
  out.reserve(texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    try {
      out.push_back(parse_json(texts[i]));
    } catch (const DecodeError &e) {
      throw e.with_line(numbers[i]);
    }
  }
  return out;
}

// ---- batch processing ----

BatchProcessor LineIndex::batch_processor(std::string job_id,
                                          BatchOptions opts) const {
  return BatchProcessor(*this, std::move(job_id), std::move(opts));
}

fs::path LineIndex::default_progress_path() const {
  return companion_path(file_, ".progress");
}

fs::path LineIndex::resolve_progress(const std::optional<fs::path> &p) const {
  return p ? *p : default_progress_path();
}

JobInfo LineIndex::to_info(const JobCursor &job,
                           const Fingerprint &live) const {
  JobInfo info;
  info.job_id = job.job_id;
  info.position = job.position;
  info.status = job.status;
  info.total_lines = total_lines();
  info.progress_pct =
      total_lines() > 0 ? static_cast<double>(job.position) /
                              static_cast<double>(total_lines()) * 100.0
                        : 100.0;
  info.created_at = job.created_at;
  info.last_checkpoint_at = job.last_checkpoint_at;
  info.completed_at = job.completed_at;
  info.is_stale = job.fingerprint() != live;
  return info;
}

std::vector<JobInfo>
LineIndex::list_jobs(const std::optional<fs::path> &progress) const {
  std::vector<JobInfo> out;
  auto jobs = ProgressStore::load(resolve_progress(progress));
  if (!jobs || jobs->empty())
    return out;
  const Fingerprint live = current_fingerprint();
  out.reserve(jobs->size());
  for (const auto &[id, job] : *jobs)
    out.push_back(to_info(job, live));
  return out;
}

std::optional<JobInfo>
LineIndex::get_job(const std::string &job_id,
                   const std::optional<fs::path> &progress) const {
  auto jobs = ProgressStore::load(resolve_progress(progress));
  if (!jobs)
    return std::nullopt;
  auto it = jobs->find(job_id);
  if (it == jobs->end())
    return std::nullopt;
  return to_info(it->second, current_fingerprint());
}

bool LineIndex::reset_job(const std::string &job_id,
                          const std::optional<fs::path> &progress) const {
  const bool removed =
      ProgressStore::delete_one(resolve_progress(progress), job_id);
  if (removed)
    spdlog::info("[job={}] reset", job_id);
  return removed;
}

bool LineIndex::delete_job(const std::string &job_id,
                           const std::optional<fs::path> &progress) const {
  return reset_job(job_id, progress);
}

size_t
LineIndex::delete_completed_jobs(const std::optional<fs::path> &progress) const {
  const fs::path path = resolve_progress(progress);
  auto jobs = ProgressStore::load(path);
  if (!jobs)
    return 0;
  size_t removed = 0;
  for (auto it = jobs->begin(); it != jobs->end();) {
    if (it->second.status == JobStatus::Completed) {
      it = jobs->erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0)
    ProgressStore::save(path, *jobs);
  return removed;
}

} // namespace lineidx
