#include <catch2/catch_all.hpp>

#include <lineidx/errors.hpp>
#include <lineidx/index.hpp>
#include <lineidx/index_store.hpp>
#include <lineidx/util.hpp>

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace lineidx;
namespace fs = std::filesystem;

static fs::path mktmp(const char *p) {
  auto d = fs::temp_directory_path() /
           (std::string(p) + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void spit(const fs::path &p, const std::string &s) {
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  f << s;
}

static void append(const fs::path &p, const std::string &s) {
  std::ofstream f(p, std::ios::binary | std::ios::app);
  f << s;
}

static std::string records(int from, int to) {
  std::string s;
  for (int i = from; i < to; ++i)
    s += R"({"id":)" + std::to_string(i) + "}\n";
  return s;
}

TEST_CASE("extend indexes appended lines only") {
  auto dir = mktmp("lineidx_update_");
  auto file = dir / "u.jsonl";
  spit(file, records(0, 150));

  LineIndex idx(file, {.checkpoint_interval = 100});
  const LineTable before = idx.lines();

  append(file, records(150, 230));
  REQUIRE(idx.extend() == 80);
  REQUIRE(idx.total_lines() == 230);
  REQUIRE(idx.file_size() == fs::file_size(file));
  for (size_t i = 0; i < before.size(); ++i)
    REQUIRE(idx.lines()[i] == before[i]);
  REQUIRE(idx.read_line(229) == R"({"id":229})");
  REQUIRE(idx.meta().checkpoints.count(200) == 1);

  SECTION("matches a fresh build") {
    LineIndex fresh(file, {.checkpoint_interval = 100,
                           .index_path = dir / "fresh.idx",
                           .auto_save = false});
    REQUIRE(fresh.lines() == idx.lines());
    REQUIRE(fresh.meta().checkpoints == idx.meta().checkpoints);
  }

  SECTION("saved index is picked up on reopen") {
    LineIndex again(file, {.checkpoint_interval = 100});
    REQUIRE(again.total_lines() == 230);
    REQUIRE(again.meta().indexed_at == idx.meta().indexed_at);
  }
}

TEST_CASE("extend with no growth is a no-op") {
  auto dir = mktmp("lineidx_update_noop_");
  auto file = dir / "n.jsonl";
  spit(file, records(0, 5));
  LineIndex idx(file);
  const auto meta = idx.meta();
  REQUIRE(idx.extend() == 0);
  REQUIRE(idx.meta() == meta);
}

TEST_CASE("extend after an unterminated last line starts a new entry") {
  auto dir = mktmp("lineidx_update_tail_");
  auto file = dir / "t.jsonl";
  spit(file, "{\"a\":1}\n{\"a\":");
  LineIndex idx(file);
  REQUIRE(idx.total_lines() == 2);
  const auto last = idx.lines()[1];

  append(file, "2}\n");
  REQUIRE(idx.extend() == 1);
  REQUIRE(idx.lines()[1] == last);
  REQUIRE(idx.read_line(2) == "2}");
  REQUIRE(idx.lines().contiguous());
}

TEST_CASE("extend on a shrunk file throws") {
  auto dir = mktmp("lineidx_update_shrunk_");
  auto file = dir / "s.jsonl";
  spit(file, records(0, 10));
  LineIndex idx(file);
  const auto total = idx.total_lines();

  fs::resize_file(file, 5);
  REQUIRE_THROWS_AS(idx.extend(), ShrunkFileError);
  REQUIRE(idx.total_lines() == total);

  idx.rebuild();
  REQUIRE(idx.total_lines() == 1);
  REQUIRE(idx.file_size() == 5);

  LineIndex fresh(file, {.index_path = dir / "fresh.idx", .auto_save = false});
  REQUIRE(idx.lines() == fresh.lines());
  REQUIRE(idx.meta().checkpoints == fresh.meta().checkpoints);
  REQUIRE(idx.meta().total_lines == fresh.meta().total_lines);
}

TEST_CASE("rebuild after shrink matches a fresh build on a larger file") {
  auto dir = mktmp("lineidx_update_shrunk_big_");
  auto file = dir / "b.jsonl";
  spit(file, records(0, 300));
  LineIndex idx(file, {.checkpoint_interval = 50});

  spit(file, records(0, 120));
  REQUIRE_THROWS_AS(idx.extend(), ShrunkFileError);
  idx.rebuild();

  LineIndex fresh(file, {.checkpoint_interval = 50,
                         .index_path = dir / "fresh.idx",
                         .auto_save = false});
  REQUIRE(idx.total_lines() == 120);
  REQUIRE(idx.lines() == fresh.lines());
  REQUIRE(idx.meta().checkpoints == fresh.meta().checkpoints);
  REQUIRE(idx.lines().contiguous());
}

// Индекс, который совпадает с файлом по (size, mtime), но сам испорчен.
static void save_forged(const fs::path &file, uint32_t interval,
                        const LineTable &lines, uint64_t total) {
  const auto live = require_fingerprint(file);
  IndexMeta m;
  m.file_path = file.string();
  m.file_size = live.size;
  m.file_mtime = live.mtime;
  m.total_lines = total;
  m.checkpoint_interval = interval;
  m.checkpoints = {{0, 0}};
  m.indexed_at = "2026-10-18T00:00:00.000000+00:00";
  IndexStore::save(companion_path(file, ".idx"), m, lines);
}

TEST_CASE("Stored zero checkpoint interval is rebuilt, extend keeps working") {
  auto dir = mktmp("lineidx_update_zero_interval_");
  auto file = dir / "z.jsonl";
  spit(file, "{\"a\":1}\n{\"a\":2}\n");
  LineTable t;
  t.append(0, 8);
  t.append(8, 8);
  save_forged(file, 0, t, 2);

  LineIndex idx(file);
  REQUIRE(idx.meta().checkpoint_interval == 100);
  append(file, "{\"a\":3}\n");
  REQUIRE(idx.extend() == 1);
  REQUIRE(idx.read_line(2) == "{\"a\":3}");
}

TEST_CASE("Stored table shorter than the file is rebuilt") {
  auto dir = mktmp("lineidx_update_short_table_");
  auto file = dir / "s.jsonl";
  spit(file, "{\"a\":1}\n{\"a\":2}\n");
  LineTable t;
  t.append(0, 8);
  save_forged(file, 100, t, 1);

  LineIndex idx(file);
  REQUIRE(idx.total_lines() == 2);
  append(file, "{\"a\":3}\n");
  REQUIRE(idx.extend() == 1);
  REQUIRE(idx.lines().contiguous());
  REQUIRE(idx.read_line(1) == "{\"a\":2}");
  REQUIRE(idx.read_line(2) == "{\"a\":3}");
}

TEST_CASE("update rebuilds when the indexed prefix was rewritten") {
  auto dir = mktmp("lineidx_update_rewrite_");
  auto file = dir / "w.jsonl";
  spit(file, "aaa\nbbb\n");
  LineIndex idx(file);

  spit(file, "xxxxxx\nyy\nzz\n");
  REQUIRE(idx.update() == 1);
  REQUIRE(idx.total_lines() == 3);
  REQUIRE(idx.read_line(0) == "xxxxxx");
}

TEST_CASE("Fingerprint match with different content triggers a rebuild") {
  auto dir = mktmp("lineidx_edge_");
  auto file = dir / "e.jsonl";
  spit(file, "aaa\nbbb\n");
  { LineIndex idx(file); }
  const auto mtime = fs::last_write_time(file);

  spit(file, "ccccccc\n"); // тот же размер
  fs::last_write_time(file, mtime);

  SECTION("verified") {
    LineIndex idx(file);
    REQUIRE(idx.total_lines() == 1);
    REQUIRE(idx.read_line(0) == "ccccccc");
  }

  SECTION("trusted without verification") {
    LineIndex idx(file, {.verify_edges = false});
    REQUIRE(idx.total_lines() == 2);
  }
}

TEST_CASE("Stale index is rebuilt on open") {
  auto dir = mktmp("lineidx_stale_idx_");
  auto file = dir / "s.jsonl";
  spit(file, records(0, 3));
  { LineIndex idx(file); }

  append(file, records(3, 7));
  LineIndex idx(file);
  REQUIRE(idx.total_lines() == 7);
}
