#include <catch2/catch_all.hpp>

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

static IndexMeta sample_meta(uint64_t total, uint64_t size) {
  IndexMeta m;
  m.file_path = "/data/events.jsonl";
  m.file_size = size;
  m.file_mtime = 1760000000.123456789;
  m.total_lines = total;
  m.checkpoint_interval = 2;
  m.indexed_at = "2026-10-18T10:11:12.123456+00:00";
  return m;
}

TEST_CASE("IndexStore round-trips meta and line table") {
  auto dir = mktmp("lineidx_store_rt_");
  LineTable t;
  t.append(0, 10);
  t.append(10, 3);
  t.append(13, 7);
  auto m = sample_meta(3, 20);
  m.checkpoints = {{0, 0}, {2, 13}};
  m.edge_hash = 0xfeedfacecafebeefULL;

  IndexStore::save(dir / "a.idx", m, t);
  auto loaded = IndexStore::load(dir / "a.idx");
  REQUIRE(loaded);
  REQUIRE(loaded->meta == m);
  REQUIRE(loaded->lines == t);
  // mtime не теряет дробную часть
  REQUIRE(loaded->meta.file_mtime == m.file_mtime);
}

TEST_CASE("IndexStore keeps offsets past 4 GiB") {
  auto dir = mktmp("lineidx_store_big_");
  const uint64_t base = (uint64_t{1} << 32) + 17;
  LineTable t;
  t.append(0, base);
  t.append(base, 12);
  auto m = sample_meta(2, base + 12);
  m.checkpoints = {{0, 0}};

  IndexStore::save(dir / "big.idx", m, t);
  auto loaded = IndexStore::load(dir / "big.idx");
  REQUIRE(loaded);
  REQUIRE(loaded->lines[1].offset == base);
  REQUIRE(loaded->meta.file_size == base + 12);
}

TEST_CASE("IndexStore saves an empty table") {
  auto dir = mktmp("lineidx_store_empty_");
  auto m = sample_meta(0, 0);
  IndexStore::save(dir / "e.idx", m, LineTable{});
  auto loaded = IndexStore::load(dir / "e.idx");
  REQUIRE(loaded);
  REQUIRE(loaded->lines.empty());
  REQUIRE(loaded->meta.total_lines == 0);
}

TEST_CASE("IndexStore load soft-fails") {
  auto dir = mktmp("lineidx_store_bad_");

  SECTION("missing file") { REQUIRE_FALSE(IndexStore::load(dir / "nope.idx")); }

  SECTION("garbage") {
    spit(dir / "g.idx", "{not json");
    REQUIRE_FALSE(IndexStore::load(dir / "g.idx"));
  }

  SECTION("foreign format version") {
    LineTable t;
    t.append(0, 5);
    IndexStore::save(dir / "v.idx", sample_meta(1, 5), t);
    auto text = *read_file(dir / "v.idx");
    auto pos = text.find("\"1.0\"");
    REQUIRE(pos != std::string::npos);
    text.replace(pos, 5, "\"9.9\"");
    spit(dir / "v.idx", text);
    REQUIRE_FALSE(IndexStore::load(dir / "v.idx"));
  }

  SECTION("line count disagrees with meta") {
    LineTable t;
    t.append(0, 5);
    IndexStore::save(dir / "c.idx", sample_meta(2, 10), t);
    REQUIRE_FALSE(IndexStore::load(dir / "c.idx"));
  }

  SECTION("non-contiguous entries") {
    spit(dir / "n.idx",
         R"({"format_version":"1.0","meta":{"file_path":"x","file_size":20,)"
         R"("file_mtime":1.5,"total_lines":2,"checkpoint_interval":100,)"
         R"("checkpoints":{"0":0},"indexed_at":"t","version":"1.0"},)"
         R"("lines":[[0,5],[6,5]]})");
    REQUIRE_FALSE(IndexStore::load(dir / "n.idx"));
  }

  SECTION("zero checkpoint interval") {
    LineTable t;
    t.append(0, 5);
    auto m = sample_meta(1, 5);
    m.checkpoint_interval = 0;
    IndexStore::save(dir / "z.idx", m, t);
    REQUIRE_FALSE(IndexStore::load(dir / "z.idx"));
  }

  SECTION("table ends before file_size") {
    // хвост файла не покрыт строками
    LineTable t;
    t.append(0, 8);
    IndexStore::save(dir / "s.idx", sample_meta(1, 16), t);
    REQUIRE_FALSE(IndexStore::load(dir / "s.idx"));
  }

  SECTION("table ends past file_size") {
    LineTable t;
    t.append(0, 8);
    IndexStore::save(dir / "p.idx", sample_meta(1, 4), t);
    REQUIRE_FALSE(IndexStore::load(dir / "p.idx"));
  }

  SECTION("checkpoint key is not an integer") {
    spit(dir / "k.idx",
         R"({"format_version":"1.0","meta":{"file_path":"x","file_size":5,)"
         R"("file_mtime":1.5,"total_lines":1,"checkpoint_interval":100,)"
         R"("checkpoints":{"zero":0},"indexed_at":"t","version":"1.0"},)"
         R"("lines":[[0,5]]})");
    REQUIRE_FALSE(IndexStore::load(dir / "k.idx"));
  }
}

TEST_CASE("IndexStore accepts a file without edge_hash") {
  auto dir = mktmp("lineidx_store_noedge_");
  spit(dir / "o.idx",
       R"({"format_version":"1.0","meta":{"file_path":"x","file_size":5,)"
       R"("file_mtime":1.5,"total_lines":1,"checkpoint_interval":100,)"
       R"("checkpoints":{"0":0},"indexed_at":"t","version":"1.0"},)"
       R"("lines":[[0,5]]})");
  auto loaded = IndexStore::load(dir / "o.idx");
  REQUIRE(loaded);
  REQUIRE_FALSE(loaded->meta.edge_hash);
  REQUIRE(loaded->meta.checkpoints.at(0) == 0);
}
