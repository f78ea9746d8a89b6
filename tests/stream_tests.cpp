#include <catch2/catch_all.hpp>

#include <lineidx/errors.hpp>
#include <lineidx/index.hpp>
#include <lineidx/stream.hpp>

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

static std::string records(int n) {
  std::string s;
  for (int i = 0; i < n; ++i)
    s += R"({"id":)" + std::to_string(i) + "}\n";
  return s;
}

static std::vector<uint64_t> drain(RecordStream &s) {
  std::vector<uint64_t> out;
  while (auto item = s.next())
    out.push_back(item->line_number);
  return out;
}

TEST_CASE("RecordStream yields every line across batches") {
  auto dir = mktmp("lineidx_stream_all_");
  spit(dir / "a.jsonl", records(25));
  LineIndex idx(dir / "a.jsonl");

  RecordStream s(idx, {.batch_size = 4});
  s.open();
  REQUIRE(s.initial_file_size() == idx.file_size());
  auto first = s.next();
  REQUIRE(first->decoded);
  REQUIRE(first->record["id"].asInt() == 0);
  auto rest = drain(s);
  REQUIRE(rest.size() == 24);
  REQUIRE(rest.back() == 24);
  REQUIRE(s.yielded_count() == 25);
  REQUIRE(s.position() == 25);
}

TEST_CASE("RecordStream start, skip and limit") {
  auto dir = mktmp("lineidx_stream_window_");
  spit(dir / "w.jsonl", records(30));
  LineIndex idx(dir / "w.jsonl");

  RecordStream s(idx, {.start_line = 10, .batch_size = 3, .skip = 2,
                       .limit = 5});
  s.open();
  auto got = drain(s);
  REQUIRE(got == std::vector<uint64_t>{12, 13, 14, 15, 16});
  REQUIRE(s.position() == 17);
}

TEST_CASE("RecordStream decode error policies") {
  auto dir = mktmp("lineidx_stream_policy_");
  spit(dir / "p.jsonl", "{\"a\":0}\nbroken\n{\"a\":2}\n");
  LineIndex idx(dir / "p.jsonl");

  SECTION("raise") {
    RecordStream s(idx);
    s.open();
    REQUIRE(s.next());
    try {
      (void)s.next();
      FAIL("expected DecodeError");
    } catch (const DecodeError &e) {
      REQUIRE(e.line() == std::optional<uint64_t>(1));
    }
  }

  SECTION("skip") {
    RecordStream s(idx, {.on_decode_error = DecodeErrorPolicy::Skip});
    s.open();
    REQUIRE(drain(s) == std::vector<uint64_t>{0, 2});
    REQUIRE(s.yielded_count() == 2);
  }

  SECTION("raw") {
    RecordStream s(idx, {.on_decode_error = DecodeErrorPolicy::Raw});
    s.open();
    (void)s.next();
    auto bad = s.next();
    REQUIRE(bad->text == "broken");
    REQUIRE_FALSE(bad->decoded);
    REQUIRE(bad->record.isNull());
  }
}

TEST_CASE("RecordStream open validates the source") {
  auto dir = mktmp("lineidx_stream_open_");
  auto file = dir / "o.jsonl";
  spit(file, records(5));
  LineIndex idx(file);

  SECTION("shrunk") {
    fs::resize_file(file, 3);
    RecordStream s(idx);
    REQUIRE_THROWS_AS(s.open(), ShrunkFileError);
  }

  SECTION("removed") {
    fs::remove(file);
    RecordStream s(idx);
    REQUIRE_THROWS_AS(s.open(), SourceNotFoundError);
  }

  SECTION("next before open") {
    RecordStream s(idx);
    REQUIRE_THROWS_AS(s.next(), UsageError);
  }
}

TEST_CASE("RecordStream close ends iteration") {
  auto dir = mktmp("lineidx_stream_close_");
  spit(dir / "c.jsonl", records(5));
  LineIndex idx(dir / "c.jsonl");

  RecordStream s(idx, {.as_json = false});
  s.open();
  REQUIRE(s.next()->text == R"({"id":0})");
  s.close();
  REQUIRE(s.closed());
  REQUIRE_FALSE(s.next());
  REQUIRE_THROWS_AS(s.open(), UsageError);
}
