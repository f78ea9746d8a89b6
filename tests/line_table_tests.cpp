#include <catch2/catch_all.hpp>

#include <lineidx/line_table.hpp>

using namespace lineidx;

TEST_CASE("LineTable numbers entries by position") {
  LineTable t;
  REQUIRE(t.empty());
  REQUIRE(t.end_offset() == 0);
  REQUIRE(t.contiguous());

  t.append(0, 4);
  t.append(4, 1);
  t.append(5, 10);
  REQUIRE(t.size() == 3);
  REQUIRE(t[1] == LineEntry{1, 4, 1});
  REQUIRE(t.back().line_number == 2);
  REQUIRE(t.end_offset() == 15);
  REQUIRE(t.contiguous());
}

TEST_CASE("LineTable detects gaps") {
  LineTable t;
  t.append(0, 4);
  t.append(5, 3); // дыра в один байт
  REQUIRE_FALSE(t.contiguous());

  LineTable u;
  u.append(1, 3); // не с нуля
  REQUIRE_FALSE(u.contiguous());
}

TEST_CASE("LineTable truncate keeps the prefix") {
  LineTable t;
  for (uint64_t i = 0; i < 10; ++i)
    t.append(i * 2, 2);
  t.truncate(4);
  REQUIRE(t.size() == 4);
  REQUIRE(t.end_offset() == 8);
  t.truncate(100);
  REQUIRE(t.size() == 4);
}
