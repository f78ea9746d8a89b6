#pragma once
#include <cstdint>
#include <string>

namespace lineidx {

struct App {
  // Exit codes: 0 ok, 1 runtime error, 2 usage error.
  int run(int argc, char **argv);
};

// 1536 -> "1.50 KB"
std::string format_size(uint64_t bytes);

} // namespace lineidx
