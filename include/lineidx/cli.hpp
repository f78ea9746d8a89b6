#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lineidx {

struct CmdInfo {
  std::string file;
  bool json = false;
};
struct CmdRead {
  std::string file;
  std::vector<int64_t> lines;
  bool pretty = false;
  bool raw = false;
};
struct CmdSample {
  std::string file;
  uint64_t n = 0;
  std::optional<uint64_t> seed;
  bool pretty = false;
};
struct CmdUpdate {
  std::string file;
};
struct CmdJobs {
  std::string file;
  std::optional<std::filesystem::path> progress;
  bool json = false;
};
struct CmdReset {
  std::string file;
  std::string job_id;
  std::optional<std::filesystem::path> progress;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdInfo, CmdRead, CmdSample, CmdUpdate, CmdJobs,
                             CmdReset, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;

  // глобальные флаги
  bool verbose = false;
  std::optional<std::filesystem::path> log_file;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace lineidx
