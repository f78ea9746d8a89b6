#include <lineidx/cli.hpp>

#include <charconv>
#include <string_view>

namespace lineidx {

template <class T> static bool parse_num(std::string_view s, T &out) {
  if (s.empty())
    return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};

  // глобальные флаги допустимы в любом месте
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "-v" || a == "--verbose") {
      r.verbose = true;
    } else if (a == "--log-file") {
      if (i + 1 >= argc) {
        r.error = "--log-file: path required";
        return r;
      }
      r.log_file = std::filesystem::path(argv[++i]);
    } else {
      args.emplace_back(a);
    }
  }

  if (args.empty()) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string cmd = args[0];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (args.size() < 2) {
    r.error = cmd + ": file required";
    return r;
  }
  const std::string file = args[1];

  // opts: всё после позиционных аргументов команды
  auto value_of = [&](size_t &k, const char *flag) -> std::optional<std::string> {
    if (k + 1 >= args.size()) {
      r.error = cmd + ": " + flag + " requires a value";
      return std::nullopt;
    }
    return args[++k];
  };

  if (cmd == "info") {
    CmdInfo c{file};
    for (size_t k = 2; k < args.size(); ++k) {
      if (args[k] == "--json")
        c.json = true;
      else {
        r.error = "info: unknown option " + args[k];
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "read") {
    CmdRead c{file};
    for (size_t k = 2; k < args.size(); ++k) {
      const auto &a = args[k];
      if (a == "--pretty") {
        c.pretty = true;
      } else if (a == "--raw") {
        c.raw = true;
      } else {
        int64_t n = 0;
        if (!parse_num(a, n)) {
          r.error = "read: bad line number " + a;
          return r;
        }
        c.lines.push_back(n);
      }
    }
    if (c.lines.empty()) {
      r.error = "read: at least one line number required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "sample") {
    CmdSample c{file};
    bool have_n = false;
    for (size_t k = 2; k < args.size(); ++k) {
      const auto &a = args[k];
      if (a == "--pretty") {
        c.pretty = true;
      } else if (a == "--seed") {
        auto v = value_of(k, "--seed");
        if (!v)
          return r;
        uint64_t s = 0;
        if (!parse_num(*v, s)) {
          r.error = "sample: bad seed " + *v;
          return r;
        }
        c.seed = s;
      } else if (!have_n && parse_num(a, c.n)) {
        have_n = true;
      } else {
        r.error = "sample: unexpected argument " + a;
        return r;
      }
    }
    if (!have_n) {
      r.error = "sample: count required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "update") {
    if (args.size() > 2) {
      r.error = "update: unexpected argument " + args[2];
      return r;
    }
    r.cmd = CmdUpdate{file};
    return r;
  }

  if (cmd == "jobs") {
    CmdJobs c{file};
    for (size_t k = 2; k < args.size(); ++k) {
      if (args[k] == "--json") {
        c.json = true;
      } else if (args[k] == "--progress") {
        auto v = value_of(k, "--progress");
        if (!v)
          return r;
        c.progress = std::filesystem::path(*v);
      } else {
        r.error = "jobs: unknown option " + args[k];
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "reset") {
    if (args.size() < 3) {
      r.error = "reset: job id required";
      return r;
    }
    CmdReset c{file, args[2]};
    for (size_t k = 3; k < args.size(); ++k) {
      if (args[k] == "--progress") {
        auto v = value_of(k, "--progress");
        if (!v)
          return r;
        c.progress = std::filesystem::path(*v);
      } else {
        r.error = "reset: unknown option " + args[k];
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace lineidx
