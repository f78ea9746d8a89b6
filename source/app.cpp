#include <lineidx/app.hpp>
#include <lineidx/cli.hpp>
#include <lineidx/errors.hpp>
#include <lineidx/index.hpp>
#include <lineidx/json_codec.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#ifndef LINEIDX_VERSION
#define LINEIDX_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace lineidx {

static constexpr size_t kLogRotateMax = 10 * 1024 * 1024;
static constexpr size_t kLogRotateFiles = 3;

static void print_help() {
  std::cout <<
      R"(lineidx - random access to line-delimited files

Usage:
  lineidx info   <file> [--json]
  lineidx read   <file> <line>... [--pretty] [--raw]
  lineidx sample <file> <n> [--seed S] [--pretty]
  lineidx update <file>
  lineidx jobs   <file> [--progress PATH] [--json]
  lineidx reset  <file> <job_id> [--progress PATH]

Options:
  -v, --verbose      debug logging
  --log-file PATH    also log to PATH (rotating)
  -h, --help
  --version
)";
}

std::string format_size(uint64_t bytes) {
  static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  if (bytes < 1024)
    return fmt::format("{} B", bytes);
  double v = static_cast<double>(bytes);
  size_t u = 0;
  while (v >= 1024.0 && u + 1 < std::size(units)) {
    v /= 1024.0;
    ++u;
  }
  return fmt::format("{:.2f} {}", v, units[u]);
}

static void setup_logging(const ParseResult &pr) {
  if (pr.log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        pr.log_file->string(), kLogRotateMax, kLogRotateFiles));
    auto logger = std::make_shared<spdlog::logger>("lineidx", sinks.begin(),
                                                   sinks.end());
    spdlog::set_default_logger(logger);
  } else {
    // stdout занят выводом команд
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "lineidx", std::make_shared<spdlog::sinks::stderr_color_sink_mt>()));
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(pr.verbose ? spdlog::level::debug : spdlog::level::info);
}

static void print_record(const std::string &text, bool pretty) {
  if (!pretty) {
    std::cout << text << "\n";
    return;
  }
  if (auto v = try_parse_json(text))
    std::cout << write_json_pretty(*v) << "\n";
  else
    std::cout << text << "\n";
}

static int cmd_info(const CmdInfo &c) {
  LineIndex idx(c.file);
  const auto &m = idx.meta();
  if (c.json) {
    Json::Value v(Json::objectValue);
    v["file_path"] = m.file_path;
    v["file_size"] = Json::UInt64(m.file_size);
    v["total_lines"] = Json::UInt64(m.total_lines);
    v["checkpoint_interval"] = m.checkpoint_interval;
    v["checkpoints"] = Json::UInt64(m.checkpoints.size());
    v["indexed_at"] = m.indexed_at;
    v["index_path"] = idx.index_path().string();
    v["version"] = m.version;
    std::cout << write_json_pretty(v) << "\n";
    return 0;
  }
  fmt::print("file:        {}\n", m.file_path);
  fmt::print("size:        {} ({} bytes)\n", format_size(m.file_size),
             m.file_size);
  fmt::print("lines:       {}\n", m.total_lines);
  fmt::print("checkpoints: {} (every {} lines)\n", m.checkpoints.size(),
             m.checkpoint_interval);
  fmt::print("indexed at:  {}\n", m.indexed_at);
  fmt::print("index:       {}\n", idx.index_path().string());
  return 0;
}

static int cmd_read(const CmdRead &c) {
  LineIndex idx(c.file);
  auto texts = idx.read_many(c.lines);
  for (size_t i = 0; i < texts.size(); ++i) {
    if (c.raw)
      std::cout << texts[i] << "\n";
    else
      print_record(texts[i], c.pretty);
  }
  return 0;
}

static int cmd_sample(const CmdSample &c) {
  LineIndex idx(c.file);
  for (const auto &t : idx.sample_lines(c.n, c.seed))
    print_record(t, c.pretty);
  return 0;
}

static int cmd_update(const CmdUpdate &c) {
  LineIndex idx(c.file);
  uint64_t added = idx.update();
  fmt::print("{} new lines, {} total\n", added, idx.total_lines());
  return 0;
}

static int cmd_jobs(const CmdJobs &c) {
  LineIndex idx(c.file);
  auto jobs = idx.list_jobs(c.progress);
  if (c.json) {
    Json::Value arr(Json::arrayValue);
    for (const auto &j : jobs) {
      Json::Value v(Json::objectValue);
      v["job_id"] = j.job_id;
      v["position"] = Json::UInt64(j.position);
      v["total_lines"] = Json::UInt64(j.total_lines);
      v["status"] = to_string(j.status);
      v["progress_pct"] = j.progress_pct;
      v["created_at"] = j.created_at;
      v["last_checkpoint_at"] = j.last_checkpoint_at;
      v["completed_at"] =
          j.completed_at ? Json::Value(*j.completed_at) : Json::Value();
      v["is_stale"] = j.is_stale;
      arr.append(v);
    }
    std::cout << write_json_pretty(arr) << "\n";
    return 0;
  }
  if (jobs.empty()) {
    std::cout << "(no jobs)\n";
    return 0;
  }
  for (const auto &j : jobs) {
    fmt::print("{:<24} {:>12}/{:<12} {:6.2f}%  {}{}\n", j.job_id, j.position,
               j.total_lines, j.progress_pct, to_string(j.status),
               j.is_stale ? "  [stale]" : "");
  }
  return 0;
}

static int cmd_reset(const CmdReset &c) {
  LineIndex idx(c.file);
  if (!idx.reset_job(c.job_id, c.progress)) {
    spdlog::warn("job '{}' not found", c.job_id);
    return 1;
  }
  fmt::print("job '{}' reset\n", c.job_id);
  return 0;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  setup_logging(pr);

  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;
          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            fmt::print("lineidx {}\n", LINEIDX_VERSION);
            return 0;
          } else if constexpr (std::is_same_v<T, CmdInfo>) {
            return cmd_info(c);
          } else if constexpr (std::is_same_v<T, CmdRead>) {
            return cmd_read(c);
          } else if constexpr (std::is_same_v<T, CmdSample>) {
            return cmd_sample(c);
          } else if constexpr (std::is_same_v<T, CmdUpdate>) {
            return cmd_update(c);
          } else if constexpr (std::is_same_v<T, CmdJobs>) {
            return cmd_jobs(c);
          } else if constexpr (std::is_same_v<T, CmdReset>) {
            return cmd_reset(c);
          }
        },
        *pr.cmd);
  } catch (const UsageError &e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

} // namespace lineidx
