#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lineidx {

// UTC, микросекунды: 2026-10-18T10:11:12.123456+00:00
std::string iso8601_now();

// tmp + fsync + rename + fsync(dir). Throws std::system_error.
void write_file_atomic(const std::filesystem::path &p, std::string_view data);

// nullopt if the file cannot be opened.
std::optional<std::string> read_file(const std::filesystem::path &p);

// events.jsonl -> events.idx
std::filesystem::path companion_path(const std::filesystem::path &source,
                                     std::string_view ext);

} // namespace lineidx
