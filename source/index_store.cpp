#include <lineidx/index_store.hpp>
#include <lineidx/json_codec.hpp>
#include <lineidx/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <iterator>

namespace fs = std::filesystem;

namespace lineidx {

static Json::Value meta_to_json(const IndexMeta &m) {
  Json::Value j(Json::objectValue);
  j["file_path"] = m.file_path;
  j["file_size"] = Json::UInt64(m.file_size);
  j["file_mtime"] = m.file_mtime;
  j["total_lines"] = Json::UInt64(m.total_lines);
  j["checkpoint_interval"] = Json::UInt(m.checkpoint_interval);
  Json::Value cps(Json::objectValue);
  for (const auto &[line, off] : m.checkpoints)
    cps[std::to_string(line)] = Json::UInt64(off);
  j["checkpoints"] = cps;
  j["indexed_at"] = m.indexed_at;
  j["version"] = m.version;
  if (m.edge_hash)
    j["edge_hash"] = Json::UInt64(*m.edge_hash);
  return j;
}

void IndexStore::save(const fs::path &p, const IndexMeta &meta,
                      const LineTable &lines) {
  // lines пишем руками: Json::Value на миллион пар слишком тяжёлый
  fmt::memory_buffer out;
  fmt::format_to(std::back_inserter(out),
                 R"({{"format_version":"{}","meta":{},"lines":[)",
                 kIndexFormatVersion, write_json_compact(meta_to_json(meta)));
  bool first = true;
  for (const auto &e : lines) {
    if (!first)
      out.push_back(',');
    fmt::format_to(std::back_inserter(out), "[{},{}]", e.offset, e.length);
    first = false;
  }
  fmt::format_to(std::back_inserter(out), "]}}\n");
  write_file_atomic(p, std::string_view(out.data(), out.size()));
}

static bool parse_u64_key(const std::string &s, uint64_t &out) {
  if (s.empty())
    return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

static std::optional<IndexMeta> meta_from_json(const Json::Value &j,
                                               std::string &why) {
  if (!j.isObject()) {
    why = "meta is not an object";
    return std::nullopt;
  }
  for (const char *k : {"file_path", "file_size", "file_mtime", "total_lines",
                        "checkpoint_interval", "checkpoints", "indexed_at",
                        "version"}) {
    if (!j.isMember(k)) {
      why = fmt::format("meta.{} missing", k);
      return std::nullopt;
    }
  }
  if (!j["file_path"].isString() || !j["file_size"].isUInt64() ||
      !j["file_mtime"].isNumeric() || !j["total_lines"].isUInt64() ||
      !j["checkpoint_interval"].isUInt() ||
      !j["checkpoints"].isObject() || !j["indexed_at"].isString() ||
      !j["version"].isString()) {
    why = "meta field has wrong type";
    return std::nullopt;
  }

  IndexMeta m;
  m.file_path = j["file_path"].asString();
  m.file_size = j["file_size"].asUInt64();
  m.file_mtime = j["file_mtime"].asDouble();
  m.total_lines = j["total_lines"].asUInt64();
  m.checkpoint_interval = j["checkpoint_interval"].asUInt();
  if (m.checkpoint_interval == 0) {
    why = "meta.checkpoint_interval must be positive";
    return std::nullopt;
  }
  m.indexed_at = j["indexed_at"].asString();
  m.version = j["version"].asString();

  const auto &cps = j["checkpoints"];
  for (const auto &name : cps.getMemberNames()) {
    uint64_t line = 0;
    if (!parse_u64_key(name, line) || !cps[name].isUInt64()) {
      why = fmt::format("bad checkpoint entry '{}'", name);
      return std::nullopt;
    }
    m.checkpoints.emplace(line, cps[name].asUInt64());
  }

  if (j.isMember("edge_hash")) {
    if (!j["edge_hash"].isUInt64()) {
      why = "meta.edge_hash has wrong type";
      return std::nullopt;
    }
    m.edge_hash = j["edge_hash"].asUInt64();
  }
  return m;
}

static std::optional<LoadedIndex> parse_index(const std::string &text,
                                              std::string &why) {
  auto doc = try_parse_json(text);
  if (!doc || !doc->isObject()) {
    why = "not a JSON object";
    return std::nullopt;
  }
  const auto &ver = (*doc)["format_version"];
  if (!ver.isString() || ver.asString() != kIndexFormatVersion) {
    why = "format_version mismatch";
    return std::nullopt;
  }

  auto meta = meta_from_json((*doc)["meta"], why);
  if (!meta)
    return std::nullopt;

  const auto &arr = (*doc)["lines"];
  if (!arr.isArray()) {
    why = "lines is not an array";
    return std::nullopt;
  }
  if (arr.size() != meta->total_lines) {
    why = fmt::format("lines has {} entries, meta.total_lines={}", arr.size(),
                      meta->total_lines);
    return std::nullopt;
  }

  LoadedIndex out;
  out.lines.reserve(arr.size());
  uint64_t expect = 0;
  for (Json::ArrayIndex i = 0; i < arr.size(); ++i) {
    const auto &e = arr[i];
    if (!e.isArray() || e.size() != 2 || !e[0].isUInt64() ||
        !e[1].isUInt64()) {
      why = fmt::format("malformed entry at line {}", i);
      return std::nullopt;
    }
    const uint64_t off = e[0].asUInt64();
    const uint64_t len = e[1].asUInt64();
    // порядок в массиве и есть номер строки, проверяем непрерывность
    if (off != expect || len == 0) {
      why = fmt::format("entry {} breaks contiguity", i);
      return std::nullopt;
    }
    out.lines.append(off, len);
    expect = off + len;
  }
  // таблица покрывает ровно [0, file_size), иначе extend() пропустит байты
  if (expect != meta->file_size) {
    why = fmt::format("table ends at {}, meta.file_size={}", expect,
                      meta->file_size);
    return std::nullopt;
  }
  out.meta = std::move(*meta);
  return out;
}

std::optional<LoadedIndex> IndexStore::load(const fs::path &p) {
  auto text = read_file(p);
  if (!text) {
    spdlog::debug("index {}: not found", p.string());
    return std::nullopt;
  }
  std::string why;
  auto loaded = parse_index(*text, why);
  if (!loaded)
    spdlog::debug("index {}: ignored ({})", p.string(), why);
  return loaded;
}

} // namespace lineidx
