#include <lineidx/errors.hpp>
#include <lineidx/json_codec.hpp>

#include <memory>

namespace lineidx {

static std::unique_ptr<Json::CharReader> make_reader() {
  Json::CharReaderBuilder b;
  b["collectComments"] = false;
  b["allowComments"] = false;
  b["failIfExtra"] = true;
  b["rejectDupKeys"] = false;
  return std::unique_ptr<Json::CharReader>(b.newCharReader());
}

static bool parse_into(std::string_view text, Json::Value &out,
                       std::string &errs) {
  auto r = make_reader();
  return r->parse(text.data(), text.data() + text.size(), &out, &errs);
}

Json::Value parse_json(std::string_view text) {
  Json::Value v;
  std::string errs;
  if (!parse_into(text, v, errs)) {
    while (!errs.empty() && (errs.back() == '\n' || errs.back() == ' '))
      errs.pop_back();
    throw DecodeError(std::nullopt, errs.empty() ? "malformed JSON" : errs);
  }
  return v;
}

std::optional<Json::Value> try_parse_json(std::string_view text) {
  Json::Value v;
  std::string errs;
  if (!parse_into(text, v, errs))
    return std::nullopt;
  return v;
}

static std::string write_with(const Json::Value &v, const char *indent) {
  Json::StreamWriterBuilder b;
  b["indentation"] = indent;
  b["emitUTF8"] = true;
  // 17 значащих цифр: double переживает запись/чтение без потерь
  b["precision"] = 17;
  return Json::writeString(b, v);
}

std::string write_json_compact(const Json::Value &v) {
  return write_with(v, "");
}

std::string write_json_pretty(const Json::Value &v) {
  return write_with(v, "  ");
}

RecordDecoder json_decoder() {
  return [](std::string_view text) { return parse_json(text); };
}

} // namespace lineidx
