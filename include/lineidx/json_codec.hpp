#pragma once
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <json/json.h>

namespace lineidx {

// Подключаемый декодер записи: строка -> значение, ошибка через DecodeError.
using RecordDecoder = std::function<Json::Value(std::string_view)>;

// Strict parse of a single JSON document; throws DecodeError.
Json::Value parse_json(std::string_view text);

// Same, but nullopt instead of throwing.
std::optional<Json::Value> try_parse_json(std::string_view text);

std::string write_json_compact(const Json::Value &v);
std::string write_json_pretty(const Json::Value &v);

// parse_json wrapped as a RecordDecoder.
RecordDecoder json_decoder();

} // namespace lineidx
