#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <lineidx/json_codec.hpp>

namespace lineidx {

class SourceFile;

// Drops trailing '\r' / '\n' bytes.
void strip_terminator(std::string &line);

// Последовательное чтение строк в пределах [begin, end) проиндексированного
// диапазона: одно позиционирование, дальше чанками подряд.
class LineCursor {
public:
  LineCursor() = default; // пустая последовательность
  LineCursor(std::shared_ptr<const SourceFile> file, uint64_t first_line,
             uint64_t begin_off, uint64_t end_off, size_t chunk_bytes);

  // Next line without terminator; nullopt at the end of the range.
  // Throws CorruptedLineError when the file ends before end_off.
  std::optional<std::string> next();

  // Line number the next successful next() returns.
  uint64_t line_number() const { return next_line_; }

  bool done() const { return !file_ || (pos_ >= end_ && buf_off_ >= buf_.size()); }

private:
  bool refill();

  std::shared_ptr<const SourceFile> file_;
  uint64_t next_line_ = 0;
  uint64_t pos_ = 0; // следующий байт на диске
  uint64_t end_ = 0;
  size_t chunk_ = 0;
  std::string buf_;
  size_t buf_off_ = 0;
};

// LineCursor + decoder.
class RecordCursor {
public:
  RecordCursor(LineCursor lines, RecordDecoder decoder);

  // Throws DecodeError (with the line number) on a bad record.
  std::optional<Json::Value> next();

  uint64_t line_number() const { return lines_.line_number(); }

private:
  LineCursor lines_;
  RecordDecoder decoder_;
};

} // namespace lineidx
