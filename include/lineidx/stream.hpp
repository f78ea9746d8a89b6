#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <lineidx/json_codec.hpp>

namespace lineidx {

class LineIndex;
class SourceFile;

enum class DecodeErrorPolicy : uint8_t {
  Raise, // пробросить DecodeError
  Skip,  // молча пропустить строку
  Raw    // отдать текст, record == null
};

struct StreamOptions {
  int64_t start_line = 0;
  size_t batch_size = 100; // строк за один проход чтения
  uint64_t skip = 0;
  std::optional<uint64_t> limit;
  DecodeErrorPolicy on_decode_error = DecodeErrorPolicy::Raise;
  bool as_json = true;
  RecordDecoder decoder;
};

struct StreamItem {
  uint64_t line_number = 0;
  std::string text;
  Json::Value record;
  bool decoded = false;
};

// Chunked reader over a LineIndex for cooperative drivers: every read call is
// bounded by batch_size lines, the handle is released on close() or
// destruction, and the number of yielded items is tracked.
class RecordStream {
public:
  RecordStream(const LineIndex &index, StreamOptions opts = {});
  ~RecordStream();

  RecordStream(const RecordStream &) = delete;
  RecordStream &operator=(const RecordStream &) = delete;

  // Throws SourceNotFoundError if the file is gone, ShrunkFileError if it is
  // smaller than the indexed size.
  void open();

  std::optional<StreamItem> next();

  void close();

  // Next line number to be examined.
  uint64_t position() const { return position_; }
  uint64_t yielded_count() const { return yielded_; }
  bool closed() const { return closed_; }
  uint64_t initial_file_size() const { return initial_size_; }

private:
  bool fill_batch();

  const LineIndex &index_;
  StreamOptions opts_;

  std::shared_ptr<const SourceFile> file_;
  std::vector<std::string> batch_;
  size_t batch_pos_ = 0;
  uint64_t batch_first_ = 0;
  uint64_t next_read_ = 0;

  uint64_t position_ = 0;
  uint64_t yielded_ = 0;
  uint64_t initial_size_ = 0;
  bool opened_ = false;
  bool closed_ = false;
};

} // namespace lineidx
