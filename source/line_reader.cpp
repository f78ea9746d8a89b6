#include <lineidx/errors.hpp>
#include <lineidx/line_reader.hpp>
#include <lineidx/source_file.hpp>

#include <algorithm>

namespace lineidx {

void strip_terminator(std::string &line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    line.pop_back();
}

LineCursor::LineCursor(std::shared_ptr<const SourceFile> file,
                       uint64_t first_line, uint64_t begin_off,
                       uint64_t end_off, size_t chunk_bytes)
    : file_(std::move(file)), next_line_(first_line), pos_(begin_off),
      end_(end_off), chunk_(std::max<size_t>(chunk_bytes, 1)) {}

bool LineCursor::refill() {
  if (pos_ >= end_)
    return false;
  // сдвигаем непрочитанный хвост в начало буфера
  if (buf_off_ > 0) {
    buf_.erase(0, buf_off_);
    buf_off_ = 0;
  }
  const size_t want = static_cast<size_t>(std::min<uint64_t>(chunk_, end_ - pos_));
  const size_t old = buf_.size();
  buf_.resize(old + want);
  const size_t got = file_->read_at(buf_.data() + old, want, pos_);
  buf_.resize(old + got);
  if (got < want)
    throw CorruptedLineError(next_line_, pos_, end_, pos_ + got);
  pos_ += got;
  return true;
}

std::optional<std::string> LineCursor::next() {
  if (!file_)
    return std::nullopt;
  for (;;) {
    const size_t nl = buf_.find('\n', buf_off_);
    if (nl != std::string::npos) {
      std::string line = buf_.substr(buf_off_, nl - buf_off_);
      buf_off_ = nl + 1;
      strip_terminator(line);
      ++next_line_;
      return line;
    }
    if (!refill())
      break;
  }
  if (buf_off_ < buf_.size()) {
    // последняя строка без '\n'
    std::string line = buf_.substr(buf_off_);
    buf_.clear();
    buf_off_ = 0;
    strip_terminator(line);
    ++next_line_;
    return line;
  }
  buf_.clear();
  buf_off_ = 0;
  return std::nullopt;
}

RecordCursor::RecordCursor(LineCursor lines, RecordDecoder decoder)
    : lines_(std::move(lines)), decoder_(std::move(decoder)) {
  if (!decoder_)
    decoder_ = json_decoder();
}

std::optional<Json::Value> RecordCursor::next() {
  const uint64_t line = lines_.line_number();
  auto text = lines_.next();
  if (!text)
    return std::nullopt;
  try {
    return decoder_(*text);
  } catch (const DecodeError &e) {
    throw e.with_line(line);
  }
}

} // namespace lineidx
