#include <lineidx/errors.hpp>
#include <lineidx/index.hpp>
#include <lineidx/stream.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lineidx {

RecordStream::RecordStream(const LineIndex &index, StreamOptions opts)
    : index_(index), opts_(std::move(opts)) {
  if (opts_.start_line < 0)
    opts_.start_line = 0;
  if (opts_.batch_size == 0)
    opts_.batch_size = 1;
  if (opts_.as_json && !opts_.decoder)
    opts_.decoder = json_decoder();
  position_ = static_cast<uint64_t>(opts_.start_line) + opts_.skip;
  next_read_ = position_;
}

RecordStream::~RecordStream() { close(); }

void RecordStream::open() {
  if (closed_)
    throw UsageError("stream is closed");
  const auto live = stat_fingerprint(index_.file_path());
  if (!live)
    throw SourceNotFoundError(index_.file_path());
  if (live->size < index_.file_size())
    throw ShrunkFileError(index_.file_path(), index_.file_size(), live->size);
  initial_size_ = live->size;
  file_ = index_.open();
  opened_ = true;
}

void RecordStream::close() {
  if (closed_)
    return;
  closed_ = true;
  file_.reset();
  batch_.clear();
  batch_pos_ = 0;
}

bool RecordStream::fill_batch() {
  batch_.clear();
  batch_pos_ = 0;
  const uint64_t total = index_.total_lines();
  if (next_read_ >= total)
    return false;
  const uint64_t n = std::min<uint64_t>(opts_.batch_size, total - next_read_);
  batch_.reserve(static_cast<size_t>(n));
  batch_first_ = next_read_;
  for (uint64_t i = 0; i < n; ++i)
    batch_.push_back(
        index_.read_line(*file_, static_cast<int64_t>(next_read_ + i)));
  next_read_ += n;
  return true;
}

std::optional<StreamItem> RecordStream::next() {
  if (closed_)
    return std::nullopt;
  if (!opened_)
    throw UsageError("stream must be opened before iterating");

  for (;;) {
    if (opts_.limit && yielded_ >= *opts_.limit)
      return std::nullopt;
    if (batch_pos_ >= batch_.size() && !fill_batch())
      return std::nullopt;

    StreamItem item;
    item.line_number = batch_first_ + batch_pos_;
    item.text = std::move(batch_[batch_pos_++]);
    position_ = item.line_number + 1;

    if (opts_.as_json) {
      try {
        item.record = opts_.decoder(item.text);
        item.decoded = true;
      } catch (const DecodeError &e) {
        switch (opts_.on_decode_error) {
        case DecodeErrorPolicy::Raise:
          throw e.with_line(item.line_number);
        case DecodeErrorPolicy::Skip:
          spdlog::debug("stream: skipping undecodable line {}",
                        item.line_number);
          continue;
        case DecodeErrorPolicy::Raw:
          break;
        }
      }
    }
    ++yielded_;
    return item;
  }
}

} // namespace lineidx
