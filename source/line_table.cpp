#include <lineidx/line_table.hpp>

namespace lineidx {

void LineTable::append(uint64_t offset, uint64_t length) {
  entries_.push_back(
      LineEntry{static_cast<uint64_t>(entries_.size()), offset, length});
}

uint64_t LineTable::end_offset() const {
  if (entries_.empty())
    return 0;
  const auto &e = entries_.back();
  return e.offset + e.length;
}

bool LineTable::contiguous() const {
  uint64_t expect = 0;
  for (size_t i = 0; i < entries_.size(); ++i) {
    const auto &e = entries_[i];
    if (e.line_number != i || e.offset != expect)
      return false;
    expect = e.offset + e.length;
  }
  return true;
}

} // namespace lineidx
