#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace lineidx {

// length включает завершающий '\n' (если он есть в файле).
struct LineEntry {
  uint64_t line_number;
  uint64_t offset;
  uint64_t length;

  bool operator==(const LineEntry &) const = default;
};

// Плотная таблица строк: line_number == позиция в векторе,
// offset[i+1] == offset[i] + length[i].
class LineTable {
public:
  LineTable() = default;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  const LineEntry &operator[](size_t i) const { return entries_[i]; }
  const LineEntry &back() const { return entries_.back(); }

  auto begin() const { return entries_.begin(); }
  auto end() const { return entries_.end(); }

  void reserve(size_t n) { entries_.reserve(n); }
  void clear() { entries_.clear(); }
  void truncate(size_t n) {
    if (n < entries_.size())
      entries_.resize(n);
  }

  // Номер строки берётся из позиции.
  void append(uint64_t offset, uint64_t length);

  // Byte just past the last entry; 0 for an empty table.
  uint64_t end_offset() const;

  // true when entries start at 0 and each one begins where the previous ends.
  bool contiguous() const;

  bool operator==(const LineTable &) const = default;

private:
  std::vector<LineEntry> entries_;
};

} // namespace lineidx
