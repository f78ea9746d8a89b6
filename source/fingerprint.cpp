#include <lineidx/fingerprint.hpp>
#include <lineidx/source_file.hpp>

#include <algorithm>
#include <new>
#include <string>
#include <xxhash.h>

namespace lineidx {

static void hash_window(XXH64_state_t *st, const SourceFile &f, uint64_t off,
                        uint64_t len) {
  if (len == 0)
    return;
  std::string buf(static_cast<size_t>(len), '\0');
  const size_t got = f.read_at(buf.data(), buf.size(), off);
  XXH64_update(st, buf.data(), got);
}

uint64_t edge_hash(const SourceFile &f, uint64_t size) {
  XXH64_state_t *st = XXH64_createState();
  if (!st)
    throw std::bad_alloc();
  XXH64_reset(st, 0);
  // размер входит в хеш: пустой хвост у разных размеров не совпадёт.
  // Little-endian, чтобы .idx не зависел от порядка байт хоста.
  unsigned char le[8];
  for (int i = 0; i < 8; ++i)
    le[i] = static_cast<unsigned char>(size >> (8 * i));
  XXH64_update(st, le, sizeof(le));

  const uint64_t head = std::min(size, kEdgeWindowBytes);
  const uint64_t tail_start = std::max(head, size > kEdgeWindowBytes
                                                 ? size - kEdgeWindowBytes
                                                 : uint64_t{0});
  try {
    hash_window(st, f, 0, head);
    hash_window(st, f, tail_start, size - tail_start);
  } catch (...) {
    XXH64_freeState(st);
    throw;
  }

  const uint64_t h = static_cast<uint64_t>(XXH64_digest(st));
  XXH64_freeState(st);
  return h;
}

} // namespace lineidx
