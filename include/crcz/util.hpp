#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <string>
#include <vector>

namespace crcz {

// ----- error + abort -----
inline void die(const char* msg) {
  std::fprintf(stderr, "%s\n", msg);
  std::quick_exit(2);
}

// ----- I/O helpers -----
inline void fwrite_exact(const void* p, size_t n, FILE* f = stdout) {
  size_t w = std::fwrite(p, 1, n, f);
  if (w != n) die("error: short write");
}

inline size_t read_chunk_into_ptr(uint8_t* dst, size_t max_n, FILE* f = stdin) {
  size_t total = 0;
  while (total < max_n) {
    size_t got = std::fread(dst + total, 1, max_n - total, f);
    total += got;
    if (got == 0) break; // EOF or short read
  }
  return total;
}

// Whole stream until EOF.
inline std::vector<uint8_t> read_all(FILE* f = stdin) {
  std::vector<uint8_t> out;
  uint8_t buf[64 * 1024];
  for (;;) {
    size_t got = read_chunk_into_ptr(buf, sizeof(buf), f);
    out.insert(out.end(), buf, buf + got);
    if (got < sizeof(buf)) break;
  }
  if (std::ferror(f)) die("error: read failed");
  return out;
}

// ----- Progress bar rendering -----
inline void render_progress_bar(double percentage, uint64_t done, uint64_t total,
                                uint64_t blocks, const char* engine) {
  const int bar_width = 20;
  int filled_width = static_cast<int>(percentage * bar_width);

  std::string bar = "[";
  for (int i = 0; i < bar_width; ++i) {
    if (i < filled_width) {
      bar += "█";
    } else if (i == filled_width && percentage < 1.0) {
      bar += ">";
    } else {
      bar += " ";
    }
  }
  bar += "]";

  std::fprintf(stderr, "\rsearch: %.1f%% %s %.3g/%.3g candidates %llu blocks [%s]",
               percentage * 100.0,
               bar.c_str(),
               (double)done,
               (double)total,
               (unsigned long long)blocks,
               engine);
  std::fflush(stderr);
}

} // namespace crcz
