// src/alphabet.cpp
#include "crcz/alphabet.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace crcz {

static Alphabet range_alphabet(unsigned lo, unsigned hi) {
  Alphabet a;
  for (unsigned v = lo; v <= hi; ++v) a.symbols.push_back(static_cast<uint8_t>(v));
  return a;
}

Alphabet Alphabet::printable() { return range_alphabet(32, 126); }
Alphabet Alphabet::full()      { return range_alphabet(0, 255); }

Alphabet Alphabet::text() {
  Alphabet a = printable();
  a.symbols.insert(a.symbols.begin(), {'\t', '\n', '\r'});
  std::sort(a.symbols.begin(), a.symbols.end());
  return a;
}

Alphabet Alphabet::from_bytes(std::vector<uint8_t> bytes) {
  std::sort(bytes.begin(), bytes.end());
  bytes.erase(std::unique(bytes.begin(), bytes.end()), bytes.end());
  Alphabet a;
  a.symbols = std::move(bytes);
  return a;
}

bool Alphabet::contains(uint8_t b) const {
  return std::binary_search(symbols.begin(), symbols.end(), b);
}

static uint8_t parse_byte(const std::string& s) {
  if (s.empty() || s.size() > 3 ||
      !std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; }))
    throw std::invalid_argument("bad byte value: '" + s + "'");
  const int v = std::stoi(s);
  if (v > 255) throw std::invalid_argument("byte value out of range: " + s);
  return static_cast<uint8_t>(v);
}

static std::vector<std::string> split(const std::string& s, char sep) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (true) {
    size_t next = s.find(sep, pos);
    out.push_back(s.substr(pos, (next == std::string::npos ? s.size() : next) - pos));
    if (next == std::string::npos) break;
    pos = next + 1;
  }
  return out;
}

std::vector<uint8_t> parse_byte_list(const std::string& text) {
  std::vector<uint8_t> out;
  for (const auto& tok : split(text, ':')) out.push_back(parse_byte(tok));
  return out;
}

Alphabet parse_alphabet(const std::string& spec)
{
  if (spec == "printable") return Alphabet::printable();
  if (spec == "all")       return Alphabet::full();
  if (spec == "text")      return Alphabet::text();
  if (spec.empty()) throw std::invalid_argument("empty alphabet spec");

  std::vector<uint8_t> bytes;
  for (const auto& item : split(spec, ',')) {
    const size_t dash = item.find('-');
    if (dash != std::string::npos) {
      const uint8_t lo = parse_byte(item.substr(0, dash));
      const uint8_t hi = parse_byte(item.substr(dash + 1));
      if (lo > hi) throw std::invalid_argument("descending alphabet range: " + item);
      for (unsigned v = lo; v <= hi; ++v) bytes.push_back(static_cast<uint8_t>(v));
    } else {
      auto list = parse_byte_list(item);
      bytes.insert(bytes.end(), list.begin(), list.end());
    }
  }
  return Alphabet::from_bytes(std::move(bytes));
}

} // namespace crcz
