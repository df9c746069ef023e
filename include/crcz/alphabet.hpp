#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crcz {

// Restricted set of byte values a bounded search may use.
// Symbols are kept sorted ascending and unique; enumeration order
// depends on it.
struct Alphabet {
  std::vector<uint8_t> symbols;

  static Alphabet printable();   // 32..126
  static Alphabet full();        // 0..255
  static Alphabet text();        // printable plus \t \n \r
  static Alphabet from_bytes(std::vector<uint8_t> bytes);

  size_t size() const { return symbols.size(); }
  bool   empty() const { return symbols.empty(); }
  bool   contains(uint8_t b) const;
};

// Alphabet spec: "printable", "all", "text", or comma separated items where
// each item is a byte ("65"), a range ("32-126") or a colon-delimited byte
// list ("72:105:33"). Throws std::invalid_argument.
Alphabet parse_alphabet(const std::string& spec);

// Colon-delimited decimal bytes, "72:105:33" -> {72,105,33}.
std::vector<uint8_t> parse_byte_list(const std::string& text);

} // namespace crcz
