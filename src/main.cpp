// src/main.cpp
#include "crcz/crcz.hpp"
#include "crcz/errors.hpp"
#include "crcz/framing.hpp"
#include "crcz/util.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

using namespace crcz;

static void usage() {
  std::fprintf(stderr,
    "crcz: checksum digest codec with brute-force reconstruction\n"
    "Usage:\n"
    "  crcz compress   [--block-size N] [-i input_file] [-o output_file]\n"
    "  crcz decompress [--engine bounded|parallel] [--alphabet SPEC] [--block-size N]\n"
    "                  [--backend host|cuda] [--gpus all|0,2,3] [--threads N] [--gid-span N]\n"
    "                  [--auto] [--timeout-ms N] [--verbose] [-i input_file] [-o output_file]\n"
    "  crcz inspect    [-i input_file]\n"
    "Alphabet SPEC: printable | all | text | comma separated 65 / 32-126 / 72:105:33 items\n"
    "Examples:\n"
    "  printf 'Hi GPU!' | crcz compress --block-size 2 > msg.crcz\n"
    "  crcz decompress --backend cuda --auto -i msg.crcz\n"
    "  crcz decompress --engine bounded --alphabet printable -i msg.crcz -o msg.txt\n");
}

static EngineKind parse_engine(const std::string& s) {
  if (s == "bounded")  return EngineKind::BOUNDED;
  if (s == "parallel") return EngineKind::PARALLEL;
  die("unknown --engine");
  return EngineKind::PARALLEL;
}

static Backend parse_backend(const std::string& s) {
  if (s == "host") return Backend::HOST;
  if (s == "cuda") return Backend::CUDA;
  die("unknown --backend");
  return Backend::HOST;
}

static std::vector<int> parse_gpu_list(const std::string& list) {
  std::vector<int> ids;
  if (list == "all") return ids;
  size_t pos = 0;
  while (pos < list.size()) {
    size_t comma = list.find(',', pos);
    int id = std::atoi(list.substr(pos, (comma == std::string::npos ? list.size() : comma) - pos).c_str());
    ids.push_back(id);
    if (comma == std::string::npos) break;
    pos = comma + 1;
  }
  return ids;
}

static int report(const Result& r, bool verbose) {
  if (!r) {
    std::fprintf(stderr, "error: %s\n", r.error_message.c_str());
    return 2;
  }
  if (verbose) {
    std::fprintf(stderr, "[%s] %zu blocks, %zu -> %zu bytes in %.1f ms (%.1f blocks/s)\n",
                 r.stats.engine.c_str(), r.stats.blocks, r.stats.input_bytes, r.stats.output_bytes,
                 r.stats.elapsed_ms, r.stats.blocks_per_second);
  }
  return 0;
}

static int cmd_compress(const Config& cfg, FILE* in, FILE* out) {
  std::vector<uint8_t> payload = read_all(in);
  std::vector<uint8_t> stream;
  Compressor c(cfg);
  Result r = c.compress(payload.data(), payload.size(), stream);
  if (r) fwrite_exact(stream.data(), stream.size(), out);
  return report(r, cfg.verbose);
}

static int cmd_decompress(const Config& cfg, FILE* in, FILE* out) {
  std::vector<uint8_t> stream = read_all(in);
  std::vector<uint8_t> payload;
  Compressor c(cfg);
  Result r = c.decompress(stream.data(), stream.size(), payload);
  if (r) fwrite_exact(payload.data(), payload.size(), out);
  return report(r, cfg.verbose);
}

// One line per record: index, crc:sum.
static int cmd_inspect(FILE* in, FILE* out) {
  std::vector<uint8_t> bytes = read_all(in);
  DigestStream s = deserialize(bytes);
  std::fprintf(out, "block_size %u, %zu records, %zu bytes\n",
               (unsigned)s.block_size, s.records.size(), bytes.size());
  for (size_t i = 0; i < s.records.size(); ++i)
    std::fprintf(out, "%8zu  %s\n", i, format_record(s.records[i]).c_str());
  return 0;
}

int main(int argc, char** argv)
{
  if (argc < 2) { usage(); return 1; }
  std::string mode = argv[1];

  Config cfg;
  cfg.backend = is_available(Backend::CUDA) ? Backend::CUDA : Backend::HOST;
  bool block_size_given = false;

  std::string input_file, output_file;

  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--block-size" && i+1 < argc) { cfg.block_size = (unsigned)std::max(0, std::atoi(argv[++i])); block_size_given = true; }
    else if (a == "--engine" && i+1 < argc) { cfg.engine = parse_engine(argv[++i]); }
    else if (a == "--alphabet" && i+1 < argc) { cfg.alphabet = argv[++i]; }
    else if (a == "--backend" && i+1 < argc) { cfg.backend = parse_backend(argv[++i]); }
    else if (a == "--gpus" && i+1 < argc) { cfg.gpu_ids = parse_gpu_list(argv[++i]); }
    else if (a == "--threads" && i+1 < argc) { cfg.host_threads = (unsigned)std::max(1, std::atoi(argv[++i])); }
    else if (a == "--gid-span" && i+1 < argc) { cfg.gid_span = std::strtoull(argv[++i], nullptr, 10); }
    else if (a == "--auto") { cfg.enable_autotune = true; }
    else if (a == "--timeout-ms" && i+1 < argc) { cfg.timeout_ms = (uint32_t)std::max(0, std::atoi(argv[++i])); }
    else if (a == "--verbose" || a == "-v") { cfg.verbose = true; }
    else if (a == "-i" || a == "--input") {
      if (i+1 < argc) input_file = argv[++i]; else { usage(); return 1; }
    }
    else if (a == "-o" || a == "--output") {
      if (i+1 < argc) output_file = argv[++i]; else { usage(); return 1; }
    }
    else { usage(); return 1; }
  }

  // decoder adopts the stream's block size unless one was asked for
  if (mode == "decompress" && !block_size_given) cfg.block_size = 0;

  FILE* input_fp = stdin;
  FILE* output_fp = stdout;
  if (!input_file.empty()) {
    input_fp = std::fopen(input_file.c_str(), "rb");
    if (!input_fp) {
      std::fprintf(stderr, "Error opening input file: %s\n", input_file.c_str());
      return 1;
    }
  }
  if (!output_file.empty()) {
    output_fp = std::fopen(output_file.c_str(), "wb");
    if (!output_fp) {
      std::fprintf(stderr, "Error opening output file: %s\n", output_file.c_str());
      if (input_fp != stdin) std::fclose(input_fp);
      return 1;
    }
  }

  int rc = 0;
  try {
    if (mode == "compress")        rc = cmd_compress(cfg, input_fp, output_fp);
    else if (mode == "decompress") rc = cmd_decompress(cfg, input_fp, output_fp);
    else if (mode == "inspect")    rc = cmd_inspect(input_fp, output_fp);
    else { usage(); rc = 1; }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "error: %s\n", e.what());
    rc = 2;
  }

  if (input_fp != stdin) std::fclose(input_fp);
  if (output_fp != stdout && std::fclose(output_fp) != 0) {
    std::fprintf(stderr, "error: closing %s failed\n", output_file.c_str());
    rc = 2;
  }
  return rc;
}
