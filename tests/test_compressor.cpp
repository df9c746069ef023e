#include "crcz/crcz.hpp"
#include "crcz/grid.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace crcz;

namespace {

std::vector<uint8_t> bytes_of(const std::string& s) { return {s.begin(), s.end()}; }

Config host_config(unsigned block_size) {
  Config c;
  c.block_size = block_size;
  c.engine = EngineKind::PARALLEL;
  c.backend = Backend::HOST;
  c.host_threads = 2;
  return c;
}

Config bounded_config(unsigned block_size, const std::string& alphabet = "printable") {
  Config c;
  c.block_size = block_size;
  c.engine = EngineKind::BOUNDED;
  c.alphabet = alphabet;
  return c;
}

std::vector<uint8_t> compress_or_die(const std::vector<uint8_t>& payload, unsigned block_size) {
  Compressor enc(host_config(block_size));
  std::vector<uint8_t> wire;
  Result r = enc.compress(payload.data(), payload.size(), wire);
  EXPECT_TRUE(r.success) << r.error_message;
  return wire;
}

// Stream whose only block has no preimage of any size up to 4 in printable ASCII.
std::vector<uint8_t> unsolvable_stream(uint8_t block_size) {
  return {block_size, 0x12, 0x34, 0xff, 0xff};
}

} // namespace

TEST(Compressor, RoundTripParallelHost) {
  auto payload = bytes_of("Hi GPU!");
  auto wire = compress_or_die(payload, 2);
  EXPECT_EQ(wire.size(), 17u);

  Compressor dec(host_config(2));
  std::vector<uint8_t> out;
  Result r = dec.decompress(wire.data(), wire.size(), out);
  ASSERT_TRUE(r.success) << r.error_message;
  EXPECT_EQ(out, payload);
  EXPECT_EQ(r.stats.blocks, 4u);
  EXPECT_EQ(r.stats.engine, "parallel");
  EXPECT_EQ(r.stats.output_bytes, payload.size());
}

TEST(Compressor, RoundTripBounded) {
  auto payload = bytes_of("Hello, digest!");
  auto wire = compress_or_die(payload, 1);

  Compressor dec(bounded_config(1));
  std::vector<uint8_t> out;
  Result r = dec.decompress(wire.data(), wire.size(), out);
  ASSERT_TRUE(r.success) << r.error_message;
  EXPECT_EQ(out, payload);
  EXPECT_EQ(r.stats.engine, "bounded");
}

TEST(Compressor, CompressStats) {
  Compressor enc(host_config(4));
  auto payload = bytes_of("Hello");
  std::vector<uint8_t> wire;
  Result r = enc.compress(payload.data(), payload.size(), wire);
  ASSERT_TRUE(r);
  EXPECT_EQ(r.stats.input_bytes, 5u);
  EXPECT_EQ(r.stats.output_bytes, 9u);
  EXPECT_EQ(r.stats.blocks, 2u);
  EXPECT_EQ(enc.get_last_stats().blocks, 2u);
  EXPECT_EQ(wire[0], 4);
}

TEST(Compressor, BlockSizeMismatchIsFormatError) {
  auto wire = compress_or_die(bytes_of("AB"), 2);
  Compressor dec(host_config(3));
  std::vector<uint8_t> out;
  Result r = dec.decompress(wire.data(), wire.size(), out);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::FORMAT);
}

TEST(Compressor, ZeroBlockSizeAdoptsStreamHeader) {
  auto wire = compress_or_die(bytes_of("AB"), 2);
  Compressor dec(host_config(0));
  std::vector<uint8_t> out;
  Result r = dec.decompress(wire.data(), wire.size(), out);
  ASSERT_TRUE(r.success) << r.error_message;
  EXPECT_EQ(out, bytes_of("AB"));
}

TEST(Compressor, MalformedStream) {
  Compressor dec(host_config(2));
  std::vector<uint8_t> out;
  std::vector<uint8_t> truncated{2, 0x4B, 0x74};
  EXPECT_EQ(dec.decompress(truncated.data(), truncated.size(), out).error, ErrorKind::FORMAT);
  EXPECT_EQ(dec.decompress(nullptr, 0, out).error, ErrorKind::FORMAT);
}

TEST(Compressor, NoCandidateLeavesOutputUntouched) {
  Compressor dec(bounded_config(2));
  auto payload = bytes_of("Hi");
  auto wire = compress_or_die(payload, 2);
  // append a second, unsolvable record
  wire.insert(wire.end(), {0x12, 0x34, 0xff, 0xff});

  std::vector<uint8_t> out{'k', 'e', 'e', 'p'};
  Result r = dec.decompress(wire.data(), wire.size(), out);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::NO_CANDIDATE);
  EXPECT_EQ(r.failed_block, 1u);
  EXPECT_EQ(out, bytes_of("keep"));
}

TEST(Compressor, TimeoutCancelsSearch) {
  Config c = bounded_config(4);
  c.timeout_ms = 1;
  Compressor dec(c);
  auto wire = unsolvable_stream(4);
  std::vector<uint8_t> out;
  Result r = dec.decompress(wire.data(), wire.size(), out);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::CANCELLED);
}

TEST(Compressor, ParallelHostTimeoutIsPrompt) {
  Config c = host_config(3);
  c.timeout_ms = 20;
  Compressor dec(c);

  // eight records no 3-byte block can produce (sum > 3 * 255)
  std::vector<uint8_t> wire{3};
  for (int i = 0; i < 8; ++i) wire.insert(wire.end(), {0x12, 0x34, 0xff, 0xff});

  std::vector<uint8_t> out;
  auto start = std::chrono::steady_clock::now();
  Result r = dec.decompress(wire.data(), wire.size(), out);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  EXPECT_EQ(r.error, ErrorKind::CANCELLED);
  EXPECT_LT(elapsed.count(), 2000);
}

TEST(Compressor, CancelFromAnotherThread) {
  Compressor dec(bounded_config(4));
  auto wire = unsolvable_stream(4);
  std::vector<uint8_t> out;
  std::atomic<bool> done{false};
  Result r;

  std::thread worker([&]() {
    r = dec.decompress(wire.data(), wire.size(), out);
    done = true;
  });
  while (!done) {
    dec.cancel();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  worker.join();

  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorKind::CANCELLED);
}

TEST(Compressor, CudaBackendWithoutCuda) {
  if (cuda_built()) GTEST_SKIP() << "built with CUDA";
  Config c = host_config(2);
  c.backend = Backend::CUDA;
  Compressor dec(c);
  auto wire = compress_or_die(bytes_of("AB"), 2);
  std::vector<uint8_t> out;
  Result r = dec.decompress(wire.data(), wire.size(), out);
  EXPECT_EQ(r.error, ErrorKind::BACKEND_UNAVAILABLE);
  EXPECT_FALSE(is_available(Backend::CUDA));
  EXPECT_TRUE(get_available_gpus().empty());
}

TEST(Compressor, ParallelRejectsLargeBlocks) {
  auto wire = compress_or_die(bytes_of("hello"), 5);
  Compressor dec(host_config(5));
  std::vector<uint8_t> out;
  EXPECT_EQ(dec.decompress(wire.data(), wire.size(), out).error, ErrorKind::UNSUPPORTED_BLOCK_SIZE);
}

TEST(Compressor, CompressRejectsZeroBlockSize) {
  Compressor enc(host_config(0));
  auto payload = bytes_of("AB");
  std::vector<uint8_t> wire;
  EXPECT_EQ(enc.compress(payload.data(), payload.size(), wire).error, ErrorKind::UNSUPPORTED_BLOCK_SIZE);
}

TEST(Compressor, InvalidConfig) {
  EXPECT_THROW(Compressor(bounded_config(2, "zzz")), std::invalid_argument);
  EXPECT_THROW(Compressor(host_config(300)), std::invalid_argument);
}

TEST(Compressor, FileRoundTrip) {
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path();
  const fs::path src = dir / "crcz_test_payload.bin";
  const fs::path mid = dir / "crcz_test_payload.crcz";
  const fs::path dst = dir / "crcz_test_payload.out";

  {
    std::ofstream f(src, std::ios::binary);
    f << "file io";
  }

  Result c = compress_file(src.string(), mid.string(), host_config(2));
  ASSERT_TRUE(c.success) << c.error_message;
  EXPECT_EQ(fs::file_size(mid), 17u);

  Result d = decompress_file(mid.string(), dst.string(), host_config(2));
  ASSERT_TRUE(d.success) << d.error_message;

  std::ifstream in(dst, std::ios::binary);
  std::string got((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(got, "file io");

  fs::remove(src);
  fs::remove(mid);
  fs::remove(dst);
}

TEST(Compressor, MissingInputFile) {
  Result r = compress_file("/nonexistent/crcz/input", "/nonexistent/crcz/output", host_config(2));
  EXPECT_EQ(r.error, ErrorKind::IO);
}

TEST(Compressor, VersionAndHost) {
  EXPECT_EQ(get_version(), "crcz 1.0.0");
  EXPECT_TRUE(is_available(Backend::HOST));
}
