#include "crcz/errors.hpp"
#include "crcz/framing.hpp"
#include "crcz/reconstruct.hpp"
#include "crcz/search.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace crcz;

static std::vector<uint8_t> bytes_of(const std::string& s) { return {s.begin(), s.end()}; }

static std::unique_ptr<SearchEngine> host_parallel() {
  EngineOptions opts;
  opts.kind = EngineKind::PARALLEL;
  opts.backend = Backend::HOST;
  opts.tune.host_threads = 4;
  opts.tune.gid_span = 1u << 14;
  return make_engine(opts);
}

TEST(Reconstruct, BoundedRecoversAB) {
  BoundedSearch engine(Alphabet::full());
  EXPECT_EQ(reconstruct(encode(bytes_of("AB"), 2), engine), bytes_of("AB"));
}

TEST(Reconstruct, BoundedFourByteBlocksWithSmallAlphabet) {
  // the zero byte is needed for the padded tail block "o\0\0\0"
  BoundedSearch engine(Alphabet::from_bytes({0, 'H', 'e', 'l', 'o'}));
  EXPECT_EQ(reconstruct(encode(bytes_of("Hello"), 4), engine), bytes_of("Hello"));
}

TEST(Reconstruct, ParallelRecoversMessage) {
  auto engine = host_parallel();
  ASSERT_NE(engine, nullptr);
  EXPECT_STREQ(engine->name(), "parallel");
  EXPECT_EQ(reconstruct(encode(bytes_of("Hi GPU!"), 2), *engine), bytes_of("Hi GPU!"));
}

TEST(Reconstruct, TrailingPayloadZerosAreLost) {
  auto engine = host_parallel();
  std::vector<uint8_t> payload{'A', 'B', 0, 0};
  EXPECT_EQ(reconstruct(encode(payload, 2), *engine), bytes_of("AB"));
}

TEST(Reconstruct, InteriorZerosSurvive) {
  auto engine = host_parallel();
  std::vector<uint8_t> payload{'A', 0, 0, 'B'};
  EXPECT_EQ(reconstruct(encode(payload, 2), *engine), payload);
}

TEST(Reconstruct, FailsFastOnUnsolvableBlock) {
  DigestStream s = encode(bytes_of("HiPU"), 2);
  s.records.insert(s.records.begin() + 1, DigestRecord{0x1234, 0x5678});

  BoundedSearch bounded(Alphabet::printable());
  try {
    reconstruct(s, bounded);
    FAIL() << "expected NoCandidateFound";
  } catch (const NoCandidateFound& e) {
    EXPECT_EQ(e.block_index(), 1u);
  }

  auto parallel = host_parallel();
  try {
    reconstruct(s, *parallel);
    FAIL() << "expected NoCandidateFound";
  } catch (const NoCandidateFound& e) {
    EXPECT_EQ(e.block_index(), 1u);
  }
}

TEST(Reconstruct, BlockSizeBeyondEngine) {
  auto engine = host_parallel();
  DigestStream s = encode(bytes_of("hello"), 5);
  EXPECT_THROW(reconstruct(s, *engine), UnsupportedBlockSize);
}

TEST(Reconstruct, EmptyStream) {
  DigestStream s;
  s.block_size = 2;
  BoundedSearch engine(Alphabet::printable());
  EXPECT_TRUE(reconstruct(s, engine).empty());
}

TEST(Reconstruct, FromSerializedStream) {
  std::vector<uint8_t> wire = serialize(encode(bytes_of("crc16"), 1));
  BoundedSearch engine(Alphabet::printable());
  EXPECT_EQ(reconstruct(deserialize(wire), engine), bytes_of("crc16"));
}

TEST(StripTrailingZeros, Cases) {
  std::vector<uint8_t> a{'a', 0, 'b', 0, 0};
  strip_trailing_zeros(a);
  EXPECT_EQ(a, (std::vector<uint8_t>{'a', 0, 'b'}));

  std::vector<uint8_t> zeros(4, 0);
  strip_trailing_zeros(zeros);
  EXPECT_TRUE(zeros.empty());

  std::vector<uint8_t> none;
  strip_trailing_zeros(none);
  EXPECT_TRUE(none.empty());
}
