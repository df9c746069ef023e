#include "crcz/errors.hpp"
#include "crcz/framing.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace crcz;

static std::vector<uint8_t> bytes_of(const std::string& s) { return {s.begin(), s.end()}; }

TEST(Encode, SingleBlock) {
  DigestStream s = encode(bytes_of("AB"), 2);
  EXPECT_EQ(s.block_size, 2);
  ASSERT_EQ(s.records.size(), 1u);
  EXPECT_EQ(s.records[0].crc16, 0x4B74);
  EXPECT_EQ(s.records[0].sum16, 131);
}

TEST(Encode, PadsLastBlockWithZeros) {
  DigestStream s = encode(bytes_of("Hello"), 4);
  ASSERT_EQ(s.records.size(), 2u);
  EXPECT_EQ(s.records[0], digest(Block{'H', 'e', 'l', 'l'}));
  EXPECT_EQ(s.records[1], digest(Block{'o', 0, 0, 0}));
  EXPECT_EQ(s.records[1].crc16, 0x09FC);
  EXPECT_EQ(s.records[1].sum16, 111);
}

TEST(Encode, RecordCountIsCeiling) {
  for (unsigned n = 1; n <= 5; ++n) {
    for (size_t len = 0; len <= 13; ++len) {
      std::vector<uint8_t> payload(len, 'x');
      EXPECT_EQ(encode(payload, n).records.size(), (len + n - 1) / n) << "n=" << n << " len=" << len;
    }
  }
}

TEST(Encode, RejectsBadBlockSize) {
  EXPECT_THROW(encode(bytes_of("AB"), 0), UnsupportedBlockSize);
  EXPECT_THROW(encode(bytes_of("AB"), 256), UnsupportedBlockSize);
  EXPECT_NO_THROW(encode(bytes_of("AB"), 255));
}

TEST(Serialize, WireLayout) {
  std::vector<uint8_t> wire = serialize(encode(bytes_of("AB"), 2));
  EXPECT_EQ(wire, (std::vector<uint8_t>{0x02, 0x4B, 0x74, 0x00, 0x83}));
}

TEST(Serialize, LengthIsHeaderPlusRecords) {
  auto payload = bytes_of("Hi GPU!");
  auto wire = serialize(encode(payload, 2));
  EXPECT_EQ(wire.size(), 1u + 4u * 4u);
  EXPECT_EQ(wire.size(), expected_stream_size(payload.size(), 2));
}

TEST(Serialize, RoundTrip) {
  DigestStream s;
  s.block_size = 3;
  s.records = {{0x0000, 0x0000}, {0xffff, 0xffff}, {0x1234, 0xabcd}, {0xE1E8, 264}};
  EXPECT_EQ(deserialize(serialize(s)), s);

  DigestStream empty;
  empty.block_size = 4;
  EXPECT_EQ(deserialize(serialize(empty)), empty);
}

TEST(Deserialize, HeaderOnlyIsEmptyStream) {
  DigestStream s = deserialize(std::vector<uint8_t>{4});
  EXPECT_EQ(s.block_size, 4);
  EXPECT_TRUE(s.records.empty());
}

TEST(Deserialize, RejectsMissingHeader) {
  EXPECT_THROW(deserialize(std::vector<uint8_t>{}), FormatError);
}

TEST(Deserialize, RejectsPartialRecord) {
  EXPECT_THROW(deserialize(std::vector<uint8_t>{2, 0x4B, 0x74, 0x00}), FormatError);
  EXPECT_THROW(deserialize(std::vector<uint8_t>{2, 0x4B, 0x74, 0x00, 0x83, 0x01}), FormatError);
}

TEST(Deserialize, RejectsZeroBlockSize) {
  EXPECT_THROW(deserialize(std::vector<uint8_t>{0, 0x4B, 0x74, 0x00, 0x83}), FormatError);
}

TEST(Deserialize, RejectsBlockSizeAboveEngineLimit) {
  std::vector<uint8_t> wire{5, 0x4B, 0x74, 0x00, 0x83};
  EXPECT_THROW(deserialize(wire, 4), FormatError);
  EXPECT_NO_THROW(deserialize(wire, 5));
}

TEST(Framing, FormatRecord) {
  EXPECT_EQ(format_record({0x4B74, 131}), "4b74:0083");
  EXPECT_EQ(format_record({0, 0}), "0000:0000");
}
