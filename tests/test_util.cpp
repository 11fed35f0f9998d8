#include <gtest/gtest.h>
#include "logging.hpp"
#include "status.hpp"
#include "util.hpp"

using namespace clipmesh;

TEST(Util, ParseHostPort) {
  std::string host;
  uint16_t port = 0;
  ASSERT_TRUE(parse_host_port("192.168.1.20:9000", host, port));
  EXPECT_EQ(host, "192.168.1.20");
  EXPECT_EQ(port, 9000);

  ASSERT_TRUE(parse_host_port("[::1]:65535", host, port));
  EXPECT_EQ(host, "::1");
  EXPECT_EQ(port, 65535);

  EXPECT_FALSE(parse_host_port("no-port", host, port));
  EXPECT_FALSE(parse_host_port(":9000", host, port));
  EXPECT_FALSE(parse_host_port("host:", host, port));
  EXPECT_FALSE(parse_host_port("host:0", host, port));
  EXPECT_FALSE(parse_host_port("host:65536", host, port));
  EXPECT_FALSE(parse_host_port("host:12a", host, port));
}

TEST(Util, Hex) {
  auto b = hex_to_bytes("00ff10Ab");
  ASSERT_EQ(b.size(), 4u);
  EXPECT_EQ(b[0], 0x00);
  EXPECT_EQ(b[1], 0xff);
  EXPECT_EQ(b[3], 0xab);
  EXPECT_EQ(bytes_to_hex(b.data(), b.size()), "00ff10ab");
  EXPECT_TRUE(hex_to_bytes("abc").empty());
  EXPECT_TRUE(hex_to_bytes("zz").empty());
  EXPECT_TRUE(hex_to_bytes("").empty());
}

TEST(Util, BigEndian) {
  std::vector<uint8_t> out;
  put_be16(out, 0x0102);
  put_be32(out, 0x03040506);
  put_be64(out, 0x0708090a0b0c0d0eull);
  ASSERT_EQ(out.size(), 14u);
  EXPECT_EQ(out[0], 0x01);
  EXPECT_EQ(out[2], 0x03);
  EXPECT_EQ(out[13], 0x0e);
  EXPECT_EQ(get_be16(out.data()), 0x0102);
  EXPECT_EQ(get_be32(out.data() + 2), 0x03040506u);
  EXPECT_EQ(get_be64(out.data() + 6), 0x0708090a0b0c0d0eull);
}

TEST(Util, Utf8Validation) {
  EXPECT_TRUE(is_valid_utf8(""));
  EXPECT_TRUE(is_valid_utf8("plain ascii"));
  EXPECT_TRUE(is_valid_utf8("h\xc3\xa9llo \xe2\x82\xac \xf0\x9f\x98\x80"));
  EXPECT_FALSE(is_valid_utf8("\xff"));
  EXPECT_FALSE(is_valid_utf8("\xc3"));           // truncated
  EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));       // overlong '/'
  EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));   // surrogate
  EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));
}

TEST(Util, PercentCoding) {
  EXPECT_EQ(percent_decode("/tmp/a%20b"), "/tmp/a b");
  EXPECT_EQ(percent_decode("%41%4a"), "AJ");
  EXPECT_EQ(percent_decode("50%"), "50%");
  EXPECT_EQ(percent_decode("%zz"), "%zz");
  EXPECT_EQ(percent_encode_path("/home/u/my file#1.txt"),
            "/home/u/my%20file%231.txt");
  EXPECT_EQ(percent_decode(percent_encode_path("/x/\xc3\xa9 y")), "/x/\xc3\xa9 y");
}

TEST(Util, Trim) {
  EXPECT_EQ(trim("  a b \t\r\n"), "a b");
  EXPECT_EQ(trim("   "), "");
}

TEST(Util, StatusAndLogLevel) {
  EXPECT_STREQ(status_str(Status::CryptoError), "crypto error");
  EXPECT_STREQ(status_str(Status::SizeLimitExceeded), "size limit exceeded");

  LogLevel lvl = LogLevel::INFO;
  EXPECT_TRUE(parse_log_level("debug", lvl));
  EXPECT_EQ(lvl, LogLevel::DEBUG);
  EXPECT_TRUE(parse_log_level("warning", lvl));
  EXPECT_EQ(lvl, LogLevel::WARN);
  EXPECT_FALSE(parse_log_level("loud", lvl));
  EXPECT_EQ(lvl, LogLevel::WARN);
}

TEST(Util, PngLengthStopsAtIend) {
  std::vector<uint8_t> png{0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
  // IHDR-like chunk with 2 data bytes
  put_be32(png, 2);
  png.insert(png.end(), {'I', 'H', 'D', 'R', 7, 7, 0, 0, 0, 0});
  put_be32(png, 0);
  png.insert(png.end(), {'I', 'E', 'N', 'D', 0xae, 0x42, 0x60, 0x82});
  size_t exact = png.size();

  std::vector<uint8_t> padded = png;
  padded.resize(exact + 13, 0);
  EXPECT_EQ(png_length(padded.data(), padded.size()), exact);
  EXPECT_EQ(png_length(png.data(), png.size()), exact);

  // no IEND yet, or not a PNG at all: left as is
  EXPECT_EQ(png_length(png.data(), exact - 12), exact - 12);
  std::vector<uint8_t> bmp{'B', 'M', 1, 2, 3, 4, 5, 6, 7, 8};
  EXPECT_EQ(png_length(bmp.data(), bmp.size()), bmp.size());
}
