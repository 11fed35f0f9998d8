#include <gtest/gtest.h>
#include "command_clipboard.hpp"

using namespace clipmesh;
using namespace std::chrono_literals;

TEST(UriList, Parse) {
  auto paths = parse_uri_list("# copied by a file manager\r\n"
                              "file:///home/u/My%20Docs/a.txt\r\n"
                              "file://localhost/tmp/b\r\n"
                              "https://example.com/not-a-file\r\n"
                              "\r\n"
                              "file:///srv/c%C3%A9");
  ASSERT_EQ(paths.size(), 3u);
  EXPECT_EQ(paths[0], "/home/u/My Docs/a.txt");
  EXPECT_EQ(paths[1], "/tmp/b");
  EXPECT_EQ(paths[2], "/srv/c\xc3\xa9");
  EXPECT_TRUE(parse_uri_list("").empty());
}

TEST(UriList, MakeParsesBack) {
  std::vector<std::string> paths{"/tmp/with space/x.txt", "/tmp/100%.txt"};
  std::string body = make_uri_list(paths);
  EXPECT_EQ(body.substr(0, 7), "file://");
  EXPECT_NE(body.find("with%20space"), std::string::npos);
  EXPECT_EQ(parse_uri_list(body), paths);
}

TEST(RunProcess, CapturesOutputAndFeedsInput) {
  std::vector<uint8_t> input{'p', 'i', 'n', 'g'};
  std::vector<uint8_t> output;
  int code = -1;
  ASSERT_TRUE(run_process({"cat"}, &input, &output, code));
  EXPECT_EQ(code, 0);
  EXPECT_EQ(output, input);
}

TEST(RunProcess, ReportsExitCodes) {
  int code = -1;
  ASSERT_TRUE(run_process({"false"}, nullptr, nullptr, code));
  EXPECT_NE(code, 0);
  ASSERT_TRUE(run_process({"clipmesh-no-such-helper"}, nullptr, nullptr, code));
  EXPECT_EQ(code, 127);
  EXPECT_FALSE(run_process({}, nullptr, nullptr, code));
}

TEST(RunProcess, KillsOnTimeout) {
  std::vector<uint8_t> output;
  int code = 0;
  auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(run_process({"sleep", "5"}, nullptr, &output, code, 100ms));
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 3s);
  EXPECT_EQ(code, -1);
}
