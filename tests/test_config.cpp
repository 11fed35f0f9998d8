#include <gtest/gtest.h>
#include <fstream>
#include "config.hpp"
#include "test_support.hpp"

using namespace clipmesh;
using clipmesh::test::TempDir;

namespace {

EngineConfig valid_config() {
  EngineConfig cfg;
  cfg.listen_port = 9000;
  cfg.secret_key = clipmesh::test::key_a();
  cfg.peers.push_back(PeerConfig{"10.0.0.2", 9000});
  return cfg;
}

} // namespace

TEST(Config, Defaults) {
  EngineConfig cfg;
  EXPECT_EQ(cfg.max_file_size, 10u * 1024 * 1024);
  EXPECT_EQ(cfg.poll_interval.count(), 300);
  EXPECT_EQ(cfg.listen_host, "0.0.0.0");
  EXPECT_FALSE(cfg.origin_id.has_value());
}

TEST(Config, Validate) {
  std::string err;
  EXPECT_TRUE(validate_config(valid_config(), err)) << err;

  auto cfg = valid_config();
  cfg.listen_port = 0;
  EXPECT_FALSE(validate_config(cfg, err));

  cfg = valid_config();
  cfg.secret_key.resize(31);
  EXPECT_FALSE(validate_config(cfg, err));
  EXPECT_NE(err.find("32 bytes"), std::string::npos);

  cfg = valid_config();
  cfg.peers.push_back(PeerConfig{"", 1});
  EXPECT_FALSE(validate_config(cfg, err));

  cfg = valid_config();
  cfg.peers.clear();
  EXPECT_TRUE(validate_config(cfg, err));

  cfg = valid_config();
  cfg.reconnect_max = std::chrono::milliseconds(100);
  cfg.reconnect_initial = std::chrono::milliseconds(200);
  EXPECT_FALSE(validate_config(cfg, err));
}

TEST(Config, ApplyValues) {
  EngineConfig cfg;
  std::string err;
  EXPECT_TRUE(apply_config_value(cfg, "listen_port", "9100", err));
  EXPECT_EQ(cfg.listen_port, 9100);
  EXPECT_TRUE(apply_config_value(cfg, "peer", "192.168.1.5:9100", err));
  EXPECT_TRUE(apply_config_value(cfg, "peer", "[fe80::1]:9200", err));
  ASSERT_EQ(cfg.peers.size(), 2u);
  EXPECT_EQ(cfg.peers[1].host, "fe80::1");
  EXPECT_EQ(cfg.peers[1].endpoint(), "fe80::1:9200");
  EXPECT_TRUE(apply_config_value(cfg, "max_file_size", "2048", err));
  EXPECT_EQ(cfg.max_file_size, 2048u);
  EXPECT_TRUE(apply_config_value(cfg, "origin_id",
                                 "000102030405060708090a0b0c0d0e0f", err));
  ASSERT_TRUE(cfg.origin_id.has_value());
  EXPECT_EQ((*cfg.origin_id)[15], 0x0f);

  EXPECT_FALSE(apply_config_value(cfg, "listen_port", "70000", err));
  EXPECT_FALSE(apply_config_value(cfg, "secret_key", "abcd", err));
  EXPECT_FALSE(apply_config_value(cfg, "peer", "nohost", err));
  EXPECT_FALSE(apply_config_value(cfg, "poll_interval_ms", "0", err));
  EXPECT_FALSE(apply_config_value(cfg, "threads", "-1", err));
  EXPECT_FALSE(apply_config_value(cfg, "colour", "blue", err));
  EXPECT_NE(err.find("unknown key"), std::string::npos);
}

TEST(Config, LoadFile) {
  TempDir tmp;
  auto path = (tmp.path() / "config.conf").string();
  {
    std::ofstream out(path);
    out << "# lan clipboard\n"
        << "listen_port = 9000\n"
        << "secret_key = \"00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff\"\n"
        << "\n"
        << "peer = 192.168.1.20:9000   # laptop\n"
        << "peer = 192.168.1.21:9000\n"
        << "log_level = debug\n"
        << "download_dir = /tmp/inbox\n";
  }
  EngineConfig cfg;
  std::string level, err;
  ASSERT_TRUE(load_config_file(path, cfg, level, err)) << err;
  EXPECT_EQ(cfg.listen_port, 9000);
  EXPECT_EQ(cfg.secret_key, clipmesh::test::key_a());
  ASSERT_EQ(cfg.peers.size(), 2u);
  EXPECT_EQ(cfg.peers[0].host, "192.168.1.20");
  EXPECT_EQ(level, "debug");
  EXPECT_EQ(cfg.download_dir, "/tmp/inbox");
  EXPECT_TRUE(validate_config(cfg, err));
}

TEST(Config, LoadFileReportsLine) {
  TempDir tmp;
  auto path = (tmp.path() / "bad.conf").string();
  {
    std::ofstream out(path);
    out << "listen_port = 9000\n"
        << "this line is broken\n";
  }
  EngineConfig cfg;
  std::string level, err;
  EXPECT_FALSE(load_config_file(path, cfg, level, err));
  EXPECT_NE(err.find(":2:"), std::string::npos) << err;

  EXPECT_FALSE(load_config_file((tmp.path() / "missing.conf").string(), cfg,
                                level, err));
}
