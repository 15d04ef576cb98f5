#include "config/options.hpp"
#include "core/server.hpp"
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

namespace {

std::expected<ProxyOptions, std::string>
Parse(std::initializer_list<const char *> args) {
  std::vector<std::string> storage{"mqtt-ws-proxy"};
  storage.insert(storage.end(), args.begin(), args.end());
  std::vector<char *> argv;
  for (auto &s : storage) {
    argv.push_back(s.data());
  }
  return ParseArgs(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(ParseArgsTest, Defaults) {
  auto opt = Parse({});
  ASSERT_TRUE(opt.has_value()) << opt.error();
  EXPECT_EQ(opt->listen_host, "127.0.0.1");
  EXPECT_EQ(opt->listen_port, "8000");
  EXPECT_EQ(opt->broker_host, "127.0.0.1");
  EXPECT_EQ(opt->broker_port, "1883");
  EXPECT_EQ(opt->ws_paths, (std::vector<std::string>{"/mqtt", "/mqtt_opt"}));
  EXPECT_EQ(opt->read_buffer_size, 65536u);
  EXPECT_EQ(opt->flush_policy.small_chunk_threshold, 100u);
  EXPECT_EQ(opt->flush_policy.flush_threshold, 131072u);
  EXPECT_EQ(opt->threads, 1);
  EXPECT_TRUE(opt->check_broker);
  EXPECT_FALSE(opt->show_help);
}

TEST(ParseArgsTest, AddressesAndTuning) {
  auto opt = Parse({"--listen", "0.0.0.0:9001", "-b", "mqtt://broker:1884",
                    "--read-buffer", "4096", "--small-chunk", "64",
                    "--flush-threshold", "65536", "-j", "4", "--log-level",
                    "debug", "--no-broker-check", "-t", "10"});
  ASSERT_TRUE(opt.has_value()) << opt.error();
  EXPECT_EQ(opt->listen_host, "0.0.0.0");
  EXPECT_EQ(opt->listen_port, "9001");
  EXPECT_EQ(opt->broker_host, "broker");
  EXPECT_EQ(opt->broker_port, "1884");
  EXPECT_EQ(opt->read_buffer_size, 4096u);
  EXPECT_EQ(opt->flush_policy.small_chunk_threshold, 64u);
  EXPECT_EQ(opt->flush_policy.flush_threshold, 65536u);
  EXPECT_EQ(opt->threads, 4);
  EXPECT_EQ(opt->log_level, logging::Level::debug);
  EXPECT_FALSE(opt->check_broker);
  EXPECT_EQ(opt->seconds, 10);
}

TEST(ParseArgsTest, PathsReplaceDefaults) {
  auto opt = Parse({"-p", "/ws", "--path", "/mqtt"});
  ASSERT_TRUE(opt.has_value()) << opt.error();
  EXPECT_EQ(opt->ws_paths, (std::vector<std::string>{"/ws", "/mqtt"}));
}

TEST(ParseArgsTest, HelpStopsParsing) {
  auto opt = Parse({"--help", "--bogus"});
  ASSERT_TRUE(opt.has_value());
  EXPECT_TRUE(opt->show_help);
}

TEST(ParseArgsTest, Errors) {
  auto unknown = Parse({"--bogus", "1"});
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error(), "unknown option: --bogus");

  auto missing = Parse({"--threads"});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), "--threads: missing value");

  EXPECT_FALSE(Parse({"--threads", "0"}).has_value());
  EXPECT_FALSE(Parse({"--threads", "four"}).has_value());
  EXPECT_FALSE(Parse({"--read-buffer", "16"}).has_value());
  EXPECT_FALSE(Parse({"--broker-port", "70000"}).has_value());
  EXPECT_FALSE(Parse({"--broker", "ws://x"}).has_value());
  EXPECT_FALSE(Parse({"--listen", "host:port"}).has_value());
  EXPECT_FALSE(Parse({"--path", "mqtt"}).has_value());
  EXPECT_FALSE(Parse({"--log-level", "loud"}).has_value());
}

TEST(ParseArgsTest, KeepalivePingsNeedIdleTimeout) {
  EXPECT_FALSE(Parse({"--ws-keepalive-pings"}).has_value());
  auto opt = Parse({"--ws-keepalive-pings", "--ws-idle-timeout", "30"});
  ASSERT_TRUE(opt.has_value()) << opt.error();
  EXPECT_TRUE(opt->ws_keepalive_pings);
  EXPECT_EQ(opt->ws_idle_timeout_s, 30);
}

TEST(MakeServerConfigTest, CarriesOptionsIntoSessions) {
  auto opt = Parse({"-b", "tcp://b:2000", "--read-buffer", "1024",
                    "--ws-idle-timeout", "5", "--handshake-timeout", "7"});
  ASSERT_TRUE(opt.has_value()) << opt.error();
  const auto cfg = proxy::MakeServerConfig(*opt);
  EXPECT_EQ(cfg.session.broker_host, "b");
  EXPECT_EQ(cfg.session.broker_port, "2000");
  EXPECT_EQ(cfg.session.read_buffer_size, 1024u);
  EXPECT_EQ(cfg.handshake_timeout, std::chrono::seconds(7));
  EXPECT_EQ(cfg.session.ws_timeouts.idle, std::chrono::seconds(5));
}
