#include "net/url.hpp"
#include <gtest/gtest.h>

TEST(ParseHostPortTest, HostAndPort) {
  auto ep = URL::ParseHostPort("example.org:9001", "80");
  ASSERT_TRUE(ep.has_value());
  EXPECT_EQ(ep->host, "example.org");
  EXPECT_EQ(ep->port, "9001");
}

TEST(ParseHostPortTest, DefaultPort) {
  auto ep = URL::ParseHostPort("0.0.0.0", "8000");
  ASSERT_TRUE(ep.has_value());
  EXPECT_EQ(ep->host, "0.0.0.0");
  EXPECT_EQ(ep->port, "8000");
}

TEST(ParseHostPortTest, BracketedIpv6) {
  auto ep = URL::ParseHostPort("[::1]:8080", "1");
  ASSERT_TRUE(ep.has_value());
  EXPECT_EQ(ep->host, "::1");
  EXPECT_EQ(ep->port, "8080");

  auto bare = URL::ParseHostPort("[::1]", "1883");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->port, "1883");
}

TEST(ParseHostPortTest, RejectsMalformed) {
  EXPECT_FALSE(URL::ParseHostPort("", "1"));
  EXPECT_FALSE(URL::ParseHostPort(":80", "1"));
  EXPECT_FALSE(URL::ParseHostPort("host:", "1"));
  EXPECT_FALSE(URL::ParseHostPort("host:http", "1"));
  EXPECT_FALSE(URL::ParseHostPort("host:65536", "1"));
  EXPECT_FALSE(URL::ParseHostPort("[::1", "1"));
  EXPECT_FALSE(URL::ParseHostPort("[::1]x", "1"));
}

TEST(ParseBrokerUrlTest, Schemes) {
  auto tcp = URL::ParseBrokerUrl("tcp://broker.local:1884");
  ASSERT_TRUE(tcp.has_value());
  EXPECT_EQ(tcp->host, "broker.local");
  EXPECT_EQ(tcp->port, "1884");

  auto mqtt = URL::ParseBrokerUrl("MQTT://10.0.0.5");
  ASSERT_TRUE(mqtt.has_value());
  EXPECT_EQ(mqtt->host, "10.0.0.5");
  EXPECT_EQ(mqtt->port, "1883");

  auto bare = URL::ParseBrokerUrl("localhost/");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->host, "localhost");
  EXPECT_EQ(bare->port, "1883");
}

TEST(ParseBrokerUrlTest, RejectsOtherSchemesAndPaths) {
  EXPECT_FALSE(URL::ParseBrokerUrl("ws://broker:1883"));
  EXPECT_FALSE(URL::ParseBrokerUrl("ssl://broker:8883"));
  EXPECT_FALSE(URL::ParseBrokerUrl("tcp://broker:1883/topic"));
  EXPECT_FALSE(URL::ParseBrokerUrl("tcp://"));
}
