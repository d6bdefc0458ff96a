#include <gtest/gtest.h>
#include "fetch/beast_http_client.hpp"

using namespace mvault::fetch;

TEST(UrlTest, ParsesDefaults) {
  auto url = parse_url("https://models.example.com/llm/model.bin?rev=2");
  EXPECT_EQ(url.scheme, "https");
  EXPECT_EQ(url.host, "models.example.com");
  EXPECT_EQ(url.port, "443");
  EXPECT_EQ(url.target, "/llm/model.bin?rev=2");

  url = parse_url("http://localhost");
  EXPECT_EQ(url.port, "80");
  EXPECT_EQ(url.target, "/");
}

TEST(UrlTest, ParsesExplicitPortAndDropsFragment) {
  auto url = parse_url("HTTP://127.0.0.1:8080/file#section");
  EXPECT_EQ(url.scheme, "http");
  EXPECT_EQ(url.host, "127.0.0.1");
  EXPECT_EQ(url.port, "8080");
  EXPECT_EQ(url.target, "/file");
}

TEST(UrlTest, ParsesQueryWithoutPath) {
  auto url = parse_url("http://example.com?x=1");
  EXPECT_EQ(url.host, "example.com");
  EXPECT_EQ(url.target, "/?x=1");
}

TEST(UrlTest, StripsUserInfoAndIpv6Brackets) {
  auto url = parse_url("http://user:pw@[::1]:9000/a");
  EXPECT_EQ(url.host, "::1");
  EXPECT_EQ(url.port, "9000");
}

TEST(UrlTest, RejectsUnsupportedUrls) {
  EXPECT_THROW(parse_url("example.com/model.bin"), FetchError);
  EXPECT_THROW(parse_url("ftp://example.com/model.bin"), FetchError);
  EXPECT_THROW(parse_url("http:///model.bin"), FetchError);
  EXPECT_THROW(parse_url("http://example.com:port/"), FetchError);
}

TEST(UrlTest, ResolvesRedirectLocations) {
  auto base = parse_url("https://cdn.example.com/models/v1/model.bin?sig=abc");

  EXPECT_EQ(resolve_location(base, "http://mirror.example.org/m.bin"), "http://mirror.example.org/m.bin");
  EXPECT_EQ(resolve_location(base, "//mirror.example.org/m.bin"), "https://mirror.example.org/m.bin");
  EXPECT_EQ(resolve_location(base, "/other/path.bin"), "https://cdn.example.com/other/path.bin");
  EXPECT_EQ(resolve_location(base, "model-v2.bin"), "https://cdn.example.com/models/v1/model-v2.bin");

  auto with_port = parse_url("http://localhost:8080/a/b");
  EXPECT_EQ(resolve_location(with_port, "/c"), "http://localhost:8080/c");
}
