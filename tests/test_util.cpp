/// @file test_util.cpp
/// Unit tests for util.hpp: host parsing and wire-path construction.

#include "util.hpp"
#include "version.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace dockapi;

// ============================================================================
// parseHostUrl
// ============================================================================

TEST(ParseHostUrl, EmptyStringThrows) {
    EXPECT_THROW(parseHostUrl(""), std::invalid_argument);
}

TEST(ParseHostUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseHostUrl("foobar"), std::invalid_argument);
    EXPECT_THROW(parseHostUrl("localhost:2375"), std::invalid_argument);
}

TEST(ParseHostUrl, ErrorMessageNamesTheHost) {
    try {
        parseHostUrl("host");
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("unable to parse host `host`"),
                  std::string::npos);
    }
}

TEST(ParseHostUrl, NothingAfterSchemeThrows) {
    EXPECT_THROW(parseHostUrl("tcp://"), std::invalid_argument);
}

TEST(ParseHostUrl, ArbitrarySchemeIsPassedThrough) {
    auto addr = parseHostUrl("foo://bar");
    EXPECT_EQ(addr.scheme, "foo");
    EXPECT_EQ(addr.host, "bar");
    EXPECT_EQ(addr.path, "");
}

TEST(ParseHostUrl, TcpWithPort) {
    auto addr = parseHostUrl("tcp://localhost:2476");
    EXPECT_EQ(addr.scheme, "tcp");
    EXPECT_EQ(addr.host, "localhost:2476");
    EXPECT_EQ(addr.path, "");
}

TEST(ParseHostUrl, TcpWithBasePath) {
    auto addr = parseHostUrl("tcp://localhost:2476/path");
    EXPECT_EQ(addr.scheme, "tcp");
    EXPECT_EQ(addr.host, "localhost:2476");
    EXPECT_EQ(addr.path, "/path");
}

TEST(ParseHostUrl, TcpBasePathIsDecodedOnce) {
    auto addr = parseHostUrl("tcp://localhost:2375/a%20b");
    EXPECT_EQ(addr.path, "/a b");
    EXPECT_EQ(buildApiPath("1.41", "/info", {}, addr.path), "/a%20b/v1.41/info");
}

TEST(ParseHostUrl, MalformedEscapeInBasePathThrows) {
    EXPECT_THROW(parseHostUrl("tcp://localhost:2375/a%2"), std::invalid_argument);
    EXPECT_THROW(parseHostUrl("tcp://localhost:2375/a%zzb"), std::invalid_argument);
}

TEST(ParseHostUrl, UnixSocketPathIsKeptWhole) {
    auto addr = parseHostUrl("unix:///var/run/docker.sock");
    EXPECT_EQ(addr.scheme, "unix");
    EXPECT_EQ(addr.host, "/var/run/docker.sock");
    EXPECT_EQ(addr.path, "");
}

TEST(ParseHostUrl, NamedPipePathIsKeptWhole) {
    auto addr = parseHostUrl("npipe:////./pipe/docker_engine");
    EXPECT_EQ(addr.scheme, "npipe");
    EXPECT_EQ(addr.host, "//./pipe/docker_engine");
    EXPECT_EQ(addr.path, "");
}

TEST(ParseHostUrl, UnknownSchemeWithPathIsNotSplit) {
    auto addr = parseHostUrl("invalid://url/with/slashes");
    EXPECT_EQ(addr.scheme, "invalid");
    EXPECT_EQ(addr.host, "url/with/slashes");
}

// ============================================================================
// splitAuthority
// ============================================================================

TEST(SplitAuthority, HostAndPort) {
    std::string host, port;
    splitAuthority("localhost:2376", "2375", host, port);
    EXPECT_EQ(host, "localhost");
    EXPECT_EQ(port, "2376");
}

TEST(SplitAuthority, DefaultPort) {
    std::string host, port;
    splitAuthority("example.com", "2375", host, port);
    EXPECT_EQ(host, "example.com");
    EXPECT_EQ(port, "2375");
}

TEST(SplitAuthority, BracketedIpv6) {
    std::string host, port;
    splitAuthority("[::1]:2375", "80", host, port);
    EXPECT_EQ(host, "::1");
    EXPECT_EQ(port, "2375");
}

TEST(UnescapePath, DecodesEscapes) {
    EXPECT_EQ(unescapePath("/a%20b%2Fc"), "/a b/c");
    EXPECT_EQ(unescapePath("/plain"), "/plain");
    EXPECT_EQ(unescapePath("%7e"), "~");
}

// ============================================================================
// buildApiPath
// ============================================================================

TEST(BuildApiPath, DefaultVersion) {
    EXPECT_EQ(buildApiPath(kDefaultApiVersion, "/containers/json"),
              "/v" + kDefaultApiVersion + "/containers/json");
}

TEST(BuildApiPath, ExplicitVersion) {
    EXPECT_EQ(buildApiPath("1.22", "/containers/json"),
              "/v1.22/containers/json");
    EXPECT_EQ(buildApiPath("1.22", "/containers/json", QueryValues{}),
              "/v1.22/containers/json");
}

TEST(BuildApiPath, LeadingVIsStripped) {
    EXPECT_EQ(buildApiPath("v1.22", "/containers/json"),
              "/v1.22/containers/json");
}

TEST(BuildApiPath, QueryIsAppended) {
    EXPECT_EQ(buildApiPath("1.22", "/containers/json", {{"s", {"c"}}}),
              "/v1.22/containers/json?s=c");
    EXPECT_EQ(buildApiPath("v1.22", "/containers/json", {{"s", {"c"}}}),
              "/v1.22/containers/json?s=c");
}

TEST(BuildApiPath, SpecialCharactersInPathAreEscaped) {
    EXPECT_EQ(buildApiPath("v1.22", "/networks/kiwl$%^"),
              "/v1.22/networks/kiwl$%25%5E");
}

TEST(BuildApiPath, QueryValuesAreFormEncoded) {
    QueryValues query{
        {"filters", {"{\"label\":[\"a=b c\"]}"}},
        {"all", {"1"}},
    };
    EXPECT_EQ(buildApiPath("1.41", "/containers/json", query),
              "/v1.41/containers/json?all=1&"
              "filters=%7B%22label%22%3A%5B%22a%3Db+c%22%5D%7D");
}

TEST(BuildApiPath, RepeatedQueryKey) {
    EXPECT_EQ(buildApiPath("1.41", "/images/json", {{"t", {"a", "b"}}}),
              "/v1.41/images/json?t=a&t=b");
}

TEST(BuildApiPath, BasePathIsPrefixed) {
    EXPECT_EQ(buildApiPath("1.41", "/info", {}, "/path"),
              "/path/v1.41/info");
    EXPECT_EQ(buildApiPath("1.41", "/info", {}, "/path/"),
              "/path/v1.41/info");
}

TEST(BuildApiPath, EmptyVersionOmitsVersionSegment) {
    EXPECT_EQ(buildApiPath("", "/_ping"), "/_ping");
    EXPECT_EQ(buildApiPath("", "/_ping", {}, "/base"), "/base/_ping");
}

// ============================================================================
// resolveRedirectTarget
// ============================================================================

TEST(ResolveRedirectTarget, AbsolutePath) {
    EXPECT_EQ(resolveRedirectTarget("/redirectme", "/bla", "localhost:2375"), "/bla");
}

TEST(ResolveRedirectTarget, AbsoluteUrlOnSameAuthorityKeepsPathAndQuery) {
    EXPECT_EQ(resolveRedirectTarget("/a", "http://localhost:2375/v1.41/info?x=1",
                                    "localhost:2375"),
              "/v1.41/info?x=1");
    EXPECT_EQ(resolveRedirectTarget("/a", "http://localhost:2375", "localhost:2375"),
              "/");
    EXPECT_EQ(resolveRedirectTarget("/a", "http://localhost:2375?x=1", "localhost:2375"),
              "/?x=1");
}

TEST(ResolveRedirectTarget, AuthorityComparisonIgnoresCase) {
    EXPECT_EQ(resolveRedirectTarget("/a", "http://Api.Moby.Localhost/b",
                                    "api.moby.localhost"),
              "/b");
}

TEST(ResolveRedirectTarget, OtherAuthorityIsNotResolved) {
    EXPECT_FALSE(resolveRedirectTarget("/v1.41/info",
                                       "http://evil.example:80/v1.41/secrets",
                                       "localhost:2375").has_value());
    EXPECT_FALSE(resolveRedirectTarget("/a", "http://localhost:2376/a",
                                       "localhost:2375").has_value());
    EXPECT_FALSE(resolveRedirectTarget("/a", "//other/a",
                                       "localhost:2375").has_value());
}

TEST(ResolveRedirectTarget, RelativeReplacesLastSegment) {
    EXPECT_EQ(resolveRedirectTarget("/v1.41/containers/json?all=1", "info",
                                    "localhost:2375"),
              "/v1.41/containers/info");
}

TEST(ResolveRedirectTarget, EmptyLocationThrows) {
    EXPECT_THROW(resolveRedirectTarget("/a", "", "localhost:2375"), std::runtime_error);
}
