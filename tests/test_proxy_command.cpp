#include <gtest/gtest.h>
#include <ssh/proxy_command.hpp>

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static ProxyConfig make_proxy(const char* user, const char* host) {
    ProxyConfig proxy;
    if (user) proxy.user = user;
    if (host) proxy.host = host;
    return proxy;
}

// ── build_proxy_command ─────────────────────────────────────

TEST(ProxyCommand, FullCommand) {
    auto cmd = build_proxy_command(make_proxy("bob", "jump"));
    ASSERT_TRUE(cmd.is_ok()) << cmd.error;
    EXPECT_EQ(cmd.value,
              "ssh -q -A -o UserKnownHostsFile=/dev/null -o StrictHostKeyChecking=no "
              "-o KeepAlive=yes -o ServerAliveInterval=60 bob@jump nc %h %p");
}

TEST(ProxyCommand, IdentityAndPort) {
    ProxyConfig proxy = make_proxy("bob", "jump");
    proxy.identity_files = {"/keys/jump"};
    proxy.port = 2022;

    auto cmd = build_proxy_command(proxy, false);
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_TRUE(contains(cmd.value, " -i /keys/jump "));
    EXPECT_TRUE(contains(cmd.value, " -p 2022 "));
    EXPECT_FALSE(contains(cmd.value, " -A "));
    EXPECT_TRUE(contains(cmd.value, "-p 2022 bob@jump nc %h %p"));
}

TEST(ProxyCommand, HostKeyVerifyKeepsKnownHosts) {
    auto cmd = build_proxy_command(make_proxy("bob", "jump"), true, true);
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_FALSE(contains(cmd.value, "UserKnownHostsFile=/dev/null"));
    EXPECT_TRUE(contains(cmd.value, "StrictHostKeyChecking=no"));
    EXPECT_TRUE(contains(cmd.value, "ServerAliveInterval=60"));
}

TEST(ProxyCommand, MissingUserIsConfigError) {
    auto cmd = build_proxy_command(make_proxy(nullptr, "jump"));
    ASSERT_TRUE(cmd.is_err());
    EXPECT_EQ(cmd.kind, ErrorKind::Config);
    EXPECT_TRUE(contains(cmd.error, "proxy user"));
}

TEST(ProxyCommand, MissingHostIsConfigError) {
    auto cmd = build_proxy_command(make_proxy("bob", nullptr));
    ASSERT_TRUE(cmd.is_err());
    EXPECT_EQ(cmd.kind, ErrorKind::Config);
    EXPECT_TRUE(contains(cmd.error, "proxy host"));
}

TEST(ProxyCommand, UserIsCheckedBeforeHost) {
    auto cmd = build_proxy_command(make_proxy(nullptr, nullptr));
    ASSERT_TRUE(cmd.is_err());
    EXPECT_TRUE(contains(cmd.error, "proxy user"));
}

TEST(ProxyCommand, EmptyStringsCountAsMissing) {
    auto cmd = build_proxy_command(make_proxy("bob", ""));
    ASSERT_TRUE(cmd.is_err());
    EXPECT_TRUE(contains(cmd.error, "proxy host"));
}

// ── expand_proxy_command ────────────────────────────────────

TEST(ProxyCommand, ExpandPlaceholders) {
    EXPECT_EQ(expand_proxy_command("nc %h %p", "10.1.2.3", 22), "nc 10.1.2.3 22");
    EXPECT_EQ(expand_proxy_command("echo 100%% %h", "db", 5432), "echo 100% db");
    EXPECT_EQ(expand_proxy_command("trailing %", "x", 1), "trailing %");
}

// ── build_console_command ───────────────────────────────────

static ConnectionConfig console_config() {
    ConnectionConfig config;
    config.host = "target";
    config.user = "alice";
    return config;
}

TEST(ConsoleCommand, PlainHost) {
    auto cmd = build_console_command(console_config());
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_EQ(cmd.value,
              "ssh -q -A -o UserKnownHostsFile=/dev/null -o StrictHostKeyChecking=no "
              "-o KeepAlive=yes -o ServerAliveInterval=60 alice@target");
}

TEST(ConsoleCommand, IdentityPortAndProxy) {
    ConnectionConfig config = console_config();
    config.identity_files = {"/k"};
    config.port = 2222;
    config.proxy = make_proxy("bob", "jump");

    auto cmd = build_console_command(config);
    ASSERT_TRUE(cmd.is_ok()) << cmd.error;
    EXPECT_TRUE(contains(cmd.value, "-i /k"));
    EXPECT_TRUE(contains(cmd.value, "-p 2222"));
    EXPECT_TRUE(contains(cmd.value, "-o ProxyCommand=\"ssh -q -A "));
    EXPECT_TRUE(contains(cmd.value, "bob@jump nc %h %p\" alice@target"));
}

TEST(ConsoleCommand, NoPortNoPortFlag) {
    ConnectionConfig config = console_config();
    config.identity_files = {"/k"};
    config.proxy = make_proxy("bob", "jump");

    auto cmd = build_console_command(config);
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_FALSE(contains(cmd.value, "-p "));
    EXPECT_TRUE(contains(cmd.value, "ProxyCommand="));
}

TEST(ConsoleCommand, NoIdentityNoProxy) {
    auto cmd = build_console_command(console_config());
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_FALSE(contains(cmd.value, "-i "));
    EXPECT_FALSE(contains(cmd.value, "ProxyCommand"));
}

TEST(ConsoleCommand, OneFlagPerIdentityFile) {
    ConnectionConfig config = console_config();
    config.identity_files = {"/k1", "/k2"};

    auto cmd = build_console_command(config);
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_TRUE(contains(cmd.value, "-i /k1 -i /k2"));
}

TEST(ConsoleCommand, ForwardAgentOff) {
    ConnectionConfig config = console_config();
    config.forward_agent = false;

    auto cmd = build_console_command(config);
    ASSERT_TRUE(cmd.is_ok());
    EXPECT_FALSE(contains(cmd.value, " -A"));
}

TEST(ConsoleCommand, ProxyWithoutUserFails) {
    ConnectionConfig config = console_config();
    config.proxy = make_proxy(nullptr, "jump");

    auto cmd = build_console_command(config);
    ASSERT_TRUE(cmd.is_err());
    EXPECT_EQ(cmd.kind, ErrorKind::Config);
}

TEST(ConsoleCommand, HostKeyVerifyStillDisablesStrictChecking) {
    ConnectionConfig config = console_config();
    config.host_key_verify = true;
    config.proxy = make_proxy("bob", "jump");

    auto cmd = build_console_command(config);
    ASSERT_TRUE(cmd.is_ok()) << cmd.error;
    EXPECT_FALSE(contains(cmd.value, "UserKnownHostsFile=/dev/null"));
    EXPECT_EQ(cmd.value,
              "ssh -q -A -o StrictHostKeyChecking=no -o KeepAlive=yes -o ServerAliveInterval=60 "
              "-o ProxyCommand=\"ssh -q -A -o StrictHostKeyChecking=no -o KeepAlive=yes "
              "-o ServerAliveInterval=60 bob@jump nc %h %p\" alice@target");
}
