#include <gtest/gtest.h>
#include <cli/cli_args.hpp>
#include <cli/hopssh_cli.hpp>
#include "fakes.hpp"

using Words = std::vector<std::string>;

TEST(CliArgs, ExecJoinsCommandWords) {
    auto r = parse_cli_args(Words{"--host", "h", "exec", "ls", "-la", "/tmp"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.command, "exec");
    ASSERT_EQ(r.value.args.size(), 1u);
    EXPECT_EQ(r.value.args[0], "ls -la /tmp");
    EXPECT_FALSE(r.value.silence);
    EXPECT_EQ(r.value.host, std::string("h"));
}

TEST(CliArgs, ExecSilence) {
    auto r = parse_cli_args(Words{"exec", "--silence", "uptime"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.silence);
    EXPECT_EQ(r.value.args[0], "uptime");
}

TEST(CliArgs, GlobalOptions) {
    auto r = parse_cli_args(Words{"--user", "u", "--port", "2222", "-i", "/k1",
                                  "--identity", "/k2", "--verbose", "console"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.user, std::string("u"));
    EXPECT_EQ(r.value.port, 2222);
    EXPECT_EQ(r.value.identity_files, (Words{"/k1", "/k2"}));
    EXPECT_TRUE(r.value.verbose);
    EXPECT_EQ(r.value.command, "console");
}

TEST(CliArgs, UploadNeedsTwoPaths) {
    EXPECT_TRUE(parse_cli_args(Words{"upload", "a", "b"}).is_ok());
    EXPECT_TRUE(parse_cli_args(Words{"upload", "a"}).is_err());
    EXPECT_TRUE(parse_cli_args(Words{"download", "a", "b", "c"}).is_err());
}

TEST(CliArgs, UsageErrors) {
    EXPECT_TRUE(parse_cli_args(Words{}).is_err());
    EXPECT_TRUE(parse_cli_args(Words{"exec"}).is_err());
    EXPECT_TRUE(parse_cli_args(Words{"--port", "abc", "console"}).is_err());
    EXPECT_TRUE(parse_cli_args(Words{"--port", "70000", "console"}).is_err());
    EXPECT_TRUE(parse_cli_args(Words{"--host"}).is_err());
    EXPECT_TRUE(parse_cli_args(Words{"--bogus", "console"}).is_err());
    EXPECT_TRUE(parse_cli_args(Words{"frobnicate"}).is_err());
    EXPECT_TRUE(parse_cli_args(Words{"console", "extra"}).is_err());
}

TEST(CliArgs, HelpAndVersionShortCircuit) {
    auto help = parse_cli_args(Words{"--host", "h", "--help", "whatever"});
    ASSERT_TRUE(help.is_ok());
    EXPECT_EQ(help.value.command, "--help");

    auto version = parse_cli_args(Words{"--version"});
    ASSERT_TRUE(version.is_ok());
    EXPECT_EQ(version.value.command, "--version");
}

TEST(CliArgs, OverridesReplaceConfigValues) {
    ConnectionConfig config;
    config.host = "from-file";
    config.user = "file-user";
    config.identity_files = {"/file/key"};

    auto r = parse_cli_args(Words{"--host", "from-flag", "-i", "/flag/key", "console"});
    ASSERT_TRUE(r.is_ok());
    apply_cli_overrides(r.value, config);

    EXPECT_EQ(config.host, "from-flag");
    EXPECT_EQ(config.user, "file-user");
    EXPECT_EQ(config.identity_files, (Words{"/flag/key"}));
}

// ── HopsshCLI ───────────────────────────────────────────────

TEST(HopsshCLI, ExecExitsWithRemoteStatus) {
    auto factory = std::make_shared<FakeFactory>();
    ScriptedExec run;
    run.exit_status = 3;
    factory->state->script = {run};

    auto args = parse_cli_args(Words{"--config", "/nonexistent/x.yaml", "exec", "false"});
    ASSERT_TRUE(args.is_ok());
    // Unreadable config file is an operation failure
    EXPECT_EQ(HopsshCLI(factory).run(args.value), EXIT_FAILURE_OP);

    TempDir dir("cli_exec");
    auto path = dir.write("c.yaml", "host: h\nuser: u\n");
    args = parse_cli_args(Words{"--config", path.string(), "exec", "--silence", "false"});
    ASSERT_TRUE(args.is_ok());
    EXPECT_EQ(HopsshCLI(factory).run(args.value), 3);
    EXPECT_EQ(factory->state->commands, (Words{"false"}));
}

TEST(HopsshCLI, MissingHostIsUsageError) {
    TempDir dir("cli_nohost");
    auto path = dir.write("c.yaml", "user: u\n");
    auto args = parse_cli_args(Words{"--config", path.string(), "exec", "true"});
    ASSERT_TRUE(args.is_ok());
    EXPECT_EQ(HopsshCLI(std::make_shared<FakeFactory>()).run(args.value), EXIT_USAGE);
}
