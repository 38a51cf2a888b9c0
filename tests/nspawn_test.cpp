#include "fake_runner.hpp"
#include "strata/nspawn.hpp"

#include <gtest/gtest.h>

using namespace strata;
using strata::testing::FakeRunner;

using Args = std::vector<std::string>;

TEST(NspawnArgs, MinimalInvocation) {
    NamespaceOptions opts{.root = "/cache/l1/fs/sid", .machine = "strata-42", .chdir = "/"};
    EXPECT_EQ(nspawn_args(opts, {"apt-get", "update"}),
              (Args{"systemd-nspawn", "-M", "strata-42", "--chdir=/", "-D", "/cache/l1/fs/sid", "--", "apt-get",
                    "update"}));
}

TEST(NspawnArgs, IsolationOptionsAndOverlay) {
    NamespaceOptions opts{
        .root = "/cache/l1/fs/sid",
        .read_only = true,
        .private_network = true,
        .overlays = {{"/home/me/hello", CONTAINER_SRC_DIR}},
        .drop_capability = {"CAP_NET_RAW", "CAP_SYS_ADMIN"},
        .system_call_filter = "~@mount",
        .env = {{"DEBIAN_FRONTEND", "noninteractive"}},
    };
    EXPECT_EQ(nspawn_args(opts, {"/usr/bin/apt-get", "build-dep", "-s", "."}),
              (Args{"systemd-nspawn", "-M", "strata", "--chdir=/srv", "--drop-capability=CAP_NET_RAW,CAP_SYS_ADMIN",
                    "--system-call-filter=~@mount", "--private-network", "-D", "/cache/l1/fs/sid", "--read-only",
                    "--overlay=/home/me/hello::/srv", "-E", "DEBIAN_FRONTEND=noninteractive", "--",
                    "/usr/bin/apt-get", "build-dep", "-s", "."}));
}

TEST(Nspawn, RunsPrivileged) {
    FakeRunner runner;
    auto out = nspawn(runner, {.root = "/r"}, {"true"}, true);
    ASSERT_TRUE(out);
    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_TRUE(runner.commands[0].privileged);
    EXPECT_TRUE(runner.commands[0].quiet);
}

TEST(Nspawn, CheckedTurnsStatusIntoError) {
    FakeRunner runner;
    runner.fail_on = "dpkg-buildpackage";

    auto checked = nspawn(runner, {.root = "/r"}, {"dpkg-buildpackage"});
    ASSERT_FALSE(checked);
    EXPECT_EQ(checked.error().kind, ErrorKind::ExternalCommandFailure);

    auto unchecked = nspawn(runner, {.root = "/r"}, {"dpkg-buildpackage"}, false, false);
    ASSERT_TRUE(unchecked);
    EXPECT_EQ(unchecked->status, 1);
}
