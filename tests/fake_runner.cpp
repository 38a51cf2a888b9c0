#include "fake_runner.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <unistd.h>

namespace strata::testing {

namespace {

void write_file(const std::filesystem::path &path, std::string_view content = "x") {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path) << content;
}

std::string option_value(const std::string &data, std::string_view key) {
    auto pos = data.find(key);
    if (pos == std::string::npos)
        return {};
    pos += key.size();
    return data.substr(pos, data.find(',', pos) - pos);
}

} // namespace

std::vector<std::string> sample_resolution() {
    return {
        "Reading package lists...",
        "Building dependency tree...",
        "The following NEW packages will be installed:",
        "  libbar libfoo",
        "Inst libfoo (1.0 Debian:unstable [amd64]) []",
        "Inst libbar (2.0 Debian:unstable [amd64]) []",
        "Conf libfoo (1.0 Debian:unstable [amd64])",
        "Conf libbar (2.0 Debian:unstable [amd64])",
    };
}

int FakeRunner::count(std::string_view needle) const {
    return static_cast<int>(std::count_if(commands.begin(), commands.end(), [&](const Command &cmd) {
        return join_args(cmd.args).find(needle) != std::string::npos;
    }));
}

int FakeRunner::nspawn_count(std::string_view inner_needle) const {
    return static_cast<int>(std::count_if(commands.begin(), commands.end(), [&](const Command &cmd) {
        if (cmd.args.empty() || cmd.args.front() != "systemd-nspawn")
            return false;
        auto sep = std::find(cmd.args.begin(), cmd.args.end(), "--");
        std::vector<std::string> inner(sep == cmd.args.end() ? sep : sep + 1, cmd.args.end());
        return join_args(inner).find(inner_needle) != std::string::npos;
    }));
}

CommandOutput FakeRunner::nspawn(const std::vector<std::string> &args) {
    CommandOutput out;
    std::filesystem::path root;
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "-D")
            root = args[i + 1];
    }
    auto sep = std::find(args.begin(), args.end(), "--");
    std::vector<std::string> inner(sep == args.end() ? sep : sep + 1, args.end());
    const std::string joined = join_args(inner);

    if (joined.find("build-dep -s") != std::string::npos) {
        out.lines = resolution_lines;
    } else if (joined.find("dpkg-buildpackage") != std::string::npos) {
        for (const char *name : {"hello_1.0_amd64.deb", "hello_1.0.dsc", "hello_1.0.tar.xz", "hello_1.0_amd64.changes",
                                 "hello_1.0_amd64.buildinfo", "hello_1.0_amd64.build"}) {
            write_file(root / name);
        }
    } else if (joined.find("apt-get install") != std::string::npos) {
        out.status = install_status;
    }
    return out;
}

Result<CommandOutput> FakeRunner::run(const Command &cmd) {
    commands.push_back(cmd);
    if (on_run)
        on_run(cmd);
    const auto &args = cmd.args;
    const std::string joined = join_args(args);

    CommandOutput out;
    if (!fail_on.empty() && joined.find(fail_on) != std::string::npos) {
        out.status = 1;
        out.err = "simulated failure";
        return out;
    }
    if (args.empty())
        return out;

    const std::string &tool = args.front();
    if (tool == "mount") {
        const std::filesystem::path mount_point = args.back();
        uppers_[mount_point.string()] = option_value(args[4], "upperdir=");
        if (!skip_sentinel)
            write_file(mount_point / "usr/bin/apt");
        mount_log.push_back("mount " + mount_point.string());
    } else if (tool == "umount") {
        const std::filesystem::path mount_point = args.back();
        const std::filesystem::path upper = uppers_[mount_point.string()];
        std::vector<std::filesystem::path> entries;
        for (const auto &entry : std::filesystem::directory_iterator(mount_point))
            entries.push_back(entry.path());
        for (const auto &entry : entries) {
            if (entry.filename() != "usr" && !upper.empty()) {
                auto target = upper / entry.filename();
                std::filesystem::remove_all(target);
                std::filesystem::rename(entry, target);
            } else {
                std::filesystem::remove_all(entry);
            }
        }
        mount_log.push_back("umount " + mount_point.string());
    } else if (tool == "debootstrap") {
        const std::filesystem::path dest = args[args.size() - 2];
        write_file(dest / "usr/bin/apt");
        std::filesystem::create_directories(dest / "etc");
    } else if (tool == "rm") {
        for (auto it = std::find(args.begin(), args.end(), "--"); it != args.end(); ++it) {
            if (*it != "--")
                std::filesystem::remove_all(*it);
        }
    } else if (tool == "du") {
        out.lines.push_back("12M\t" + args.back());
    } else if (tool == "machinectl") {
        out.lines = machines;
    } else if (tool == "systemd-nspawn") {
        out = nspawn(args);
    }
    return out;
}

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("strata_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

} // namespace strata::testing
