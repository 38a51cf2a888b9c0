#include "strata/config.hpp"
#include "strata/console.hpp"
#include "strata/lifecycle.hpp"
#include "strata/process_exec.hpp"

#include <filesystem>
#include <iostream>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::string_view ACTIONS[] = {"create", "update", "build", "install", "purge", "show"};

void print_help() {
    std::println("Usage: strata [options] <action> [-- extra args]");
    std::println("Build Debian packages on stacked overlay layers inside systemd-nspawn containers.");
    std::println("");
    std::println("Actions:");
    std::println("  create           Create the base system (L1) for --codename using debootstrap");
    std::println("  update           Update the base system in place");
    std::println("  build            Build the package in the current directory; extra args go to");
    std::println("                   dpkg-buildpackage. Creates L1 and the dependency layer (L2) if needed");
    std::println("  install          Install the given package files and their dependencies into a");
    std::println("                   temporary layer and report the package tool's exit status");
    std::println("  purge            Remove dependency layers past the configured age/count limits");
    std::println("  show             Show overlay mounts, running containers and layers");
    std::println("");
    std::println("Options:");
    std::println("  -h, --help       Show this help message");
    std::println("  --version        Show version");
    std::println("  --conf <file>    Configuration file (default: {})", strata::Config::default_path().string());
    std::println("  --codename <c>   Distribution codename (default: sid)");
    std::println("  -v, --verbose    Increase verbosity");
    std::println("");
    std::println("Default configuration:");
    std::print("{}", strata::Config::default_document());
}

void print_version() {
    std::println("strata {}", STRATA_PROJ_VER);
}

bool is_action(std::string_view arg) {
    for (auto action : ACTIONS) {
        if (arg == action)
            return true;
    }
    return false;
}

} // namespace

int main(const int argc, const char *const *argv) {
    std::filesystem::path conf_path = strata::Config::default_path();
    bool conf_given = false;
    std::string codename = "sid";
    std::string action;
    std::vector<std::string> extra_args;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "--conf") {
            if (i + 1 < argc) {
                conf_path = argv[++i];
                conf_given = true;
            } else {
                std::println(std::cerr, "Missing argument for --conf");
                return 1;
            }
        } else if (arg == "--codename") {
            if (i + 1 < argc) {
                codename = argv[++i];
            } else {
                std::println(std::cerr, "Missing argument for --codename");
                return 1;
            }
        } else if (arg == "-v" || arg == "--verbose") {
            verbosity++;
        } else if (arg.size() > 2 && arg.starts_with("-v") && arg.find_first_not_of('v', 1) == std::string_view::npos) {
            verbosity += static_cast<int>(arg.size() - 1);
        } else if (arg == "--") {
            for (++i; i < argc; ++i)
                extra_args.emplace_back(argv[i]);
        } else if (action.empty() && is_action(arg)) {
            action = arg;
        } else if (!action.empty() && !arg.starts_with("-")) {
            extra_args.emplace_back(arg);
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (action.empty()) {
        std::println(std::cerr, "Missing action, one of: create, update, build, install, purge, show");
        return 1;
    }
    if (!extra_args.empty() && action != "build" && action != "install") {
        std::println(std::cerr, "Extra arguments should be passed only during build or install");
        return 1;
    }

    auto config = strata::Config::load(conf_path, !conf_given);
    if (!config) {
        std::println(std::cerr, "{}", config.error());
        return 1;
    }

    strata::Console console(config->style, verbosity);
    strata::ReprocRunner runner(console, config->privilege_command);

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        console.error("Cannot determine working directory: {}", ec.message());
        return 1;
    }

    strata::CacheManager manager(*config, runner, console);
    strata::BuildRequest request{.codename = codename, .source_dir = cwd, .extra_args = extra_args};

    if (action == "create") {
        if (auto res = manager.create_base(codename); !res) {
            console.error("Error: {}", res.error());
            return 1;
        }
    } else if (action == "update") {
        if (auto res = manager.update_base(codename); !res) {
            console.error("Error: {}", res.error());
            return 1;
        }
    } else if (action == "build") {
        if (auto res = manager.build(request); !res) {
            console.error("Build failed: {}", res.error());
            return 1;
        }
    } else if (action == "install") {
        std::vector<std::filesystem::path> packages;
        for (const auto &arg : extra_args) {
            packages.push_back(std::filesystem::absolute(arg, ec));
            if (ec) {
                console.error("Cannot resolve {}: {}", arg, ec.message());
                return 1;
            }
        }
        request.extra_args.clear();
        auto res = manager.install(request, packages);
        if (!res) {
            console.error("Install failed: {}", res.error());
            return 1;
        }
        return *res;
    } else if (action == "purge") {
        if (auto res = manager.purge(); !res) {
            console.error("Purge failed: {}", res.error());
            return 1;
        }
    } else if (action == "show") {
        if (auto res = manager.show(); !res) {
            console.error("{}", res.error());
            return 1;
        }
    }

    return 0;
}
