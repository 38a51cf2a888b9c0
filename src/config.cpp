#include "strata/config.hpp"

#include "strata/utility.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>

namespace strata {

namespace {

using json = nlohmann::json;

std::vector<std::string> split_capabilities(std::string_view value) {
    std::vector<std::string> caps;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        if (end == std::string_view::npos)
            end = value.size();
        std::string_view cap = value.substr(start, end - start);
        while (!cap.empty() && (cap.front() == ' ' || cap.front() == '\t'))
            cap.remove_prefix(1);
        while (!cap.empty() && (cap.back() == ' ' || cap.back() == '\t'))
            cap.remove_suffix(1);
        if (!cap.empty())
            caps.emplace_back(cap);
        start = end + 1;
    }
    return caps;
}

} // namespace

std::filesystem::path Config::default_path() {
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0')
        return std::filesystem::path(xdg) / "strata.json";
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0')
        return std::filesystem::path(home) / ".config" / "strata.json";
    return std::filesystem::path(".config") / "strata.json";
}

std::string Config::default_document() {
    const Config defaults;
    json doc = {
        {"cache_dir", defaults.cache_dir.string()},
        {"export_dir", defaults.export_dir.string()},
        {"mirror", defaults.mirror},
        {"drop_capability", defaults.drop_capability},
        {"system_call_filter", defaults.system_call_filter},
        {"private_network", defaults.private_network},
        {"l2_max_age_days", defaults.eviction.max_age_days},
        {"l2_max_number", defaults.eviction.max_count},
        {"privilege_command", defaults.privilege_command},
        {"color", defaults.style.color},
        {"color_info", defaults.style.info},
        {"color_error", defaults.style.error},
        {"color_success", defaults.style.success},
    };
    return doc.dump(4) + "\n";
}

Result<Config> Config::from_json(std::string_view text) {
    Config config;
    try {
        json doc = json::parse(text, nullptr, true, /*ignore_comments=*/true);
        if (!doc.is_object())
            return fail(ErrorKind::ConfigurationError, "configuration must be a JSON object");

        config.cache_dir = doc.value("cache_dir", config.cache_dir.string());
        config.export_dir = doc.value("export_dir", config.export_dir.string());
        config.mirror = doc.value("mirror", config.mirror);
        config.system_call_filter = doc.value("system_call_filter", config.system_call_filter);
        config.private_network = doc.value("private_network", config.private_network);

        if (auto it = doc.find("drop_capability"); it != doc.end()) {
            if (it->is_string()) {
                config.drop_capability = split_capabilities(it->get<std::string>());
            } else {
                config.drop_capability = it->get<std::vector<std::string>>();
            }
        }

        if (auto it = doc.find("l2_max_age_days"); it != doc.end()) {
            int days = it->get<int>();
            if (days < 0)
                return fail(ErrorKind::ConfigurationError, "l2_max_age_days must not be negative, got {}", days);
            config.eviction.max_age_days = days;
        }
        if (auto it = doc.find("l2_max_number"); it != doc.end()) {
            long long count = it->get<long long>();
            if (count < 0)
                return fail(ErrorKind::ConfigurationError, "l2_max_number must not be negative, got {}", count);
            config.eviction.max_count = static_cast<std::size_t>(count);
        }

        config.privilege_command = doc.value("privilege_command", config.privilege_command);
        config.style.color = doc.value("color", config.style.color);
        config.style.info = doc.value("color_info", config.style.info);
        config.style.error = doc.value("color_error", config.style.error);
        config.style.success = doc.value("color_success", config.style.success);
    } catch (const json::exception &err) {
        return fail(ErrorKind::ConfigurationError, "{}", err.what());
    }

    if (auto res = config.validate(); !res)
        return std::unexpected(res.error());
    return config;
}

Result<Config> Config::load(const std::filesystem::path &path, bool generate_if_missing) {
    std::error_code ec;
    if (generate_if_missing && !std::filesystem::exists(path, ec)) {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec)
                return fail(ErrorKind::ConfigurationError, "Cannot create {}: {}", path.parent_path().string(),
                            ec.message());
        }
        std::ofstream out(path);
        out << default_document();
        if (!out)
            return fail(ErrorKind::ConfigurationError, "Cannot write default configuration to {}", path.string());
    }

    std::ifstream in(path);
    if (!in.is_open())
        return fail(ErrorKind::ConfigurationError, "Cannot open configuration file {}", path.string());
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto config = from_json(buffer.str());
    if (!config)
        return fail(config.error().kind, "{}: {}", path.string(), config.error().message);
    return config;
}

Result<void> Config::validate() const {
    if (cache_dir.empty() || cache_dir == "/")
        return fail(ErrorKind::ConfigurationError, "Invalid cache dir '{}'", cache_dir.string());
    if (mirror.empty())
        return fail(ErrorKind::ConfigurationError, "mirror must not be empty");
    return {};
}

} // namespace strata
