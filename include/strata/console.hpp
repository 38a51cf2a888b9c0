#pragma once

#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace strata {

struct ConsoleStyle {
    bool color = true;
    std::string info = "38;2;0;98;149";
    std::string error = "38;2;200;0;0";
    std::string success = "38;2;0;200;0";
};

/**
 * @brief Colored, verbosity-aware user output.
 *
 * One instance is created from the configuration and handed to every
 * component that reports progress. Messages go to `out`, errors to `err`.
 */
class Console {
public:
    explicit Console(ConsoleStyle style = {}, int verbosity = 0, std::FILE *out = stdout, std::FILE *err = stderr);

    int verbosity() const {
        return verbosity_;
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args &&...args) {
        write(out_, style_.info, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args &&...args) {
        write(err_, style_.error, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void success(std::format_string<Args...> fmt, Args &&...args) {
        write(out_, style_.success, std::format(fmt, std::forward<Args>(args)...));
    }

    /// Only printed at verbosity 1 and above.
    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args &&...args) {
        if (verbosity_ > 0)
            write(out_, {}, std::format(fmt, std::forward<Args>(args)...));
    }

private:
    void write(std::FILE *stream, std::string_view sgr, std::string_view text);

    ConsoleStyle style_;
    int verbosity_;
    std::FILE *out_;
    std::FILE *err_;
};

} // namespace strata
