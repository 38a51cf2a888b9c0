#include "strata/console.hpp"

#include <print>
#include <unistd.h>

namespace strata {

Console::Console(ConsoleStyle style, int verbosity, std::FILE *out, std::FILE *err)
    : style_(std::move(style)), verbosity_(verbosity), out_(out), err_(err) {
    // no escape sequences into pipes and log files
    if (out_ != nullptr && !isatty(fileno(out_)))
        style_.color = false;
}

void Console::write(std::FILE *stream, std::string_view sgr, std::string_view text) {
    if (stream == nullptr)
        return;
    if (style_.color && !sgr.empty()) {
        std::println(stream, "\x1b[{}m{}\x1b[0m", sgr, text);
    } else {
        std::println(stream, "{}", text);
    }
    std::fflush(stream);
}

} // namespace strata
