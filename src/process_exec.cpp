#include "strata/process_exec.hpp"

#include "strata/utility.hpp"

#include <cstdint>
#include <reproc++/drain.hpp>
#include <reproc++/reproc.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace strata {

namespace {

/// Splits a byte stream into lines as it arrives, echoing each one unless quiet.
class LineSink {
public:
    LineSink(std::vector<std::string> &lines, Console &console, bool quiet)
        : lines_(lines), console_(console), quiet_(quiet) {
    }

    std::error_code operator()(reproc::stream, const uint8_t *buffer, size_t size) {
        pending_.append(reinterpret_cast<const char *>(buffer), size);
        size_t start = 0;
        size_t end;
        while ((end = pending_.find('\n', start)) != std::string::npos) {
            emit(std::string_view(pending_).substr(start, end - start));
            start = end + 1;
        }
        pending_.erase(0, start);
        return {};
    }

    void flush() {
        if (!pending_.empty()) {
            emit(pending_);
            pending_.clear();
        }
    }

private:
    void emit(std::string_view line) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t'))
            line.remove_suffix(1);
        lines_.emplace_back(line);
        if (!quiet_)
            console_.info("{}", line);
    }

    std::vector<std::string> &lines_;
    Console &console_;
    bool quiet_;
    std::string pending_;
};

} // namespace

std::string join_args(const std::vector<std::string> &args) {
    std::string joined;
    for (const auto &arg : args) {
        if (!joined.empty())
            joined += ' ';
        joined += arg;
    }
    return joined;
}

Result<CommandOutput> CommandRunner::run_checked(const Command &cmd) {
    auto res = run(cmd);
    if (!res)
        return res;
    if (res->status != 0) {
        return fail(ErrorKind::ExternalCommandFailure, "'{}' returned {}\n{}", join_args(cmd.args), res->status,
                    res->err);
    }
    return res;
}

ReprocRunner::ReprocRunner(Console &console, std::vector<std::string> privilege_command)
    : console_(console), privilege_command_(std::move(privilege_command)) {
}

Result<CommandOutput> ReprocRunner::run(const Command &cmd) {
    if (cmd.args.empty()) {
        return fail(ErrorKind::ExternalCommandFailure, "Cannot execute empty command");
    }

    std::vector<std::string> args;
    if (cmd.privileged)
        args = privilege_command_;
    args.insert(args.end(), cmd.args.begin(), cmd.args.end());

    if (!cmd.quiet_cmd)
        console_.info("{}", join_args(args));

    reproc::options options;
    if (cmd.working_dir) {
        options.working_directory = cmd.working_dir->c_str();
    }

    reproc::process process;
    if (std::error_code ec = process.start(args, options); ec) {
        return fail(ErrorKind::ExternalCommandFailure, "Failed to start '{}': {}", join_args(args), ec.message());
    }

    CommandOutput output;
    LineSink out_sink(output.lines, console_, cmd.quiet);
    reproc::sink::string err_sink(output.err);

    if (std::error_code ec = reproc::drain(process, out_sink, err_sink); ec) {
        return fail(ErrorKind::ExternalCommandFailure, "Failed to read output of '{}': {}", join_args(args),
                    ec.message());
    }
    out_sink.flush();

    auto [status, ec] = process.wait(reproc::infinite);
    if (ec) {
        return fail(ErrorKind::ExternalCommandFailure, "Failed to wait for '{}': {}", join_args(args), ec.message());
    }
    output.status = status;

    if (status != 0 && !output.err.empty()) {
        console_.error("-- Error --");
        console_.error("{}", output.err);
        console_.error("-----------");
    }
    return output;
}

} // namespace strata
