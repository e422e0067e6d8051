#pragma once

/// @file bash_task.hpp
/// @brief Bash step payloads
///
/// A bash step runs either an inline script or a script file. Both share
/// the same shell options. Defaults match the CI agent's defaults and are
/// omitted when rendered.

#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pipeforge_model {

/// Shell options shared by all bash steps
struct BashTask {
    /// Directory to run in; the agent's sources directory when unset
    std::optional<std::string> working_directory;

    /// Fail the step if anything is written to stderr
    bool fail_on_stderr = false;

    /// Skip /etc/profile and the personal initialization files
    bool no_profile = false;

    /// Skip ~/.bashrc
    bool no_rc = true;
};

/// Bash step running an inline script
struct InlineBashTask : BashTask {
    std::string contents;

    InlineBashTask() = default;

    explicit InlineBashTask(std::string script)
        : contents(std::move(script)) {}

    /// Lines are joined with "\n"
    InlineBashTask(std::initializer_list<std::string> lines)
        : contents(join(lines.begin(), lines.end())) {}

    explicit InlineBashTask(const std::vector<std::string>& lines)
        : contents(join(lines.begin(), lines.end())) {}

private:
    template<typename It>
    static std::string join(It first, It last) {
        std::string result;
        for (auto it = first; it != last; ++it) {
            if (it != first) {
                result += '\n';
            }
            result += *it;
        }
        return result;
    }
};

/// Bash step running a script file
struct BashFileTask : BashTask {
    /// Absolute, or relative to the agent's default working directory
    std::string file_path;

    std::optional<std::string> arguments;

    explicit BashFileTask(std::string path, std::optional<std::string> args = std::nullopt)
        : file_path(std::move(path))
        , arguments(std::move(args))
    {
        if (file_path.empty()) {
            throw std::invalid_argument("BashFileTask requires a file path");
        }
    }
};

} // namespace pipeforge_model
