#pragma once

#include <quickdrop/core/Error.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace QD::Bridge {

enum class OutputMode {
    Capture, // child stdout is collected into ProcessResult::output
    Inherit, // child writes straight to our terminal (progress bars stay visible)
};

struct ProcessResult {
    int         exit_code{0};
    std::string output;
};

using CommandRunner =
    std::function<Expected<ProcessResult>(std::vector<std::string> const& argv, OutputMode mode)>;

// fork/exec of argv[0] looked up on PATH; waits for the child. A child killed by a
// signal reports 128 + signal number, an exec failure reports 127.
auto RunProcess(std::vector<std::string> const& argv, OutputMode mode) -> Expected<ProcessResult>;

// First executable named `name` on PATH.
auto FindOnPath(std::string_view name) -> std::optional<std::filesystem::path>;

} // namespace QD::Bridge
