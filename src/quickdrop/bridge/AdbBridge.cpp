#include <quickdrop/bridge/AdbBridge.hpp>

#include <array>
#include <cstdlib>
#include <system_error>
#include <utility>
#include <vector>

namespace QD::Bridge {

namespace {

constexpr std::array<char const*, 2> kFallbackAdbLocations{"/opt/homebrew/bin/adb", "/usr/local/bin/adb"};

constexpr std::string_view kUnauthorizedHint =
    "Device unauthorized - check your phone for USB debugging prompt";

std::string_view trim_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.remove_suffix(1);
    }
    return line;
}

std::string remote_basename(std::string_view remote_file) {
    while (remote_file.size() > 1 && remote_file.back() == '/') {
        remote_file.remove_suffix(1);
    }
    auto const slash = remote_file.rfind('/');
    if (slash == std::string_view::npos) {
        return std::string{remote_file};
    }
    return std::string{remote_file.substr(slash + 1)};
}

} // namespace

auto LocateAdb() -> std::optional<std::string> {
    if (FindOnPath("adb")) {
        return std::string{"adb"};
    }
    for (auto const* location : kFallbackAdbLocations) {
        std::error_code ec;
        if (std::filesystem::exists(location, ec)) {
            return std::string{location};
        }
    }
    return std::nullopt;
}

auto ParseDeviceList(std::string_view devices_output) -> BridgeStatus {
    bool saw_unauthorized = false;
    bool header_skipped   = false;
    while (!devices_output.empty()) {
        auto const newline = devices_output.find('\n');
        auto       line    = trim_line(devices_output.substr(0, newline));
        devices_output.remove_prefix(newline == std::string_view::npos ? devices_output.size() : newline + 1);

        // "List of devices attached"
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        auto const tab = line.find('\t');
        if (tab == std::string_view::npos) {
            continue;
        }
        auto const state = line.substr(tab + 1);
        if (state.starts_with("device")) {
            return BridgeStatus{true, std::string{line.substr(0, tab)}};
        }
        if (state.starts_with("unauthorized")) {
            saw_unauthorized = true;
        }
    }
    if (saw_unauthorized) {
        return BridgeStatus{false, std::string{kUnauthorizedHint}};
    }
    return BridgeStatus{false, "No device connected"};
}

auto ExpandLocalPath(std::string_view path) -> std::filesystem::path {
    std::filesystem::path expanded{path};
    if (path == "~" || path.starts_with("~/")) {
        if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
            expanded = std::filesystem::path{home};
            if (path.size() > 2) {
                expanded /= path.substr(2);
            }
        }
    }
    std::error_code ec;
    auto absolute = std::filesystem::absolute(expanded, ec);
    if (ec) {
        return expanded.lexically_normal();
    }
    return absolute.lexically_normal();
}

auto RemoteDestinationFor(std::string_view local_file, std::string_view remote_dir) -> std::string {
    std::string destination{remote_dir};
    destination.append(ExpandLocalPath(local_file).filename().string());
    return destination;
}

auto LocalDestinationFor(std::string_view remote_file, std::string_view local_dest) -> std::filesystem::path {
    auto            destination = ExpandLocalPath(local_dest);
    std::error_code ec;
    if (std::filesystem::is_directory(destination, ec)) {
        destination /= remote_basename(remote_file);
    }
    return destination;
}

AdbBridge::AdbBridge(CommandRunner runner, AdbLocator locator)
    : runner_(std::move(runner))
    , locator_(std::move(locator)) {}

auto AdbBridge::available() const -> bool {
    return locator_ && locator_().has_value();
}

auto AdbBridge::adb_command() const -> Expected<std::string> {
    if (locator_) {
        if (auto adb = locator_()) {
            return *adb;
        }
    }
    return std::unexpected(Error{Error::Code::BridgeUnavailable, "ADB not found"});
}

auto AdbBridge::run(std::vector<std::string> argv, OutputMode mode, std::string_view action)
    -> Expected<ProcessResult> {
    auto adb = adb_command();
    if (!adb) {
        return std::unexpected(adb.error());
    }
    argv.insert(argv.begin(), std::move(*adb));
    auto result = runner_(argv, mode);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->exit_code != 0) {
        return std::unexpected(Error{Error::Code::CommandFailed,
                                     std::string{action} + " exited with code "
                                         + std::to_string(result->exit_code)});
    }
    return result;
}

auto AdbBridge::status() -> BridgeStatus {
    auto result = run({"devices"}, OutputMode::Capture, "adb devices");
    if (!result) {
        if (result.error().code == Error::Code::BridgeUnavailable) {
            return BridgeStatus{false, "ADB not found"};
        }
        return BridgeStatus{false, describeError(result.error())};
    }
    return ParseDeviceList(result->output);
}

auto AdbBridge::push(std::string const& local_file, std::string const& remote_dir) -> Expected<void> {
    auto            source = ExpandLocalPath(local_file);
    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        return std::unexpected(Error{Error::Code::NotFound, "File not found: " + local_file});
    }
    auto result = run({"push", source.string(), RemoteDestinationFor(local_file, remote_dir)},
                      OutputMode::Inherit,
                      "adb push");
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

auto AdbBridge::pull(std::string const& remote_file, std::string const& local_dest) -> Expected<void> {
    auto destination = LocalDestinationFor(remote_file, local_dest);
    auto result      = run({"pull", remote_file, destination.string()}, OutputMode::Inherit, "adb pull");
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

auto AdbBridge::list(std::string const& remote_dir) -> Expected<std::string> {
    auto result = run({"shell", "ls", "-la", remote_dir}, OutputMode::Capture, "adb shell ls");
    if (!result) {
        return std::unexpected(result.error());
    }
    return std::move(result->output);
}

} // namespace QD::Bridge
