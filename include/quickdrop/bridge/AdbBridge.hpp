#pragma once

#include <quickdrop/bridge/DeviceBridge.hpp>
#include <quickdrop/bridge/ProcessRunner.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace QD::Bridge {

using AdbLocator = std::function<std::optional<std::string>()>;

// `adb` on PATH, else the usual Homebrew install locations.
auto LocateAdb() -> std::optional<std::string>;

// Reads `adb devices` output: the first line ending in "\tdevice" wins, an
// "\tunauthorized" entry yields a hint, anything else means no device.
auto ParseDeviceList(std::string_view devices_output) -> BridgeStatus;

// `~` expanded and made absolute.
auto ExpandLocalPath(std::string_view path) -> std::filesystem::path;

// <remote_dir><basename of local_file>
auto RemoteDestinationFor(std::string_view local_file, std::string_view remote_dir) -> std::string;

// `local_dest`, or local_dest/<basename of remote_file> when local_dest is a directory.
auto LocalDestinationFor(std::string_view remote_file, std::string_view local_dest) -> std::filesystem::path;

class AdbBridge final : public DeviceBridge {
public:
    explicit AdbBridge(CommandRunner runner = RunProcess, AdbLocator locator = LocateAdb);

    [[nodiscard]] auto available() const -> bool override;
    [[nodiscard]] auto status() -> BridgeStatus override;

    auto push(std::string const& local_file, std::string const& remote_dir) -> Expected<void> override;
    auto pull(std::string const& remote_file, std::string const& local_dest) -> Expected<void> override;
    auto list(std::string const& remote_dir) -> Expected<std::string> override;

private:
    auto adb_command() const -> Expected<std::string>;
    auto run(std::vector<std::string> argv, OutputMode mode, std::string_view action) -> Expected<ProcessResult>;

    CommandRunner runner_;
    AdbLocator    locator_;
};

} // namespace QD::Bridge
