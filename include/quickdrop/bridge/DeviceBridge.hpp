#pragma once

#include <quickdrop/core/Error.hpp>

#include <string>

namespace QD::Bridge {

inline constexpr char const* kDefaultRemoteDir = "/sdcard/Download/";

struct BridgeStatus {
    bool        connected{false};
    // Device serial when connected, otherwise a hint for the user.
    std::string info;
};

// USB transfer capability between this host and one attached device.
class DeviceBridge {
public:
    virtual ~DeviceBridge() = default;

    // False when the bridge tool itself cannot be found.
    [[nodiscard]] virtual auto available() const -> bool = 0;
    [[nodiscard]] virtual auto status() -> BridgeStatus = 0;

    // Copies `local_file` into `remote_dir` (which ends with '/').
    virtual auto push(std::string const& local_file, std::string const& remote_dir) -> Expected<void> = 0;
    // Copies `remote_file` to `local_dest`, inside it when it names a directory.
    virtual auto pull(std::string const& remote_file, std::string const& local_dest) -> Expected<void> = 0;
    // Long listing of `remote_dir` as printed by the device shell.
    virtual auto list(std::string const& remote_dir) -> Expected<std::string> = 0;
};

} // namespace QD::Bridge
