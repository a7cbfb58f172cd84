#include <quickdrop/bridge/QuickSendCli.hpp>

#include <quickdrop/bridge/AdbBridge.hpp>
#include <quickdrop/transfer/FileCatalog.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace QD::Bridge {

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string arg_or(std::vector<std::string> const& args, std::size_t index, std::string_view fallback) {
    return args.size() > index ? args[index] : std::string{fallback};
}

// Prints the bridge hint and returns false when no device is attached.
bool require_device(DeviceBridge& bridge, std::ostream& err) {
    auto status = bridge.status();
    if (!status.connected) {
        err << "[quicksend] " << status.info << "\n";
        return false;
    }
    return true;
}

int run_send(std::vector<std::string> const& args, DeviceBridge& bridge, std::ostream& out, std::ostream& err) {
    if (args.size() < 2) {
        err << "Usage: quicksend send <file> [destination]\n";
        return kExitUsage;
    }
    if (!require_device(bridge, err)) {
        return kExitError;
    }

    auto const& source     = args[1];
    auto const  remote_dir = arg_or(args, 2, kDefaultRemoteDir);
    auto const  local_path = ExpandLocalPath(source);

    std::error_code ec;
    auto const      size = std::filesystem::file_size(local_path, ec);
    if (ec) {
        err << "[quicksend] File not found: " << source << "\n";
        return kExitError;
    }

    auto const destination = RemoteDestinationFor(source, remote_dir);
    out << "[quicksend] Sending: " << local_path.filename().string() << "\n"
        << "[quicksend]    To: " << destination << "\n"
        << "[quicksend]    Size: " << Transfer::FormatFileSize(size) << "\n";
    out.flush();

    auto pushed = bridge.push(source, remote_dir);
    if (!pushed) {
        err << "[quicksend] Transfer failed: " << describeError(pushed.error()) << "\n";
        return kExitError;
    }
    out << "[quicksend] Done! File saved to " << destination << "\n";
    return kExitOk;
}

int run_get(std::vector<std::string> const& args, DeviceBridge& bridge, std::ostream& out, std::ostream& err) {
    if (args.size() < 2) {
        err << "Usage: quicksend get <android_path> [local_dest]\n";
        return kExitUsage;
    }
    if (!require_device(bridge, err)) {
        return kExitError;
    }

    auto const& source      = args[1];
    auto const  local_dest  = arg_or(args, 2, ".");
    auto const  destination = LocalDestinationFor(source, local_dest);
    out << "[quicksend] Downloading: " << source << "\n"
        << "[quicksend]    To: " << destination.string() << "\n";
    out.flush();

    auto pulled = bridge.pull(source, local_dest);
    if (!pulled) {
        err << "[quicksend] Transfer failed: " << describeError(pulled.error()) << "\n";
        return kExitError;
    }
    out << "[quicksend] Done! File saved to " << destination.string() << "\n";
    return kExitOk;
}

int run_list(std::vector<std::string> const& args, DeviceBridge& bridge, std::ostream& out, std::ostream& err) {
    if (!require_device(bridge, err)) {
        return kExitError;
    }
    auto const remote_dir = arg_or(args, 1, kDefaultRemoteDir);
    auto       listing    = bridge.list(remote_dir);
    if (!listing) {
        err << "[quicksend] Cannot list " << remote_dir << ": " << describeError(listing.error()) << "\n";
        return kExitError;
    }
    out << "Files in " << remote_dir << ":\n\n" << *listing;
    return kExitOk;
}

} // namespace

void PrintQuickSendUsage(std::ostream& out) {
    out << "QuickSend - USB file transfer through adb\n"
        << "\n"
        << "Usage:\n"
        << "  quicksend send <file>             Send file to the device\n"
        << "  quicksend send <file> <dest>      Send to a specific folder\n"
        << "  quicksend get <android_path>      Download from the device\n"
        << "  quicksend get <android_path> <local_dest>\n"
        << "  quicksend list [path]             List files on the device\n"
        << "  quicksend status                  Check the connection\n"
        << "  quicksend help                    Show this help\n"
        << "\n"
        << "Default device folder: " << kDefaultRemoteDir << "\n";
}

int RunQuickSend(std::vector<std::string> const& args, DeviceBridge& bridge, std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        PrintQuickSendUsage(out);
        return kExitOk;
    }

    auto const command = to_lower(args.front());
    if (command == "help" || command == "--help" || command == "-h") {
        PrintQuickSendUsage(out);
        return kExitOk;
    }

    if (!bridge.available()) {
        err << "[quicksend] ADB not found!\n"
            << "Install the Android platform tools (e.g. brew install android-platform-tools)\n";
        return kExitError;
    }

    if (command == "status") {
        auto status = bridge.status();
        if (!status.connected) {
            err << "[quicksend] " << status.info << "\n";
            return kExitError;
        }
        out << "[quicksend] Device connected: " << status.info << "\n";
        return kExitOk;
    }
    if (command == "send") {
        return run_send(args, bridge, out, err);
    }
    if (command == "get") {
        return run_get(args, bridge, out, err);
    }
    if (command == "list") {
        return run_list(args, bridge, out, err);
    }

    err << "[quicksend] Unknown command: " << args.front() << "\n";
    PrintQuickSendUsage(out);
    return kExitUsage;
}

} // namespace QD::Bridge
