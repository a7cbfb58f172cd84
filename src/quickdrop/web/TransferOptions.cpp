#include <quickdrop/web/TransferOptions.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace QD::Web {

namespace {

constexpr int          kMaxWorkerThreads = 256;
constexpr std::int64_t kMaxTimeoutSeconds = 24 * 60 * 60;

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

bool set_port(std::string_view value, char const* label, TransferOptions& options) {
    int parsed = options.port;
    if (!parse_integer_in_range<int>(value, 0, 65535, parsed)) {
        std::cerr << label << " must be within 0-65535\n";
        return false;
    }
    options.port = parsed;
    return true;
}

bool set_positive_u64(std::string_view value, char const* label, std::uint64_t& target) {
    std::uint64_t parsed = target;
    if (!parse_integer_in_range<std::uint64_t>(value, 1, std::numeric_limits<std::uint64_t>::max(), parsed)) {
        std::cerr << label << " must be a positive byte count\n";
        return false;
    }
    target = parsed;
    return true;
}

bool set_threads(std::string_view value, char const* label, TransferOptions& options) {
    int parsed = options.worker_threads;
    if (!parse_integer_in_range<int>(value, 1, kMaxWorkerThreads, parsed)) {
        std::cerr << label << " must be within 1-" << kMaxWorkerThreads << "\n";
        return false;
    }
    options.worker_threads = parsed;
    return true;
}

bool set_timeout(std::string_view value, char const* label, TransferOptions& options) {
    std::int64_t parsed = options.timeout_seconds;
    if (!parse_integer_in_range<std::int64_t>(value, 1, kMaxTimeoutSeconds, parsed)) {
        std::cerr << label << " must be within 1-" << kMaxTimeoutSeconds << " seconds\n";
        return false;
    }
    options.timeout_seconds = parsed;
    return true;
}

} // namespace

auto DefaultSharedFolder() -> std::string {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return (std::filesystem::path{home} / "Downloads" / "PhoneTransfer").string();
    }
    return (std::filesystem::path{"."} / "PhoneTransfer").string();
}

bool IsValidTransferPort(int port) {
    return port >= 0 && port <= 65535;
}

auto NamingPolicyFor(TransferOptions const& options) -> Transfer::NamingPolicy {
    return options.exclusive_create ? Transfer::NamingPolicy::ExclusiveCreate
                                    : Transfer::NamingPolicy::CheckThenCreate;
}

auto ValidateTransferOptions(TransferOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidTransferPort(options.port)) {
        return std::string{"--port must be within 0-65535"};
    }
    if (options.shared_folder.empty()) {
        return std::string{"--folder must not be empty"};
    }
    if (options.max_upload_bytes == 0) {
        return std::string{"--max-upload-bytes must be positive"};
    }
    if (options.worker_threads < 1 || options.worker_threads > kMaxWorkerThreads) {
        return std::string{"--threads must be within 1-" + std::to_string(kMaxWorkerThreads)};
    }
    if (options.chunk_size_bytes == 0) {
        return std::string{"--chunk-size must be positive"};
    }
    if (options.timeout_seconds < 1 || options.timeout_seconds > kMaxTimeoutSeconds) {
        return std::string{"--timeout must be within 1-" + std::to_string(kMaxTimeoutSeconds) + " seconds"};
    }
    return std::nullopt;
}

bool ApplyTransferEnvOverrides(TransferOptions& options) {
    if (!apply_env("QUICKDROP_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "QUICKDROP_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }
    if (!apply_env("QUICKDROP_PORT", [&](std::string_view value) {
            return set_port(value, "QUICKDROP_PORT", options);
        })) {
        return false;
    }
    if (!apply_env("QUICKDROP_FOLDER", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "QUICKDROP_FOLDER must not be empty\n";
                return false;
            }
            options.shared_folder = std::string{value};
            return true;
        })) {
        return false;
    }
    if (!apply_env("QUICKDROP_MAX_UPLOAD_BYTES", [&](std::string_view value) {
            return set_positive_u64(value, "QUICKDROP_MAX_UPLOAD_BYTES", options.max_upload_bytes);
        })) {
        return false;
    }
    if (!apply_env("QUICKDROP_THREADS", [&](std::string_view value) {
            return set_threads(value, "QUICKDROP_THREADS", options);
        })) {
        return false;
    }
    if (!apply_env("QUICKDROP_CHUNK_SIZE", [&](std::string_view value) {
            return set_positive_u64(value, "QUICKDROP_CHUNK_SIZE", options.chunk_size_bytes);
        })) {
        return false;
    }
    if (!apply_env("QUICKDROP_TIMEOUT_SECONDS", [&](std::string_view value) {
            return set_timeout(value, "QUICKDROP_TIMEOUT_SECONDS", options);
        })) {
        return false;
    }
    if (!apply_env("QUICKDROP_EXCLUSIVE_CREATE", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "QUICKDROP_EXCLUSIVE_CREATE must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.exclusive_create = *parsed;
            return true;
        })) {
        return false;
    }
    return true;
}

void PrintTransferUsage() {
    std::cout << "Usage: quickdrop_server [options]\n"
              << "  --host <host>              Bind address (default 0.0.0.0)\n"
              << "  --port <port>              Bind port, 0 for any free port (default 5000)\n"
              << "  --folder <path>            Shared folder (default ~/Downloads/PhoneTransfer)\n"
              << "  --max-upload-bytes <n>     Largest accepted upload body (default 10 GiB)\n"
              << "  --threads <n>              Worker threads (default 8)\n"
              << "  --chunk-size <bytes>       Download chunk size (default 1 MiB)\n"
              << "  --timeout <seconds>        Socket read/write timeout (default 120)\n"
              << "  --exclusive-create         Never let two uploads share a stored name\n"
              << "  --help                     Show this help\n"
              << "Environment: QUICKDROP_HOST, QUICKDROP_PORT, QUICKDROP_FOLDER,\n"
              << "  QUICKDROP_MAX_UPLOAD_BYTES, QUICKDROP_THREADS, QUICKDROP_CHUNK_SIZE,\n"
              << "  QUICKDROP_TIMEOUT_SECONDS, QUICKDROP_EXCLUSIVE_CREATE\n";
}

std::optional<TransferOptions> ParseTransferArguments(int argc, char** argv) {
    TransferOptions options{};
    options.shared_folder = DefaultSharedFolder();
    if (!ApplyTransferEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            auto value = require_value(i, "--host");
            if (!value) {
                return std::nullopt;
            }
            if (value->empty()) {
                std::cerr << "--host must not be empty\n";
                return std::nullopt;
            }
            options.host = std::string{*value};
        } else if (arg == "--port") {
            auto value = require_value(i, "--port");
            if (!value || !set_port(*value, "--port", options)) {
                return std::nullopt;
            }
        } else if (arg == "--folder") {
            auto value = require_value(i, "--folder");
            if (!value) {
                return std::nullopt;
            }
            if (value->empty()) {
                std::cerr << "--folder must not be empty\n";
                return std::nullopt;
            }
            options.shared_folder = std::string{*value};
        } else if (arg == "--max-upload-bytes") {
            auto value = require_value(i, "--max-upload-bytes");
            if (!value || !set_positive_u64(*value, "--max-upload-bytes", options.max_upload_bytes)) {
                return std::nullopt;
            }
        } else if (arg == "--threads") {
            auto value = require_value(i, "--threads");
            if (!value || !set_threads(*value, "--threads", options)) {
                return std::nullopt;
            }
        } else if (arg == "--chunk-size") {
            auto value = require_value(i, "--chunk-size");
            if (!value || !set_positive_u64(*value, "--chunk-size", options.chunk_size_bytes)) {
                return std::nullopt;
            }
        } else if (arg == "--timeout") {
            auto value = require_value(i, "--timeout");
            if (!value || !set_timeout(*value, "--timeout", options)) {
                return std::nullopt;
            }
        } else if (arg == "--exclusive-create") {
            options.exclusive_create = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateTransferOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

} // namespace QD::Web
