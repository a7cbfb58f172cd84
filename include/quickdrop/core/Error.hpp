#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace QD {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidPath,
        NotFound,
        AccessDenied,
        RangeNotSatisfiable,
        IoError,
        TransferAborted,
        MalformedInput,
        BridgeUnavailable,
        CommandFailed
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::AccessDenied:
        return "access_denied";
    case Error::Code::RangeNotSatisfiable:
        return "range_not_satisfiable";
    case Error::Code::IoError:
        return "io_error";
    case Error::Code::TransferAborted:
        return "transfer_aborted";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::BridgeUnavailable:
        return "bridge_unavailable";
    case Error::Code::CommandFailed:
        return "command_failed";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Status code a download or upload handler answers for a failed transfer step.
[[nodiscard]] inline auto httpStatusForError(Error const& error) -> int {
    switch (error.code) {
    case Error::Code::InvalidPath:
    case Error::Code::MalformedInput:
        return 400;
    case Error::Code::AccessDenied:
        return 403;
    case Error::Code::NotFound:
        return 404;
    case Error::Code::RangeNotSatisfiable:
        return 416;
    default:
        return 500;
    }
}

} // namespace QD
