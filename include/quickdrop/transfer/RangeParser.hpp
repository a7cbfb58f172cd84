#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace QD::Transfer {

enum class RangeMode {
    Full,    // no Range header: answer 200
    Partial, // a Range header was sent, parsed or not: answer 206
};

// Inclusive byte interval [start, end] of a file of `total` bytes.
struct RangeSpec {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::uint64_t total{0};
    RangeMode     mode{RangeMode::Full};

    [[nodiscard]] auto length() const -> std::uint64_t {
        if (total == 0 || end < start) {
            return 0;
        }
        return end - start + 1;
    }

    [[nodiscard]] auto is_partial() const -> bool { return mode == RangeMode::Partial; }

    auto operator==(RangeSpec const&) const -> bool = default;
};

// Parses `bytes=<start>-<end>` permissively: an empty start means 0, an empty end means
// the last byte, and anything that does not parse falls back to the whole file while
// keeping the Partial mode. Satisfiability is not checked here.
[[nodiscard]] auto ParseRangeHeader(std::optional<std::string_view> header, std::uint64_t file_size)
    -> RangeSpec;

// Pulls an end beyond the last byte back to `total - 1`.
[[nodiscard]] auto ClampRangeToFile(RangeSpec range) -> RangeSpec;

// False for a partial range that selects no bytes of the file.
[[nodiscard]] bool IsSatisfiable(RangeSpec const& range);

// `bytes {start}-{end}/{total}`, or `bytes */0` for an empty file.
[[nodiscard]] auto FormatContentRange(RangeSpec const& range) -> std::string;
[[nodiscard]] auto FormatUnsatisfiedRange(std::uint64_t total) -> std::string;

} // namespace QD::Transfer
