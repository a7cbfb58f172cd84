#include <quickdrop/transfer/RangeParser.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace QD::Transfer {

namespace {

constexpr std::string_view kBytesPrefix = "bytes=";

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return value;
}

// nullopt unless the whole token is a decimal number.
std::optional<std::uint64_t> parse_offset(std::string_view token) {
    std::uint64_t value{};
    auto const*   first  = token.data();
    auto const*   last   = token.data() + token.size();
    auto const    result = std::from_chars(first, last, value);
    if (result.ec != std::errc{} || result.ptr != last) {
        return std::nullopt;
    }
    return value;
}

RangeSpec whole_file(std::uint64_t file_size, RangeMode mode) {
    RangeSpec range{};
    range.start = 0;
    range.end   = file_size == 0 ? 0 : file_size - 1;
    range.total = file_size;
    range.mode  = mode;
    return range;
}

} // namespace

auto ParseRangeHeader(std::optional<std::string_view> header, std::uint64_t file_size) -> RangeSpec {
    if (!header) {
        return whole_file(file_size, RangeMode::Full);
    }

    auto const fallback = whole_file(file_size, RangeMode::Partial);

    auto ranges = trim(*header);
    if (ranges.starts_with(kBytesPrefix)) {
        ranges.remove_prefix(kBytesPrefix.size());
    }

    auto const dash = ranges.find('-');
    if (dash == std::string_view::npos) {
        return fallback;
    }

    auto first_token  = trim(ranges.substr(0, dash));
    auto second_token = ranges.substr(dash + 1);
    // "bytes=1-3-5" reads as 1-3.
    if (auto extra = second_token.find('-'); extra != std::string_view::npos) {
        second_token = second_token.substr(0, extra);
    }
    second_token = trim(second_token);

    RangeSpec range = fallback;

    if (first_token.empty()) {
        range.start = 0;
    } else if (auto start = parse_offset(first_token)) {
        range.start = *start;
    } else {
        return fallback;
    }

    if (second_token.empty()) {
        range.end = file_size == 0 ? 0 : file_size - 1;
    } else if (auto end = parse_offset(second_token)) {
        range.end = *end;
    } else {
        return fallback;
    }

    return range;
}

auto ClampRangeToFile(RangeSpec range) -> RangeSpec {
    if (range.total > 0) {
        range.end = std::min(range.end, range.total - 1);
    }
    return range;
}

bool IsSatisfiable(RangeSpec const& range) {
    if (range.mode == RangeMode::Full) {
        return true;
    }
    if (range.total == 0) {
        return false;
    }
    return range.start <= range.end && range.start < range.total && range.end < range.total;
}

auto FormatContentRange(RangeSpec const& range) -> std::string {
    if (range.total == 0) {
        return FormatUnsatisfiedRange(0);
    }
    std::string header{"bytes "};
    header.append(std::to_string(range.start));
    header.push_back('-');
    header.append(std::to_string(range.end));
    header.push_back('/');
    header.append(std::to_string(range.total));
    return header;
}

auto FormatUnsatisfiedRange(std::uint64_t total) -> std::string {
    return "bytes */" + std::to_string(total);
}

} // namespace QD::Transfer
