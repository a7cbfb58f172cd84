#include <quickdrop/transfer/UrlCodec.hpp>

#include <array>
#include <limits>

namespace QD::Transfer {

namespace {

constexpr auto kUnreservedTable = []() constexpr {
    std::array<bool, std::numeric_limits<unsigned char>::max() + 1> table{};
    for (int ch = 'A'; ch <= 'Z'; ++ch) {
        table[static_cast<unsigned char>(ch)] = true;
    }
    for (int ch = 'a'; ch <= 'z'; ++ch) {
        table[static_cast<unsigned char>(ch)] = true;
    }
    for (int ch = '0'; ch <= '9'; ++ch) {
        table[static_cast<unsigned char>(ch)] = true;
    }
    table[static_cast<unsigned char>('-')] = true;
    table[static_cast<unsigned char>('_')] = true;
    table[static_cast<unsigned char>('.')] = true;
    table[static_cast<unsigned char>('~')] = true;
    return table;
}();

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

} // namespace

auto PercentDecode(std::string_view value) -> std::string {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char const ch = value[i];
        if (ch == '%' && i + 2 < value.size()) {
            int const high = hex_value(value[i + 1]);
            int const low  = hex_value(value[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(ch);
    }
    return decoded;
}

auto PercentEncode(std::string_view value) -> std::string {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (char ch : value) {
        auto const byte = static_cast<unsigned char>(ch);
        if (kUnreservedTable[byte]) {
            encoded.push_back(ch);
            continue;
        }
        encoded.push_back('%');
        encoded.push_back(kHex[byte >> 4]);
        encoded.push_back(kHex[byte & 0x0F]);
    }
    return encoded;
}

auto MakeContentDisposition(std::string_view file_name) -> std::string {
    std::string header{"attachment; filename*=UTF-8''"};
    header.append(PercentEncode(file_name));
    return header;
}

} // namespace QD::Transfer
