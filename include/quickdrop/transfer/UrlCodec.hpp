#pragma once

#include <string>
#include <string_view>

namespace QD::Transfer {

// Decodes %XX escapes. Malformed escapes are kept verbatim; '+' is not a space here
// because the input comes from a URL path, not a form body.
[[nodiscard]] auto PercentDecode(std::string_view value) -> std::string;

// Encodes every byte outside the RFC 3986 unreserved set as %XX (upper-case hex).
[[nodiscard]] auto PercentEncode(std::string_view value) -> std::string;

// `attachment; filename*=UTF-8''<percent-encoded name>`
[[nodiscard]] auto MakeContentDisposition(std::string_view file_name) -> std::string;

} // namespace QD::Transfer
