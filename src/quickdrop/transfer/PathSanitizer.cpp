#include <quickdrop/transfer/PathSanitizer.hpp>

#include <quickdrop/transfer/UrlCodec.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>

namespace QD::Transfer {

namespace {

bool has_root_anchor(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    if (name.front() == '/' || name.front() == '\\') {
        return true;
    }
    return name.size() >= 2 && name[1] == ':' && std::isalpha(static_cast<unsigned char>(name[0])) != 0;
}

} // namespace

bool IsWithinRoot(std::filesystem::path const& candidate, std::filesystem::path const& root) {
    auto root_it      = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++candidate_it) {
        // A trailing separator yields an empty final element; it matches anything.
        if (root_it->empty()) {
            continue;
        }
        if (candidate_it == candidate.end() || *candidate_it != *root_it) {
            return false;
        }
    }
    return true;
}

auto SanitizeDownloadPath(std::string_view requested, SharedFolder const& folder)
    -> Expected<std::filesystem::path> {
    auto const decoded = PercentDecode(requested);

    if (decoded.empty()) {
        return std::unexpected(Error{Error::Code::InvalidPath, "empty file name"});
    }
    if (decoded.find('\0') != std::string::npos) {
        return std::unexpected(Error{Error::Code::InvalidPath, "file name contains NUL"});
    }
    if (decoded.find("..") != std::string::npos || has_root_anchor(decoded)) {
        return std::unexpected(Error{Error::Code::InvalidPath, "invalid file name: " + decoded});
    }

    std::error_code ec;
    auto const candidate = folder.canonical_root() / decoded;
    auto const resolved  = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::NotFound, decoded + ": " + ec.message()});
    }

    if (!IsWithinRoot(resolved, folder.canonical_root())) {
        return std::unexpected(Error{Error::Code::AccessDenied,
                                     decoded + " resolves outside the shared folder"});
    }

    auto const status = std::filesystem::status(resolved, ec);
    if (ec || !std::filesystem::exists(status) || !std::filesystem::is_regular_file(status)) {
        return std::unexpected(Error{Error::Code::NotFound, "file not found: " + decoded});
    }

    return resolved;
}

} // namespace QD::Transfer
