#pragma once

#include <quickdrop/core/Error.hpp>
#include <quickdrop/transfer/SharedFolder.hpp>

#include <filesystem>
#include <string_view>

namespace QD::Transfer {

// Validates a client-supplied download name against the shared folder.
//
// The name is URL-decoded, rejected with InvalidPath when it contains ".." or starts
// with a root anchor ('/', '\\' or a drive letter), then resolved with all symlinks
// followed. A resolved path outside the canonical root fails with AccessDenied, a
// missing path or anything that is not a regular file fails with NotFound.
// Touches the filesystem only through stat-like queries.
[[nodiscard]] auto SanitizeDownloadPath(std::string_view requested, SharedFolder const& folder)
    -> Expected<std::filesystem::path>;

// True when `candidate` equals `root` or lies beneath it, compared component by component.
[[nodiscard]] bool IsWithinRoot(std::filesystem::path const& candidate, std::filesystem::path const& root);

} // namespace QD::Transfer
