#pragma once

#include <quickdrop/core/Error.hpp>
#include <quickdrop/transfer/SharedFolder.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace QD::Transfer {

struct FileEntry {
    std::string   name;
    std::uint64_t size_bytes{0};
    std::string   display_size;
    std::string   icon;
};

// "0.0 B", "1.5 KB", ... one decimal, 1024-based, TB as the last unit.
[[nodiscard]] auto FormatFileSize(std::uint64_t size_bytes) -> std::string;

[[nodiscard]] auto IconForFilename(std::string_view name) -> std::string;

// Regular files directly inside the folder (symlinks to regular files count, directories
// do not), sorted by case-insensitive name. Enumeration failures yield an empty list and
// are reported through `on_error` when given.
[[nodiscard]] auto ListSharedFiles(SharedFolder const&                      folder,
                                   std::function<void(Error const&)> const& on_error = {})
    -> std::vector<FileEntry>;

} // namespace QD::Transfer
