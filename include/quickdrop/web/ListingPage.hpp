#pragma once

#include <quickdrop/transfer/FileCatalog.hpp>

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace QD::Web {

auto escape_html(std::string_view text) -> std::string;

// Upload form plus one download link per entry.
auto BuildListingPage(std::string_view folder_display, std::vector<Transfer::FileEntry> const& files)
    -> std::string;

// {"folder": ..., "files": [{"name", "size", "size_bytes", "icon"}]}
auto BuildListingJson(std::string_view folder_display, std::vector<Transfer::FileEntry> const& files)
    -> nlohmann::json;

} // namespace QD::Web
