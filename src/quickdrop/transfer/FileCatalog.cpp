#include <quickdrop/transfer/FileCatalog.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace QD::Transfer {

namespace {

std::string to_lower(std::string_view value) {
    std::string lowered;
    lowered.reserve(value.size());
    std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

auto const& icon_table() {
    static std::unordered_map<std::string, std::string> const table{
        {"pdf", "\xF0\x9F\x93\x95"},
        {"doc", "\xF0\x9F\x93\x98"},  {"docx", "\xF0\x9F\x93\x98"},
        {"xls", "\xF0\x9F\x93\x97"},  {"xlsx", "\xF0\x9F\x93\x97"},
        {"ppt", "\xF0\x9F\x93\x99"},  {"pptx", "\xF0\x9F\x93\x99"},
        {"jpg", "\xF0\x9F\x96\xBC\xEF\xB8\x8F"},  {"jpeg", "\xF0\x9F\x96\xBC\xEF\xB8\x8F"},
        {"png", "\xF0\x9F\x96\xBC\xEF\xB8\x8F"},  {"gif", "\xF0\x9F\x96\xBC\xEF\xB8\x8F"},
        {"webp", "\xF0\x9F\x96\xBC\xEF\xB8\x8F"},
        {"mp4", "\xF0\x9F\x8E\xAC"},  {"mov", "\xF0\x9F\x8E\xAC"},
        {"avi", "\xF0\x9F\x8E\xAC"},  {"mkv", "\xF0\x9F\x8E\xAC"},
        {"mp3", "\xF0\x9F\x8E\xB5"},  {"wav", "\xF0\x9F\x8E\xB5"},
        {"flac", "\xF0\x9F\x8E\xB5"}, {"m4a", "\xF0\x9F\x8E\xB5"},
        {"zip", "\xF0\x9F\x93\xA6"},  {"rar", "\xF0\x9F\x93\xA6"},
        {"7z", "\xF0\x9F\x93\xA6"},   {"tar", "\xF0\x9F\x93\xA6"},
        {"gz", "\xF0\x9F\x93\xA6"},
        {"txt", "\xF0\x9F\x93\x84"},  {"md", "\xF0\x9F\x93\x84"},
        {"py", "\xF0\x9F\x90\x8D"},   {"js", "\xF0\x9F\x92\x9B"},
        {"html", "\xF0\x9F\x8C\x90"}, {"css", "\xF0\x9F\x8E\xA8"},
        {"apk", "\xF0\x9F\xA4\x96"},
    };
    return table;
}

constexpr std::string_view kDefaultIcon = "\xF0\x9F\x93\x84";

} // namespace

auto FormatFileSize(std::uint64_t size_bytes) -> std::string {
    static constexpr std::array<char const*, 4> kUnits{"B", "KB", "MB", "GB"};
    auto value = static_cast<double>(size_bytes);

    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    for (auto const* unit : kUnits) {
        if (value < 1024.0) {
            out << value << ' ' << unit;
            return out.str();
        }
        value /= 1024.0;
    }
    out << value << " TB";
    return out.str();
}

auto IconForFilename(std::string_view name) -> std::string {
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos) {
        return std::string{kDefaultIcon};
    }
    auto const& table = icon_table();
    auto        it    = table.find(to_lower(name.substr(dot + 1)));
    if (it == table.end()) {
        return std::string{kDefaultIcon};
    }
    return it->second;
}

auto ListSharedFiles(SharedFolder const& folder, std::function<void(Error const&)> const& on_error)
    -> std::vector<FileEntry> {
    auto report = [&](std::string message) {
        if (on_error) {
            on_error(Error{Error::Code::IoError, std::move(message)});
        }
    };

    std::vector<FileEntry> entries;
    std::error_code        ec;
    std::filesystem::directory_iterator it(folder.root(), ec);
    if (ec) {
        report("cannot list " + folder.display() + ": " + ec.message());
        return {};
    }

    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            report("listing " + folder.display() + " stopped: " + ec.message());
            return {};
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        auto const size = it->file_size(entry_ec);
        if (entry_ec) {
            continue;
        }
        auto name = it->path().filename().string();
        FileEntry entry{};
        entry.display_size = FormatFileSize(size);
        entry.icon         = IconForFilename(name);
        entry.size_bytes   = size;
        entry.name         = std::move(name);
        entries.push_back(std::move(entry));
    }
    if (ec) {
        report("listing " + folder.display() + " stopped: " + ec.message());
        return {};
    }

    std::sort(entries.begin(), entries.end(), [](FileEntry const& lhs, FileEntry const& rhs) {
        auto const lhs_key = to_lower(lhs.name);
        auto const rhs_key = to_lower(rhs.name);
        if (lhs_key != rhs_key) {
            return lhs_key < rhs_key;
        }
        return lhs.name < rhs.name;
    });
    return entries;
}

} // namespace QD::Transfer
