#pragma once

#include <quickdrop/core/Error.hpp>
#include <quickdrop/transfer/ChunkedFileStream.hpp>
#include <quickdrop/transfer/RangeParser.hpp>
#include <quickdrop/transfer/SharedFolder.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace QD::Transfer {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Everything a download handler needs to answer one request.
struct DownloadJob {
    std::filesystem::path absolute_path;
    std::string           file_name;
    RangeSpec             range;
    std::uint64_t         chunk_size{ChunkedFileStream::kDefaultChunkSize};

    [[nodiscard]] auto satisfiable() const -> bool { return IsSatisfiable(range); }

    // 200 without a Range header, 206 with one, 416 when the range selects nothing.
    [[nodiscard]] auto status() const -> int;

    [[nodiscard]] auto headers() const -> HeaderList;
};

// Sanitizes `requested`, sizes the file and resolves the Range header against it.
// Ranges ending past the file are clamped to its last byte.
[[nodiscard]] auto PlanDownload(std::string_view                requested,
                                std::optional<std::string_view> range_header,
                                SharedFolder const&             folder,
                                std::uint64_t chunk_size = ChunkedFileStream::kDefaultChunkSize)
    -> Expected<DownloadJob>;

} // namespace QD::Transfer
