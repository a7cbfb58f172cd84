#include <quickdrop/transfer/DownloadPlanner.hpp>

#include <quickdrop/transfer/PathSanitizer.hpp>
#include <quickdrop/transfer/UrlCodec.hpp>

#include <system_error>

namespace QD::Transfer {

auto DownloadJob::status() const -> int {
    if (!satisfiable()) {
        return 416;
    }
    return range.is_partial() ? 206 : 200;
}

auto DownloadJob::headers() const -> HeaderList {
    HeaderList headers;
    headers.reserve(7);
    if (!satisfiable()) {
        headers.emplace_back("Content-Range", FormatUnsatisfiedRange(range.total));
        headers.emplace_back("Accept-Ranges", "bytes");
        return headers;
    }
    headers.emplace_back("Content-Disposition", MakeContentDisposition(file_name));
    headers.emplace_back("Content-Length", std::to_string(range.length()));
    if (range.total > 0) {
        headers.emplace_back("Content-Range", FormatContentRange(range));
    }
    headers.emplace_back("Accept-Ranges", "bytes");
    headers.emplace_back("Cache-Control", "no-cache");
    headers.emplace_back("Content-Type", "application/octet-stream");
    headers.emplace_back("X-Accel-Buffering", "no");
    return headers;
}

auto PlanDownload(std::string_view                requested,
                  std::optional<std::string_view> range_header,
                  SharedFolder const&             folder,
                  std::uint64_t                   chunk_size) -> Expected<DownloadJob> {
    if (chunk_size == 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "chunk size must be positive"});
    }

    auto path = SanitizeDownloadPath(requested, folder);
    if (!path) {
        return std::unexpected(path.error());
    }

    std::error_code ec;
    auto const      size = std::filesystem::file_size(*path, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError, "cannot size " + path->string() + ": " + ec.message()});
    }

    DownloadJob job{};
    job.file_name     = path->filename().string();
    job.absolute_path = std::move(*path);
    job.range         = ClampRangeToFile(ParseRangeHeader(range_header, size));
    job.chunk_size    = chunk_size;
    return job;
}

} // namespace QD::Transfer
