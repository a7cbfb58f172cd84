#include <quickdrop/transfer/ChunkedFileStream.hpp>

#include <algorithm>
#include <utility>

namespace QD::Transfer {

ChunkedFileStream::ChunkedFileStream(std::ifstream file, RangeSpec const& range, std::uint64_t chunk_size)
    : file_(std::move(file))
    , range_(range)
    , chunk_size_(chunk_size)
    , remaining_(range.length()) {
    if (remaining_ == 0) {
        finish(State::Exhausted);
    }
}

auto ChunkedFileStream::Open(std::filesystem::path const& path,
                             RangeSpec const&             range,
                             std::uint64_t                chunk_size) -> Expected<ChunkedFileStream> {
    if (chunk_size == 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "chunk size must be positive"});
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot open " + path.string()});
    }

    if (range.length() > 0) {
        file.seekg(static_cast<std::streamoff>(range.start), std::ios::beg);
        if (!file) {
            return std::unexpected(Error{Error::Code::IoError,
                                         "cannot seek to " + std::to_string(range.start) + " in "
                                             + path.string()});
        }
    }

    return ChunkedFileStream{std::move(file), range, chunk_size};
}

auto ChunkedFileStream::next() -> std::optional<std::span<char const>> {
    if (state_ != State::Open) {
        return std::nullopt;
    }

    auto const want = static_cast<std::size_t>(std::min(chunk_size_, remaining_));
    if (buffer_.size() < want) {
        buffer_.resize(want);
    }

    file_.read(buffer_.data(), static_cast<std::streamsize>(want));
    auto const got = static_cast<std::size_t>(std::max<std::streamsize>(file_.gcount(), 0));
    if (got == 0) {
        finish(State::ShortRead);
        return std::nullopt;
    }

    bytes_streamed_ += got;
    remaining_ -= got;

    if (got < want) {
        finish(State::ShortRead);
    } else if (remaining_ == 0) {
        finish(State::Exhausted);
    }
    return std::span<char const>{buffer_.data(), got};
}

void ChunkedFileStream::close() {
    if (state_ == State::Open) {
        finish(State::Closed);
    }
}

void ChunkedFileStream::finish(State state) {
    state_ = state;
    if (file_.is_open()) {
        file_.close();
    }
}

} // namespace QD::Transfer
