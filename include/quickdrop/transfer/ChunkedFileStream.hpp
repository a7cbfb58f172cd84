#pragma once

#include <quickdrop/core/Error.hpp>
#include <quickdrop/transfer/RangeParser.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <vector>

namespace QD::Transfer {

// Pull-based reader of one byte interval of a file.
//
// Lifecycle: Open() acquires the handle and seeks to range.start; next() hands out
// chunks of at most chunk_size bytes; the handle is released as soon as the interval
// is exhausted, a read comes back short, close() is called, or the stream is
// destroyed. A stream cannot be rewound; resuming means opening a new one.
// The returned span stays valid until the following next()/close() call.
class ChunkedFileStream {
public:
    static constexpr std::uint64_t kDefaultChunkSize = 1024 * 1024;

    enum class State {
        Open,
        Exhausted,
        ShortRead,
        Closed,
    };

    static auto Open(std::filesystem::path const& path,
                     RangeSpec const&             range,
                     std::uint64_t                chunk_size = kDefaultChunkSize) -> Expected<ChunkedFileStream>;

    ChunkedFileStream(ChunkedFileStream&&) noexcept                    = default;
    auto operator=(ChunkedFileStream&&) noexcept -> ChunkedFileStream& = default;
    ChunkedFileStream(ChunkedFileStream const&)                        = delete;
    auto operator=(ChunkedFileStream const&) -> ChunkedFileStream&     = delete;
    ~ChunkedFileStream()                                               = default;

    [[nodiscard]] auto next() -> std::optional<std::span<char const>>;
    void               close();

    [[nodiscard]] auto state() const -> State { return state_; }
    [[nodiscard]] auto handle_open() const -> bool { return file_.is_open(); }
    [[nodiscard]] auto range() const -> RangeSpec const& { return range_; }
    [[nodiscard]] auto chunk_size() const -> std::uint64_t { return chunk_size_; }
    [[nodiscard]] auto bytes_streamed() const -> std::uint64_t { return bytes_streamed_; }
    [[nodiscard]] auto remaining() const -> std::uint64_t { return remaining_; }
    // Absolute file offset of the next byte next() would produce.
    [[nodiscard]] auto position() const -> std::uint64_t { return range_.start + bytes_streamed_; }

private:
    ChunkedFileStream(std::ifstream file, RangeSpec const& range, std::uint64_t chunk_size);

    void finish(State state);

    std::ifstream     file_;
    RangeSpec         range_;
    std::uint64_t     chunk_size_{kDefaultChunkSize};
    std::uint64_t     bytes_streamed_{0};
    std::uint64_t     remaining_{0};
    State             state_{State::Open};
    std::vector<char> buffer_;
};

} // namespace QD::Transfer
