#pragma once

#include <quickdrop/core/Error.hpp>
#include <quickdrop/transfer/SharedFolder.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace QD::Transfer {

enum class NamingPolicy {
    // Existence check, then open with truncate. Two racing uploads of the same
    // desired name can both observe "free" and write the same file.
    CheckThenCreate,
    // O_CREAT|O_EXCL on every candidate; EEXIST advances to the next candidate.
    ExclusiveCreate,
};

// Reduces a client filename to [A-Za-z0-9._-] with whitespace runs folded to '_'
// and leading/trailing '.' and '_' removed. Path separators never survive, so the
// result is never a traversal vector. May return an empty string.
[[nodiscard]] auto SecureFilename(std::string_view client_name) -> std::string;

// `{stem}_{n}{ext}` for n >= 1, `desired` itself for n == 0.
[[nodiscard]] auto CollisionCandidate(std::string_view desired, std::size_t n) -> std::string;

// First name among desired, stem_1.ext, stem_2.ext, ... that does not exist in the
// folder at the time of the call.
[[nodiscard]] auto ReserveUploadName(std::string_view desired, SharedFolder const& folder) -> std::string;

// Write handle for one stored upload. Closing is explicit so write errors that only
// surface on close are reported; the destructor closes silently.
class UploadFile {
public:
    UploadFile() = default;
    explicit UploadFile(int fd);
    ~UploadFile();

    UploadFile(UploadFile const&)                    = delete;
    auto operator=(UploadFile const&) -> UploadFile& = delete;
    UploadFile(UploadFile&& other) noexcept;
    auto operator=(UploadFile&& other) noexcept -> UploadFile&;

    [[nodiscard]] auto is_open() const -> bool { return fd_ >= 0; }
    [[nodiscard]] auto bytes_written() const -> std::uint64_t { return bytes_written_; }

    auto write(char const* data, std::size_t length) -> Expected<void>;
    auto close() -> Expected<void>;

private:
    int           fd_{-1};
    std::uint64_t bytes_written_{0};
};

struct UploadTarget {
    std::string           name;
    std::filesystem::path path;
    UploadFile            file;
};

// Picks the final stored name for `desired` (already passed through SecureFilename)
// and opens it for writing under `policy`.
[[nodiscard]] auto CreateUploadTarget(std::string_view    desired,
                                      SharedFolder const& folder,
                                      NamingPolicy        policy) -> Expected<UploadTarget>;

} // namespace QD::Transfer
