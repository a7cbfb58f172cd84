#include <quickdrop/transfer/UploadNamer.hpp>

#include <cctype>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace QD::Transfer {

namespace {

constexpr int kCreateMode = 0644;

bool is_safe_char(unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '_' || ch == '.' || ch == '-';
}

auto split_extension(std::string_view name) -> std::pair<std::string_view, std::string_view> {
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return {name, {}};
    }
    // A run of leading dots belongs to the stem (".bashrc", "..x").
    auto first_non_dot = name.find_first_not_of('.');
    if (first_non_dot == std::string_view::npos || dot < first_non_dot) {
        return {name, {}};
    }
    return {name.substr(0, dot), name.substr(dot)};
}

auto errno_error(Error::Code code, std::string const& what) -> Error {
    return Error{code, what + ": " + std::strerror(errno)};
}

bool exists_no_throw(std::filesystem::path const& path) {
    std::error_code ec;
    auto const status = std::filesystem::symlink_status(path, ec);
    return std::filesystem::exists(status);
}

} // namespace

auto SecureFilename(std::string_view client_name) -> std::string {
    std::string spaced;
    spaced.reserve(client_name.size());
    for (char ch : client_name) {
        auto const byte = static_cast<unsigned char>(ch);
        if (byte >= 0x80) {
            continue;
        }
        spaced.push_back(ch == '/' || ch == '\\' ? ' ' : ch);
    }

    std::string joined;
    joined.reserve(spaced.size());
    bool pending_separator = false;
    for (char ch : spaced) {
        auto const byte = static_cast<unsigned char>(ch);
        if (std::isspace(byte) != 0 || (byte >= 0x1c && byte <= 0x1f)) {
            pending_separator = !joined.empty();
            continue;
        }
        if (pending_separator) {
            joined.push_back('_');
            pending_separator = false;
        }
        joined.push_back(ch);
    }

    std::string filtered;
    filtered.reserve(joined.size());
    for (char ch : joined) {
        if (is_safe_char(static_cast<unsigned char>(ch))) {
            filtered.push_back(ch);
        }
    }

    auto const first = filtered.find_first_not_of("._");
    if (first == std::string::npos) {
        return {};
    }
    auto const last = filtered.find_last_not_of("._");
    return filtered.substr(first, last - first + 1);
}

auto CollisionCandidate(std::string_view desired, std::size_t n) -> std::string {
    if (n == 0) {
        return std::string{desired};
    }
    auto [stem, ext] = split_extension(desired);
    std::string candidate;
    candidate.reserve(desired.size() + 8);
    candidate.append(stem);
    candidate.push_back('_');
    candidate.append(std::to_string(n));
    candidate.append(ext);
    return candidate;
}

auto ReserveUploadName(std::string_view desired, SharedFolder const& folder) -> std::string {
    for (std::size_t n = 0;; ++n) {
        auto candidate = CollisionCandidate(desired, n);
        if (!exists_no_throw(folder.path_for(candidate))) {
            return candidate;
        }
    }
}

UploadFile::UploadFile(int fd)
    : fd_(fd) {}

UploadFile::~UploadFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

UploadFile::UploadFile(UploadFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , bytes_written_(std::exchange(other.bytes_written_, 0)) {}

auto UploadFile::operator=(UploadFile&& other) noexcept -> UploadFile& {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_            = std::exchange(other.fd_, -1);
        bytes_written_ = std::exchange(other.bytes_written_, 0);
    }
    return *this;
}

auto UploadFile::write(char const* data, std::size_t length) -> Expected<void> {
    if (fd_ < 0) {
        return std::unexpected(Error{Error::Code::IoError, "upload file is not open"});
    }
    while (length > 0) {
        auto const written = ::write(fd_, data, length);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(errno_error(Error::Code::IoError, "write failed"));
        }
        data += written;
        length -= static_cast<std::size_t>(written);
        bytes_written_ += static_cast<std::uint64_t>(written);
    }
    return {};
}

auto UploadFile::close() -> Expected<void> {
    if (fd_ < 0) {
        return {};
    }
    auto const fd = std::exchange(fd_, -1);
    if (::close(fd) != 0) {
        return std::unexpected(errno_error(Error::Code::IoError, "close failed"));
    }
    return {};
}

auto CreateUploadTarget(std::string_view    desired,
                        SharedFolder const& folder,
                        NamingPolicy        policy) -> Expected<UploadTarget> {
    if (desired.empty()) {
        return std::unexpected(Error{Error::Code::InvalidPath, "empty upload name"});
    }

    if (policy == NamingPolicy::CheckThenCreate) {
        auto name = ReserveUploadName(desired, folder);
        auto path = folder.path_for(name);
        int  fd   = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, kCreateMode);
        if (fd < 0) {
            return std::unexpected(errno_error(Error::Code::IoError, "cannot create " + path.string()));
        }
        return UploadTarget{std::move(name), std::move(path), UploadFile{fd}};
    }

    for (std::size_t n = 0;; ++n) {
        auto name = CollisionCandidate(desired, n);
        auto path = folder.path_for(name);
        int  fd   = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, kCreateMode);
        if (fd >= 0) {
            return UploadTarget{std::move(name), std::move(path), UploadFile{fd}};
        }
        if (errno != EEXIST) {
            return std::unexpected(errno_error(Error::Code::IoError, "cannot create " + path.string()));
        }
    }
}

} // namespace QD::Transfer
