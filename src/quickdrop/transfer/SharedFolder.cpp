#include <quickdrop/transfer/SharedFolder.hpp>

#include <system_error>
#include <utility>

namespace QD::Transfer {

SharedFolder::SharedFolder(std::filesystem::path root, std::filesystem::path canonical_root)
    : root_(std::move(root))
    , canonical_root_(std::move(canonical_root)) {}

auto SharedFolder::Open(std::filesystem::path const& root) -> Expected<SharedFolder> {
    if (root.empty()) {
        return std::unexpected(Error{Error::Code::InvalidPath, "shared folder path is empty"});
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(root, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::InvalidPath,
                                     "cannot resolve " + root.string() + ": " + ec.message()});
    }

    std::filesystem::create_directories(absolute, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError,
                                     "cannot create " + absolute.string() + ": " + ec.message()});
    }

    if (!std::filesystem::is_directory(absolute, ec)) {
        return std::unexpected(Error{Error::Code::InvalidPath,
                                     absolute.string() + " is not a directory"});
    }

    auto canonical = std::filesystem::canonical(absolute, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::IoError,
                                     "cannot canonicalize " + absolute.string() + ": " + ec.message()});
    }

    return SharedFolder{std::move(absolute), std::move(canonical)};
}

auto SharedFolder::path_for(std::string const& name) const -> std::filesystem::path {
    return root_ / name;
}

auto SharedFolder::display() const -> std::string {
    return root_.string();
}

} // namespace QD::Transfer
