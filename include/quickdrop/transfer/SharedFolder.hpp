#pragma once

#include <quickdrop/core/Error.hpp>

#include <filesystem>
#include <string>

namespace QD::Transfer {

// The single directory whose regular files are listed, served and accepted.
// Constructed once at startup and passed to every component that touches disk.
class SharedFolder {
public:
    // Creates the directory (and parents) when absent and resolves its canonical form.
    static auto Open(std::filesystem::path const& root) -> Expected<SharedFolder>;

    [[nodiscard]] auto root() const -> std::filesystem::path const& { return root_; }
    [[nodiscard]] auto canonical_root() const -> std::filesystem::path const& { return canonical_root_; }

    [[nodiscard]] auto path_for(std::string const& name) const -> std::filesystem::path;
    [[nodiscard]] auto display() const -> std::string;

private:
    SharedFolder(std::filesystem::path root, std::filesystem::path canonical_root);

    std::filesystem::path root_;
    std::filesystem::path canonical_root_;
};

} // namespace QD::Transfer
