#include <doctest/doctest.h>

#include <quickdrop/transfer/PathSanitizer.hpp>

#include "../TransferTestHelper.hpp"

#include <filesystem>
#include <string>

using QD::Error;
using QD::Transfer::IsWithinRoot;
using QD::Transfer::SanitizeDownloadPath;

TEST_SUITE("PathSanitizer") {

TEST_CASE("plain names resolve inside the canonical root") {
    QD::Test::TempFolder temp;
    temp.write_file("a.txt", "hello");
    auto folder = temp.shared_folder();

    auto resolved = SanitizeDownloadPath("a.txt", folder);
    REQUIRE(resolved.has_value());
    CHECK(*resolved == folder.canonical_root() / "a.txt");
}

TEST_CASE("names are percent-decoded before lookup") {
    QD::Test::TempFolder temp;
    temp.write_file("my file.txt", "x");
    auto folder = temp.shared_folder();

    auto resolved = SanitizeDownloadPath("my%20file.txt", folder);
    REQUIRE(resolved.has_value());
    CHECK(resolved->filename() == "my file.txt");
}

TEST_CASE("traversal and root anchors are rejected as invalid") {
    QD::Test::TempFolder temp;
    auto folder = temp.shared_folder();

    for (auto const* name : {"../etc/passwd", "sub/../../x", "a..b", "%2e%2e/secret", "/etc/passwd",
                             "%2Fetc%2Fpasswd", "\\windows\\win.ini", "C:evil.txt", ""}) {
        CAPTURE(name);
        auto resolved = SanitizeDownloadPath(name, folder);
        REQUIRE_FALSE(resolved.has_value());
        CHECK(resolved.error().code == Error::Code::InvalidPath);
        CHECK(QD::httpStatusForError(resolved.error()) == 400);
    }
}

TEST_CASE("embedded NUL bytes are rejected") {
    QD::Test::TempFolder temp;
    auto folder = temp.shared_folder();

    auto resolved = SanitizeDownloadPath("a.txt%00.jpg", folder);
    REQUIRE_FALSE(resolved.has_value());
    CHECK(resolved.error().code == Error::Code::InvalidPath);
}

TEST_CASE("missing files and directories are not found") {
    QD::Test::TempFolder temp;
    std::filesystem::create_directories(temp.path() / "nested");
    auto folder = temp.shared_folder();

    SUBCASE("missing") {
        auto resolved = SanitizeDownloadPath("ghost.bin", folder);
        REQUIRE_FALSE(resolved.has_value());
        CHECK(resolved.error().code == Error::Code::NotFound);
        CHECK(QD::httpStatusForError(resolved.error()) == 404);
    }
    SUBCASE("directory") {
        auto resolved = SanitizeDownloadPath("nested", folder);
        REQUIRE_FALSE(resolved.has_value());
        CHECK(resolved.error().code == Error::Code::NotFound);
    }
}

TEST_CASE("symlinks are followed before the containment check") {
    QD::Test::TempFolder temp;
    QD::Test::TempFolder outside{"quickdrop_outside"};
    auto secret = outside.write_file("secret.txt", "top secret");
    auto inner  = temp.write_file("inner.txt", "fine");
    std::filesystem::create_symlink(secret, temp.path() / "escape.txt");
    std::filesystem::create_symlink(inner, temp.path() / "alias.txt");
    auto folder = temp.shared_folder();

    SUBCASE("link leaving the folder is denied") {
        auto resolved = SanitizeDownloadPath("escape.txt", folder);
        REQUIRE_FALSE(resolved.has_value());
        CHECK(resolved.error().code == Error::Code::AccessDenied);
        CHECK(QD::httpStatusForError(resolved.error()) == 403);
    }
    SUBCASE("link staying inside is served") {
        auto resolved = SanitizeDownloadPath("alias.txt", folder);
        REQUIRE(resolved.has_value());
        CHECK(*resolved == folder.canonical_root() / "inner.txt");
    }
}

TEST_CASE("containment compares whole components") {
    CHECK(IsWithinRoot("/srv/share/a.txt", "/srv/share"));
    CHECK(IsWithinRoot("/srv/share/deep/a.txt", "/srv/share/"));
    CHECK(IsWithinRoot("/srv/share", "/srv/share"));
    CHECK_FALSE(IsWithinRoot("/srv/shared/a.txt", "/srv/share"));
    CHECK_FALSE(IsWithinRoot("/srv", "/srv/share"));
}

} // TEST_SUITE
