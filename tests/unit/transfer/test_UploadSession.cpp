#include <doctest/doctest.h>

#include <quickdrop/transfer/UploadSession.hpp>

#include "../TransferTestHelper.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

using namespace QD::Transfer;

namespace {

void feed(UploadSession& session, std::string_view field, std::string_view filename, std::string_view body) {
    session.begin_part(field, filename);
    // Two slices per part, like a body split across socket reads.
    auto const half = body.size() / 2;
    session.write(body.data(), half);
    session.write(body.data() + half, body.size() - half);
}

} // namespace

TEST_SUITE("UploadSession") {

TEST_CASE("file parts are stored and empty names skipped") {
    QD::Test::TempFolder temp;
    auto folder = temp.shared_folder();

    UploadSession session{folder, NamingPolicy::CheckThenCreate};
    feed(session, "files", "x.txt", "payload");
    feed(session, "files", "", "ignored");
    auto result = session.finish();

    CHECK(result.saw_files_field);
    CHECK(result.uploaded == std::vector<std::string>{"x.txt"});
    CHECK(result.failed.empty());
    CHECK(QD::Test::read_file(temp.path() / "x.txt") == "payload");
    CHECK(session.bytes_received() == 7);
}

TEST_CASE("other form fields are ignored") {
    QD::Test::TempFolder temp;
    auto folder = temp.shared_folder();

    UploadSession session{folder, NamingPolicy::CheckThenCreate};
    feed(session, "comment", "note.txt", "hi");
    auto result = session.finish();

    CHECK_FALSE(result.saw_files_field);
    CHECK(result.uploaded.empty());
    CHECK_FALSE(std::filesystem::exists(temp.path() / "note.txt"));
}

TEST_CASE("duplicate names in one request get suffixes") {
    QD::Test::TempFolder temp;
    auto folder = temp.shared_folder();

    UploadSession session{folder, NamingPolicy::ExclusiveCreate};
    feed(session, "files", "photo.jpg", "one");
    feed(session, "files", "photo.jpg", "two");
    feed(session, "files", "photo.jpg", "three");
    auto result = session.finish();

    CHECK(result.uploaded == std::vector<std::string>{"photo.jpg", "photo_1.jpg", "photo_2.jpg"});
    CHECK(QD::Test::read_file(temp.path() / "photo_1.jpg") == "two");
}

TEST_CASE("hostile names stay inside the folder") {
    QD::Test::TempFolder temp;
    auto folder = temp.shared_folder();

    UploadSession session{folder, NamingPolicy::CheckThenCreate};
    feed(session, "files", "../../evil.sh", "#!/bin/sh");
    feed(session, "files", "...", "dots only");
    auto result = session.finish();

    CHECK(result.uploaded == std::vector<std::string>{"evil.sh"});
    CHECK(std::filesystem::exists(temp.path() / "evil.sh"));
    CHECK_FALSE(std::filesystem::exists(temp.path().parent_path() / "evil.sh"));
    REQUIRE(result.failed.size() == 1);
    CHECK(result.failed[0].client_filename == "...");
    CHECK(result.failed[0].error.code == QD::Error::Code::InvalidPath);
}

TEST_CASE("names that filter down to nothing are reported") {
    QD::Test::TempFolder temp;
    auto folder = temp.shared_folder();

    UploadSession session{folder, NamingPolicy::CheckThenCreate};
    feed(session, "files", "\xC3\xA9\xC3\xA9", "accents only");
    feed(session, "files", "", "no name at all");
    feed(session, "files", "kept.txt", "kept");
    auto result = session.finish();

    REQUIRE(result.failed.size() == 1);
    CHECK(result.failed[0].client_filename == "\xC3\xA9\xC3\xA9");
    CHECK(result.failed[0].error.code == QD::Error::Code::InvalidPath);
    CHECK(result.uploaded == std::vector<std::string>{"kept.txt"});
    CHECK(QD::Test::read_file(temp.path() / "kept.txt") == "kept");
}

TEST_CASE("a failing part is reported while later parts are stored") {
    QD::Test::TempFolder temp;
    auto folder = temp.shared_folder();

    std::string const too_long(400, 'a');
    UploadSession     session{folder, NamingPolicy::CheckThenCreate};
    feed(session, "files", too_long, "lost");
    feed(session, "files", "ok.txt", "kept");
    auto result = session.finish();

    REQUIRE(result.failed.size() == 1);
    CHECK(result.failed[0].client_filename == too_long);
    CHECK(result.failed[0].error.code == QD::Error::Code::IoError);
    CHECK(result.uploaded == std::vector<std::string>{"ok.txt"});
}

TEST_CASE("a session dropped mid-part keeps what arrived") {
    QD::Test::TempFolder temp;
    auto folder = temp.shared_folder();

    {
        UploadSession session{folder, NamingPolicy::CheckThenCreate};
        session.begin_part("files", "partial.bin");
        session.write("abc", 3);
    }
    CHECK(QD::Test::read_file(temp.path() / "partial.bin") == "abc");
}

} // TEST_SUITE
