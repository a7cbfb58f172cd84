#include <doctest/doctest.h>

#include <quickdrop/transfer/FileCatalog.hpp>

#include "../TransferTestHelper.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace QD::Transfer;

TEST_SUITE("FileCatalog") {

TEST_CASE("human readable sizes") {
    CHECK(FormatFileSize(0) == "0.0 B");
    CHECK(FormatFileSize(1023) == "1023.0 B");
    CHECK(FormatFileSize(1024) == "1.0 KB");
    CHECK(FormatFileSize(1536) == "1.5 KB");
    CHECK(FormatFileSize(1024ull * 1024) == "1.0 MB");
    CHECK(FormatFileSize(5ull * 1024 * 1024 * 1024) == "5.0 GB");
    CHECK(FormatFileSize(1024ull * 1024 * 1024 * 1024) == "1.0 TB");
}

TEST_CASE("icons follow the lowercase extension") {
    auto const fallback = IconForFilename("noext");
    CHECK_FALSE(fallback.empty());
    CHECK(IconForFilename("notes.unknownext") == fallback);
    CHECK(IconForFilename("paper.PDF") == IconForFilename("paper.pdf"));
    CHECK(IconForFilename("paper.pdf") != fallback);
    CHECK(IconForFilename("song.mp3") == IconForFilename("take.flac"));
    CHECK(IconForFilename("app.apk") != IconForFilename("song.mp3"));
}

TEST_CASE("listing holds regular files sorted without case") {
    QD::Test::TempFolder temp;
    temp.write_file("b.txt", "bb");
    temp.write_file("A.txt", "a");
    temp.write_file("c.bin", std::string(2048, 'c'));
    std::filesystem::create_directories(temp.path() / "dir");
    auto folder = temp.shared_folder();

    bool errored = false;
    auto entries = ListSharedFiles(folder, [&](QD::Error const&) { errored = true; });
    CHECK_FALSE(errored);

    std::vector<std::string> names;
    for (auto const& entry : entries) {
        names.push_back(entry.name);
    }
    CHECK(names == std::vector<std::string>{"A.txt", "b.txt", "c.bin"});
    REQUIRE(entries.size() == 3);
    CHECK(entries[1].size_bytes == 2);
    CHECK(entries[1].display_size == "2.0 B");
    CHECK(entries[2].display_size == "2.0 KB");
    CHECK(entries[0].icon == IconForFilename("A.txt"));
}

TEST_CASE("an empty folder lists nothing") {
    QD::Test::TempFolder temp;
    auto folder = temp.shared_folder();
    CHECK(ListSharedFiles(folder).empty());
}

TEST_CASE("a vanished folder yields an empty list and a report") {
    QD::Test::TempFolder temp;
    temp.write_file("a.txt", "a");
    auto folder = temp.shared_folder();
    std::filesystem::remove_all(temp.path());

    int  reports = 0;
    auto entries = ListSharedFiles(folder, [&](QD::Error const& error) {
        ++reports;
        CHECK(error.code == QD::Error::Code::IoError);
    });
    CHECK(entries.empty());
    CHECK(reports == 1);
}

} // TEST_SUITE
