#include <doctest/doctest.h>

#include <quickdrop/transfer/FileCatalog.hpp>
#include <quickdrop/web/ListingPage.hpp>

#include <string>
#include <vector>

namespace {

auto make_entry(std::string name, std::uint64_t size) -> QD::Transfer::FileEntry {
    QD::Transfer::FileEntry entry{};
    entry.display_size = QD::Transfer::FormatFileSize(size);
    entry.icon         = QD::Transfer::IconForFilename(name);
    entry.size_bytes   = size;
    entry.name         = std::move(name);
    return entry;
}

} // namespace

TEST_SUITE("web.listing") {

TEST_CASE("escape_html covers markup characters") {
    CHECK(QD::Web::escape_html("<a href=\"x\">&'</a>") == "&lt;a href=&quot;x&quot;&gt;&amp;&#39;&lt;/a&gt;");
    CHECK(QD::Web::escape_html("plain") == "plain");
}

TEST_CASE("page links every file through an encoded download URL") {
    std::vector<QD::Transfer::FileEntry> files{make_entry("my file.txt", 1536), make_entry("<b>.txt", 3)};
    auto page = QD::Web::BuildListingPage("/srv/drop", files);

    CHECK(page.find("/download/my%20file.txt") != std::string::npos);
    CHECK(page.find("1.5 KB") != std::string::npos);
    CHECK(page.find("&lt;b&gt;.txt") != std::string::npos);
    CHECK(page.find("<b>.txt") == std::string::npos);
    CHECK(page.find("name=\"files\"") != std::string::npos);
    CHECK(page.find("/srv/drop") != std::string::npos);
    CHECK(page.find("No files yet") == std::string::npos);
}

TEST_CASE("empty folder shows a placeholder") {
    auto page = QD::Web::BuildListingPage("/srv/drop", {});
    CHECK(page.find("No files yet") != std::string::npos);
    CHECK(page.find("/upload") != std::string::npos);
}

TEST_CASE("json listing mirrors the entries") {
    std::vector<QD::Transfer::FileEntry> files{make_entry("a.txt", 5)};
    auto payload = QD::Web::BuildListingJson("/srv/drop", files);

    CHECK(payload["folder"] == "/srv/drop");
    REQUIRE(payload["files"].size() == 1);
    CHECK(payload["files"][0]["name"] == "a.txt");
    CHECK(payload["files"][0]["size"] == "5.0 B");
    CHECK(payload["files"][0]["size_bytes"] == 5);

    auto empty = QD::Web::BuildListingJson("/srv/drop", {});
    CHECK(empty["files"].is_array());
    CHECK(empty["files"].empty());
}

} // TEST_SUITE
