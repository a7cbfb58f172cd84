#include <quickdrop/web/ListingPage.hpp>

#include <quickdrop/transfer/UrlCodec.hpp>

namespace QD::Web {

namespace {

constexpr std::string_view kPageHead = R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>QuickDrop</title>
<style>
body { font-family: -apple-system, sans-serif; margin: 0 auto; max-width: 40rem; padding: 1rem; }
.upload { border: 2px dashed #888; border-radius: 8px; padding: 1rem; margin-bottom: 1rem; }
ul { list-style: none; padding: 0; }
li { display: flex; gap: 0.5rem; padding: 0.5rem 0; border-bottom: 1px solid #ddd; }
li a { flex: 1; word-break: break-all; }
.size { color: #666; white-space: nowrap; }
.empty { color: #666; }
</style>
</head>
<body>
<h1>QuickDrop</h1>
)";

constexpr std::string_view kUploadForm = R"(<form class="upload" action="/upload" method="post" enctype="multipart/form-data">
<input type="file" name="files" multiple>
<button type="submit">Upload</button>
</form>
)";

constexpr std::string_view kPageTail = "</body>\n</html>\n";

} // namespace

auto escape_html(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&':
            escaped.append("&amp;");
            break;
        case '<':
            escaped.append("&lt;");
            break;
        case '>':
            escaped.append("&gt;");
            break;
        case '"':
            escaped.append("&quot;");
            break;
        case '\'':
            escaped.append("&#39;");
            break;
        default:
            escaped.push_back(ch);
            break;
        }
    }
    return escaped;
}

auto BuildListingPage(std::string_view folder_display, std::vector<Transfer::FileEntry> const& files)
    -> std::string {
    std::string page{kPageHead};
    page.append("<p>Shared folder: <code>");
    page.append(escape_html(folder_display));
    page.append("</code></p>\n");
    page.append(kUploadForm);

    if (files.empty()) {
        page.append("<p class=\"empty\">No files yet</p>\n");
    } else {
        page.append("<ul>\n");
        for (auto const& file : files) {
            page.append("<li><span>");
            page.append(file.icon);
            page.append("</span><a href=\"/download/");
            page.append(Transfer::PercentEncode(file.name));
            page.append("\" download>");
            page.append(escape_html(file.name));
            page.append("</a><span class=\"size\">");
            page.append(escape_html(file.display_size));
            page.append("</span></li>\n");
        }
        page.append("</ul>\n");
    }
    page.append(kPageTail);
    return page;
}

auto BuildListingJson(std::string_view folder_display, std::vector<Transfer::FileEntry> const& files)
    -> nlohmann::json {
    auto entries = nlohmann::json::array();
    for (auto const& file : files) {
        entries.push_back(nlohmann::json{{"name", file.name},
                                         {"size", file.display_size},
                                         {"size_bytes", file.size_bytes},
                                         {"icon", file.icon}});
    }
    return nlohmann::json{{"folder", folder_display}, {"files", std::move(entries)}};
}

} // namespace QD::Web
