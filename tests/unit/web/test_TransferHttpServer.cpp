#include <doctest/doctest.h>

#include <quickdrop/web/TransferHttpServer.hpp>

#include "../TransferTestHelper.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

struct CapturedLogs {
    std::mutex               mutex;
    std::vector<std::string> info;
    std::vector<std::string> error;

    auto hooks() -> QD::Web::TransferLogHooks {
        return QD::Web::TransferLogHooks{
            .info =
                [this](std::string_view message) {
                    std::lock_guard<std::mutex> lock(mutex);
                    info.emplace_back(message);
                },
            .error =
                [this](std::string_view message) {
                    std::lock_guard<std::mutex> lock(mutex);
                    error.emplace_back(message);
                },
        };
    }
};

auto local_options(std::filesystem::path const& folder) -> QD::Web::TransferOptions {
    QD::Web::TransferOptions options{};
    options.host          = "127.0.0.1";
    options.port          = 0;
    options.shared_folder = folder.string();
    options.worker_threads = 4;
    options.timeout_seconds = 5;
    return options;
}

// Running server over a fresh folder holding a.txt = "hello".
struct LiveServer {
    QD::Test::TempFolder        temp;
    CapturedLogs                logs;
    QD::Web::TransferHttpServer server;

    explicit LiveServer(std::uint64_t max_upload_bytes = QD::Web::kDefaultMaxUploadBytes)
        : server{make_options(temp, max_upload_bytes), logs.hooks()} {
        temp.write_file("a.txt", "hello");
        auto started = server.start();
        REQUIRE(started.has_value());
        REQUIRE(server.port() > 0);
    }

    auto client() const -> httplib::Client {
        httplib::Client cli("127.0.0.1", server.port());
        cli.set_read_timeout(5, 0);
        return cli;
    }

    static auto make_options(QD::Test::TempFolder const& temp, std::uint64_t max_upload_bytes)
        -> QD::Web::TransferOptions {
        auto options             = local_options(temp.path());
        options.max_upload_bytes = max_upload_bytes;
        options.chunk_size_bytes = 4;
        return options;
    }
};

} // namespace

TEST_SUITE("web.transfer.server") {

TEST_CASE("TransferHttpServer rejects invalid options") {
    QD::Web::TransferOptions options{};
    options.shared_folder.clear();

    QD::Web::TransferHttpServer server{options};
    auto started = server.start();
    REQUIRE_FALSE(started.has_value());
    CHECK(started.error().code == QD::Error::Code::MalformedInput);
    CHECK_FALSE(server.is_running());
}

TEST_CASE("TransferHttpServer surfaces bind failures") {
    QD::Test::TempFolder temp;
    auto options = local_options(temp.path());
    options.host = "256.256.256.256";
    options.port = 9099;

    QD::Web::TransferHttpServer server{options};
    auto started = server.start();
    REQUIRE_FALSE(started.has_value());
    CHECK(started.error().code == QD::Error::Code::IoError);
}

TEST_CASE("TransferHttpServer start/stop uses injected launcher") {
    QD::Test::TempFolder temp;
    auto run_count = std::make_shared<std::atomic<int>>(0);

    auto launcher = [run_count](QD::Web::TransferOptions const&,
                                std::atomic<bool>&                       stop_flag,
                                QD::Web::TransferLogHooks const&         hooks,
                                std::function<void(QD::Expected<int>)>   on_listen) {
        run_count->fetch_add(1);
        if (hooks.info) {
            hooks.info("hello");
        }
        on_listen(4321);
        while (!stop_flag.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(1ms);
        }
        return 0;
    };

    CapturedLogs                logs;
    QD::Web::TransferHttpServer server{local_options(temp.path()), logs.hooks(), launcher};

    REQUIRE(server.start().has_value());
    CHECK(server.is_running());
    CHECK(server.port() == 4321);
    server.stop();
    CHECK_FALSE(server.is_running());

    REQUIRE(server.start().has_value());
    server.stop();
    CHECK(run_count->load() == 2);
    REQUIRE(logs.info.size() == 2);
    CHECK(logs.info[0] == "hello");
}

TEST_CASE("TransferHttpServer reports a launcher that never listens") {
    QD::Test::TempFolder temp;
    auto launcher = [](QD::Web::TransferOptions const&,
                       std::atomic<bool>&,
                       QD::Web::TransferLogHooks const&,
                       std::function<void(QD::Expected<int>)>) { return 3; };

    QD::Web::TransferHttpServer server{local_options(temp.path()), {}, launcher};
    auto started = server.start();
    REQUIRE_FALSE(started.has_value());
    CHECK(started.error().code == QD::Error::Code::UnknownError);
}

TEST_CASE("downloads honour ranges") {
    LiveServer live;
    auto       cli = live.client();

    SUBCASE("partial") {
        auto res = cli.Get("/download/a.txt", httplib::Headers{{"Range", "bytes=1-3"}});
        REQUIRE(res);
        CHECK(res->status == 206);
        CHECK(res->body == "ell");
        CHECK(res->get_header_value("Content-Range") == "bytes 1-3/5");
        CHECK(res->get_header_value("Accept-Ranges") == "bytes");
        CHECK(res->get_header_value("Content-Disposition") == "attachment; filename*=UTF-8''a.txt");
    }
    SUBCASE("whole file") {
        auto res = cli.Get("/download/a.txt");
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(res->body == "hello");
        CHECK(res->get_header_value("Content-Length") == "5");
        CHECK(res->get_header_value("Cache-Control") == "no-cache");
    }
    SUBCASE("open ended") {
        auto res = cli.Get("/download/a.txt", httplib::Headers{{"Range", "bytes=2-"}});
        REQUIRE(res);
        CHECK(res->status == 206);
        CHECK(res->body == "llo");
        CHECK(res->get_header_value("Content-Range") == "bytes 2-4/5");
    }
    SUBCASE("end past the file is clamped") {
        auto res = cli.Get("/download/a.txt", httplib::Headers{{"Range", "bytes=3-100"}});
        REQUIRE(res);
        CHECK(res->status == 206);
        CHECK(res->body == "lo");
        CHECK(res->get_header_value("Content-Range") == "bytes 3-4/5");
        CHECK(res->get_header_value("Content-Length") == "2");
    }
    SUBCASE("empty start counts from the first byte") {
        auto res = cli.Get("/download/a.txt", httplib::Headers{{"Range", "bytes=-2"}});
        REQUIRE(res);
        CHECK(res->status == 206);
        CHECK(res->body == "hel");
        CHECK(res->get_header_value("Content-Range") == "bytes 0-2/5");
        CHECK(res->get_header_value("Content-Length") == "3");
    }
    SUBCASE("several ranges fall back to the whole file") {
        auto res = cli.Get("/download/a.txt", httplib::Headers{{"Range", "bytes=0-0,2-2"}});
        REQUIRE(res);
        CHECK(res->status == 206);
        CHECK(res->body == "hello");
        CHECK(res->get_header_value("Content-Range") == "bytes 0-4/5");
    }
    SUBCASE("syntactically broken header is refused before routing") {
        auto res = cli.Get("/download/a.txt", httplib::Headers{{"Range", "bytes=abc"}});
        REQUIRE(res);
        CHECK(res->status == 416);
        CHECK(res->body.find("hello") == std::string::npos);
    }
    SUBCASE("unsatisfiable") {
        auto res = cli.Get("/download/a.txt", httplib::Headers{{"Range", "bytes=10-20"}});
        REQUIRE(res);
        CHECK(res->status == 416);
        CHECK(res->get_header_value("Content-Range") == "bytes */5");
    }
}

TEST_CASE("ranged downloads cross chunk boundaries") {
    LiveServer live;
    auto const data = QD::Test::make_pattern(4096);
    live.temp.write_file("mid.bin", data);
    auto cli = live.client();

    auto res = cli.Get("/download/mid.bin", httplib::Headers{{"Range", "bytes=1000-2999"}});
    REQUIRE(res);
    CHECK(res->status == 206);
    CHECK(res->get_header_value("Content-Range") == "bytes 1000-2999/4096");
    CHECK(res->body == data.substr(1000, 2000));
}

TEST_CASE("empty files download without a content range") {
    LiveServer live;
    live.temp.write_file("empty.txt", "");
    auto cli = live.client();

    auto res = cli.Get("/download/empty.txt");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->body.empty());
    CHECK_FALSE(res->has_header("Content-Range"));
}

TEST_CASE("large downloads stream across many chunks") {
    LiveServer live;
    auto const data = QD::Test::make_pattern(256 * 1024 + 3);
    live.temp.write_file("big.bin", data);
    auto cli = live.client();

    auto res = cli.Get("/download/big.bin");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(res->body == data);

    auto partial = cli.Get("/download/big.bin", httplib::Headers{{"Range", "bytes=1000-200000"}});
    REQUIRE(partial);
    CHECK(partial->status == 206);
    CHECK(partial->body == data.substr(1000, 199001));
}

TEST_CASE("download refusals map to status codes") {
    LiveServer           live;
    QD::Test::TempFolder outside{"quickdrop_outside"};
    auto secret = outside.write_file("secret.txt", "nope");
    std::filesystem::create_symlink(secret, live.temp.path() / "link.txt");
    auto cli = live.client();

    auto traversal = cli.Get("/download/..%2Fsecret.txt");
    REQUIRE(traversal);
    CHECK(traversal->status == 400);

    auto escaped = cli.Get("/download/link.txt");
    REQUIRE(escaped);
    CHECK(escaped->status == 403);

    auto missing = cli.Get("/download/ghost.txt");
    REQUIRE(missing);
    CHECK(missing->status == 404);
}

TEST_CASE("uploads store files and report their names") {
    LiveServer live;
    auto       cli = live.client();

    SUBCASE("files and an empty part") {
        httplib::MultipartFormDataItems items{
            {"files", "uploaded body", "x.txt", "text/plain"},
            {"files", "", "", "application/octet-stream"},
        };
        auto res = cli.Post("/upload", items);
        REQUIRE(res);
        CHECK(res->status == 200);
        auto payload = nlohmann::json::parse(res->body);
        CHECK(payload == nlohmann::json{{"uploaded", {"x.txt"}}});
        CHECK(QD::Test::read_file(live.temp.path() / "x.txt") == "uploaded body");
    }
    SUBCASE("collisions never overwrite") {
        httplib::MultipartFormDataItems items{
            {"files", "new", "a.txt", "text/plain"},
        };
        auto res = cli.Post("/upload", items);
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(nlohmann::json::parse(res->body)["uploaded"][0] == "a_1.txt");
        CHECK(QD::Test::read_file(live.temp.path() / "a.txt") == "hello");
    }
    SUBCASE("no files field") {
        httplib::MultipartFormDataItems items{
            {"comment", "hi", "", ""},
        };
        auto res = cli.Post("/upload", items);
        REQUIRE(res);
        CHECK(res->status == 400);
        CHECK(nlohmann::json::parse(res->body)["error"] == "No files");
    }
    SUBCASE("not multipart") {
        auto res = cli.Post("/upload", std::string{"raw"}, "text/plain");
        REQUIRE(res);
        CHECK(res->status == 400);
        CHECK(nlohmann::json::parse(res->body)["error"] == "No files");
    }
}

TEST_CASE("uploads above the limit are refused") {
    LiveServer live{64};
    auto       cli = live.client();

    httplib::MultipartFormDataItems items{
        {"files", std::string(4096, 'z'), "big.bin", "application/octet-stream"},
    };
    auto res = cli.Post("/upload", items);
    REQUIRE(res);
    CHECK(res->status == 413);
    CHECK_FALSE(std::filesystem::exists(live.temp.path() / "big.bin"));
}

TEST_CASE("listing, health and metrics endpoints") {
    LiveServer live;
    auto       cli = live.client();

    auto page = cli.Get("/");
    REQUIRE(page);
    CHECK(page->status == 200);
    CHECK(page->body.find("/download/a.txt") != std::string::npos);

    auto listing = cli.Get("/?format=json");
    REQUIRE(listing);
    CHECK(listing->status == 200);
    auto payload = nlohmann::json::parse(listing->body);
    REQUIRE(payload["files"].size() == 1);
    CHECK(payload["files"][0]["name"] == "a.txt");
    CHECK(payload["files"][0]["size_bytes"] == 5);

    auto health = cli.Get("/healthz");
    REQUIRE(health);
    CHECK(health->status == 200);
    CHECK(health->body == "ok");

    auto metrics = cli.Get("/metrics");
    REQUIRE(metrics);
    CHECK(metrics->body.find("quickdrop_requests_total{route=\"list\"} 2") != std::string::npos);

    auto metrics_json = cli.Get("/metrics", httplib::Headers{{"Accept", "application/json"}});
    REQUIRE(metrics_json);
    CHECK(nlohmann::json::parse(metrics_json->body)["requests"]["healthz"]["total"] == 1);
}

TEST_CASE("server logs its listening address") {
    LiveServer live;
    live.server.stop();

    std::lock_guard<std::mutex> lock(live.logs.mutex);
    REQUIRE_FALSE(live.logs.info.empty());
    CHECK(live.logs.info.front().find("[quickdrop] Listening on http://127.0.0.1:") == 0);
    CHECK(live.logs.info.back() == "[quickdrop] Stopped");
}

} // TEST_SUITE
