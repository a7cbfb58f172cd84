#include <doctest/doctest.h>

#include <quickdrop/web/Metrics.hpp>

#include <chrono>
#include <string>

using namespace std::chrono_literals;

TEST_SUITE("web.metrics") {

TEST_CASE("request counters split errors per route") {
    QD::Web::MetricsCollector metrics;
    metrics.record_request(QD::Web::RouteMetric::Download, 206, 3ms);
    metrics.record_request(QD::Web::RouteMetric::Download, 404, 1ms);
    metrics.record_request(QD::Web::RouteMetric::List, 0, 2ms);

    auto snapshot = metrics.capture_snapshot();
    auto const& download = snapshot.routes[static_cast<std::size_t>(QD::Web::RouteMetric::Download)];
    CHECK(download.total == 2);
    CHECK(download.errors == 1);
    CHECK(download.latency.count == 2);
    CHECK(download.latency.sum_micros == 4000);
    auto const& list = snapshot.routes[static_cast<std::size_t>(QD::Web::RouteMetric::List)];
    CHECK(list.total == 1);
    CHECK(list.errors == 0);
}

TEST_CASE("transfer counters track downloads and uploads") {
    QD::Web::MetricsCollector metrics;
    metrics.record_download_started(true);
    metrics.record_download_started(false);
    metrics.record_bytes_sent(100);
    metrics.record_download_finished(true);

    auto snapshot = metrics.capture_snapshot();
    CHECK(snapshot.downloads_in_flight == 1);
    CHECK(snapshot.range_requests == 1);
    CHECK(snapshot.downloads_completed == 1);

    metrics.record_download_finished(false);
    metrics.record_upload_stored();
    metrics.record_upload_failed();
    metrics.record_bytes_received(42);

    auto json = metrics.snapshot_json();
    CHECK(json["downloads"]["in_flight"] == 0);
    CHECK(json["downloads"]["aborted"] == 1);
    CHECK(json["downloads"]["bytes_sent"] == 100);
    CHECK(json["uploads"]["stored"] == 1);
    CHECK(json["uploads"]["failed"] == 1);
    CHECK(json["uploads"]["bytes_received"] == 42);
    CHECK(json.contains("captured_at"));
}

TEST_CASE("prometheus rendering labels routes") {
    QD::Web::MetricsCollector metrics;
    metrics.record_request(QD::Web::RouteMetric::Upload, 400, 10ms);
    metrics.record_bytes_received(7);

    auto text = metrics.render_prometheus();
    CHECK(text.find("quickdrop_requests_total{route=\"upload\"} 1") != std::string::npos);
    CHECK(text.find("quickdrop_request_errors_total{route=\"upload\"} 1") != std::string::npos);
    CHECK(text.find("quickdrop_bytes_received_total 7") != std::string::npos);
    CHECK(text.find("quickdrop_request_duration_seconds_bucket{route=\"upload\"") != std::string::npos);
}

} // TEST_SUITE
