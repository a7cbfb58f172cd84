#include <quickdrop/web/Metrics.hpp>

#include <quickdrop/web/TimeUtils.hpp>

#include <httplib.h>

#include <cmath>
#include <sstream>
#include <utility>

namespace QD::Web {

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<RouteMetric, char const*>, static_cast<std::size_t>(RouteMetric::Count)>
    kRouteMetricNames{{
        {RouteMetric::List, "list"},
        {RouteMetric::Upload, "upload"},
        {RouteMetric::Download, "download"},
        {RouteMetric::Healthz, "healthz"},
        {RouteMetric::Metrics, "metrics"},
    }};

void write_counter(std::ostringstream& out, char const* name, char const* help, std::uint64_t value) {
    out << "# HELP quickdrop_" << name << ' ' << help << "\n";
    out << "# TYPE quickdrop_" << name << " counter\n";
    out << "quickdrop_" << name << ' ' << value << "\n";
}

} // namespace

void MetricsCollector::Histogram::observe(std::chrono::microseconds value) {
    auto const micros = static_cast<std::uint64_t>(value.count());
    sum_micros_.fetch_add(micros, std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_relaxed);
    double const millis = static_cast<double>(micros) / 1000.0;
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        if (millis <= kLatencyBucketsMs[i]) {
            buckets_[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    buckets_.back().fetch_add(1, std::memory_order_relaxed);
}

auto MetricsCollector::Histogram::snapshot() const -> HistogramSnapshot {
    HistogramSnapshot snapshot{};
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        snapshot.buckets[i] = buckets_[i].load(std::memory_order_relaxed);
    }
    snapshot.count      = count_.load(std::memory_order_relaxed);
    snapshot.sum_micros = sum_micros_.load(std::memory_order_relaxed);
    return snapshot;
}

auto MetricsCollector::Histogram::bucket_boundaries()
    -> std::array<double, HistogramSnapshot::kBucketCount> const& {
    return kLatencyBucketsMs;
}

void MetricsCollector::record_request(RouteMetric route,
                                      int         status,
                                      std::chrono::microseconds latency) {
    auto const index = static_cast<std::size_t>(route);
    if (index >= routes_.size()) {
        return;
    }
    auto& counters = routes_[index];
    counters.latency.observe(latency);
    counters.total.fetch_add(1, std::memory_order_relaxed);
    int effective_status = status <= 0 ? 200 : status;
    if (effective_status >= 400) {
        counters.errors.fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_download_started(bool partial) {
    downloads_in_flight_.fetch_add(1, std::memory_order_relaxed);
    if (partial) {
        range_requests_.fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_download_finished(bool completed) {
    downloads_in_flight_.fetch_sub(1, std::memory_order_relaxed);
    if (completed) {
        downloads_completed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        downloads_aborted_.fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_bytes_sent(std::uint64_t bytes) {
    bytes_sent_.fetch_add(bytes, std::memory_order_relaxed);
}

void MetricsCollector::record_upload_stored() {
    uploads_stored_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::record_upload_failed() {
    uploads_failed_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::record_bytes_received(std::uint64_t bytes) {
    bytes_received_.fetch_add(bytes, std::memory_order_relaxed);
}

auto MetricsCollector::capture_snapshot() const -> MetricsSnapshot {
    MetricsSnapshot snapshot;
    snapshot.captured_at = std::chrono::system_clock::now();
    for (std::size_t i = 0; i < routes_.size(); ++i) {
        snapshot.routes[i].latency = routes_[i].latency.snapshot();
        snapshot.routes[i].total = routes_[i].total.load(std::memory_order_relaxed);
        snapshot.routes[i].errors = routes_[i].errors.load(std::memory_order_relaxed);
    }
    snapshot.downloads_in_flight = downloads_in_flight_.load(std::memory_order_relaxed);
    snapshot.downloads_completed = downloads_completed_.load(std::memory_order_relaxed);
    snapshot.downloads_aborted = downloads_aborted_.load(std::memory_order_relaxed);
    snapshot.range_requests = range_requests_.load(std::memory_order_relaxed);
    snapshot.bytes_sent = bytes_sent_.load(std::memory_order_relaxed);
    snapshot.uploads_stored = uploads_stored_.load(std::memory_order_relaxed);
    snapshot.uploads_failed = uploads_failed_.load(std::memory_order_relaxed);
    snapshot.bytes_received = bytes_received_.load(std::memory_order_relaxed);
    return snapshot;
}

auto MetricsCollector::render_prometheus() const -> std::string {
    auto snapshot = capture_snapshot();
    return render_prometheus(snapshot);
}

auto MetricsCollector::render_prometheus(MetricsSnapshot const& snapshot) const -> std::string {
    metrics_scrapes_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream out;

    out << "# HELP quickdrop_request_duration_seconds Request latency histogram\n";
    out << "# TYPE quickdrop_request_duration_seconds histogram\n";
    auto const& buckets = Histogram::bucket_boundaries();
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const& route_stats = snapshot.routes[i];
        auto const* name        = kRouteMetricNames[i].second;
        std::uint64_t cumulative = 0;
        for (std::size_t b = 0; b < buckets.size(); ++b) {
            cumulative += route_stats.latency.buckets[b];
            auto boundary = buckets[b];
            out << "quickdrop_request_duration_seconds_bucket{route=\"" << name
                << "\",le=\"" << (std::isinf(boundary) ? std::string{"+Inf"}
                                                           : std::to_string(boundary / 1000.0))
                << "\"} " << cumulative << "\n";
        }
        double sum_seconds = route_stats.latency.sum_micros / 1'000'000.0;
        out << "quickdrop_request_duration_seconds_sum{route=\"" << name
            << "\"} " << sum_seconds << "\n";
        out << "quickdrop_request_duration_seconds_count{route=\"" << name
            << "\"} " << route_stats.latency.count << "\n";
    }

    out << "# HELP quickdrop_requests_total Total HTTP requests\n";
    out << "# TYPE quickdrop_requests_total counter\n";
    out << "# HELP quickdrop_request_errors_total HTTP requests returning >=400\n";
    out << "# TYPE quickdrop_request_errors_total counter\n";
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const* name = kRouteMetricNames[i].second;
        out << "quickdrop_requests_total{route=\"" << name << "\"} "
            << snapshot.routes[i].total << "\n";
        out << "quickdrop_request_errors_total{route=\"" << name << "\"} "
            << snapshot.routes[i].errors << "\n";
    }

    out << "# HELP quickdrop_downloads_in_flight Downloads currently streaming\n";
    out << "# TYPE quickdrop_downloads_in_flight gauge\n";
    out << "quickdrop_downloads_in_flight " << snapshot.downloads_in_flight << "\n";
    write_counter(out, "downloads_completed_total", "Downloads streamed to the end", snapshot.downloads_completed);
    write_counter(out, "downloads_aborted_total", "Downloads cut short by the client or a read failure",
                  snapshot.downloads_aborted);
    write_counter(out, "range_requests_total", "Downloads answered with 206", snapshot.range_requests);
    write_counter(out, "bytes_sent_total", "File bytes written to download responses", snapshot.bytes_sent);
    write_counter(out, "uploads_stored_total", "Uploaded files stored", snapshot.uploads_stored);
    write_counter(out, "uploads_failed_total", "Uploaded files dropped after an error", snapshot.uploads_failed);
    write_counter(out, "bytes_received_total", "Uploaded bytes written to disk", snapshot.bytes_received);
    write_counter(out, "metrics_scrapes_total", "Metrics scrapes",
                  metrics_scrapes_.load(std::memory_order_relaxed));

    return out.str();
}

auto MetricsCollector::snapshot_json() const -> json {
    auto snapshot = capture_snapshot();
    return snapshot_json(snapshot);
}

auto MetricsCollector::snapshot_json(MetricsSnapshot const& snapshot) const -> json {
    json payload;
    payload["captured_at"] = format_timestamp(snapshot.captured_at);

    json request_stats;
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const* name   = kRouteMetricNames[i].second;
        auto const& stats  = snapshot.routes[i];
        double       avg_ms = stats.latency.count == 0
                                  ? 0.0
                                  : static_cast<double>(stats.latency.sum_micros) / 1000.0
                                        / static_cast<double>(stats.latency.count);
        request_stats[name] = json{{"total", stats.total}, {"errors", stats.errors}, {"avg_ms", avg_ms}};
    }
    payload["requests"] = std::move(request_stats);

    payload["downloads"] = json{{"in_flight", snapshot.downloads_in_flight},
                                {"completed", snapshot.downloads_completed},
                                {"aborted", snapshot.downloads_aborted},
                                {"range_requests", snapshot.range_requests},
                                {"bytes_sent", snapshot.bytes_sent}};

    payload["uploads"] = json{{"stored", snapshot.uploads_stored},
                              {"failed", snapshot.uploads_failed},
                              {"bytes_received", snapshot.bytes_received}};

    return payload;
}

RequestMetricsScope::RequestMetricsScope(MetricsCollector& metrics,
                                         RouteMetric       route,
                                         httplib::Response& res)
    : metrics_{metrics}
    , route_{route}
    , response_{res}
    , start_{std::chrono::steady_clock::now()} {}

RequestMetricsScope::~RequestMetricsScope() {
    auto duration = std::chrono::steady_clock::now() - start_;
    metrics_.record_request(route_,
                            response_.status,
                            std::chrono::duration_cast<std::chrono::microseconds>(duration));
}

} // namespace QD::Web
