#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

namespace httplib {
class Response;
}

namespace QD::Web {

enum class RouteMetric : std::size_t {
    List = 0,
    Upload,
    Download,
    Healthz,
    Metrics,
    Count,
};

class MetricsCollector {
public:
    struct HistogramSnapshot {
        static constexpr std::size_t kBucketCount = 10;
        std::array<std::uint64_t, kBucketCount>   buckets{};
        std::uint64_t                             count{0};
        std::uint64_t                             sum_micros{0};
    };

    struct MetricsSnapshot {
        struct RouteCounters {
            HistogramSnapshot latency;
            std::uint64_t     total{0};
            std::uint64_t     errors{0};
        };

        std::chrono::system_clock::time_point                                   captured_at{};
        std::array<RouteCounters, static_cast<std::size_t>(RouteMetric::Count)> routes{};
        std::int64_t                                                            downloads_in_flight{0};
        std::uint64_t                                                           downloads_completed{0};
        std::uint64_t                                                           downloads_aborted{0};
        std::uint64_t                                                           range_requests{0};
        std::uint64_t                                                           bytes_sent{0};
        std::uint64_t                                                           uploads_stored{0};
        std::uint64_t                                                           uploads_failed{0};
        std::uint64_t                                                           bytes_received{0};
    };

    void record_request(RouteMetric route,
                        int         status,
                        std::chrono::microseconds latency);

    void record_download_started(bool partial);
    void record_download_finished(bool completed);
    void record_bytes_sent(std::uint64_t bytes);
    void record_upload_stored();
    void record_upload_failed();
    void record_bytes_received(std::uint64_t bytes);

    auto capture_snapshot() const -> MetricsSnapshot;
    auto render_prometheus() const -> std::string;
    auto render_prometheus(MetricsSnapshot const& snapshot) const -> std::string;
    auto snapshot_json() const -> nlohmann::json;
    auto snapshot_json(MetricsSnapshot const& snapshot) const -> nlohmann::json;

private:
    class Histogram {
    public:
        void observe(std::chrono::microseconds value);
        auto snapshot() const -> HistogramSnapshot;
        static auto bucket_boundaries() -> std::array<double, HistogramSnapshot::kBucketCount> const&;

    private:
        // Downloads of large files keep a request open for minutes.
        static constexpr std::array<double, HistogramSnapshot::kBucketCount> kLatencyBucketsMs{
            1.0,     10.0,    50.0,     250.0,    1000.0,
            5000.0,  30000.0, 120000.0, 600000.0, std::numeric_limits<double>::infinity()};

        std::array<std::atomic<std::uint64_t>, HistogramSnapshot::kBucketCount> buckets_{};
        std::atomic<std::uint64_t>                                               count_{0};
        std::atomic<std::uint64_t>                                               sum_micros_{0};
    };

    struct RouteCounters {
        Histogram                  latency;
        std::atomic<std::uint64_t> total{0};
        std::atomic<std::uint64_t> errors{0};
    };

    std::array<RouteCounters, static_cast<std::size_t>(RouteMetric::Count)> routes_{};
    std::atomic<std::int64_t>                                            downloads_in_flight_{0};
    std::atomic<std::uint64_t>                                           downloads_completed_{0};
    std::atomic<std::uint64_t>                                           downloads_aborted_{0};
    std::atomic<std::uint64_t>                                           range_requests_{0};
    std::atomic<std::uint64_t>                                           bytes_sent_{0};
    std::atomic<std::uint64_t>                                           uploads_stored_{0};
    std::atomic<std::uint64_t>                                           uploads_failed_{0};
    std::atomic<std::uint64_t>                                           bytes_received_{0};
    mutable std::atomic<std::uint64_t>                                   metrics_scrapes_{0};
};

class RequestMetricsScope {
public:
    RequestMetricsScope(MetricsCollector& metrics, RouteMetric route, httplib::Response& res);
    ~RequestMetricsScope();

private:
    MetricsCollector&                     metrics_;
    RouteMetric                           route_;
    httplib::Response&                    response_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace QD::Web
