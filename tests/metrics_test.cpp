#include "test_support.hpp"

#include "runtime/metrics.hpp"

#include <gtest/gtest.h>

using namespace rp::engine;
using rp::engine::testing::wait_for_condition;

namespace {

struct SampleLog {
  std::mutex mutex;
  std::vector<AutoscalingSample> samples;

  auto count() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex);
    return samples.size();
  }
};

auto fast_options() -> MetricsOptions {
  MetricsOptions options;
  options.gauge_period = std::chrono::milliseconds(10);
  options.autoscaling_record_period = std::chrono::milliseconds(5);
  return options;
}

auto fast_autoscaling() -> AutoscalingConfig {
  AutoscalingConfig config;
  config.metrics_interval = std::chrono::milliseconds(20);
  config.look_back_period = std::chrono::seconds(5);
  return config;
}

} // namespace

TEST(LatencyHistogram, BucketsByUpperBound) {
  LatencyHistogram histogram;
  ASSERT_EQ(histogram.boundaries().size(), 19u);
  ASSERT_EQ(histogram.bucket_counts().size(), 20u);

  histogram.observe(0.4);
  histogram.observe(1.0);
  histogram.observe(3.0);
  histogram.observe(700000.0);

  EXPECT_EQ(histogram.bucket_counts()[0], 2u);
  EXPECT_EQ(histogram.bucket_counts()[2], 1u);
  EXPECT_EQ(histogram.bucket_counts()[19], 1u);
  EXPECT_EQ(histogram.count(), 4u);
  EXPECT_DOUBLE_EQ(histogram.sum(), 700004.4);
}

TEST(InMemoryMetricsStore, WindowAverageAndPrune) {
  InMemoryMetricsStore store;
  const auto t0 = InMemoryMetricsStore::Clock::now();
  store.add_metrics_point({{"r1", 2.0}, {"r2", 10.0}}, t0);
  store.add_metrics_point({{"r1", 4.0}}, t0 + std::chrono::seconds(1));
  store.add_metrics_point({{"r1", 6.0}}, t0 + std::chrono::seconds(2));

  EXPECT_DOUBLE_EQ(*store.window_average("r1", t0), 4.0);
  EXPECT_DOUBLE_EQ(*store.window_average("r1", t0 + std::chrono::seconds(1)), 5.0);
  EXPECT_FALSE(store.window_average("r1", t0 + std::chrono::seconds(3)));
  EXPECT_FALSE(store.window_average("missing", t0));

  store.prune(t0 + std::chrono::seconds(2));
  EXPECT_DOUBLE_EQ(*store.window_average("r1", t0), 6.0);
  EXPECT_FALSE(store.window_average("r2", t0));
}

TEST(ReplicaMetricsManager, CountsRequestsPerRoute) {
  ReplicaMetricsManager metrics("greeter#a", DeploymentId{"", "greeter"},
                                [] { return QueueDepth{}; }, std::nullopt);
  metrics.record_request("/greet", "OK", 3.0, false);
  metrics.record_request("/greet", "ERROR", 12.0, true);
  metrics.record_request("/greet", "CANCELLED", 1.0, true);
  metrics.record_request("/other", "OK", 0.5, false);

  auto snapshot = metrics.snapshot();
  EXPECT_EQ(snapshot.replica_starts, 1u);
  const auto &greet = snapshot.routes.at("/greet");
  EXPECT_EQ(greet.requests, 1u);
  EXPECT_EQ(greet.errors, 2u);
  EXPECT_EQ(greet.latency_ms.count(), 3u);
  EXPECT_EQ(snapshot.routes.at("/other").requests, 1u);
}

TEST(ReplicaMetricsManager, RefreshesGauges) {
  ReplicaMetricsManager metrics("greeter#a", DeploymentId{"", "greeter"},
                                [] { return QueueDepth{2, 3}; }, std::nullopt, {},
                                fast_options());
  EXPECT_EQ(metrics.current_queue_depth().total(), 5u);
  metrics.start();
  ASSERT_TRUE(wait_for_condition(
      [&] {
        auto snapshot = metrics.snapshot();
        return snapshot.pending_gauge == 2 && snapshot.processing_gauge == 3;
      },
      std::chrono::seconds(5)));
  metrics.shutdown();
  metrics.shutdown();
}

TEST(ReplicaMetricsManager, PushesAutoscalingWindowAverage) {
  auto log = std::make_shared<SampleLog>();
  ReplicaMetricsManager metrics(
      "app#greeter#a", DeploymentId{"app", "greeter"}, [] { return QueueDepth{1, 3}; },
      fast_autoscaling(),
      [log](const AutoscalingSample &sample) {
        std::lock_guard<std::mutex> lock(log->mutex);
        log->samples.push_back(sample);
      },
      fast_options());
  metrics.start();

  ASSERT_TRUE(wait_for_condition(
      [&] {
        std::lock_guard<std::mutex> lock(log->mutex);
        for (const auto &sample : log->samples) {
          if (sample.window_average && *sample.window_average == 4.0) {
            return true;
          }
        }
        return false;
      },
      std::chrono::seconds(5)));
  {
    std::lock_guard<std::mutex> lock(log->mutex);
    EXPECT_EQ(log->samples.front().replica_tag, "app#greeter#a");
  }

  metrics.set_autoscaling_config(std::nullopt);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  const auto settled = log->count();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(log->count(), settled);
  metrics.shutdown();
}

TEST(ReplicaMetricsManager, AutoscalingEnabledByReconfigure) {
  auto log = std::make_shared<SampleLog>();
  ReplicaMetricsManager metrics(
      "greeter#a", DeploymentId{"", "greeter"}, [] { return QueueDepth{0, 1}; },
      std::nullopt,
      [log](const AutoscalingSample &sample) {
        std::lock_guard<std::mutex> lock(log->mutex);
        log->samples.push_back(sample);
      },
      fast_options());
  metrics.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  EXPECT_EQ(log->count(), 0u);

  metrics.set_autoscaling_config(fast_autoscaling());
  EXPECT_TRUE(wait_for_condition([&] { return log->count() > 0; },
                                 std::chrono::seconds(5)));
  metrics.shutdown();
}
