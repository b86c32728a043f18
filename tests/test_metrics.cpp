#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "metrics.hpp"

class RollingHistTest : public ::testing::Test {
protected:
    void SetUp() override {
        hist = std::make_unique<RollingHist>(5);  // Small capacity for testing
    }

    std::unique_ptr<RollingHist> hist;
};

TEST_F(RollingHistTest, EmptyHistogram) {
    EXPECT_EQ(hist->size(), 0u);
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 0.0);
    EXPECT_DOUBLE_EQ(hist->perc(95.0), 0.0);
}

TEST_F(RollingHistTest, SingleValue) {
    hist->add(42.0);
    EXPECT_EQ(hist->size(), 1u);
    EXPECT_DOUBLE_EQ(hist->perc(0.0), 42.0);
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 42.0);
    EXPECT_DOUBLE_EQ(hist->perc(100.0), 42.0);
}

TEST_F(RollingHistTest, MultipleValues) {
    // Add values: 1, 2, 3, 4, 5
    for (int i = 1; i <= 5; ++i) {
        hist->add(static_cast<double>(i));
    }
    
    EXPECT_EQ(hist->size(), 5u);
    EXPECT_DOUBLE_EQ(hist->perc(0.0), 1.0);   // Min value
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 3.0);  // Median
    EXPECT_DOUBLE_EQ(hist->perc(100.0), 5.0); // Max value
}

TEST_F(RollingHistTest, CapacityOverflow) {
    // Add 7 values to a capacity-5 histogram
    for (int i = 1; i <= 7; ++i) {
        hist->add(static_cast<double>(i));
    }
    
    EXPECT_EQ(hist->size(), 5u);  // Should cap at 5
    // Should contain values 3, 4, 5, 6, 7 (oldest dropped)
    EXPECT_DOUBLE_EQ(hist->perc(0.0), 3.0);
    EXPECT_DOUBLE_EQ(hist->perc(100.0), 7.0);
}

TEST_F(RollingHistTest, InterpolatesBetweenRanks) {
    hist->add(10.0);
    hist->add(20.0);

    // rank = 0.5 * (2 - 1) sits halfway between the two samples
    EXPECT_DOUBLE_EQ(hist->perc(50.0), 15.0);
    EXPECT_DOUBLE_EQ(hist->perc(25.0), 12.5);
}

TEST_F(RollingHistTest, OutOfRangePercentileIsClamped) {
    for (double v : {3.0, 1.0, 2.0}) hist->add(v);

    EXPECT_DOUBLE_EQ(hist->perc(-10.0), 1.0);
    EXPECT_DOUBLE_EQ(hist->perc(250.0), 3.0);
}

TEST_F(RollingHistTest, ThreadSafety) {
    const int num_threads = 4;
    const int values_per_thread = 100;
    
    std::vector<std::thread> threads;
    
    // Launch multiple threads to add values concurrently
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, values_per_thread]() {
            for (int i = 0; i < values_per_thread; ++i) {
                hist->add(static_cast<double>(t * values_per_thread + i));
            }
        });
    }
    
    // Wait for all threads to complete
    for (auto& thread : threads) {
        thread.join();
    }
    
    // Should have exactly 5 values due to capacity limit
    EXPECT_EQ(hist->size(), 5u);
    
    // All values should be valid (no corruption)
    double p50 = hist->perc(50.0);
    double p95 = hist->perc(95.0);
    EXPECT_GE(p50, 0.0);
    EXPECT_GE(p95, p50);
}

class MetricsRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry = std::make_unique<MetricsRegistry>();
    }

    std::unique_ptr<MetricsRegistry> registry;
};

TEST_F(MetricsRegistryTest, InitialState) {
    EXPECT_EQ(registry->frames_captured(), 0u);
    EXPECT_EQ(registry->frames_dropped(), 0u);
    EXPECT_EQ(registry->inference_failures(), 0u);
    auto s = registry->snapshot();
    EXPECT_DOUBLE_EQ(s.drop_rate, 0.0);
    EXPECT_DOUBLE_EQ(s.fps, 0.0);
}

TEST_F(MetricsRegistryTest, FrameCounters) {
    registry->inc_captured();
    registry->inc_captured();
    registry->inc_dropped();
    registry->inc_inference_failure();

    EXPECT_EQ(registry->frames_captured(), 2u);
    EXPECT_EQ(registry->frames_dropped(), 1u);
    EXPECT_EQ(registry->inference_failures(), 1u);
}

TEST_F(MetricsRegistryTest, TimingMetrics) {
    registry->add_capture(1.5);
    registry->add_inference(12.0);

    auto snapshot = registry->snapshot();
    EXPECT_DOUBLE_EQ(snapshot.capture_p50, 1.5);
    EXPECT_DOUBLE_EQ(snapshot.infer_p50, 12.0);
    EXPECT_DOUBLE_EQ(snapshot.infer_p99, 12.0);
}

TEST_F(MetricsRegistryTest, DropRateCalculation) {
    // 10 captured, 2 dropped by the inference slot
    for (int i = 0; i < 10; ++i) {
        registry->inc_captured();
    }
    registry->inc_dropped();
    registry->inc_dropped();

    auto snapshot = registry->snapshot();
    EXPECT_DOUBLE_EQ(snapshot.drop_rate, 0.2);
}

TEST_F(MetricsRegistryTest, JobCounters) {
    registry->inc_conversion(true);
    registry->inc_conversion(false);
    registry->inc_conversion(false);
    registry->inc_upload_failure();
    registry->inc_write_failure();

    auto s = registry->snapshot();
    EXPECT_EQ(s.conversions_ok, 1u);
    EXPECT_EQ(s.conversions_failed, 2u);
    EXPECT_EQ(s.uploads_failed, 1u);
    EXPECT_EQ(s.write_failures, 1u);
}

TEST_F(MetricsRegistryTest, PrometheusOutput) {
    registry->add_inference(5.0);
    registry->inc_captured();
    registry->set_fps(29.5);

    std::string text = registry->prometheus_text(registry->snapshot());

    EXPECT_NE(text.find("frames_captured_total 1"), std::string::npos);
    EXPECT_NE(text.find("frames_dropped_total 0"), std::string::npos);
    EXPECT_NE(text.find("inference_ms{quantile=\"0.95\"} 5"), std::string::npos);
    EXPECT_NE(text.find("conversions_total{result=\"failed\"}"), std::string::npos);
    EXPECT_NE(text.find("capture_fps 29.5"), std::string::npos);
}

TEST_F(MetricsRegistryTest, ConcurrentAccess) {
    const int num_threads = 4;
    const int operations_per_thread = 1000;

    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, operations_per_thread]() {
            for (int i = 0; i < operations_per_thread; ++i) {
                registry->add_capture(1.0);
                registry->inc_captured();
                if (i % 10 == 0) {
                    registry->inc_dropped();
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry->frames_captured(), static_cast<uint64_t>(num_threads * operations_per_thread));
    EXPECT_EQ(registry->frames_dropped(),
              static_cast<uint64_t>(num_threads * (operations_per_thread / 10)));
}
