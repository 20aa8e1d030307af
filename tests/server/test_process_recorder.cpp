#include <gtest/gtest.h>
#include "mqttd/server/protocols/http/process_recorder.h"
#include <thread>

using namespace mqttd::server::protocols::http;

TEST(ProcessRecorderTest, SampleNowReadsProcSelf) {
    ProcessRecorder recorder(ProcessRecorder::Options{});
    ASSERT_TRUE(recorder.sampleNow());

    auto samples = recorder.samples();
    ASSERT_EQ(samples.size(), 1u);
    EXPECT_GT(samples[0].threads, 0);
    EXPECT_GT(samples[0].rssBytes, 0u);
    EXPECT_GT(samples[0].vmsBytes, 0u);
    EXPECT_GT(samples[0].openFiles, 0u);
    EXPECT_DOUBLE_EQ(samples[0].cpuPercent, 0.0);
}

TEST(ProcessRecorderTest, StartTakesAFirstSample) {
    ProcessRecorder recorder(ProcessRecorder::Options{});
    EXPECT_FALSE(recorder.isRunning());

    recorder.start();
    EXPECT_TRUE(recorder.isRunning());
    EXPECT_EQ(recorder.samples().size(), 1u);

    recorder.stop();
    EXPECT_FALSE(recorder.isRunning());
    recorder.stop();
}

TEST(ProcessRecorderTest, SamplesOnTheInterval) {
    ProcessRecorder::Options options;
    options.interval = std::chrono::milliseconds(20);
    ProcessRecorder recorder(options);

    recorder.start();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (recorder.samples().size() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    recorder.stop();

    EXPECT_GE(recorder.samples().size(), 3u);
}

TEST(ProcessRecorderTest, RetentionEvictsOldSamples) {
    ProcessRecorder::Options options;
    options.retention = std::chrono::milliseconds(0);
    ProcessRecorder recorder(options);

    ASSERT_TRUE(recorder.sampleNow());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(recorder.sampleNow());

    EXPECT_EQ(recorder.samples().size(), 1u);
}

TEST(ProcessRecorderTest, JsonCarriesNameIntervalAndRecords) {
    ProcessRecorder::Options options;
    options.name = "Test Broker";
    options.interval = std::chrono::seconds(30);
    ProcessRecorder recorder(options);
    ASSERT_TRUE(recorder.sampleNow());

    auto json = recorder.toJson();
    EXPECT_EQ(json["name"], "Test Broker");
    EXPECT_EQ(json["interval_seconds"], 30);
    ASSERT_EQ(json["records"].size(), 1u);

    const auto& record = json["records"][0];
    EXPECT_TRUE(record.contains("time"));
    EXPECT_TRUE(record.contains("cpu_percent"));
    EXPECT_TRUE(record.contains("rss"));
    EXPECT_TRUE(record.contains("vms"));
    EXPECT_TRUE(record.contains("threads"));
    EXPECT_TRUE(record.contains("open_files"));
}
