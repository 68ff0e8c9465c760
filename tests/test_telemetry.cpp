#include "telemetry.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <regex>

using json = nlohmann::json;

static RunTelemetryRecord sample_record() {
    RunTelemetryRecord r;
    r.model = "llama3";
    r.start = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    r.end = r.start + std::chrono::milliseconds(1500);
    r.duration_ms = 1500;
    r.exit_code = 0;
    r.output_chars = 42;
    return r;
}

TEST(Telemetry, Iso8601HasMillisecondsAndZulu) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    EXPECT_EQ(iso8601_utc(tp), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(iso8601_utc(std::chrono::system_clock::time_point{}), "1970-01-01T00:00:00.000Z");
}

TEST(Telemetry, RecordJsonFields) {
    json j = sample_record();
    EXPECT_EQ(j["model"], "llama3");
    EXPECT_EQ(j["timestamp"], "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(j["start"], j["timestamp"]);
    EXPECT_EQ(j["end"], "2023-11-14T22:13:21.623Z");
    EXPECT_EQ(j["duration_ms"], 1500);
    EXPECT_EQ(j["exit_code"], 0);
    EXPECT_EQ(j["output_chars"], 42);
    EXPECT_EQ(j["timed_out"], false);
    EXPECT_FALSE(j.contains("batch_id"));
    EXPECT_FALSE(j.contains("concurrency"));

    auto rec = sample_record();
    rec.batch_id = "batch_1_abcdef01";
    rec.concurrency = 3;
    rec.timed_out = true;
    rec.exit_code = -1;
    j = rec;
    EXPECT_EQ(j["batch_id"], "batch_1_abcdef01");
    EXPECT_EQ(j["concurrency"], 3);
    EXPECT_EQ(j["timed_out"], true);
    EXPECT_EQ(j["exit_code"], -1);
}

TEST(Telemetry, BatchIdsAreWellFormedAndDistinct) {
    const std::regex shape("batch_[0-9]+_[0-9a-f]{8}");
    std::string a = make_batch_id();
    std::string b = make_batch_id();
    EXPECT_TRUE(std::regex_match(a, shape)) << a;
    EXPECT_TRUE(std::regex_match(b, shape)) << b;
    EXPECT_NE(a, b);
}

TEST(Telemetry, JsonlSinkAppendsOneLinePerRecord) {
    TempDir dir;
    auto path = dir.path() / "nested" / "runs.jsonl";
    {
        JsonlTelemetrySink sink(path);
        auto rec = sample_record();
        sink.record(rec);
        rec.model = "mistral";
        rec.batch_id = "batch_9_00000000";
        sink.record(rec);
        sink.flush();
    }

    std::ifstream in(path);
    std::vector<json> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(json::parse(line));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["model"], "llama3");
    EXPECT_EQ(lines[1]["model"], "mistral");
    EXPECT_EQ(lines[1]["batch_id"], "batch_9_00000000");
}

TEST(Telemetry, JsonlSinkAppendsAcrossInstances) {
    TempDir dir;
    auto path = dir.path() / "runs.jsonl";
    for (int i = 0; i < 2; ++i) {
        JsonlTelemetrySink sink(path);
        sink.record(sample_record());
    }
    std::ifstream in(path);
    int n = 0;
    std::string line;
    while (std::getline(in, line)) ++n;
    EXPECT_EQ(n, 2);
}

TEST(Telemetry, UnwritablePathIsSwallowed) {
    TempDir dir;
    // A regular file where a directory is expected.
    auto blocker = dir.path() / "file";
    std::ofstream(blocker) << "x";
    JsonlTelemetrySink sink(blocker / "runs.jsonl");
    EXPECT_NO_THROW(sink.record(sample_record()));
    EXPECT_NO_THROW(sink.flush());
}

TEST(Telemetry, DefaultPathIsUnderCache) {
    auto p = JsonlTelemetrySink::default_path();
    EXPECT_EQ(p.filename().string(), "runs.jsonl");
    EXPECT_EQ(p.parent_path().filename().string(), "ollama-batch");
}
