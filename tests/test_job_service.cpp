#include "job_service.hpp"
#include "validation.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <set>

namespace {

Job make_job(std::string model, std::string prompt = "p") {
    Job j;
    j.model = std::move(model);
    j.prompt = std::move(prompt);
    return j;
}

// Sleeps for the seconds encoded in the model name ("m0.2" -> 0.2s), then
// prints the model name.
ServiceConfig sleepy_config() {
    ServiceConfig cfg;
    cfg.run_command = sh_runtime("d=${1#m}; sleep \"$d\"; printf %s \"$1\"");
    return cfg;
}

} // namespace

TEST(JobService, RunOneReturnsProcessResult) {
    RecordingSink sink;
    ServiceConfig cfg;
    cfg.run_command = sh_runtime("cat; echo \"ran $1\" >&2");
    JobService service(sink, cfg);

    auto r = service.run_one(make_job("llama3", "hello"));
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.stdout_text, "hello\n");
    EXPECT_EQ(r.stderr_text, "ran llama3\n");
    EXPECT_FALSE(r.error);
    EXPECT_EQ(sink.count(), 1u);
}

TEST(JobService, InvalidSingleJobThrowsWithoutRecord) {
    RecordingSink sink;
    JobService service(sink, sleepy_config());
    EXPECT_THROW(service.run_one(make_job("")), ValidationError);
    EXPECT_THROW(service.run_one(make_job("a|b")), ValidationError);
    Job j = make_job("m0");
    j.options.temperature = 3.0;
    EXPECT_THROW(service.run_one(j), ValidationError);
    EXPECT_EQ(sink.count(), 0u);
}

TEST(JobService, RunManyKeepsOrderAndTagsRecords) {
    RecordingSink sink;
    JobService service(sink, sleepy_config());

    auto results = service.run_many(
        {make_job("m0.3"), make_job("m0.2"), make_job("m0.1"), make_job("m0")}, 4);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].stdout_text, "m0.3");
    EXPECT_EQ(results[1].stdout_text, "m0.2");
    EXPECT_EQ(results[2].stdout_text, "m0.1");
    EXPECT_EQ(results[3].stdout_text, "m0");
    for (const auto& r : results) EXPECT_EQ(r.exit_code, 0);

    auto recs = sink.records();
    ASSERT_EQ(recs.size(), 4u);
    std::set<std::string> ids;
    for (const auto& rec : recs) {
        ASSERT_TRUE(rec.batch_id);
        ids.insert(*rec.batch_id);
        EXPECT_EQ(rec.concurrency, std::optional<int>(4));
    }
    EXPECT_EQ(ids.size(), 1u);
}

TEST(JobService, RunManyRunsInParallel) {
    RecordingSink sink;
    JobService service(sink, sleepy_config());

    auto t0 = std::chrono::steady_clock::now();
    auto results = service.run_many({make_job("m0.4"), make_job("m0.4"), make_job("m0.4")}, 3);
    EXPECT_EQ(results.size(), 3u);
    EXPECT_LT(elapsed_ms(t0), 1100);
}

TEST(JobService, RunManyValidatesEverythingFirst) {
    RecordingSink sink;
    JobService service(sink, sleepy_config());
    EXPECT_THROW(service.run_many({make_job("m0"), make_job("bad;name")}), ValidationError);
    EXPECT_EQ(sink.count(), 0u);
}

TEST(JobService, TimedOutJobDoesNotHoldUpTheBatch) {
    RecordingSink sink;
    JobService service(sink, sleepy_config());

    Job slow = make_job("m30");
    slow.options.timeout = std::chrono::milliseconds(200);
    auto t0 = std::chrono::steady_clock::now();
    auto results = service.run_many({slow, make_job("m0")}, 2);
    EXPECT_LT(elapsed_ms(t0), 5000);

    ASSERT_EQ(results.size(), 2u);
    ASSERT_TRUE(results[0].error);
    EXPECT_EQ(*results[0].error, "Timeout exceeded");
    EXPECT_EQ(results[1].stdout_text, "m0");
}

TEST(JobService, ListModelsUsesConfiguredExecutable) {
    TempDir dir;
    auto exe = dir.script("ollama",
        "echo 'NAME ID SIZE MODIFIED'\n"
        "echo 'llama3:latest a 4GB now'\n"
        "echo 'mistral:7b b 4GB now'");
    RecordingSink sink;
    ServiceConfig cfg;
    cfg.ollama = exe.string();
    JobService service(sink, cfg);

    EXPECT_EQ(service.list_models(), (std::vector<std::string>{"llama3:latest", "mistral:7b"}));
    EXPECT_EQ(sink.count(), 0u);
}

TEST(JobService, ListModelsFailureThrowsListError) {
    TempDir dir;
    auto exe = dir.script("ollama", "echo 'server not running' >&2\nexit 1");
    RecordingSink sink;
    ServiceConfig cfg;
    cfg.ollama = exe.string();
    JobService service(sink, cfg);

    try {
        service.list_models();
        FAIL() << "expected ListError";
    } catch (const ListError& e) {
        EXPECT_NE(std::string(e.what()).find("server not running"), std::string::npos);
    }
}
