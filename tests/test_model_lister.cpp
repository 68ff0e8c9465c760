#include "model_lister.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>

TEST(ModelLister, ParsesFirstColumnAndSkipsHeader) {
    const std::string listing =
        "NAME                ID              SIZE      MODIFIED\n"
        "llama3:latest       365c0bd3c000    4.7 GB    2 days ago\n"
        "qwen2.5:7b          845dbda0ea48    4.7 GB    3 weeks ago\n"
        "\n";
    auto models = ModelLister::parse(listing);
    ASSERT_EQ(models.size(), 2u);
    EXPECT_EQ(models[0], "llama3:latest");
    EXPECT_EQ(models[1], "qwen2.5:7b");
}

TEST(ModelLister, HeaderOnlyOrEmpty) {
    EXPECT_TRUE(ModelLister::parse("").empty());
    EXPECT_TRUE(ModelLister::parse("NAME ID SIZE MODIFIED\n").empty());
}

TEST(ModelLister, LeadingBlankLinesAndIndentedRows) {
    auto models = ModelLister::parse("\n\nNAME ID\nphi3 abc\n   orphan\nmistral\tdef\n");
    ASSERT_EQ(models.size(), 2u);
    EXPECT_EQ(models[0], "phi3");
    EXPECT_EQ(models[1], "mistral");
}

struct ListOutcome {
    std::vector<std::string> models;
    std::string error;
    bool called = false;
};

static ListOutcome list_with(const std::string& executable) {
    boost::asio::io_context ioc;
    ModelLister lister(ioc, executable);
    ListOutcome out;
    lister.async_list([&](std::vector<std::string> models, std::string error) {
        out.models = std::move(models);
        out.error = std::move(error);
        out.called = true;
    });
    ioc.run();
    return out;
}

TEST(ModelLister, RunsListSubcommand) {
    TempDir dir;
    auto exe = dir.script("fake-ollama",
        "[ \"$1\" = list ] || { echo \"unexpected $1\" >&2; exit 2; }\n"
        "echo 'NAME ID SIZE MODIFIED'\n"
        "echo 'llama3:latest 1 4GB now'\n"
        "echo 'phi3:mini 2 2GB now'");
    auto out = list_with(exe.string());
    ASSERT_TRUE(out.called);
    EXPECT_EQ(out.error, "");
    EXPECT_EQ(out.models, (std::vector<std::string>{"llama3:latest", "phi3:mini"}));
}

TEST(ModelLister, NonZeroExitReportsStderr) {
    TempDir dir;
    auto exe = dir.script("fake-ollama", "echo 'could not connect to ollama app' >&2\nexit 1");
    auto out = list_with(exe.string());
    ASSERT_TRUE(out.called);
    EXPECT_EQ(out.error.rfind("Ollama list failed: ", 0), 0u) << out.error;
    EXPECT_NE(out.error.find("could not connect"), std::string::npos);
}

TEST(ModelLister, KilledBySignalIsAListFailure) {
    TempDir dir;
    auto exe = dir.script("fake-ollama", "echo 'listing aborted' >&2\nkill -KILL $$");
    auto out = list_with(exe.string());
    ASSERT_TRUE(out.called);
    EXPECT_EQ(out.error.rfind("Ollama list failed: ", 0), 0u) << out.error;
    EXPECT_NE(out.error.find("listing aborted"), std::string::npos);
}

TEST(ModelLister, MissingExecutable) {
    auto out = list_with("/nonexistent/dir/ollama");
    ASSERT_TRUE(out.called);
    EXPECT_EQ(out.error.rfind("Failed to execute ollama: ", 0), 0u) << out.error;
}
