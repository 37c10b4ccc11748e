#include <gtest/gtest.h>
#include "prism_con.hpp"
#include "utils/test_utils.hpp"
#include <chrono>
#include <memory>

class OutputSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        TestUtils::cleanupLogFiles();
        build(false);
    }

    void TearDown() override {
        out.reset();
        ctx.reset();
        TestUtils::cleanupLogFiles();
    }

    void build(bool colour) {
        out.reset();
        ctx = prism::detail::make_unique<prism::ConsoleContext>(
            prism::Palette::make(colour), "test", std::chrono::milliseconds(20));
        screen.clear();
        log.clear();
        out = prism::detail::make_unique<prism::OutputSink>(
            *ctx, screen.device(), std::shared_ptr<prism::ITransport>(log.device()));
    }

    ScreenCapture screen;
    ScreenCapture log;
    std::unique_ptr<prism::ConsoleContext> ctx;
    std::unique_ptr<prism::OutputSink> out;
};

// --- Visibility ---

TEST_F(OutputSinkTest, WriteReachesScreenAndLog) {
    out->write("hello\n");
    EXPECT_EQ(screen.text(), "hello\n");
    EXPECT_EQ(log.text(), "hello\n");
    EXPECT_EQ(out->last(), '\n');
}

TEST_F(OutputSinkTest, LastStartsEmpty) {
    EXPECT_EQ(out->last(), '\0');
    out->write("partial");
    EXPECT_EQ(out->last(), 'l');
}

TEST_F(OutputSinkTest, UserModeHidesDefaultRole) {
    ctx->setUserMode(true);
    out->write("hello\n");
    EXPECT_EQ(screen.text(), "");
    EXPECT_EQ(log.text(), "hello\n");
}

TEST_F(OutputSinkTest, UserRoleShowsInUserMode) {
    ctx->setUserMode(true);
    {
        prism::ScopedValue<bool> scope = out->scopeRole(prism::Role::User, true);
        out->write("hello\n");
    }
    EXPECT_EQ(screen.text(), "hello\n");
    EXPECT_EQ(log.text(), "hello\n");
}

TEST_F(OutputSinkTest, FileOnlySkipsScreen) {
    {
        prism::ScopedValue<bool> scope = out->scopeRole(prism::Role::FileOnly, true);
        out->write("log only\n");
    }
    out->write("both\n");
    EXPECT_EQ(screen.text(), "both\n");
    EXPECT_EQ(log.text(), "log only\nboth\n");
}

TEST_F(OutputSinkTest, VisibilityDecidedAtWriteTime) {
    out->setAllowed(false);
    out->write("queued\n");
    ctx->setUserMode(true);
    out->setAllowed(true);
    out->drainPending();
    EXPECT_EQ(screen.text(), "queued\n");
}

// --- Queueing ---

TEST_F(OutputSinkTest, QueuesWhileNotAllowed) {
    out->setAllowed(false);
    out->write("one\n");
    out->write("two\n");
    EXPECT_EQ(out->pendingCount(), 2u);
    EXPECT_EQ(screen.text(), "");
    EXPECT_EQ(log.text(), "");

    out->setAllowed(true);
    out->drainPending();
    EXPECT_EQ(out->pendingCount(), 0u);
    EXPECT_EQ(screen.text(), "one\ntwo\n");
    EXPECT_EQ(log.text(), "one\ntwo\n");
}

TEST_F(OutputSinkTest, DrainPendingDoesNothingWhileHeld) {
    out->setAllowed(false);
    out->write("one\n");
    out->drainPending();
    EXPECT_EQ(out->pendingCount(), 1u);
}

TEST_F(OutputSinkTest, CloseDrainsQueue) {
    out->write("partial");
    out->close();
    EXPECT_EQ(screen.text(), "partial");
    EXPECT_EQ(log.text(), "partial");
}

TEST_F(OutputSinkTest, CloseKeepsHeldRecords) {
    out->setAllowed(false);
    out->write("late\n");
    out->close();
    EXPECT_EQ(screen.text(), "");
    EXPECT_EQ(out->pendingCount(), 1u);

    // the error block that held them releases them when it ends
    out->setAllowed(true);
    out->drainPending();
    EXPECT_EQ(screen.text(), "late\n");
    EXPECT_EQ(log.text(), "late\n");
}

TEST_F(OutputSinkTest, WriteScreenBypassesLogAndUserMode) {
    ctx->setUserMode(true);
    out->writeScreen("Prompt> ");
    EXPECT_EQ(screen.text(), "Prompt> ");
    EXPECT_EQ(log.text(), "");
}

// --- Line-completed hook ---

TEST_F(OutputSinkTest, HookRunsOnLineBoundary) {
    int calls = 0;
    out->onLineCompleted([&calls]() { ++calls; });
    out->write("partial");
    EXPECT_EQ(calls, 0);
    out->write(" done\n");
    EXPECT_EQ(calls, 1);
}

TEST_F(OutputSinkTest, HookNotRunWhileHeld) {
    int calls = 0;
    out->onLineCompleted([&calls]() { ++calls; });
    out->setAllowed(false);
    out->write("line\n");
    EXPECT_EQ(calls, 0);
}

TEST_F(OutputSinkTest, HookMayTakeTheLock) {
    bool ran = false;
    prism::ConsoleContext &context = *ctx;
    out->onLineCompleted([&]() {
        std::lock_guard<std::recursive_mutex> lock(context.mutex());
        ran = true;
    });
    out->write("line\n");
    EXPECT_TRUE(ran);
}

// --- Colour ---

TEST_F(OutputSinkTest, DefaultRoleIsDull) {
    build(true);
    const prism::Palette &p = ctx->palette();
    out->write("text");
    EXPECT_EQ(screen.text(), p.none + p.dull + "text");
    EXPECT_EQ(log.text(), "text");
}

TEST_F(OutputSinkTest, ColourPriority) {
    build(true);
    const prism::Palette &p = ctx->palette();
    prism::ScopedValue<bool> user = out->scopeRole(prism::Role::User, true);
    EXPECT_EQ(out->processText("x"), p.none + p.user + "x");
    {
        prism::ScopedValue<bool> warn = out->scopeRole(prism::Role::Warn, true);
        EXPECT_EQ(out->processText("x"), p.none + p.warn + "x");
        prism::ScopedValue<bool> error = out->scopeRole(prism::Role::Error, true);
        EXPECT_EQ(out->processText("x"), p.none + p.error + "x");
    }
    EXPECT_EQ(out->processText("x"), p.none + p.user + "x");
}

TEST_F(OutputSinkTest, StatusWordsHighlighted) {
    build(true);
    const prism::Palette &p = ctx->palette();
    std::string formatted = out->processText("a ERRO b");
    EXPECT_NE(formatted.find(p.error + "ERRO"), std::string::npos);
}

TEST_F(OutputSinkTest, ScopedKeywordsHighlighted) {
    build(true);
    const prism::Palette &p = ctx->palette();
    prism::KeywordMaps maps;
    maps.high["alpha"] = "";
    maps.low["beta"] = "";
    {
        prism::ScopedValue<prism::KeywordMaps> scope = out->scopeKeywords(maps);
        std::string formatted = out->processText("alpha and beta");
        EXPECT_NE(formatted.find(p.highlight + "alpha"), std::string::npos);
        EXPECT_NE(formatted.find(p.lowlight + "beta"), std::string::npos);
    }
    EXPECT_TRUE(out->keywords().high.empty());
}

TEST_F(OutputSinkTest, GlobalHighlights) {
    build(true);
    const prism::Palette &p = ctx->palette();
    prism::WordColourMap global;
    global["server"] = "";
    ctx->setHighlights(global);
    EXPECT_NE(out->processText("the server").find(p.highlight + "server"), std::string::npos);
}

TEST_F(OutputSinkTest, CloseResetsColour) {
    build(true);
    out->write("x");
    out->close();
    const std::string text = screen.text();
    const std::string &none = ctx->palette().none;
    ASSERT_GE(text.size(), none.size());
    EXPECT_EQ(text.substr(text.size() - none.size()), none);
}

// --- Failures ---

TEST_F(OutputSinkTest, FailingLogReportedOnceAndScreenContinues) {
    std::shared_ptr<prism::ITransport> badLog(new prism::CallbackTransport(
        [](const std::string &) { throw std::runtime_error("disk full"); }));
    prism::OutputSink sink(*ctx, screen.device(), badLog);
    screen.clear();
    sink.write("one\n");
    sink.write("two\n");
    const std::string text = screen.text();
    EXPECT_EQ(TestUtils::countOccurrences(text, "[PrismCon][OutputSink] log write failed: disk full"), 1u);
    EXPECT_NE(text.find("one\n"), std::string::npos);
    EXPECT_NE(text.find("two\n"), std::string::npos);
}
