#include <gtest/gtest.h>
#include "prism_con.hpp"
#include "utils/test_utils.hpp"
#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {
const char *const kLogPath = "prism_thread_test.log";
const int kThreads = 6;
const int kLines = 200;

std::string lineFor(const char *kind, int thread, int line) {
    std::ostringstream oss;
    oss << kind << " t" << thread << " line " << line << "\n";
    return oss.str();
}
} // anonymous namespace

class ThreadSafetyTest : public ::testing::Test {
protected:
    void SetUp() override { TestUtils::cleanupLogFiles(); }
    void TearDown() override { TestUtils::cleanupLogFiles(); }

    ScreenCapture screen;
    ScreenCapture errScreen;
};

TEST_F(ThreadSafetyTest, ConcurrentWritesStayWhole) {
    {
        prism::Console console(
            prism::ConsoleOptions().setColour(false).setPrintLogName(false)
                .setLogPath(kLogPath).setBatchIntervalMs(5),
            screen.device(), errScreen.device());

        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.push_back(std::thread([&console, t]() {
                for (int i = 0; i < kLines; ++i) {
                    if (i % 10 == 0) {
                        console.printErr(lineFor("err", t, i));
                    } else {
                        console.print(lineFor("out", t, i));
                    }
                }
            }));
        }
        for (size_t i = 0; i < threads.size(); ++i) {
            threads[i].join();
        }
    }

    const std::string logged = TestUtils::readLogFile(kLogPath);
    const std::string shown = screen.text();
    const std::string errors = errScreen.text();
    for (int t = 0; t < kThreads; ++t) {
        size_t lastOut = 0;
        size_t lastErr = 0;
        for (int i = 0; i < kLines; ++i) {
            // each sink logs in submission order
            const char *kind = (i % 10 == 0) ? "err" : "out";
            size_t pos = logged.find(lineFor(kind, t, i));
            ASSERT_NE(pos, std::string::npos);
            size_t &last = (i % 10 == 0) ? lastErr : lastOut;
            EXPECT_GE(pos, last);
            last = pos;

            if (i % 10 == 0) {
                std::string line = lineFor("err", t, i);
                EXPECT_EQ(TestUtils::countOccurrences(logged, line), 1u) << line;
                // error lines end with the block prefix on screen
                EXPECT_EQ(TestUtils::countOccurrences(errors, line + "+    "), 1u) << line;
            } else {
                std::string line = lineFor("out", t, i);
                EXPECT_EQ(TestUtils::countOccurrences(logged, line), 1u) << line;
                EXPECT_EQ(TestUtils::countOccurrences(shown, line), 1u) << line;
            }
        }
    }
}

TEST_F(ThreadSafetyTest, ScopedSwitchesAcrossThreads) {
    prism::Console console(prism::ConsoleOptions().setColour(false),
                           screen.device(), errScreen.device());
    console.setUserMode(true);

    std::thread userThread([&console]() {
        for (int i = 0; i < 100; ++i) {
            prism::ScopedValue<bool> user = console.user();
            console.print("U\n");
        }
    });
    std::thread otherThread([&console]() {
        for (int i = 0; i < 100; ++i) {
            console.print("H\n");
        }
    });
    userThread.join();
    otherThread.join();

    // the role switch is shared console state, so only the user lines are
    // guaranteed visible
    EXPECT_EQ(TestUtils::countOccurrences(screen.text(), "U\n"), 100u);
}

TEST_F(ThreadSafetyTest, FacadeUsedFromManyThreads) {
    std::shared_ptr<prism::Console> console = std::make_shared<prism::Console>(
        prism::ConsoleOptions().setColour(false), screen.device(), errScreen.device());
    prism::Con::install(console);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.push_back(std::thread([t]() {
            for (int i = 0; i < 50; ++i) {
                prism::Con::out(lineFor("out", t, i));
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }
    prism::Con::shutdown();

    EXPECT_EQ(TestUtils::countOccurrences(screen.text(), "\n"), 200u);
    EXPECT_TRUE(console->isClosed());
}

TEST_F(ThreadSafetyTest, ShutdownWhileFacadeWrites) {
    for (int round = 0; round < 50; ++round) {
        screen.clear();
        errScreen.clear();
        prism::Con::install(std::make_shared<prism::Console>(
            prism::ConsoleOptions().setColour(false).setPrintLogName(false)
                .setLogPath(kLogPath).setBatchIntervalMs(5),
            screen.device(), errScreen.device()));

        std::atomic<bool> started(false);
        std::thread writer([&started]() {
            for (;;) {
                std::shared_ptr<prism::Console> console;
                try {
                    console = prism::Con::instance();
                } catch (const std::logic_error &) {
                    return;
                }
                console->print("x\n");
                if (!started.exchange(true)) {
                    console->printErr("e\n");
                }
            }
        });
        while (!started.load()) {
            std::this_thread::yield();
        }
        prism::Con::shutdown();
        writer.join();

        // late writes reach the screen only; nothing reports a failure
        EXPECT_FALSE(screen.contains("[PrismCon]")) << screen.text();
        EXPECT_FALSE(errScreen.contains("[PrismCon]")) << errScreen.text();
        EXPECT_TRUE(screen.contains("x\n"));
    }
}

TEST_F(ThreadSafetyTest, TimestampsFormattedInParallel) {
    const std::chrono::system_clock::time_point base = std::chrono::system_clock::now();
    std::vector<std::chrono::system_clock::time_point> times;
    std::vector<std::string> expected;
    for (int t = 0; t < 4; ++t) {
        // days apart so a shared calendar buffer would show up as a wrong date
        times.push_back(base - std::chrono::hours(24 * 40 * t) + std::chrono::milliseconds(t));
        expected.push_back(prism::detail::formatTimestamp(times.back()));
    }

    std::atomic<int> mismatches(0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.push_back(std::thread([&, t]() {
            for (int i = 0; i < 2000; ++i) {
                if (prism::detail::formatTimestamp(times[t]) != expected[t]) {
                    ++mismatches;
                }
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}
