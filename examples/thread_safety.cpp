// thread_safety.cpp
//
// Demonstrates several threads sharing one console.
//
// Console thread safety contract:
// - every write is serialized by one console lock, so lines never interleave
// - error output from any thread joins the currently open error block
// - normal output written while an error block is on screen is held back
//   and printed right after the block closes
// - scoped switches (user(), warn(), pre(), ...) change shared state
// - the Console must outlive all writing threads
//
// Compile: g++ -std=c++11 -I include examples/thread_safety.cpp -o thread_safety -pthread

#include "prism_con.hpp"
#include <chrono>
#include <sstream>
#include <thread>
#include <vector>

int main() {
    prism::Con::init(prism::ConsoleOptions().setLogPath("threads.log").applyEnvironment());

    // ---------------------------------------------------------------
    // 1. Multiple threads writing concurrently
    // ---------------------------------------------------------------
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.push_back(std::thread([t]() {
            for (int i = 0; i < 5; ++i) {
                std::ostringstream line;
                line << "worker " << t << " step " << i << "\n";
                prism::Con::out(line.str());
                if (i == 2) {
                    prism::Con::err("worker " + std::to_string(t) + " hit a recoverable error\n");
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        }));
    }
    for (size_t i = 0; i < workers.size(); ++i) {
        workers[i].join();
    }

    // ---------------------------------------------------------------
    // 2. A contiguous multi-line report
    // ---------------------------------------------------------------
    {
        std::shared_ptr<prism::Console> console = prism::Con::instance();
        auto hold = console->batch();
        console->print("report:\n");
        console->print("  workers: 4\n");
        console->print("  steps:   20\n");
    }

    prism::Con::shutdown();
    return 0;
}
