#include <benchmark/benchmark.h>
#include <cstdio>
#include <string>
#include "prism_con.hpp"
#include "null_transport.hpp"

#ifdef _WIN32
#include <process.h>
#include <windows.h>
#define BENCH_GETPID() _getpid()
static std::string tempDir() {
    char buf[MAX_PATH];
    GetTempPathA(MAX_PATH, buf);
    return std::string(buf);
}
#else
#include <unistd.h>
#define BENCH_GETPID() getpid()
static std::string tempDir() { return "/tmp/"; }
#endif

static std::string benchPath(const std::string& suffix) {
    return tempDir() + "prism_bench_" + std::to_string(BENCH_GETPID()) + "_" + suffix;
}

static std::unique_ptr<prism::Console> nullConsole(prism::ConsoleOptions options) {
    return prism::detail::make_unique<prism::Console>(
        options.setPrintLogName(false),
        prism::detail::make_unique<prism::NullTransport>(),
        prism::detail::make_unique<prism::NullTransport>());
}

// ---------------------------------------------------------------------------
// BM_Output_Plain
// Output Sink baseline: no colour, no log file.
// ---------------------------------------------------------------------------
static void BM_Output_Plain(benchmark::State& state) {
    std::unique_ptr<prism::Console> console = nullConsole(prism::ConsoleOptions().setColour(false));

    for (auto _ : state) {
        console->print("plain line\n");
        benchmark::ClobberMemory();
    }
    console->close();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Output_Plain);

// ---------------------------------------------------------------------------
// BM_Output_Colour
// Colourized output with the status keyword layer active.
// ---------------------------------------------------------------------------
static void BM_Output_Colour(benchmark::State& state) {
    std::unique_ptr<prism::Console> console = nullConsole(prism::ConsoleOptions().setColour(true));

    for (auto _ : state) {
        console->print("prism|STAT|26-01-01 00:00:00.000| worker ready\n");
        benchmark::ClobberMemory();
    }
    console->close();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Output_Colour);

// ---------------------------------------------------------------------------
// BM_Output_File
// Output Sink with an append-mode log flushed on every line.
// ---------------------------------------------------------------------------
static void BM_Output_File(benchmark::State& state) {
    std::string path = benchPath("out.log");
    {
        std::unique_ptr<prism::Console> console =
            nullConsole(prism::ConsoleOptions().setColour(false).setLogPath(path));

        for (auto _ : state) {
            console->print("logged line\n");
            benchmark::ClobberMemory();
        }
        console->close();
        state.SetItemsProcessed(state.iterations());
    }
    std::remove(path.c_str());
}
BENCHMARK(BM_Output_File);

// ---------------------------------------------------------------------------
// BM_Error_Enqueue
// Cost of a write into an open error block (queueing only; the block is
// drained once at close).
// ---------------------------------------------------------------------------
static void BM_Error_Enqueue(benchmark::State& state) {
    std::unique_ptr<prism::Console> console =
        nullConsole(prism::ConsoleOptions().setColour(false).setBatchIntervalMs(1000));

    for (auto _ : state) {
        console->printErr("error fragment\n");
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
    state.PauseTiming();
    console->close();
    state.ResumeTiming();
}
BENCHMARK(BM_Error_Enqueue);

// ---------------------------------------------------------------------------
// BM_Output_Contended
// Several threads printing through one console.
// ---------------------------------------------------------------------------
static prism::Console* g_shared = nullptr;

static void BM_Output_Contended(benchmark::State& state) {
    static std::unique_ptr<prism::Console> console;
    if (state.thread_index() == 0) {
        console = nullConsole(prism::ConsoleOptions().setColour(false));
        g_shared = console.get();
    }
    for (auto _ : state) {
        g_shared->print("contended line\n");
    }
    if (state.thread_index() == 0) {
        state.SetItemsProcessed(state.iterations() * state.threads());
        console.reset();
        g_shared = nullptr;
    }
}
BENCHMARK(BM_Output_Contended)->Threads(1)->Threads(4);
