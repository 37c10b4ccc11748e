// basic_usage.cpp
//
// Tour of the console: roles, status lines, highlighting and batched errors.
//
// Compile: g++ -std=c++11 -I include examples/basic_usage.cpp -o basic_usage -pthread

#include "prism_con.hpp"
#include <string>
#include <vector>

int main() {
    prism::ConsoleOptions options;
    options.setLogPath("app.log").setPrefix("app").applyEnvironment();
    prism::Console console(options);

    // Plain output, mirrored to the log
    console.print("Starting up\n");

    // Timestamped status lines
    console.logStat();
    console.print(" configuration loaded\n");
    console.logStat(prism::kStatusWarn);
    console.print(" cache directory missing, using /tmp\n");

    // Roles
    {
        auto scope = console.warn();
        console.print("Disk usage above 80%\n");
    }
    {
        auto scope = console.error();
        console.print("Upstream returned 503\n");
    }

    // Keyword highlighting
    {
        auto scope = console.highlight({"ready"}, {"debug"});
        console.print("Service ready (debug build)\n");
    }

    // Written to the log only
    {
        auto scope = console.fileOnly();
        console.print("build id 4f2a91\n");
    }

    // Error output is batched into one block with a header
    {
        auto header = console.errHeader(" Connection ");
        console.printErr("connect() timed out\n");
        console.printErr("retrying in 5s\n");
    }

    // Stream style
    console.out() << "Processed " << 128 << " records" << std::endl;

    console.print("Done\n");
    console.close();
    return 0;
}
