// user_mode.cpp
//
// In user mode only output marked as user-facing reaches the screen;
// everything still goes to the log.
//
// Compile: g++ -std=c++11 -I include examples/user_mode.cpp -o user_mode -pthread

#include "prism_con.hpp"
#include <stdexcept>
#include <string>

int main() {
    prism::Console console(prism::ConsoleOptions()
                               .setLogPath("user_mode.log")
                               .setUserMode(true)
                               .applyEnvironment());

    console.print("internal detail: cache warmed\n");   // log only
    {
        auto scope = console.user();
        console.print("Welcome!\n");                   // screen and log
    }

    try {
        std::string name = prism::userInput(console, "Your name: ");
        std::string secret = prism::userInput(console, "Password: ", false);
        auto scope = console.user();
        console.print("Hello " + name + ", your password has " +
                      std::to_string(secret.size()) + " characters\n");
    } catch (const std::runtime_error &e) {
        auto scope = console.userErr();
        console.printErr(std::string("input ended: ") + e.what() + "\n");
    }

    console.printErr("hidden error, logged only\n");
    {
        auto scope = console.userErr();
        console.printErr("visible error\n");
    }
    return 0;
}
