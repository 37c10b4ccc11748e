#ifndef PRISM_CON_GLOBAL_HPP
#define PRISM_CON_GLOBAL_HPP

#include "console.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace prism {

    /// Process-wide "installed console" facade.
    ///
    /// Code that has no Console reference writes through Con::out() and
    /// Con::err(), which route to whichever console is installed.  The
    /// standard streams themselves are never hijacked.
    ///
    /// Usage:
    /// @code
    ///   prism::Con::init(prism::ConsoleOptions().setLogPath("app.log"));
    ///   prism::Con::out("Hello\n");
    ///   prism::Con::shutdown();
    /// @endcode
    ///
    /// Thread safety: every call copies the shared_ptr under a mutex and
    /// writes outside it, so concurrent writers are only serialized by the
    /// console lock.  A write that already obtained the console completes
    /// safely even if shutdown() runs concurrently; once the console is
    /// closed such a write reaches the device but no longer the log.
    class Con {
    public:
        Con() = delete;

        /// Build a console from @p options and install it.
        /// @throws std::runtime_error if the log file cannot be opened.
        static std::shared_ptr<Console> init(const ConsoleOptions &options = ConsoleOptions()) {
            std::shared_ptr<Console> console = std::make_shared<Console>(options);
            install(console);
            return console;
        }

        /// Install @p console, returning the previously installed one (if any).
        /// The previous console is not closed.
        static std::shared_ptr<Console> install(std::shared_ptr<Console> console) {
            std::lock_guard<std::mutex> lock(mutex());
            storage().swap(console);
            return console;
        }

        /// Uninstall and return the current console without closing it.
        static std::shared_ptr<Console> uninstall() {
            std::shared_ptr<Console> old;
            {
                std::lock_guard<std::mutex> lock(mutex());
                old = std::move(storage());
            }
            return old;
        }

        /// Uninstall and close the current console.
        static void shutdown() {
            std::shared_ptr<Console> old = uninstall();
            if (old) {
                old->close();
            }
        }

        static bool isInstalled() {
            std::lock_guard<std::mutex> lock(mutex());
            return storage() != nullptr;
        }

        /// @throws std::logic_error if no console is installed.
        static std::shared_ptr<Console> instance() {
            std::lock_guard<std::mutex> lock(mutex());
            std::shared_ptr<Console> ptr = storage();
            if (!ptr) {
                throw std::logic_error(
                    "prism::Con has no console installed. Call Con::init() or "
                    "Con::install() first.");
            }
            return ptr;
        }

        static void out(const std::string &text) { instance()->print(text); }
        static void err(const std::string &text) { instance()->printErr(text); }

    private:
        static std::shared_ptr<Console> &storage() {
            static std::shared_ptr<Console> s_console;
            return s_console;
        }

        static std::mutex &mutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

} // namespace prism

#endif // PRISM_CON_GLOBAL_HPP
