#ifndef PRISM_CON_EXCEPTION_PRINTER_HPP
#define PRISM_CON_EXCEPTION_PRINTER_HPP

#include "console.hpp"
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <typeinfo>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace prism {
namespace detail {

    /// Causes listed below this depth are dropped.
    constexpr int kMaxCauseDepth = 16;

    /// "type: message" for one exception, with the type demangled where
    /// the ABI allows it.
    inline std::string describeException(const std::exception &ex) {
        std::string type = typeid(ex).name();
#if defined(__GNUC__) || defined(__clang__)
        int status = 0;
        std::unique_ptr<char, void (*)(void *)> readable(
            abi::__cxa_demangle(type.c_str(), nullptr, nullptr, &status), std::free);
        if (status == 0 && readable) type = readable.get();
#endif
        const char *what = ex.what();
        return type + ": " + (what ? what : "");
    }

    /// Appends one "  caused by ..." line per nested exception, innermost last.
    inline void appendCauses(const std::exception &ex, std::string &trace, int depth) {
        if (depth >= kMaxCauseDepth) return;
        try {
            std::rethrow_if_nested(ex);
        } catch (const std::exception &cause) {
            trace += "  caused by " + describeException(cause) + "\n";
            appendCauses(cause, trace, depth + 1);
        } catch (...) {
            trace += "  caused by unknown exception\n";
        }
    }

    /// The trace printed for @p ex:
    /// @code
    ///   std::runtime_error: outer
    ///     caused by std::logic_error: inner
    /// @endcode
    inline std::string exceptionTrace(const std::exception &ex) {
        std::string trace = describeException(ex) + "\n";
        appendCauses(ex, trace, 0);
        return trace;
    }

} // namespace detail

    /// Route @p ex, with its nested causes, through the Error Sink as one
    /// block whose header carries @p message.
    inline void printException(Console &console, const std::exception &ex,
                               const std::string &message = "Exception Details") {
        std::string trace = detail::exceptionTrace(ex);
        ScopedValue<std::string> header = console.errHeader(" " + message + " ");
        console.printErr(trace);
    }

    /// Print the exception currently being handled.  Call from a catch block;
    /// does nothing when no exception is active.
    /// @code
    ///   try { run(); } catch (...) { prism::printException(console); }
    /// @endcode
    inline void printException(Console &console, const std::string &message = "Exception Details") {
        std::exception_ptr current = std::current_exception();
        if (!current) return;
        try {
            std::rethrow_exception(current);
        } catch (const std::exception &ex) {
            printException(console, ex, message);
        } catch (...) {
            ScopedValue<std::string> header = console.errHeader(" " + message + " ");
            console.printErr("unknown exception\n");
        }
    }

} // namespace prism

#endif // PRISM_CON_EXCEPTION_PRINTER_HPP
