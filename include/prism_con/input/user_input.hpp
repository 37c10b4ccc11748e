#ifndef PRISM_CON_USER_INPUT_HPP
#define PRISM_CON_USER_INPUT_HPP

#include "../console.hpp"
#include <iostream>
#include <istream>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <termios.h>
#include <unistd.h>
#endif

namespace prism {

    /// Placeholder logged in place of hidden input.
    static const char *const kMaskedInput = "********";

namespace detail {

    /// Turns terminal echo off for its lifetime when @p active and stdin is
    /// a terminal; otherwise does nothing.
    class EchoGuard {
    public:
        explicit EchoGuard(bool active) : m_active(false) {
            if (!active) return;
#ifdef _WIN32
            m_handle = GetStdHandle(STD_INPUT_HANDLE);
            if (m_handle == INVALID_HANDLE_VALUE) return;
            if (!GetConsoleMode(m_handle, &m_saved)) return;
            if (!SetConsoleMode(m_handle, m_saved & ~ENABLE_ECHO_INPUT)) return;
            m_active = true;
#else
            if (!isatty(STDIN_FILENO)) return;
            if (tcgetattr(STDIN_FILENO, &m_saved) != 0) return;
            termios silent = m_saved;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            if (tcsetattr(STDIN_FILENO, TCSANOW, &silent) != 0) return;
            m_active = true;
#endif
        }

        ~EchoGuard() {
            if (!m_active) return;
#ifdef _WIN32
            SetConsoleMode(m_handle, m_saved);
#else
            tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
        }

        EchoGuard(const EchoGuard &) = delete;
        EchoGuard &operator=(const EchoGuard &) = delete;

    private:
        bool m_active;
#ifdef _WIN32
        HANDLE m_handle;
        DWORD m_saved;
#else
        termios m_saved;
#endif
    };

} // namespace detail

    /// Prompt for one line of input.
    ///
    /// The prompt is written straight to the screen, so it shows even in
    /// user mode.  Visible input is read as typed; hidden input is read with
    /// terminal echo off (when @p in is std::cin on a terminal).  The prompt
    /// and answer are then logged as one file-only line, the answer replaced
    /// by kMaskedInput when hidden.
    ///
    /// @throws std::runtime_error if the input stream ends before a line is read.
    inline std::string userInput(Console &console, const std::string &prompt,
                                 bool visible = true, std::istream &in = std::cin) {
        const Palette &p = console.context().palette();
        ScopedValue<bool> userScope = console.user();
        console.output().writeScreen(p.none + p.prompt + prompt + p.userInput);

        std::string value;
        bool ok;
        {
            detail::EchoGuard echo(!visible && &in == &std::cin);
            ok = static_cast<bool>(std::getline(in, value));
        }

        // hidden input leaves the cursor on the prompt line
        console.output().writeScreen(visible ? p.none : p.none + "\n");
        if (!ok) {
            throw std::runtime_error("userInput: input stream closed");
        }

        ScopedValue<bool> fileOnlyScope = console.fileOnly();
        console.print(prompt + (visible ? value : std::string(kMaskedInput)) + "\n");
        return value;
    }

    /// Visible input with the console's configured default prompt.
    inline std::string userInput(Console &console) {
        return userInput(console, console.options().prompt_);
    }

} // namespace prism

#endif // PRISM_CON_USER_INPUT_HPP
