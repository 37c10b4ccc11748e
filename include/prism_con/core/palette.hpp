#ifndef PRISM_CON_PALETTE_HPP
#define PRISM_CON_PALETTE_HPP

#include <cstdio>
#include <cstdlib>
#include <string>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace prism {

    /// Build an ANSI SGR sequence: "\033[<code>m", or "\033[<code>;1m" when bright.
    /// 30-37 select the foreground, 40-47 the background, 0 resets.
    inline std::string genColour(int code, bool bright = false) {
        std::string result = "\033[";
        result += std::to_string(code);
        result += bright ? ";1m" : "m";
        return result;
    }

    /// Colour table shared by both sinks.
    ///
    /// Built once per console by Palette::make().  With colour disabled every
    /// colour is the empty string and only the error-block markers keep a
    /// plain-text rendering, so formatted output degrades to raw text.
    struct Palette {
        bool enabled;

        std::string prompt;
        std::string userInput;
        std::string disabled;
        std::string none;
        std::string error;
        std::string warn;
        std::string stat;
        std::string dull;
        std::string user;
        std::string highlight;
        std::string lowlight;

        /// Injected after every line break inside an error block.
        std::string stderrPrefix;
        /// Opens an error block header.
        std::string stderrHeader;

        Palette() : enabled(false) {}

        static Palette make(bool colour) {
            Palette p;
            p.enabled = colour;
            if (colour) {
                p.prompt    = genColour(36);        // dark cyan
                p.userInput = genColour(36, true);  // bright cyan
                p.disabled  = genColour(30, true);  // dark grey
                p.none      = genColour(0);
                p.error     = genColour(31, true);  // bright red
                p.warn      = genColour(33, true);  // bright yellow
                p.stat      = genColour(37);        // grey
                p.dull      = genColour(32);        // dark green
                p.user      = genColour(32, true);  // bright green
                p.highlight = genColour(35, true);  // bright magenta
                p.lowlight  = genColour(30, true);  // dark grey

                // black '+' on dark red marks every error line, which also
                // makes error output easy to grep for
                p.stderrPrefix = p.none + genColour(41) + genColour(30) + "+" +
                                 p.none + "    " + p.error;
                p.stderrHeader = "\n" + p.none + genColour(41) + genColour(30);
            } else {
                p.stderrPrefix = "+    ";
                p.stderrHeader = "\n";
            }
            return p;
        }
    };

namespace detail {

    /// True when the environment asks for plain output:
    /// `NO_COLOR` set to anything (https://no-color.org/) or
    /// `PRISM_CON_NO_COLOR` set and non-empty.
    inline bool colourDisabledByEnvironment() {
        if (std::getenv("NO_COLOR") != nullptr) return true;
        const char* noColour = std::getenv("PRISM_CON_NO_COLOR");
        return noColour && noColour[0] != '\0';
    }

    inline bool isTerminal(std::FILE* fp) {
#ifdef _WIN32
        return _isatty(_fileno(fp)) != 0;
#else
        return isatty(fileno(fp)) != 0;
#endif
    }

} // namespace detail
} // namespace prism

#endif // PRISM_CON_PALETTE_HPP
