#ifndef PRISM_CON_CONSOLE_OPTIONS_HPP
#define PRISM_CON_CONSOLE_OPTIONS_HPP

#include "core/palette.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace prism {

    /// Configuration for a Console.
    ///
    /// All setters return `*this` for fluent chaining:
    /// @code
    ///   ConsoleOptions opts;
    ///   opts.setLogPath("app.log").setPrefix("app").setBatchIntervalMs(30);
    /// @endcode
    ///
    /// Options can also be read from JSON:
    /// @code
    ///   {
    ///     "colour": true,
    ///     "log": "app.log",
    ///     "prefix": "app",
    ///     "log_stderr": true,
    ///     "stderr_header": true,
    ///     "batch_interval_ms": 20,
    ///     "user_mode": false,
    ///     "print_log_name": true,
    ///     "separator": "|",
    ///     "prompt": "Command> "
    ///   }
    /// @endcode
    /// Every key is optional; unknown keys are ignored.
    struct ConsoleOptions {
        bool colour_;              ///< ANSI colour on the devices
        std::string logPath_;      ///< Append-mode log file, empty = no log
        std::string prefix_;       ///< Leads every timestamped line
        bool logStderr_;           ///< Mirror error output to the log too
        bool stderrHeader_;        ///< Open each error block with a header line
        size_t batchIntervalMs_;   ///< Error batching / quiescence interval
        bool userMode_;            ///< Start in user mode
        bool printLogName_;        ///< Announce the log file once at start-up
        std::string separator_;    ///< Field separator in timestamped prefixes
        std::string prompt_;       ///< Default prompt for userInput()

        ConsoleOptions()
            : colour_(true)
            , prefix_("prism")
            , logStderr_(true)
            , stderrHeader_(true)
            , batchIntervalMs_(20)
            , userMode_(false)
            , printLogName_(true)
            , separator_("|")
            , prompt_("Command> ") {}

        ConsoleOptions& setColour(bool enabled) { colour_ = enabled; return *this; }
        ConsoleOptions& setLogPath(const std::string& path) { logPath_ = path; return *this; }
        ConsoleOptions& setPrefix(const std::string& prefix) { prefix_ = prefix; return *this; }
        ConsoleOptions& setLogStderr(bool enabled) { logStderr_ = enabled; return *this; }
        ConsoleOptions& setStderrHeader(bool enabled) { stderrHeader_ = enabled; return *this; }
        /// @note A value of 0 is clamped to 1.
        ConsoleOptions& setBatchIntervalMs(size_t ms) { batchIntervalMs_ = (ms > 0 ? ms : 1); return *this; }
        ConsoleOptions& setUserMode(bool enabled) { userMode_ = enabled; return *this; }
        ConsoleOptions& setPrintLogName(bool enabled) { printLogName_ = enabled; return *this; }
        ConsoleOptions& setSeparator(const std::string& separator) { separator_ = separator; return *this; }
        ConsoleOptions& setPrompt(const std::string& prompt) { prompt_ = prompt; return *this; }

        std::chrono::milliseconds batchInterval() const {
            return std::chrono::milliseconds(static_cast<long long>(batchIntervalMs_));
        }

        /// Turn colour off when NO_COLOR or PRISM_CON_NO_COLOR ask for it.
        ConsoleOptions& applyEnvironment() {
            if (detail::colourDisabledByEnvironment()) colour_ = false;
            return *this;
        }

        /// Colour only when stdout is a terminal (and the environment allows it).
        ConsoleOptions& detectColour() {
            colour_ = detail::isTerminal(stdout) && !detail::colourDisabledByEnvironment();
            return *this;
        }

        /// @throws std::invalid_argument if @p j is not an object or a key
        ///         has the wrong type.
        static ConsoleOptions fromJson(const nlohmann::json& j) {
            if (!j.is_object()) {
                throw std::invalid_argument("ConsoleOptions: configuration must be a JSON object");
            }
            ConsoleOptions opts;
            readField(j, "colour", opts.colour_);
            readField(j, "prefix", opts.prefix_);
            readField(j, "log_stderr", opts.logStderr_);
            readField(j, "stderr_header", opts.stderrHeader_);
            readField(j, "user_mode", opts.userMode_);
            readField(j, "print_log_name", opts.printLogName_);
            readField(j, "separator", opts.separator_);
            readField(j, "prompt", opts.prompt_);

            nlohmann::json::const_iterator log = j.find("log");
            if (log != j.end() && !log->is_null()) {
                if (!log->is_string()) {
                    throw std::invalid_argument("ConsoleOptions: 'log' must be a string or null");
                }
                opts.logPath_ = log->get<std::string>();
            }

            nlohmann::json::const_iterator interval = j.find("batch_interval_ms");
            if (interval != j.end() && !interval->is_null()) {
                if (!interval->is_number_integer() || interval->get<long long>() < 0) {
                    throw std::invalid_argument("ConsoleOptions: 'batch_interval_ms' must be a non-negative integer");
                }
                opts.setBatchIntervalMs(static_cast<size_t>(interval->get<long long>()));
            }
            return opts;
        }

        /// @throws std::runtime_error if the file cannot be read,
        ///         std::invalid_argument if it is not valid configuration.
        static ConsoleOptions fromFile(const std::string& path) {
            std::ifstream in(path);
            if (!in.is_open()) {
                throw std::runtime_error("ConsoleOptions: cannot open configuration file: " + path);
            }
            nlohmann::json j;
            try {
                in >> j;
            } catch (const nlohmann::json::parse_error& e) {
                throw std::invalid_argument("ConsoleOptions: " + path + ": " + e.what());
            }
            return fromJson(j);
        }

    private:
        template<typename T>
        static void readField(const nlohmann::json& j, const char* key, T& out) {
            nlohmann::json::const_iterator it = j.find(key);
            if (it == j.end() || it->is_null()) return;
            try {
                out = it->get<T>();
            } catch (const nlohmann::json::type_error& e) {
                throw std::invalid_argument(std::string("ConsoleOptions: '") + key + "': " + e.what());
            }
        }
    };

} // namespace prism

#endif // PRISM_CON_CONSOLE_OPTIONS_HPP
