#ifndef PRISM_CON_CONSOLE_HPP
#define PRISM_CON_CONSOLE_HPP

#include "console_options.hpp"
#include "core/common.hpp"
#include "core/console_context.hpp"
#include "core/palette.hpp"
#include "core/scoped_value.hpp"
#include "sink/error_sink.hpp"
#include "sink/output_sink.hpp"
#include "sink/sink_streambuf.hpp"
#include "transport/file_transport.hpp"
#include "transport/stdout_transport.hpp"
#include <cstdio>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace prism {

    /// A console: one context, one Output Sink, one Error Sink and the
    /// optional log file they share.
    ///
    /// Construction opens the log (append mode), wires the sinks together
    /// and, when a log is configured and printLogName is set, announces the
    /// log destination once.  close() (or the destructor) drains and tears
    /// everything down.
    ///
    /// Usage:
    /// @code
    ///   prism::Console console(prism::ConsoleOptions().setLogPath("app.log"));
    ///   console.print("plain line\n");
    ///   {
    ///       auto scope = console.warn();
    ///       console.print("yellow line\n");
    ///   }
    ///   console.printErr("something broke\n");   // batched into a block
    ///   console.close();
    /// @endcode
    class Console {
    public:
        /// Console on the process's stdout / stderr.
        /// @throws std::runtime_error if the log file cannot be opened.
        explicit Console(const ConsoleOptions &options = ConsoleOptions())
            : Console(options,
                      detail::make_unique<StdoutTransport>(),
                      detail::make_unique<StderrTransport>()) {}

        /// Console on caller-supplied devices.
        Console(const ConsoleOptions &options,
                std::unique_ptr<ITransport> outDevice,
                std::unique_ptr<ITransport> errDevice)
            : m_options(options)
            , m_closed(false) {
            m_ctx = detail::make_unique<ConsoleContext>(
                Palette::make(options.colour_), options.prefix_,
                options.batchInterval(), options.separator_);
            m_ctx->setUserMode(options.userMode_);

            if (!options.logPath_.empty()) {
                m_logFile = std::make_shared<FileTransport>(options.logPath_);
            }

            m_out = detail::make_unique<OutputSink>(*m_ctx, std::move(outDevice), m_logFile);
            m_err = detail::make_unique<ErrorSink>(
                *m_ctx, std::move(errDevice),
                options.logStderr_ ? m_logFile : std::shared_ptr<FileTransport>(),
                *m_out, options.stderrHeader_);
            ErrorSink *err = m_err.get();
            m_out->onLineCompleted([err]() { err->flushIfReady(false); });

            m_outBuf = detail::make_unique<SinkStreamBuf>(*m_out);
            m_errBuf = detail::make_unique<SinkStreamBuf>(*m_err);
            m_outStream = detail::make_unique<std::ostream>(m_outBuf.get());
            m_errStream = detail::make_unique<std::ostream>(m_errBuf.get());

            if (m_logFile && options.printLogName_) {
                announceLog();
            }
        }

        ~Console() noexcept {
            try {
                close();
            } catch (const std::exception &e) {
                std::fprintf(stderr, "[PrismCon][Console] close failed: %s\n", e.what());
            }
        }

        Console(const Console &) = delete;
        Console &operator=(const Console &) = delete;

        /// Flush and close both sinks, then the log file.  Idempotent.
        /// Must not be called while holding batch().
        void close() {
            {
                std::lock_guard<std::recursive_mutex> lock(m_ctx->mutex());
                if (m_closed) return;
                m_closed = true;
            }
            m_err->close();
            m_out->onLineCompleted(OutputSink::LineCompletedHook());
            m_out->close();
            if (m_logFile) {
                std::lock_guard<std::recursive_mutex> lock(m_ctx->mutex());
                m_out->detachLog();
                m_err->detachLog();
                m_logFile->close();
            }
        }

        bool isClosed() const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx->mutex());
            return m_closed;
        }

        void print(const std::string &text) { m_out->write(text); }
        void printErr(const std::string &text) { m_err->write(text); }

        /// Streams that write through the sinks.
        std::ostream &out() { return *m_outStream; }
        std::ostream &err() { return *m_errStream; }

        /// Hold the console lock so a multi-line sequence stays contiguous on
        /// screen.  Keep the hold short; error blocks wait for it.
        std::unique_lock<std::recursive_mutex> batch() {
            return std::unique_lock<std::recursive_mutex>(m_ctx->mutex());
        }

        // --- Mode ---

        bool userMode() const { return m_ctx->userMode(); }
        void setUserMode(bool enabled) { m_ctx->setUserMode(enabled); }

        void setHighlights(const WordColourMap &highlights) { m_ctx->setHighlights(highlights); }

        // --- Scoped switches ---
        // Each returns a guard that restores the previous value when it goes
        // out of scope:  { auto scope = console.user(); ... }

        /// Normal output shown even in user mode, in the user colour.
        ScopedValue<bool> user() { return m_out->scopeRole(Role::User, true); }
        /// Error output shown even in user mode.
        ScopedValue<bool> userErr() { return m_err->scopeRole(Role::User, true); }
        ScopedValue<bool> warn() { return m_out->scopeRole(Role::Warn, true); }
        /// Error output in the warning colour.
        ScopedValue<bool> warnErr() { return m_err->scopeRole(Role::Error, false); }
        ScopedValue<bool> error() { return m_out->scopeRole(Role::Error, true); }
        /// Normal output goes to the log only.
        ScopedValue<bool> fileOnly() { return m_out->scopeRole(Role::FileOnly, true); }

        /// Highlight words in the default highlight / lowlight colours.
        ScopedValue<KeywordMaps> highlight(const std::vector<std::string> &highWords,
                                           const std::vector<std::string> &lowWords) {
            KeywordMaps maps;
            for (size_t i = 0; i < highWords.size(); ++i) maps.high[highWords[i]] = std::string();
            for (size_t i = 0; i < lowWords.size(); ++i) maps.low[lowWords[i]] = std::string();
            return m_out->scopeKeywords(std::move(maps));
        }

        /// Highlight words in their own colours (empty colour = default).
        ScopedValue<KeywordMaps> highmap(const WordColourMap &highWords,
                                         const WordColourMap &lowWords) {
            return m_out->scopeKeywords(KeywordMaps(highWords, lowWords));
        }

        /// Timestamp prefix for the scope.
        ScopedValue<std::string> pre(const std::string &prefix) { return m_ctx->scopePrefix(prefix); }

        /// Message shown in the header of error blocks opened in the scope.
        ScopedValue<std::string> errHeader(const std::string &message) {
            return m_err->scopeHeaderMessage(message);
        }

        // --- Timestamped lines ---

        /// Write "prefix|timestamp|".
        void log() { m_out->write(m_ctx->logPrefix()); }

        /// Write "prefix|type|timestamp|"; type is usually STAT, WARN or ERRO.
        void logStat(const std::string &type = kStatusStat) { m_out->write(m_ctx->logPrefix(type)); }

        // --- Access ---

        OutputSink &output() { return *m_out; }
        ErrorSink &errors() { return *m_err; }
        ConsoleContext &context() { return *m_ctx; }
        const ConsoleOptions &options() const { return m_options; }
        const std::string &logPath() const { return m_options.logPath_; }

    private:
        void announceLog() {
            ScopedValue<bool> userScope = user();
            ScopedValue<KeywordMaps> highlightScope =
                highlight(std::vector<std::string>{m_options.logPath_, m_options.prefix_},
                          std::vector<std::string>());
            print(m_options.prefix_ + ": begin logging to " + m_options.logPath_ + "\n");
        }

        ConsoleOptions m_options;
        std::unique_ptr<ConsoleContext> m_ctx;
        std::shared_ptr<FileTransport> m_logFile;
        std::unique_ptr<OutputSink> m_out;
        std::unique_ptr<ErrorSink> m_err;
        std::unique_ptr<SinkStreamBuf> m_outBuf;
        std::unique_ptr<SinkStreamBuf> m_errBuf;
        std::unique_ptr<std::ostream> m_outStream;
        std::unique_ptr<std::ostream> m_errStream;
        bool m_closed;
    };

} // namespace prism

#endif // PRISM_CON_CONSOLE_HPP
