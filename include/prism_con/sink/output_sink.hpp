#ifndef PRISM_CON_OUTPUT_SINK_HPP
#define PRISM_CON_OUTPUT_SINK_HPP

#include "sink_interface.hpp"
#include "../core/common.hpp"
#include "../core/write_record.hpp"
#include "../formatter/highlight_formatter.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace prism {

    /// Sink for normal output (the stdout replacement).
    ///
    /// Every write becomes a WriteRecord and is queued under the console
    /// lock.  While the sink is allowed to, it drains the queue: the raw
    /// text goes to the log, the colourized text goes to the device unless
    /// the record is file-only or hidden by user mode, and the log is
    /// flushed whenever a record contains a line break.
    ///
    /// The Error Sink clears `allowed` while it owns the screen.  Records
    /// queued in that window are drained by drainPending() once the error
    /// block closes.
    ///
    /// When a drain leaves the screen on a line boundary the line-completed
    /// hook runs (outside the lock); the console wires it to
    /// ErrorSink::flushIfReady(false) so pending error blocks surface at
    /// the next clean line.
    class OutputSink : public ConsoleSink {
    public:
        using LineCompletedHook = std::function<void()>;

        OutputSink(ConsoleContext &ctx,
                   std::unique_ptr<ITransport> device,
                   std::shared_ptr<ITransport> log)
            : ConsoleSink(ctx, std::move(device), std::move(log), RoleFlags(), "OutputSink")
            , m_allowed(true)
            , m_last('\0') {}

        /// Writers copy the hook under the lock and run the copy, so it may be
        /// replaced while other threads write.
        void onLineCompleted(LineCompletedHook hook) {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            m_lineCompleted = std::move(hook);
        }

        void write(const std::string &text) override {
            LineCompletedHook hook;
            try {
                std::unique_lock<std::recursive_mutex> lock(m_ctx.mutex());
                m_queue.push_back(makeRecord(text));
                if (!m_allowed) return;
                // copied under the lock: close() may replace the hook concurrently
                if (drainLocked()) hook = m_lineCompleted;
            } catch (const std::exception &e) {
                reportFailure("write", e);
                return;
            }
            if (hook) {
                hook();
            }
        }

        /// Drain records queued while the screen was held by the Error Sink.
        void drainPending() {
            try {
                std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
                if (!m_allowed) return;
                drainLocked();
            } catch (const std::exception &e) {
                reportFailure("drain", e);
            }
        }

        /// Write straight to the device, skipping the log and the user-mode
        /// gate.  Used for prompts and terminal control sequences.
        void writeScreen(const std::string &text) {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            writeDevice(text);
        }

        /// Drain anything still queued, flush the log, reset the colour.
        /// Records held back by an open error block stay queued; the block
        /// drains them when it closes.
        void close() override {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            try {
                if (m_allowed) drainLocked();
                flushLog();
                if (m_ctx.palette().enabled) {
                    writeDevice(m_ctx.palette().none);
                }
                if (m_device) m_device->flush();
            } catch (const std::exception &e) {
                reportFailure("close", e);
            }
        }

        /// Colourize @p text for the current role and keyword maps.
        /// Priority: error > warn > user > default.
        std::string processText(const std::string &text) const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            const Palette &p = m_ctx.palette();
            if (!p.enabled) return text;

            std::string colour = m_roles.user ? p.user : p.dull;
            if (m_roles.warn) colour = p.warn;
            if (m_roles.error) colour = p.error;

            std::vector<KeywordLayer> layers;
            layers.push_back(KeywordLayer(&m_keywords.high, p.highlight));
            layers.push_back(KeywordLayer(&m_keywords.low, p.lowlight));
            layers.push_back(KeywordLayer(&m_ctx.highlights(), p.highlight));
            layers.push_back(KeywordLayer(&m_ctx.statusHighlights(), p.highlight));
            return HighlightFormatter::format(text, colour, layers, p, m_ctx.separator());
        }

        ScopedValue<KeywordMaps> scopeKeywords(KeywordMaps keywords) {
            return ScopedValue<KeywordMaps>(m_ctx.mutex(), m_keywords, std::move(keywords));
        }

        KeywordMaps keywords() const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            return m_keywords;
        }

        // The accessors below are used by the Error Sink while it holds the
        // console lock.

        bool allowed() const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            return m_allowed;
        }

        void setAllowed(bool allowed) {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            m_allowed = allowed;
        }

        /// Last character written, '\0' before the first write.
        char last() const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            return m_last;
        }

        size_t pendingCount() const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            return m_queue.size();
        }

    private:
        WriteRecord makeRecord(const std::string &text) {
            std::string formatted;
            try {
                formatted = processText(text);
            } catch (const std::exception &e) {
                // A bad keyword map only costs the highlighting.
                reportFailure("highlight", e);
                const Palette &p = m_ctx.palette();
                formatted = p.enabled ? p.none + p.dull + text : text;
            }
            return WriteRecord(m_roles.fileOnly, text, std::move(formatted),
                               m_ctx.isVisible(m_roles.user));
        }

        /// Caller holds the lock.  Returns true if the screen ended on a
        /// line boundary.
        bool drainLocked() {
            while (!m_queue.empty()) {
                WriteRecord record = std::move(m_queue.front());
                m_queue.pop_front();

                writeLog(record.raw);
                if (!record.fileOnly && record.shouldPrint) {
                    writeDevice(record.formatted);
                }
                if (detail::containsNewline(record.raw)) {
                    flushLog();
                }
                if (!record.raw.empty()) {
                    m_last = record.raw[record.raw.size() - 1];
                }
            }
            return m_last == '\n';
        }

        bool m_allowed;
        char m_last;
        std::deque<WriteRecord> m_queue;
        KeywordMaps m_keywords;
        LineCompletedHook m_lineCompleted;
    };

} // namespace prism

#endif // PRISM_CON_OUTPUT_SINK_HPP
