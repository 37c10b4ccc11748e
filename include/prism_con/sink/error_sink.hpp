#ifndef PRISM_CON_ERROR_SINK_HPP
#define PRISM_CON_ERROR_SINK_HPP

#include "sink_interface.hpp"
#include "output_sink.hpp"
#include "../core/common.hpp"
#include "../core/delay_timer.hpp"
#include "../core/write_record.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace prism {

namespace detail {

    /// Holds the screen for an error block: clears the Output Sink's
    /// `allowed` flag and restores its previous value on every exit path.
    class ScreenGate {
    public:
        explicit ScreenGate(OutputSink &out) : m_out(out), m_previous(out.allowed()) {
            m_out.setAllowed(false);
        }
        ~ScreenGate() { m_out.setAllowed(m_previous); }

        ScreenGate(const ScreenGate &) = delete;
        ScreenGate &operator=(const ScreenGate &) = delete;

    private:
        OutputSink &m_out;
        bool m_previous;
    };

} // namespace detail

    /// Sink for error output (the stderr replacement).
    ///
    /// Writes are queued, not printed.  The first write into an idle sink
    /// opens a block (a header line with the timestamped prefix and the
    /// pending header message, if headers are enabled) and arms the delay
    /// timer for one batching interval.  When the timer fires:
    ///   - if normal output is mid-line, the attempt is re-armed once more
    ///     with force set, giving the Output Sink one more interval to
    ///     finish its line;
    ///   - otherwise the block is drained: the Output Sink is locked out of
    ///     the screen, fragments are popped with a bounded wait of one
    ///     interval each, and the first wait that times out closes the block
    ///     with a line break.
    /// The Output Sink also calls flushIfReady(false) whenever it completes
    /// a line, which lets a pending block surface before its timer lapses.
    ///
    /// The timer is the only scheduler of delayed attempts and holds at most
    /// one pending attempt.  Every flushIfReady() call first clears it, so a
    /// drain started by the Output Sink supersedes the timer and a timer
    /// firing after the queue was emptied finds nothing to do.
    ///
    /// The bounded wait is on the console lock itself.  When the drain holds
    /// the lock once, the wait releases it, so other threads can add to the
    /// open block (normal output only queues, since `allowed` is false).
    /// When the lock is held re-entrantly, nothing can arrive and the block
    /// closes after one interval.
    class ErrorSink : public ConsoleSink {
    public:
        ErrorSink(ConsoleContext &ctx,
                  std::unique_ptr<ITransport> device,
                  std::shared_ptr<ITransport> log,
                  OutputSink &out,
                  bool printHeader = true)
            : ConsoleSink(ctx, std::move(device), std::move(log), RoleFlags::errorRole(), "ErrorSink")
            , m_out(out)
            , m_printHeader(printHeader)
            , m_flushing(false)
            , m_closing(false)
            , m_closed(false)
            , m_blockCount(0)
            , m_timer(std::bind(&ErrorSink::flushIfReady, this, std::placeholders::_1)) {}

        ~ErrorSink() noexcept {
            close();
        }

        void write(const std::string &text) override {
            try {
                std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
                if (m_closed) {
                    // No timer any more: pass straight through.
                    writeLog(text);
                    if (visible(m_roles)) writeDevice(processText(text));
                    if (detail::containsNewline(text)) flushLog();
                    return;
                }
                if (m_queue.empty() && !m_flushing && m_printHeader) {
                    m_queue.push_back(makeHeader());
                }
                m_queue.push_back(makeFragment(text));
                m_arrived.notify_all();
                if (!m_flushing && !m_timer.pending()) {
                    m_timer.arm(m_ctx.batchInterval(), false);
                }
            } catch (const std::exception &e) {
                reportFailure("write", e);
            }
        }

        /// Attempt to flush the pending block.
        ///
        /// @param force  skip the "normal output is mid-line" deferral.
        void flushIfReady(bool force) {
            try {
                std::unique_lock<std::recursive_mutex> lock(m_ctx.mutex());
                m_timer.disarm();
                if (m_queue.empty() || m_flushing) return;
                if (!force && m_out.last() != '\n') {
                    m_timer.arm(m_ctx.batchInterval(), true);
                    return;
                }
                drainBlock(lock);
            } catch (const std::exception &e) {
                reportFailure("flush", e);
                m_drained.notify_all();
            }
        }

        /// Stop the timer, let any open block finish, drain what is still
        /// queued, flush, reset the colour.
        ///
        /// A block being drained on another thread (the timer, or a writer
        /// whose completed line triggered it) is told to close at once and
        /// waited for, so the block terminator and the output it held back
        /// land before the log goes away.
        /// Must not be called while holding the console lock.
        void close() override {
            {
                std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
                if (m_closed) return;
                m_closing = true;
                m_arrived.notify_all();
            }
            m_timer.stop();
            std::unique_lock<std::recursive_mutex> lock(m_ctx.mutex());
            if (m_closed) return;
            m_drained.wait(lock, [this] { return !m_flushing; });
            try {
                if (!m_queue.empty()) {
                    drainBlock(lock);
                }
                flushLog();
                if (m_ctx.palette().enabled) {
                    writeDevice(m_ctx.palette().none);
                }
                if (m_device) m_device->flush();
            } catch (const std::exception &e) {
                reportFailure("close", e);
            }
            m_closed = true;
        }

        /// Insert the error line prefix after every line break and wrap the
        /// fragment in the role colour.  Priority: user > error > warn.
        std::string processText(const std::string &text) const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            const Palette &p = m_ctx.palette();
            std::string result = detail::replaceAll(text, "\n", "\n" + p.stderrPrefix);
            if (!p.enabled) return result;

            std::string colour = m_roles.error ? p.error : p.warn;
            if (m_roles.user) colour = p.user;
            return p.none + colour + result + p.none;
        }

        std::string headerMessage() const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            return m_message;
        }

        void setHeaderMessage(const std::string &message) {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            m_message = message;
        }

        ScopedValue<std::string> scopeHeaderMessage(const std::string &message) {
            return ScopedValue<std::string>(m_ctx.mutex(), m_message, message);
        }

        size_t pendingCount() const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            return m_queue.size();
        }

        /// Number of blocks closed so far.
        size_t blockCount() const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            return m_blockCount;
        }

        bool flushPending() const { return m_timer.pending(); }

    private:
        ErrorFragment makeHeader() {
            const Palette &p = m_ctx.palette();
            std::string line = m_ctx.logPrefix() + m_message;
            std::string formatted = processText(p.stderrHeader + line + p.none + "\n");
            return ErrorFragment("\n" + line + "\n", std::move(formatted), visible(m_roles));
        }

        ErrorFragment makeFragment(const std::string &text) {
            std::string formatted;
            try {
                formatted = processText(text);
            } catch (const std::exception &e) {
                reportFailure("format", e);
                formatted = text;
            }
            return ErrorFragment(text, std::move(formatted), visible(m_roles));
        }

        /// Caller holds @p lock.  Runs until one interval passes with an
        /// empty queue, then closes the block.
        void drainBlock(std::unique_lock<std::recursive_mutex> &lock) {
            bool blockVisible = false;
            {
                ScopedValue<bool> flushing(m_ctx.mutex(), m_flushing, true);
                detail::ScreenGate gate(m_out);
                for (;;) {
                    if (m_queue.empty()) {
                        m_arrived.wait_for(lock, m_ctx.batchInterval(),
                            [this] { return !m_queue.empty() || m_closing; });
                        if (m_queue.empty()) break;
                    }
                    ErrorFragment fragment = std::move(m_queue.front());
                    m_queue.pop_front();

                    writeLog(fragment.raw);
                    if (fragment.visible) {
                        writeDevice(fragment.formatted);
                        blockVisible = true;
                    }
                    if (detail::containsNewline(fragment.raw)) {
                        flushLog();
                    }
                }

                // quiescent: close the block on its own line
                writeLog("\n");
                if (blockVisible) writeDevice("\n");
                flushLog();
                ++m_blockCount;
            }
            m_out.drainPending();
            m_drained.notify_all();
        }

        OutputSink &m_out;
        bool m_printHeader;
        bool m_flushing;
        bool m_closing;
        bool m_closed;
        size_t m_blockCount;
        std::string m_message;
        std::deque<ErrorFragment> m_queue;
        std::condition_variable_any m_arrived;
        std::condition_variable_any m_drained;
        // Declared last: its thread calls back into the members above, so it
        // must start after and stop before them.
        DelayTimer m_timer;
    };

} // namespace prism

#endif // PRISM_CON_ERROR_SINK_HPP
