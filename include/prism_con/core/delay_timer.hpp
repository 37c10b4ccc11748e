#ifndef PRISM_CON_DELAY_TIMER_HPP
#define PRISM_CON_DELAY_TIMER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

namespace prism {

    /// Single-slot delayed task runner.
    ///
    /// Owns one scheduling thread and at most one pending one-shot task.
    /// arm() replaces whatever is pending, disarm() drops it, so there is
    /// never more than one outstanding attempt per owner.  The callback runs
    /// on the scheduling thread with the internal mutex released, which lets
    /// it block on other locks while arm()/disarm() callers hold them.
    ///
    /// @warning stop() joins the thread.  Do not call it while holding a lock
    ///          the callback may need.
    class DelayTimer {
    public:
        using Callback = std::function<void(bool force)>;

        explicit DelayTimer(Callback callback)
            : m_callback(std::move(callback))
            , m_running(true)
            , m_pending(false)
            , m_force(false)
            , m_fireCount(0) {
            m_thread = std::thread(&DelayTimer::run, this);
        }

        ~DelayTimer() noexcept {
            stop();
        }

        DelayTimer(const DelayTimer &) = delete;
        DelayTimer &operator=(const DelayTimer &) = delete;

        /// Schedule the callback to run once after @p delay with @p force.
        void arm(std::chrono::milliseconds delay, bool force) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) return;
            m_pending = true;
            m_force = force;
            m_deadline = std::chrono::steady_clock::now() + delay;
            m_cv.notify_all();
        }

        void disarm() {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_pending) return;
            m_pending = false;
            m_cv.notify_all();
        }

        bool pending() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_pending;
        }

        /// Number of callbacks started so far (for testing).
        size_t fireCount() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_fireCount;
        }

        /// Drop any pending task and join the scheduling thread.
        void stop() noexcept {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!m_running) return;
                m_running = false;
                m_pending = false;
                m_cv.notify_all();
            }
            if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
                m_thread.join();
            } else if (m_thread.joinable()) {
                m_thread.detach();
            }
        }

    private:
        void run() {
            std::unique_lock<std::mutex> lock(m_mutex);
            while (m_running) {
                if (!m_pending) {
                    m_cv.wait(lock, [this] { return m_pending || !m_running; });
                    continue;
                }

                // Re-evaluated every wake-up: arm() may have moved the deadline.
                std::chrono::steady_clock::time_point deadline = m_deadline;
                m_cv.wait_until(lock, deadline);
                if (!m_running) break;
                if (!m_pending || std::chrono::steady_clock::now() < m_deadline) continue;

                m_pending = false;
                bool force = m_force;
                ++m_fireCount;
                lock.unlock();
                try {
                    m_callback(force);
                } catch (const std::exception &e) {
                    std::fprintf(stderr, "[PrismCon][DelayTimer] callback failed: %s\n", e.what());
                }
                lock.lock();
            }
        }

        Callback m_callback;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_running;
        bool m_pending;
        bool m_force;
        size_t m_fireCount;
        std::chrono::steady_clock::time_point m_deadline;
        std::thread m_thread;
    };

} // namespace prism

#endif // PRISM_CON_DELAY_TIMER_HPP
