#ifndef PRISM_CON_CONSOLE_CONTEXT_HPP
#define PRISM_CON_CONSOLE_CONTEXT_HPP

#include "common.hpp"
#include "palette.hpp"
#include "role_flags.hpp"
#include "scoped_value.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace prism {

    /// Status keywords highlighted in their own colours.
    static const char *const kStatusStat = "STAT";
    static const char *const kStatusWarn = "WARN";
    static const char *const kStatusError = "ERRO";

    /// State shared by the Output Sink and the Error Sink.
    ///
    /// Holds the one serialization lock of a console, the user-mode gate, the
    /// timestamp prefix, the colour palette and the global keyword maps.
    /// Fields without their own synchronization are guarded by mutex(); the
    /// accessors returning references expect the caller to hold it.
    class ConsoleContext {
    public:
        ConsoleContext(const Palette &palette,
                       const std::string &prefix,
                       std::chrono::milliseconds batchInterval,
                       const std::string &separator = "|")
            : m_palette(palette)
            , m_prefix(prefix)
            , m_separator(separator)
            , m_batchInterval(batchInterval)
            , m_userMode(false) {
            m_statusHighlights[kStatusStat] = m_palette.stat;
            m_statusHighlights[kStatusWarn] = m_palette.warn;
            m_statusHighlights[kStatusError] = m_palette.error;
        }

        ConsoleContext(const ConsoleContext &) = delete;
        ConsoleContext &operator=(const ConsoleContext &) = delete;

        /// The re-entrant lock serializing every sink mutation and device write.
        std::recursive_mutex &mutex() const { return m_mutex; }

        const Palette &palette() const { return m_palette; }

        const std::string &separator() const { return m_separator; }

        std::chrono::milliseconds batchInterval() const { return m_batchInterval; }

        bool userMode() const { return m_userMode.load(std::memory_order_acquire); }

        void setUserMode(bool enabled) { m_userMode.store(enabled, std::memory_order_release); }

        /// Screen gate: in user mode only user-role writes reach the device.
        bool isVisible(bool userRole) const {
            bool userMode = this->userMode();
            return (userRole && userMode) || !userMode;
        }

        std::string prefix() const {
            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            return m_prefix;
        }

        void setPrefix(const std::string &prefix) {
            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            m_prefix = prefix;
        }

        ScopedValue<std::string> scopePrefix(const std::string &prefix) {
            return ScopedValue<std::string>(m_mutex, m_prefix, prefix);
        }

        /// Caller must hold mutex().
        const WordColourMap &highlights() const { return m_highlights; }

        void setHighlights(const WordColourMap &highlights) {
            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            m_highlights = highlights;
        }

        const WordColourMap &statusHighlights() const { return m_statusHighlights; }

        /// "prefix|yy-mm-dd HH:MM:SS.mmm|"
        std::string logPrefix() const {
            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            return m_prefix + m_separator +
                   detail::formatTimestamp(std::chrono::system_clock::now()) + m_separator;
        }

        /// "prefix|type|yy-mm-dd HH:MM:SS.mmm|"
        std::string logPrefix(const std::string &type) const {
            std::lock_guard<std::recursive_mutex> lock(m_mutex);
            return m_prefix + m_separator + type + m_separator +
                   detail::formatTimestamp(std::chrono::system_clock::now()) + m_separator;
        }

    private:
        mutable std::recursive_mutex m_mutex;
        const Palette m_palette;
        std::string m_prefix;
        const std::string m_separator;
        const std::chrono::milliseconds m_batchInterval;
        std::atomic<bool> m_userMode;
        WordColourMap m_highlights;
        WordColourMap m_statusHighlights;
    };

} // namespace prism

#endif // PRISM_CON_CONSOLE_CONTEXT_HPP
