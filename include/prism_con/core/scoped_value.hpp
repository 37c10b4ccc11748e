#ifndef PRISM_CON_SCOPED_VALUE_HPP
#define PRISM_CON_SCOPED_VALUE_HPP

#include <mutex>
#include <utility>

namespace prism {

    /// RAII switch over one field of console state.
    ///
    /// The constructor saves the current value of @p slot and stores the new
    /// one; the destructor puts the saved value back.  Both steps take the
    /// console lock, so a switch never tears a concurrent write.  Restoration
    /// runs on every exit path, including stack unwinding, which makes nested
    /// switches safe.
    ///
    /// @code
    ///   {
    ///       auto scope = console.user();
    ///       console.print("shown even in user mode\n");
    ///   }   // user flag is back to its previous value here
    /// @endcode
    template<typename T>
    class ScopedValue {
    public:
        ScopedValue(std::recursive_mutex &mutex, T &slot, T value)
            : m_mutex(&mutex)
            , m_slot(&slot) {
            std::lock_guard<std::recursive_mutex> lock(mutex);
            m_previous = std::move(slot);
            slot = std::move(value);
        }

        ScopedValue(ScopedValue &&other)
            : m_mutex(other.m_mutex)
            , m_slot(other.m_slot)
            , m_previous(std::move(other.m_previous)) {
            other.m_slot = nullptr;
        }

        ScopedValue(const ScopedValue &) = delete;
        ScopedValue &operator=(const ScopedValue &) = delete;
        ScopedValue &operator=(ScopedValue &&) = delete;

        ~ScopedValue() {
            restore();
        }

        /// Restore early.  Later calls, and the destructor, do nothing.
        void restore() {
            if (!m_slot) return;
            std::lock_guard<std::recursive_mutex> lock(*m_mutex);
            *m_slot = std::move(m_previous);
            m_slot = nullptr;
        }

        bool active() const { return m_slot != nullptr; }

        const T &previous() const { return m_previous; }

    private:
        std::recursive_mutex *m_mutex;
        T *m_slot;
        T m_previous;
    };

} // namespace prism

#endif // PRISM_CON_SCOPED_VALUE_HPP
