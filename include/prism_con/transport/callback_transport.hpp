#ifndef PRISM_CON_CALLBACK_TRANSPORT_HPP
#define PRISM_CON_CALLBACK_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <functional>
#include <string>

namespace prism {

    /// Transport that hands every write to a user callback.
    ///
    /// Useful for embedding the console in a GUI, or for capturing what
    /// would have reached the screen.  The callback runs under the console
    /// lock, so it must not write back into the console.
    ///
    /// @note If the callback throws, the owning sink reports the failure
    ///       directly and carries on with the next write.
    class CallbackTransport : public ITransport {
    public:
        using StringCallback = std::function<void(const std::string&)>;

        explicit CallbackTransport(StringCallback cb)
            : m_callback(std::move(cb)) {}

        void write(const std::string& text) override {
            if (m_callback) {
                m_callback(text);
            }
        }

    private:
        StringCallback m_callback;
    };

} // namespace prism

#endif // PRISM_CON_CALLBACK_TRANSPORT_HPP
