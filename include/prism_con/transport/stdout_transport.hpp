#ifndef PRISM_CON_STDOUT_TRANSPORT_HPP
#define PRISM_CON_STDOUT_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>
#include <stdexcept>

namespace prism {

    /// Writes to a standard stream and flushes after every write, so the
    /// order of device writes is the order the console lock handed them out.
    ///
    /// @note No locking here: sinks only write while holding
    ///       ConsoleContext::mutex(), which also serializes stdout against stderr.
    class StreamTransport : public ITransport {
    public:
        StreamTransport(std::ostream& stream, const char* name)
            : m_stream(stream), m_name(name) {}

        void write(const std::string& text) override {
            m_stream.write(text.data(), static_cast<std::streamsize>(text.size()));
            m_stream.flush();
            if (!m_stream) {
                m_stream.clear();
                throw std::runtime_error(std::string(m_name) + " is not writable");
            }
        }

        void flush() override {
            m_stream.flush();
        }

    private:
        std::ostream& m_stream;
        const char* m_name;
    };

    class StdoutTransport : public StreamTransport {
    public:
        StdoutTransport() : StreamTransport(std::cout, "stdout") {}
    };

    class StderrTransport : public StreamTransport {
    public:
        StderrTransport() : StreamTransport(std::cerr, "stderr") {}
    };

} // namespace prism

#endif // PRISM_CON_STDOUT_TRANSPORT_HPP
