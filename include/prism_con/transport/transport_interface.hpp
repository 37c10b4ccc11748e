#ifndef PRISM_CON_TRANSPORT_INTERFACE_HPP
#define PRISM_CON_TRANSPORT_INTERFACE_HPP

#include <string>

namespace prism {

    /// Byte destination behind a sink: a real device or the log file.
    /// Implementations throw on failure; sinks catch at their boundary.
    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::string& text) = 0;
        virtual void flush() {}
        virtual void close() {}
    };

} // namespace prism

#endif // PRISM_CON_TRANSPORT_INTERFACE_HPP
