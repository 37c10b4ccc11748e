#ifndef PRISM_CON_SINK_STREAMBUF_HPP
#define PRISM_CON_SINK_STREAMBUF_HPP

#include "sink_interface.hpp"
#include <streambuf>
#include <string>

namespace prism {

    /// Unbuffered std::streambuf that forwards every put to a sink, so
    /// `std::ostream` code can write through the console:
    /// @code
    ///   console.out() << "ready " << 42 << std::endl;
    /// @endcode
    /// Each `operator<<` reaches the sink as one write; std::endl maps to a
    /// "\n" write followed by a sink flush.
    class SinkStreamBuf : public std::streambuf {
    public:
        explicit SinkStreamBuf(ISink &sink) : m_sink(sink) {}

        SinkStreamBuf(const SinkStreamBuf &) = delete;
        SinkStreamBuf &operator=(const SinkStreamBuf &) = delete;

    protected:
        int_type overflow(int_type ch) override {
            if (traits_type::eq_int_type(ch, traits_type::eof())) {
                return traits_type::not_eof(ch);
            }
            m_sink.write(std::string(1, traits_type::to_char_type(ch)));
            return ch;
        }

        std::streamsize xsputn(const char *s, std::streamsize n) override {
            if (n > 0) {
                m_sink.write(std::string(s, static_cast<size_t>(n)));
            }
            return n;
        }

        int sync() override {
            m_sink.flush();
            return 0;
        }

    private:
        ISink &m_sink;
    };

} // namespace prism

#endif // PRISM_CON_SINK_STREAMBUF_HPP
