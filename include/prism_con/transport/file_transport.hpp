#ifndef PRISM_CON_FILE_TRANSPORT_HPP
#define PRISM_CON_FILE_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <fstream>
#include <stdexcept>
#include <string>

namespace prism {

    /// Append-only log file.
    ///
    /// Text is written verbatim; structure comes from the embedded line
    /// breaks.  Data reaches the disk on flush(), which the sinks call on
    /// every line boundary.  Shared by both sinks and only written under
    /// the console lock.
    class FileTransport : public ITransport {
    public:
        /// @throws std::runtime_error if the file cannot be opened for appending.
        explicit FileTransport(const std::string& path) : m_path(path) {
            m_file.open(path, std::ios::out | std::ios::app | std::ios::binary);
            if (!m_file.is_open()) {
                throw std::runtime_error("cannot open log file for appending: " + path);
            }
        }

        ~FileTransport() noexcept {
            if (m_file.is_open()) {
                m_file.close();
            }
        }

        void write(const std::string& text) override {
            if (!m_file.is_open()) {
                throw std::runtime_error("log file is closed: " + m_path);
            }
            m_file.write(text.data(), static_cast<std::streamsize>(text.size()));
            if (!m_file) {
                m_file.clear();
                throw std::runtime_error("failed writing log file: " + m_path);
            }
        }

        void flush() override {
            if (!m_file.is_open()) return;
            m_file.flush();
            if (!m_file) {
                m_file.clear();
                throw std::runtime_error("failed flushing log file: " + m_path);
            }
        }

        void close() override {
            if (!m_file.is_open()) return;
            m_file.flush();
            m_file.close();
        }

        bool isOpen() const { return m_file.is_open(); }

        const std::string& path() const { return m_path; }

    private:
        std::string m_path;
        std::ofstream m_file;
    };

} // namespace prism

#endif // PRISM_CON_FILE_TRANSPORT_HPP
