#ifndef PRISM_CON_SINK_INTERFACE_HPP
#define PRISM_CON_SINK_INTERFACE_HPP

#include "../core/console_context.hpp"
#include "../core/role_flags.hpp"
#include "../core/scoped_value.hpp"
#include "../transport/transport_interface.hpp"
#include <cstdio>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

namespace prism {

    /// The writer interface callers route text through in place of a raw
    /// standard stream.
    class ISink {
    public:
        virtual ~ISink() = default;

        virtual void write(const std::string &text) = 0;
        virtual void flush() = 0;
        virtual void close() = 0;
    };

    /// Shared plumbing of the Output Sink and the Error Sink: the console
    /// context, the real device, the optional shared log and the role flags.
    ///
    /// Write-path failures never escape a sink.  They are reported straight
    /// to the device (or stderr if the device itself is failing) and the
    /// write carries on.  A failing log is reported only once.
    class ConsoleSink : public ISink {
    public:
        ConsoleSink(ConsoleContext &ctx,
                    std::unique_ptr<ITransport> device,
                    std::shared_ptr<ITransport> log,
                    RoleFlags roles,
                    const char *name)
            : m_ctx(ctx)
            , m_device(std::move(device))
            , m_log(std::move(log))
            , m_roles(roles)
            , m_name(name)
            , m_logFailed(false)
            , m_deviceFailed(false) {}

        ConsoleSink(const ConsoleSink &) = delete;
        ConsoleSink &operator=(const ConsoleSink &) = delete;

        /// Flush the log file.  No-op without one.
        void flush() override {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            flushLog();
        }

        RoleFlags roles() const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            return m_roles;
        }

        void setRole(Role role, bool value) {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            m_roles.flag(role) = value;
        }

        ScopedValue<bool> scopeRole(Role role, bool value) {
            return ScopedValue<bool>(m_ctx.mutex(), m_roles.flag(role), value);
        }

        bool hasLog() const {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            return static_cast<bool>(m_log);
        }

        /// Stop mirroring to the log.  The console detaches both sinks before
        /// it closes the shared file, so writes racing teardown reach only
        /// the device.
        void detachLog() {
            std::lock_guard<std::recursive_mutex> lock(m_ctx.mutex());
            m_log.reset();
        }

        ConsoleContext &context() { return m_ctx; }

    protected:
        bool visible(const RoleFlags &roles) const {
            return !roles.fileOnly && m_ctx.isVisible(roles.user);
        }

        void writeLog(const std::string &raw) {
            if (!m_log || raw.empty()) return;
            try {
                m_log->write(raw);
            } catch (const std::exception &e) {
                reportLogFailure(e);
            }
        }

        void flushLog() {
            if (!m_log) return;
            try {
                m_log->flush();
            } catch (const std::exception &e) {
                reportLogFailure(e);
            }
        }

        void writeDevice(const std::string &text) {
            if (!m_device || text.empty()) return;
            try {
                m_device->write(text);
            } catch (const std::exception &e) {
                if (!m_deviceFailed) {
                    m_deviceFailed = true;
                    std::fprintf(stderr, "[PrismCon][%s] device write failed: %s\n", m_name, e.what());
                }
            }
        }

        /// Dump a failure straight to the device, bypassing the queues so a
        /// broken formatter or log cannot recurse through the sink.
        void reportFailure(const char *operation, const std::exception &e) {
            std::string line = std::string("[PrismCon][") + m_name + "] " + operation +
                               " failed: " + e.what() + "\n";
            try {
                if (m_device) {
                    m_device->write(line);
                    return;
                }
            } catch (const std::exception &) {
                // device is broken too; stderr below
            }
            std::fprintf(stderr, "%s", line.c_str());
        }

        ConsoleContext &m_ctx;
        std::unique_ptr<ITransport> m_device;
        std::shared_ptr<ITransport> m_log;
        RoleFlags m_roles;

    private:
        void reportLogFailure(const std::exception &e) {
            if (m_logFailed) return;
            m_logFailed = true;
            reportFailure("log write", e);
        }

        const char *m_name;
        bool m_logFailed;
        bool m_deviceFailed;
    };

} // namespace prism

#endif // PRISM_CON_SINK_INTERFACE_HPP
