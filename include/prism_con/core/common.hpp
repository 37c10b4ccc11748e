#ifndef PRISM_CON_COMMON_HPP
#define PRISM_CON_COMMON_HPP

#include <string>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <memory>
#include <utility>

namespace prism {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    /// Millisecond-precision local time, e.g. "26-10-19 14:03:07.125".
    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &time) {
        auto nowTime = std::chrono::system_clock::to_time_t(time);
        auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()) % 1000;

        std::tm tmBuf;
#if defined(_MSC_VER)
        localtime_s(&tmBuf, &nowTime);
#else
        localtime_r(&nowTime, &tmBuf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tmBuf, "%y-%m-%d %H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << nowMs.count();
        return oss.str();
    }

    inline bool containsNewline(const std::string &text) {
        return text.find('\n') != std::string::npos;
    }

    inline std::string replaceAll(const std::string &text, const std::string &from, const std::string &to) {
        if (from.empty()) return text;
        std::string result;
        result.reserve(text.size());
        size_t start = 0;
        size_t pos;
        while ((pos = text.find(from, start)) != std::string::npos) {
            result.append(text, start, pos - start);
            result += to;
            start = pos + from.size();
        }
        result.append(text, start, std::string::npos);
        return result;
    }
} // namespace detail
} // namespace prism

#endif // PRISM_CON_COMMON_HPP
