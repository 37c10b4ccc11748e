#ifndef PRISM_CON_ROLE_FLAGS_HPP
#define PRISM_CON_ROLE_FLAGS_HPP

#include <map>
#include <string>
#include <utility>

namespace prism {

    enum class Role {
        User,
        Error,
        Warn,
        FileOnly
    };

    inline const char *getRoleString(Role role) {
        switch (role) {
            case Role::User: return "user";
            case Role::Error: return "error";
            case Role::Warn: return "warn";
            case Role::FileOnly: return "file_only";
            default: return "unknown";
        }
    }

    /// Active colour / visibility role of a sink.
    struct RoleFlags {
        bool user;
        bool error;
        bool warn;
        bool fileOnly;

        RoleFlags() : user(false), error(false), warn(false), fileOnly(false) {}

        bool &flag(Role role) {
            switch (role) {
                case Role::User: return user;
                case Role::Error: return error;
                case Role::Warn: return warn;
                default: return fileOnly;
            }
        }

        bool flag(Role role) const {
            return const_cast<RoleFlags *>(this)->flag(role);
        }

        static RoleFlags errorRole() {
            RoleFlags flags;
            flags.error = true;
            return flags;
        }
    };

    /// Keyword -> colour sequence.  An empty colour means "use the default
    /// colour of the map this word came from".
    typedef std::map<std::string, std::string> WordColourMap;

    /// Per-sink keyword highlighting, swapped as a unit by the
    /// highlight()/highmap() switches.
    struct KeywordMaps {
        WordColourMap high;
        WordColourMap low;

        KeywordMaps() {}
        KeywordMaps(WordColourMap highWords, WordColourMap lowWords)
            : high(std::move(highWords)), low(std::move(lowWords)) {}
    };

} // namespace prism

#endif // PRISM_CON_ROLE_FLAGS_HPP
