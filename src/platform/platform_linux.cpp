#include "../platform.hpp"
#include <cstdlib>
#include <string>

namespace ctxpack::platform {

    namespace system {
        std::filesystem::path get_config_dir() {
            const char* xdg = std::getenv("XDG_CONFIG_HOME");
            if (xdg && *xdg) return std::filesystem::path(xdg) / "ctxpack";
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".config/ctxpack" : "";
        }

        std::filesystem::path expand_user(const std::filesystem::path& path) {
            const std::string raw = path.string();
            if (raw.empty() || raw[0] != '~') return path;
            if (raw.size() > 1 && raw[1] != '/') return path; // "~user" is left alone

            const char* home = std::getenv("HOME");
            if (!home) return path;
            if (raw.size() <= 2) return std::filesystem::path(home);
            return std::filesystem::path(home) / raw.substr(2);
        }
    }

}
