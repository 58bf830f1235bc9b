#pragma once

#include <filesystem>

namespace ctxpack::platform {

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        /**
         * @brief Per-user config directory: $XDG_CONFIG_HOME/ctxpack, else ~/.config/ctxpack.
         * @return Empty path when neither variable is set.
         */
        std::filesystem::path get_config_dir();

        /**
         * @brief Expands a leading "~" or "~/" to $HOME. Other paths are returned unchanged.
         */
        std::filesystem::path expand_user(const std::filesystem::path& path);
    }

}
