#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ctxpack::engine {

    /**
     * @brief Trims patterns and drops blank ones.
     * @param default_all When the result is empty, return {"*"} instead.
     */
    std::vector<std::string> normalize_patterns(const std::vector<std::string>& patterns, bool default_all);

    /**
     * @brief fnmatch-style whole-string glob: '*' (crosses '/'), '?', "[...]", "[!...]".
     * An unterminated '[' is matched literally.
     */
    bool glob_match(std::string_view text, std::string_view pattern);

    /**
     * @brief A pattern matches when it globs the whole path or appears verbatim inside it.
     *
     * The substring fallback lets bare folder names ("build") work as excludes. It is
     * looser than glob semantics ("build" also hits "src/build_utils.py") and is kept
     * that way on purpose.
     */
    bool pattern_matches(std::string_view path, std::string_view pattern);

    /** @brief Empty list matches everything. */
    bool matches_include(std::string_view path, const std::vector<std::string>& patterns);

    /** @brief Empty list matches nothing. */
    bool matches_exclude(std::string_view path, const std::vector<std::string>& patterns);

}
