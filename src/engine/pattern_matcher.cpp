#include "pattern_matcher.hpp"
#include <algorithm>

namespace ctxpack::engine {

    namespace {

        std::string trim(const std::string& s) {
            const char* ws = " \t\r\n";
            auto start = s.find_first_not_of(ws);
            if (start == std::string::npos) return "";
            auto end = s.find_last_not_of(ws);
            return s.substr(start, end - start + 1);
        }

        // Parses the bracket expression starting at pattern[start] == '['.
        // Returns false when it is unterminated; otherwise sets length and whether ch is a member.
        bool match_class(std::string_view pattern, size_t start, char ch, size_t& length, bool& matched) {
            size_t i = start + 1;
            bool negate = false;
            if (i < pattern.size() && pattern[i] == '!') {
                negate = true;
                ++i;
            }

            bool found = false;
            bool first = true;
            while (i < pattern.size()) {
                char c = pattern[i];
                if (c == ']' && !first) {
                    length = i - start + 1;
                    matched = (found != negate);
                    return true;
                }
                first = false;

                if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
                    char lo = c;
                    char hi = pattern[i + 2];
                    if (lo <= ch && ch <= hi) found = true;
                    i += 3;
                } else {
                    if (c == ch) found = true;
                    ++i;
                }
            }
            return false;
        }

    }

    std::vector<std::string> normalize_patterns(const std::vector<std::string>& patterns, bool default_all) {
        std::vector<std::string> result;
        for (const auto& p : patterns) {
            std::string trimmed = trim(p);
            if (!trimmed.empty()) result.push_back(std::move(trimmed));
        }
        if (result.empty() && default_all) {
            result.push_back("*");
        }
        return result;
    }

    bool glob_match(std::string_view text, std::string_view pattern) {
        size_t t = 0;
        size_t p = 0;
        size_t star_p = std::string_view::npos;
        size_t star_t = 0;

        while (t < text.size()) {
            bool advanced = false;
            if (p < pattern.size()) {
                char c = pattern[p];
                if (c == '*') {
                    star_p = p++;
                    star_t = t;
                    continue;
                }
                if (c == '?') {
                    ++p;
                    ++t;
                    advanced = true;
                } else if (c == '[') {
                    size_t length = 0;
                    bool matched = false;
                    if (match_class(pattern, p, text[t], length, matched)) {
                        if (matched) {
                            p += length;
                            ++t;
                            advanced = true;
                        }
                    } else if (text[t] == '[') {
                        ++p;
                        ++t;
                        advanced = true;
                    }
                } else if (c == text[t]) {
                    ++p;
                    ++t;
                    advanced = true;
                }
            }
            if (advanced) continue;

            // Mismatch: let the last '*' swallow one more character.
            if (star_p == std::string_view::npos) return false;
            p = star_p + 1;
            t = ++star_t;
        }

        while (p < pattern.size() && pattern[p] == '*') ++p;
        return p == pattern.size();
    }

    bool pattern_matches(std::string_view path, std::string_view pattern) {
        return glob_match(path, pattern) || path.find(pattern) != std::string_view::npos;
    }

    bool matches_include(std::string_view path, const std::vector<std::string>& patterns) {
        if (patterns.empty()) return true;
        return std::any_of(patterns.begin(), patterns.end(),
            [&](const std::string& p) { return pattern_matches(path, p); });
    }

    bool matches_exclude(std::string_view path, const std::vector<std::string>& patterns) {
        if (patterns.empty()) return false;
        return std::any_of(patterns.begin(), patterns.end(),
            [&](const std::string& p) { return pattern_matches(path, p); });
    }

}
