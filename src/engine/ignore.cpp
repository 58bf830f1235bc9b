#include "ignore.hpp"
#include <fstream>
#include <iostream>

namespace ctxpack::engine {

    namespace {

        void append_literal(std::string& regex_str, char c) {
            static const std::string special = ".^$|()[]{}+*?\\";
            if (special.find(c) != std::string::npos) regex_str += '\\';
            regex_str += c;
        }

    }

    std::optional<IgnoreScope> IgnoreScope::load(const std::filesystem::path& directory,
                                                 const std::string& relative_dir,
                                                 const std::vector<std::string>& file_names) {
        IgnoreScope scope(relative_dir);

        for (const auto& name : file_names) {
            auto ignore_file = directory / name;
            std::error_code ec;
            if (!std::filesystem::is_regular_file(ignore_file, ec)) continue;

            std::ifstream file(ignore_file);
            if (!file.is_open()) {
                std::cerr << "[IgnoreScope] Cannot read " << ignore_file.string() << ", skipping.\n";
                continue;
            }

            std::string line;
            while (std::getline(file, line)) {
                scope.add_line(line);
            }
        }

        if (scope.m_rules.empty()) return std::nullopt;
        return scope;
    }

    std::optional<IgnoreScope> IgnoreScope::from_lines(const std::string& relative_dir,
                                                       const std::vector<std::string>& lines) {
        IgnoreScope scope(relative_dir);
        for (const auto& line : lines) {
            scope.add_line(line);
        }
        if (scope.m_rules.empty()) return std::nullopt;
        return scope;
    }

    void IgnoreScope::add_line(const std::string& raw) {
        std::string line = raw;
        // Trim trailing whitespace (including CR from CRLF files)
        line.erase(line.find_last_not_of(" \t\r\n") + 1);

        if (line.empty() || line[0] == '#') return;

        bool negated = false;
        if (line[0] == '!') {
            negated = true;
            line.erase(0, 1);
        } else if (line.size() > 1 && line[0] == '\\' && (line[1] == '#' || line[1] == '!')) {
            line.erase(0, 1);
        }

        bool dir_only = false;
        while (!line.empty() && line.back() == '/') {
            dir_only = true;
            line.pop_back();
        }
        if (line.empty()) return;

        bool anchored = line.find('/') != std::string::npos;
        if (line[0] == '/') line.erase(0, 1);
        if (line.empty()) return;

        std::string body = glob_to_regex(line, anchored);
        try {
            m_rules.push_back({std::regex(body + (dir_only ? "/$" : "/?$")),
                               std::regex(body + "/.+$"),
                               raw,
                               negated});
        } catch (const std::regex_error& e) {
            std::cerr << "[IgnoreScope] Dropping invalid rule '" << raw << "': " << e.what() << "\n";
        }
    }

    std::optional<bool> IgnoreScope::match(const std::string& relative_path, bool is_dir) const {
        std::string scoped;
        if (m_base.empty()) {
            scoped = relative_path;
        } else if (relative_path.size() > m_base.size()
                   && relative_path.compare(0, m_base.size(), m_base) == 0
                   && relative_path[m_base.size()] == '/') {
            scoped = relative_path.substr(m_base.size() + 1);
        } else {
            return std::nullopt;
        }

        if (scoped.empty()) return std::nullopt;
        if (is_dir && scoped.back() != '/') scoped += '/';

        // 2 = direct match, 1 = match through a parent directory
        std::optional<bool> verdict;
        int priority = 0;
        for (const auto& rule : m_rules) {
            int p = 0;
            if (std::regex_match(scoped, rule.direct)) p = 2;
            else if (std::regex_match(scoped, rule.descendant)) p = 1;
            else continue;

            bool ignore = !rule.negated;
            if ((ignore && p == 1) || p >= priority) {
                verdict = ignore;
                priority = p;
            }
        }
        return verdict;
    }

    std::string IgnoreScope::glob_to_regex(const std::string& glob, bool anchored) {
        // Unanchored patterns may match at any depth below the scope directory.
        std::string regex_str = anchored ? "^" : "^(?:.*/)?";

        for (size_t i = 0; i < glob.size(); ++i) {
            char c = glob[i];
            bool at_segment_start = (i == 0 || glob[i - 1] == '/');

            if (c == '*' && at_segment_start && i + 1 < glob.size() && glob[i + 1] == '*'
                && (i + 2 == glob.size() || glob[i + 2] == '/')) {
                if (i + 2 == glob.size()) {
                    regex_str += ".+";       // "dir/**": everything inside, not dir itself
                    i += 1;
                } else {
                    regex_str += "(?:.*/)?"; // "**/" : zero or more directories
                    i += 2;
                }
            } else if (c == '*') {
                regex_str += "[^/]*";
            } else if (c == '?') {
                regex_str += "[^/]";
            } else if (c == '[') {
                // A ']' right after "[" or "[!" is a member, not the end of the class
                size_t first = (i + 1 < glob.size() && glob[i + 1] == '!') ? i + 2 : i + 1;
                size_t close = glob.find(']', first + 1);
                if (close == std::string::npos) {
                    regex_str += "\\[";
                    continue;
                }
                std::string cls = glob.substr(i + 1, close - i - 1);
                regex_str += '[';
                size_t k = 0;
                if (!cls.empty() && cls[0] == '!') {
                    regex_str += '^';
                    k = 1;
                }
                for (; k < cls.size(); ++k) {
                    if (cls[k] == '\\' || cls[k] == '^' || cls[k] == '[' || cls[k] == ']') regex_str += '\\';
                    regex_str += cls[k];
                }
                regex_str += ']';
                i = close;
            } else if (c == '\\' && i + 1 < glob.size()) {
                append_literal(regex_str, glob[++i]);
            } else {
                append_literal(regex_str, c);
            }
        }
        return regex_str;
    }

    void ScopeChain::push(IgnoreScope scope) {
        m_scopes.push_back(std::move(scope));
    }

    void ScopeChain::pop() {
        if (!m_scopes.empty()) m_scopes.pop_back();
    }

    bool ScopeChain::is_ignored(const std::string& relative_path, bool is_dir) const {
        bool ignored = false;
        for (const auto& scope : m_scopes) {
            auto verdict = scope.match(relative_path, is_dir);
            if (verdict) ignored = *verdict;
        }
        return ignored;
    }

}
