#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <regex>

namespace ctxpack::engine {

    /**
     * @brief Rules of the ignore-file(s) of one directory, applying to that directory
     * and everything below it.
     */
    class IgnoreScope {
    public:
        /**
         * @brief Builds the scope of a directory from its ignore files.
         * @param directory Absolute path of the directory.
         * @param relative_dir Root-relative, '/'-separated path of the directory ("" for the root).
         * @param file_names Ignore-file names to read, in order (e.g. ".gitignore").
         * @return std::nullopt when no file exists or none of them holds a rule.
         */
        static std::optional<IgnoreScope> load(const std::filesystem::path& directory,
                                               const std::string& relative_dir,
                                               const std::vector<std::string>& file_names);

        /**
         * @brief Builds a scope from in-memory lines, one rule per line.
         */
        static std::optional<IgnoreScope> from_lines(const std::string& relative_dir,
                                                     const std::vector<std::string>& lines);

        /**
         * @brief Evaluates the rules in file order; the last matching rule wins.
         *
         * A rule that only matches through a parent directory of the candidate is
         * weaker than one matching the candidate itself: a negated parent match
         * cannot re-include a file that a direct rule ignored.
         *
         * @param relative_path Root-relative candidate path.
         * @param is_dir Directory candidates are matched with a trailing '/'.
         * @return true = ignored, false = re-included by a negated rule,
         *         std::nullopt = no rule matched (or the candidate lies outside this scope).
         */
        std::optional<bool> match(const std::string& relative_path, bool is_dir) const;

        const std::string& base() const { return m_base; }
        size_t rule_count() const { return m_rules.size(); }

    private:
        struct Rule {
            std::regex direct;     // Matches the candidate itself
            std::regex descendant; // Matches a path below something the rule names
            std::string original;
            bool negated = false;
        };

        std::string m_base;
        std::vector<Rule> m_rules;

        explicit IgnoreScope(std::string base) : m_base(std::move(base)) {}

        void add_line(const std::string& line);
        static std::string glob_to_regex(const std::string& glob, bool anchored);
    };

    /**
     * @brief Scopes from the walk root down to the directory currently being walked.
     */
    class ScopeChain {
    public:
        void push(IgnoreScope scope);
        void pop();

        bool empty() const { return m_scopes.empty(); }
        size_t size() const { return m_scopes.size(); }

        /**
         * @brief A more specific scope overrides the verdict of less specific ones,
         * but only when one of its rules matches. No match anywhere means kept.
         */
        bool is_ignored(const std::string& relative_path, bool is_dir) const;

    private:
        std::vector<IgnoreScope> m_scopes;
    };

}
