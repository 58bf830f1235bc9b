#include "walker.hpp"
#include "classifier.hpp"
#include "pattern_matcher.hpp"
#include "ctxpack/errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace ctxpack::engine {

    namespace {

        std::string to_lower(const std::string& s) {
            std::string data = s;
            std::transform(data.begin(), data.end(), data.begin(),
                [](unsigned char c){ return std::tolower(c); });
            return data;
        }

    }

    const char* to_string(SkipReason reason) {
        switch (reason) {
            case SkipReason::None: return "selected";
            case SkipReason::ExcludePattern: return "matches exclude pattern";
            case SkipReason::IgnoreFile: return "ignored by ignore file";
            case SkipReason::TooLarge: return "exceeds size limit";
            case SkipReason::Binary: return "binary";
            case SkipReason::NotIncluded: return "matches no include pattern";
            case SkipReason::Unreadable: return "cannot stat";
            case SkipReason::Symlink: return "symlinked directory";
            case SkipReason::NotRegular: return "not a regular file";
            case SkipReason::OutputArtifact: return "is the output artifact";
        }
        return "unknown";
    }

    SkipReason evaluate_directory(const std::string& relative_path,
                                  const IngestConfig& config,
                                  const ScopeChain& scopes) {
        if (matches_exclude(relative_path, config.exclude_patterns)) return SkipReason::ExcludePattern;
        if (!scopes.empty() && scopes.is_ignored(relative_path, true)) return SkipReason::IgnoreFile;
        return SkipReason::None;
    }

    SkipReason evaluate_file(const std::filesystem::path& absolute_path,
                             const std::string& relative_path,
                             const IngestConfig& config,
                             const ScopeChain& scopes) {
        if (matches_exclude(relative_path, config.exclude_patterns)) return SkipReason::ExcludePattern;
        if (!scopes.empty() && scopes.is_ignored(relative_path, false)) return SkipReason::IgnoreFile;

        if (config.max_file_size_bytes) {
            std::error_code ec;
            auto size = std::filesystem::file_size(absolute_path, ec);
            if (ec) return SkipReason::Unreadable;
            if (size > *config.max_file_size_bytes) return SkipReason::TooLarge;
        }

        if (config.skip_binary_files && is_binary(absolute_path)) return SkipReason::Binary;
        if (!matches_include(relative_path, config.include_patterns)) return SkipReason::NotIncluded;
        return SkipReason::None;
    }

    TreeWalker::TreeWalker(const IngestConfig& config, SkipCallback on_skip)
        : m_config(config.normalized()), m_on_skip(std::move(on_skip)) {
        if (!m_config.output_path.empty()) {
            std::error_code ec;
            m_output_path = std::filesystem::weakly_canonical(m_config.output_path, ec);
            if (ec) m_output_path = std::filesystem::absolute(m_config.output_path, ec).lexically_normal();
        }
    }

    std::vector<FileEntry> TreeWalker::collect(const std::filesystem::path& root) const {
        std::error_code ec;
        auto status = std::filesystem::status(root, ec);
        if (!std::filesystem::exists(status)) {
            throw IngestError(IngestError::Kind::NotFound, "Path does not exist: " + root.string());
        }

        std::vector<FileEntry> entries;
        if (std::filesystem::is_regular_file(status)) {
            ScopeChain no_scopes;
            std::string name = root.filename().string();
            auto reason = evaluate_file(root, name, m_config, no_scopes);
            if (reason == SkipReason::None) {
                entries.push_back({root, name});
            } else {
                report(root, false, reason);
            }
        } else if (std::filesystem::is_directory(status)) {
            ScopeChain scopes;
            walk_directory(root, "", scopes, entries);
        } else {
            throw IngestError(IngestError::Kind::InvalidPath,
                              "Path is neither a regular file nor a directory: " + root.string());
        }
        return entries;
    }

    void TreeWalker::walk_directory(const std::filesystem::path& directory,
                                    const std::string& relative_dir,
                                    ScopeChain& scopes,
                                    std::vector<FileEntry>& entries) const {
        bool pushed = false;
        if (m_config.respect_ignore_files) {
            if (auto scope = IgnoreScope::load(directory, relative_dir, m_config.ignore_file_names)) {
                scopes.push(std::move(*scope));
                pushed = true;
            }
        }

        std::vector<std::filesystem::directory_entry> children;
        std::error_code ec;
        std::filesystem::directory_iterator it(directory, std::filesystem::directory_options::skip_permission_denied, ec);
        for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            children.push_back(*it);
        }
        if (ec) {
            std::cerr << "[TreeWalker] Cannot read directory " << directory.string() << ": " << ec.message() << "\n";
        }

        std::sort(children.begin(), children.end(), [](const auto& a, const auto& b) {
            auto name_a = a.path().filename().string();
            auto name_b = b.path().filename().string();
            auto lower_a = to_lower(name_a);
            auto lower_b = to_lower(name_b);
            if (lower_a != lower_b) return lower_a < lower_b;
            return name_a < name_b;
        });

        for (const auto& child : children) {
            std::string name = child.path().filename().string();
            std::string relative_path = relative_dir.empty() ? name : relative_dir + "/" + name;

            std::error_code type_ec;
            if (child.is_directory(type_ec)) {
                if (child.is_symlink(type_ec)) {
                    report(child.path(), true, SkipReason::Symlink);
                    continue;
                }
                auto reason = evaluate_directory(relative_path, m_config, scopes);
                if (reason != SkipReason::None) {
                    report(child.path(), true, reason);
                    continue;
                }
                walk_directory(child.path(), relative_path, scopes, entries);
            } else if (child.is_regular_file(type_ec)) {
                if (!m_output_path.empty() && child.path() == m_output_path) {
                    report(child.path(), false, SkipReason::OutputArtifact);
                    continue;
                }
                if (m_config.respect_ignore_files
                    && std::find(m_config.ignore_file_names.begin(), m_config.ignore_file_names.end(), name)
                       != m_config.ignore_file_names.end()) {
                    report(child.path(), false, SkipReason::IgnoreFile);
                    continue;
                }
                auto reason = evaluate_file(child.path(), relative_path, m_config, scopes);
                if (reason != SkipReason::None) {
                    report(child.path(), false, reason);
                    continue;
                }
                entries.push_back({child.path(), relative_path});
            } else {
                report(child.path(), false, SkipReason::NotRegular);
            }
        }

        if (pushed) scopes.pop();
    }

    void TreeWalker::report(const std::filesystem::path& path, bool is_dir, SkipReason reason) const {
        if (m_on_skip) m_on_skip(path, is_dir, reason);
    }

}
