#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <functional>
#include "ctxpack/types.hpp"
#include "config.hpp"
#include "ignore.hpp"

namespace ctxpack::engine {

    /**
     * @brief Why a path was left out of the selection. None means selected.
     */
    enum class SkipReason {
        None,
        ExcludePattern,
        IgnoreFile,
        TooLarge,
        Binary,
        NotIncluded,
        Unreadable,
        Symlink,
        NotRegular,
        OutputArtifact
    };

    const char* to_string(SkipReason reason);

    /**
     * @brief Pruning decision for a directory: exclude pattern, then ignore verdict.
     */
    SkipReason evaluate_directory(const std::string& relative_path,
                                  const IngestConfig& config,
                                  const ScopeChain& scopes);

    /**
     * @brief Selection decision for a file, cheapest checks first:
     * exclude pattern, ignore verdict, size limit, binary sniff, include pattern.
     */
    SkipReason evaluate_file(const std::filesystem::path& absolute_path,
                             const std::string& relative_path,
                             const IngestConfig& config,
                             const ScopeChain& scopes);

    class TreeWalker {
    public:
        using SkipCallback = std::function<void(const std::filesystem::path&, bool is_dir, SkipReason)>;

        /**
         * @param config Patterns are normalized on construction.
         * @param on_skip Called for every rejected file and every pruned directory.
         */
        explicit TreeWalker(const IngestConfig& config, SkipCallback on_skip = {});

        /**
         * @brief Collects the selected files under root (or root itself when it is a file).
         * @throws IngestError NotFound when root is missing, InvalidPath when it is
         *         neither a regular file nor a directory.
         * @return Entries in traversal order: case-insensitive name order per directory.
         */
        std::vector<FileEntry> collect(const std::filesystem::path& root) const;

    private:
        IngestConfig m_config;
        SkipCallback m_on_skip;
        std::filesystem::path m_output_path; // Never select the artifact being written

        void walk_directory(const std::filesystem::path& directory,
                            const std::string& relative_dir,
                            ScopeChain& scopes,
                            std::vector<FileEntry>& entries) const;

        void report(const std::filesystem::path& path, bool is_dir, SkipReason reason) const;
    };

}
