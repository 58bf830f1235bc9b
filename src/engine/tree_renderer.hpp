#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <filesystem>
#include "ctxpack/types.hpp"

namespace ctxpack::engine {

    constexpr const char* TREE_BRANCH = "├── ";
    constexpr const char* TREE_LAST_BRANCH = "└── ";
    constexpr const char* TREE_VERTICAL = "│   ";
    constexpr const char* TREE_SPACER = "    ";
    constexpr const char* TREE_EMPTY_PLACEHOLDER = "(no files matched the include/exclude filters)";

    /**
     * @brief Prefix-tree node built from relative path segments.
     */
    struct TreeNode {
        enum class Kind { File, Directory };

        std::string name;
        Kind kind = Kind::File;
        std::map<std::string, std::unique_ptr<TreeNode>> children;
        const FileEntry* entry = nullptr; // Set on nodes recorded from a FileEntry

        bool is_directory() const { return kind == Kind::Directory; }
    };

    class TreeRenderer {
    public:
        /**
         * @brief Builds the prefix tree. A node becomes a directory as soon as a path
         * passes through it. Entries must outlive the returned tree.
         */
        static std::unique_ptr<TreeNode> build_tree(const std::vector<FileEntry>& entries);

        /**
         * @brief Renders the tree diagram, one string per line, without trailing newlines.
         *
         * A file root renders as its name alone. A directory root with no entries renders
         * a single placeholder line. Never touches the filesystem.
         */
        static std::vector<std::string> render(const std::string& root_display_name,
                                               const std::vector<FileEntry>& entries,
                                               bool is_directory);

        /**
         * @brief Entries in the order the diagram lists them: depth-first,
         * directories before files, case-insensitive by name.
         */
        static std::vector<FileEntry> order_entries(const std::vector<FileEntry>& entries);

        /**
         * @brief Last path component, or the whole path when there is none (e.g. "/").
         */
        static std::string root_display_name(const std::filesystem::path& root);

    private:
        static std::vector<const TreeNode*> sorted_children(const TreeNode& node);
        static void render_node(const TreeNode& node, const std::string& prefix, std::vector<std::string>& lines);
        static void collect_entries(const TreeNode& node, std::vector<FileEntry>& out);
    };

}
