#include "tree_renderer.hpp"
#include <algorithm>
#include <cctype>

namespace ctxpack::engine {

    namespace {

        std::vector<std::string> split_path(const std::string& path) {
            std::vector<std::string> parts;
            size_t start = 0;
            while (start <= path.size()) {
                size_t slash = path.find('/', start);
                if (slash == std::string::npos) slash = path.size();
                if (slash > start) parts.push_back(path.substr(start, slash - start));
                start = slash + 1;
            }
            return parts;
        }

        std::string to_lower(const std::string& s) {
            std::string data = s;
            std::transform(data.begin(), data.end(), data.begin(),
                [](unsigned char c){ return std::tolower(c); });
            return data;
        }

    }

    std::unique_ptr<TreeNode> TreeRenderer::build_tree(const std::vector<FileEntry>& entries) {
        auto root = std::make_unique<TreeNode>();
        root->kind = TreeNode::Kind::Directory;

        for (const auto& entry : entries) {
            auto parts = split_path(entry.display_name());
            TreeNode* node = root.get();
            for (size_t i = 0; i < parts.size(); ++i) {
                bool has_tail = i + 1 < parts.size();
                auto& slot = node->children[parts[i]];
                if (!slot) {
                    slot = std::make_unique<TreeNode>();
                    slot->name = parts[i];
                }
                if (has_tail) {
                    slot->kind = TreeNode::Kind::Directory;
                } else {
                    slot->entry = &entry;
                }
                node = slot.get();
            }
        }
        return root;
    }

    std::vector<const TreeNode*> TreeRenderer::sorted_children(const TreeNode& node) {
        std::vector<const TreeNode*> children;
        children.reserve(node.children.size());
        for (const auto& [name, child] : node.children) {
            children.push_back(child.get());
        }

        std::sort(children.begin(), children.end(), [](const TreeNode* a, const TreeNode* b) {
            if (a->is_directory() != b->is_directory()) return a->is_directory();
            auto lower_a = to_lower(a->name);
            auto lower_b = to_lower(b->name);
            if (lower_a != lower_b) return lower_a < lower_b;
            return a->name < b->name;
        });
        return children;
    }

    std::vector<std::string> TreeRenderer::render(const std::string& root_display_name,
                                                  const std::vector<FileEntry>& entries,
                                                  bool is_directory) {
        if (!is_directory) return {root_display_name};
        if (entries.empty()) return {TREE_EMPTY_PLACEHOLDER};

        auto root = build_tree(entries);
        std::vector<std::string> lines;
        lines.push_back(root_display_name + "/");
        render_node(*root, "", lines);
        return lines;
    }

    void TreeRenderer::render_node(const TreeNode& node, const std::string& prefix, std::vector<std::string>& lines) {
        auto children = sorted_children(node);
        for (size_t i = 0; i < children.size(); ++i) {
            const TreeNode* child = children[i];
            bool is_last = (i + 1 == children.size());

            std::string label = child->is_directory() ? child->name + "/" : child->name;
            lines.push_back(prefix + (is_last ? TREE_LAST_BRANCH : TREE_BRANCH) + label);

            if (!child->children.empty()) {
                render_node(*child, prefix + (is_last ? TREE_SPACER : TREE_VERTICAL), lines);
            }
        }
    }

    std::vector<FileEntry> TreeRenderer::order_entries(const std::vector<FileEntry>& entries) {
        auto root = build_tree(entries);
        std::vector<FileEntry> ordered;
        ordered.reserve(entries.size());
        collect_entries(*root, ordered);
        return ordered;
    }

    void TreeRenderer::collect_entries(const TreeNode& node, std::vector<FileEntry>& out) {
        for (const TreeNode* child : sorted_children(node)) {
            if (child->entry) out.push_back(*child->entry);
            collect_entries(*child, out);
        }
    }

    std::string TreeRenderer::root_display_name(const std::filesystem::path& root) {
        auto name = root.filename().string();
        if (!name.empty()) return name;

        auto parent_name = root.parent_path().filename().string();
        if (!parent_name.empty()) return parent_name; // "dir/" has an empty filename
        return root.string();
    }

}
