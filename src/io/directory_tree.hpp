/**
 * @file    directory_tree.hpp
 * @brief   Lazily expanded directory tree for the file browser
 * @author  AllenK (Kwyshell)
 * @license MIT
 *
 * @details
 * Nodes live in a flat arena and are addressed by NodeId; the parent /
 * children relation is kept in a separate adjacency table. Ids stay valid
 * until the node's parent is collapsed, after which they are recycled.
 *
 * Two kinds of roots:
 *   - directory roots, whose children are read from disk on expansion and
 *     dropped on collapse
 *   - virtual roots (e.g. "Recents"), whose children are supplied by the
 *     caller and survive collapse
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace loupe {

using NodeId = std::uint32_t;
inline constexpr NodeId kInvalidNode = std::numeric_limits<NodeId>::max();

struct TreeNode {
    std::string name;
    std::filesystem::path path;
    NodeId parent{kInvalidNode};
    bool is_directory{false};
    bool is_virtual{false};
    bool expanded{false};
    bool children_loaded{false};
};

class DirectoryTree {
public:
    /**
     * Add a directory root (not expanded)
     */
    NodeId add_root(const std::filesystem::path& directory);

    /**
     * Add a virtual root whose children are the given files
     */
    NodeId add_virtual_root(const std::string& name, std::span<const std::filesystem::path> files);

    /**
     * Replace the children of a virtual root
     */
    void set_virtual_children(NodeId root, std::span<const std::filesystem::path> files);

    /**
     * Expand or collapse a directory node
     * @return  New expanded state (false for files / invalid ids)
     */
    bool toggle(NodeId id);

    [[nodiscard]] const TreeNode& node(NodeId id) const;
    [[nodiscard]] std::span<const NodeId> children(NodeId id) const;
    [[nodiscard]] std::span<const NodeId> roots() const noexcept { return m_roots; }

    /**
     * Find a live node by exact path
     */
    [[nodiscard]] std::optional<NodeId> find(const std::filesystem::path& path) const;

    [[nodiscard]] bool valid(NodeId id) const noexcept;

    /**
     * Number of live nodes
     */
    [[nodiscard]] std::size_t size() const noexcept { return m_nodes.size() - m_free.size(); }

private:
    std::vector<TreeNode> m_nodes;
    std::vector<std::vector<NodeId>> m_children;
    std::vector<bool> m_alive;
    std::vector<NodeId> m_free;
    std::vector<NodeId> m_roots;

    NodeId allocate(TreeNode node);
    void release_children(NodeId id);
    void load_children(NodeId id);
};

/**
 * Ordered list of supported image files directly inside a directory
 */
[[nodiscard]] std::vector<std::filesystem::path> list_images(const std::filesystem::path& directory);

}  // namespace loupe
