/**
 * @file    directory_tree.cpp
 * @brief   Lazily expanded directory tree for the file browser
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "io/directory_tree.hpp"
#include "io/image_codec.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace loupe {

namespace {

std::string display_name(const fs::path& path) {
    std::string name = filename_utf8(path);
    if (name.empty()) {
        name = to_utf8(path);   // Root directories have no filename
    }
    return name;
}

bool by_name(const fs::path& a, const fs::path& b) {
    return a.filename() < b.filename();
}

}  // anonymous namespace

NodeId DirectoryTree::allocate(TreeNode node) {
    if (!m_free.empty()) {
        const NodeId id = m_free.back();
        m_free.pop_back();
        m_nodes[id] = std::move(node);
        m_children[id].clear();
        m_alive[id] = true;
        return id;
    }

    const auto id = static_cast<NodeId>(m_nodes.size());
    m_nodes.push_back(std::move(node));
    m_children.emplace_back();
    m_alive.push_back(true);
    return id;
}

NodeId DirectoryTree::add_root(const fs::path& directory) {
    TreeNode node;
    node.name = display_name(directory);
    node.path = directory;
    node.is_directory = true;

    const NodeId id = allocate(std::move(node));
    m_roots.push_back(id);
    return id;
}

NodeId DirectoryTree::add_virtual_root(const std::string& name, std::span<const fs::path> files) {
    TreeNode node;
    node.name = name;
    node.is_directory = true;
    node.is_virtual = true;

    const NodeId id = allocate(std::move(node));
    m_roots.push_back(id);
    set_virtual_children(id, files);
    return id;
}

void DirectoryTree::set_virtual_children(NodeId root, std::span<const fs::path> files) {
    if (!valid(root) || !m_nodes[root].is_virtual) {
        throw std::invalid_argument("Not a virtual root");
    }

    release_children(root);

    for (const auto& file : files) {
        TreeNode child;
        child.name = display_name(file);
        child.path = file;
        child.parent = root;

        const NodeId child_id = allocate(std::move(child));
        m_children[root].push_back(child_id);
    }
    m_nodes[root].children_loaded = true;
}

bool DirectoryTree::toggle(NodeId id) {
    if (!valid(id) || !m_nodes[id].is_directory) {
        return false;
    }

    TreeNode& node = m_nodes[id];
    node.expanded = !node.expanded;

    if (node.is_virtual) {
        return node.expanded;
    }

    if (node.expanded) {
        if (!node.children_loaded) {
            load_children(id);
        }
    } else {
        // Collapsing drops the subtree; it is re-read on the next expansion
        release_children(id);
        m_nodes[id].children_loaded = false;
    }

    return m_nodes[id].expanded;
}

const TreeNode& DirectoryTree::node(NodeId id) const {
    if (!valid(id)) {
        throw std::out_of_range("Invalid tree node id");
    }
    return m_nodes[id];
}

std::span<const NodeId> DirectoryTree::children(NodeId id) const {
    if (!valid(id)) {
        return {};
    }
    return m_children[id];
}

std::optional<NodeId> DirectoryTree::find(const fs::path& path) const {
    for (NodeId id = 0; id < m_nodes.size(); ++id) {
        if (m_alive[id] && !m_nodes[id].is_virtual && m_nodes[id].path == path) {
            return id;
        }
    }
    return std::nullopt;
}

bool DirectoryTree::valid(NodeId id) const noexcept {
    return id < m_nodes.size() && m_alive[id];
}

void DirectoryTree::release_children(NodeId id) {
    // Iterative so deep trees cannot blow the stack
    std::vector<NodeId> pending(m_children[id].begin(), m_children[id].end());
    m_children[id].clear();

    while (!pending.empty()) {
        const NodeId current = pending.back();
        pending.pop_back();

        pending.insert(pending.end(), m_children[current].begin(), m_children[current].end());
        m_children[current].clear();
        m_nodes[current] = TreeNode{};
        m_alive[current] = false;
        m_free.push_back(current);
    }
}

void DirectoryTree::load_children(NodeId id) {
    const fs::path directory = m_nodes[id].path;

    std::vector<fs::path> directories;
    std::vector<fs::path> files;

    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot read directory {}: {}", directory, ec.message());
        m_nodes[id].children_loaded = true;
        return;
    }

    for (const auto& entry : it) {
        const fs::path& child = entry.path();
        std::error_code type_ec;

        if (entry.is_directory(type_ec)) {
            if (!filename_utf8(child).starts_with('.')) {
                directories.push_back(child);
            }
        } else if (entry.is_regular_file(type_ec) && is_supported_extension(child)) {
            files.push_back(child);
        }
    }

    std::sort(directories.begin(), directories.end(), by_name);
    std::sort(files.begin(), files.end(), by_name);

    for (const auto& dir : directories) {
        TreeNode child;
        child.name = display_name(dir);
        child.path = dir;
        child.parent = id;
        child.is_directory = true;
        const NodeId child_id = allocate(std::move(child));
        m_children[id].push_back(child_id);
    }
    for (const auto& file : files) {
        TreeNode child;
        child.name = display_name(file);
        child.path = file;
        child.parent = id;
        const NodeId child_id = allocate(std::move(child));
        m_children[id].push_back(child_id);
    }

    m_nodes[id].children_loaded = true;
    spdlog::debug("Loaded {} entries under {}", m_children[id].size(), directory);
}

std::vector<fs::path> list_images(const fs::path& directory) {
    std::vector<fs::path> images;

    std::error_code ec;
    fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot list directory {}: {}", directory, ec.message());
        return images;
    }

    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_regular_file(type_ec) && is_supported_extension(entry.path())) {
            images.push_back(entry.path());
        }
    }

    std::sort(images.begin(), images.end(), by_name);
    return images;
}

}  // namespace loupe
