/**
 * @file    directory_tree_test.cpp
 * @brief   Lazy folder tree and image listing
 * @author  AllenK (Kwyshell)
 * @license MIT
 */

#include "io/directory_tree.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace loupe {
namespace {

namespace fs = std::filesystem;

class DirectoryTreeTest : public testing::Test {
protected:
    void SetUp() override {
        const auto* info = testing::UnitTest::GetInstance()->current_test_info();
        m_root = fs::temp_directory_path() / (std::string("loupe_tree_") + info->name());
        fs::remove_all(m_root);

        fs::create_directories(m_root / "zeta");
        fs::create_directories(m_root / "alpha" / "nested");
        fs::create_directories(m_root / ".hidden");
        touch(m_root / "b.png");
        touch(m_root / "a.JPG");
        touch(m_root / "readme.txt");
        touch(m_root / "alpha" / "inner.gif");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_root, ec);
    }

    static void touch(const fs::path& file) {
        std::ofstream(file) << "x";
    }

    std::vector<std::string> child_names(const DirectoryTree& tree, NodeId id) const {
        std::vector<std::string> names;
        for (NodeId child : tree.children(id)) {
            names.push_back(tree.node(child).name);
        }
        return names;
    }

    fs::path m_root;
};

TEST_F(DirectoryTreeTest, RootStartsCollapsed) {
    DirectoryTree tree;
    const NodeId root = tree.add_root(m_root);

    EXPECT_EQ(tree.size(), 1u);
    EXPECT_FALSE(tree.node(root).expanded);
    EXPECT_FALSE(tree.node(root).children_loaded);
    EXPECT_TRUE(tree.children(root).empty());
    ASSERT_EQ(tree.roots().size(), 1u);
    EXPECT_EQ(tree.roots()[0], root);
}

TEST_F(DirectoryTreeTest, ExpandListsFoldersThenImages) {
    DirectoryTree tree;
    const NodeId root = tree.add_root(m_root);

    EXPECT_TRUE(tree.toggle(root));
    EXPECT_TRUE(tree.node(root).children_loaded);
    EXPECT_EQ(child_names(tree, root), (std::vector<std::string>{"alpha", "zeta", "a.JPG", "b.png"}));

    const NodeId alpha = tree.children(root)[0];
    EXPECT_TRUE(tree.node(alpha).is_directory);
    EXPECT_EQ(tree.node(alpha).parent, root);
    EXPECT_FALSE(tree.node(tree.children(root)[2]).is_directory);
}

TEST_F(DirectoryTreeTest, NestedExpansionLoadsLazily) {
    DirectoryTree tree;
    const NodeId root = tree.add_root(m_root);
    tree.toggle(root);

    const NodeId alpha = tree.children(root)[0];
    EXPECT_FALSE(tree.node(alpha).children_loaded);

    tree.toggle(alpha);
    EXPECT_EQ(child_names(tree, alpha), (std::vector<std::string>{"nested", "inner.gif"}));
    EXPECT_EQ(tree.size(), 7u);
}

TEST_F(DirectoryTreeTest, CollapseReleasesSubtreeAndReusesIds) {
    DirectoryTree tree;
    const NodeId root = tree.add_root(m_root);
    tree.toggle(root);
    const NodeId alpha = tree.children(root)[0];
    tree.toggle(alpha);
    ASSERT_EQ(tree.size(), 7u);

    EXPECT_FALSE(tree.toggle(root));
    EXPECT_EQ(tree.size(), 1u);
    EXPECT_TRUE(tree.children(root).empty());
    EXPECT_FALSE(tree.node(root).children_loaded);
    EXPECT_FALSE(tree.valid(alpha));
    EXPECT_THROW((void)tree.node(alpha), std::out_of_range);

    // Re-expanding recycles the freed slots instead of growing
    tree.toggle(root);
    EXPECT_EQ(tree.size(), 5u);
    for (NodeId child : tree.children(root)) {
        EXPECT_LT(child, 7u);
    }
}

TEST_F(DirectoryTreeTest, FilesDoNotToggle) {
    DirectoryTree tree;
    const NodeId root = tree.add_root(m_root);
    tree.toggle(root);

    const NodeId file = tree.children(root)[2];
    EXPECT_FALSE(tree.toggle(file));
    EXPECT_FALSE(tree.node(file).expanded);
    EXPECT_FALSE(tree.toggle(kInvalidNode));
}

TEST_F(DirectoryTreeTest, FindLocatesLoadedPaths) {
    DirectoryTree tree;
    const NodeId root = tree.add_root(m_root);
    EXPECT_FALSE(tree.find(m_root / "b.png").has_value());

    tree.toggle(root);
    const auto found = tree.find(m_root / "b.png");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(tree.node(*found).name, "b.png");
}

TEST_F(DirectoryTreeTest, UnreadableDirectoryExpandsEmpty) {
    DirectoryTree tree;
    const NodeId root = tree.add_root(m_root / "does-not-exist");
    EXPECT_TRUE(tree.toggle(root));
    EXPECT_TRUE(tree.children(root).empty());
    EXPECT_TRUE(tree.node(root).children_loaded);
}

TEST_F(DirectoryTreeTest, VirtualRootHoldsFlatList) {
    DirectoryTree tree;
    const std::vector<fs::path> files = {m_root / "b.png", m_root / "a.JPG"};
    const NodeId recents = tree.add_virtual_root("Recents", files);

    EXPECT_TRUE(tree.node(recents).is_virtual);
    EXPECT_EQ(tree.node(recents).name, "Recents");
    EXPECT_EQ(child_names(tree, recents), (std::vector<std::string>{"b.png", "a.JPG"}));

    // Collapsing a virtual root keeps its entries
    EXPECT_TRUE(tree.toggle(recents));
    EXPECT_FALSE(tree.toggle(recents));
    EXPECT_EQ(tree.children(recents).size(), 2u);

    const std::vector<fs::path> updated = {m_root / "alpha" / "inner.gif"};
    tree.set_virtual_children(recents, updated);
    EXPECT_EQ(child_names(tree, recents), (std::vector<std::string>{"inner.gif"}));
    EXPECT_EQ(tree.size(), 2u);

    // Virtual entries are not real locations
    EXPECT_FALSE(tree.find(fs::path()).has_value());
}

TEST_F(DirectoryTreeTest, VirtualChildrenRequireVirtualRoot) {
    DirectoryTree tree;
    const NodeId root = tree.add_root(m_root);
    EXPECT_THROW(tree.set_virtual_children(root, {}), std::invalid_argument);
}

TEST_F(DirectoryTreeTest, ListImagesIsSortedAndFiltered) {
    const auto images = list_images(m_root);
    ASSERT_EQ(images.size(), 2u);
    EXPECT_EQ(images[0].filename().string(), "a.JPG");
    EXPECT_EQ(images[1].filename().string(), "b.png");

    EXPECT_TRUE(list_images(m_root / "does-not-exist").empty());
}

}  // anonymous namespace
}  // namespace loupe
