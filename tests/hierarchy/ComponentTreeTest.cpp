#include <gtest/gtest.h>
#include <pagecraft/hierarchy/HierarchyManager.h>

using namespace pagecraft;

class ComponentTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        // root -> [left -> [a, b -> [b1]], right]
        auto map = ComponentMap::fromRecords({
            ComponentRecord::create("root", ComponentType::Container),
            ComponentRecord::create("right", ComponentType::Container, "root", 1),
            ComponentRecord::create("left", ComponentType::Container, "root", 0),
            ComponentRecord::create("a", ComponentType::Text, "left", 0),
            ComponentRecord::create("b", ComponentType::Container, "left", 1),
            ComponentRecord::create("b1", ComponentType::Image, "b", 0),
        });
        tree = manager.buildHierarchy(map, "root");
    }

    RuleEngine rules;
    HierarchyManager manager{rules};
    ComponentTree tree;
};

TEST_F(ComponentTreeTest, NodesArePreOrder) {
    std::vector<ComponentId> ids;
    for (const auto& node : tree.nodes()) {
        ids.push_back(node.componentId);
    }

    EXPECT_EQ(ids, (std::vector<ComponentId>{"root", "left", "a", "b", "b1", "right"}));
    EXPECT_EQ(tree.rootId(), "root");
}

TEST_F(ComponentTreeTest, DescendantsStopAtSiblingSubtree) {
    EXPECT_EQ(tree.descendants("left"), (std::vector<ComponentId>{"a", "b", "b1"}));
    EXPECT_EQ(tree.descendants("b"), (std::vector<ComponentId>{"b1"}));
    EXPECT_TRUE(tree.descendants("right").empty());
    EXPECT_EQ(tree.descendants("root").size(), 5u);
}

TEST_F(ComponentTreeTest, ParentPathRunsFromRoot) {
    EXPECT_EQ(tree.parentPath("b1"), (std::vector<ComponentId>{"root", "left", "b"}));
    EXPECT_TRUE(tree.parentPath("root").empty());
    EXPECT_EQ(tree.pathOf("b1"), std::optional<std::string>("root/left/b/b1"));
}

TEST_F(ComponentTreeTest, UnknownIdsAreEmpty) {
    EXPECT_FALSE(tree.contains("ghost"));
    EXPECT_EQ(tree.tryNode("ghost"), nullptr);
    EXPECT_TRUE(tree.children("ghost").empty());
    EXPECT_TRUE(tree.descendants("ghost").empty());
    EXPECT_FALSE(tree.pathOf("ghost").has_value());
    EXPECT_THROW(tree.node("ghost"), std::out_of_range);
}

TEST_F(ComponentTreeTest, ChildrenFollowOrder) {
    EXPECT_EQ(tree.children("root"), (std::vector<ComponentId>{"left", "right"}));
    EXPECT_EQ(tree.node("b1").depth, 3);
}
