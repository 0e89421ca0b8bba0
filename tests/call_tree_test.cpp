#include "flowdiff/call_tree.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace flowdiff {
namespace {

SymbolPtr AddSymbol(SymbolUniverse &universe, const std::string &qname,
                    std::vector<std::string> calls) {
    auto symbol = std::make_shared<Symbol>();
    symbol->name = qname;
    symbol->qualified_name = qname;
    symbol->language = PYTHON_LANGUAGE;
    symbol->metadata = PythonMetadata{};
    symbol->resolved_calls = std::move(calls);
    universe[qname] = symbol;
    return symbol;
}

// f0 -> f1 -> ... -> f{length-1}
SymbolUniverse MakeChain(int length) {
    SymbolUniverse universe;
    for (int i = 0; i < length; ++i) {
        std::vector<std::string> calls;
        if (i + 1 < length)
            calls.push_back("f" + std::to_string(i + 1));
        AddSymbol(universe, "f" + std::to_string(i), calls);
    }
    return universe;
}

const CallTreeNode *NodeAtDepth(const CallTreeNode &root, int depth) {
    const CallTreeNode *node = &root;
    while (node->depth < depth && !node->children.empty()) {
        node = &node->children[0];
    }
    return node->depth == depth ? node : nullptr;
}

TEST(CallTreeTest, MutualRecursionTerminates) {
    SymbolUniverse universe;
    auto a = AddSymbol(universe, "A", {"B"});
    AddSymbol(universe, "B", {"A"});

    auto trees = build_call_trees({a}, universe);
    ASSERT_EQ(trees.size(), 1u);

    // A -> B -> A(leaf)
    const CallTreeNode &root = trees[0];
    ASSERT_EQ(root.children.size(), 1u);
    const CallTreeNode &b = root.children[0];
    EXPECT_EQ(b.symbol->qualified_name, "B");
    ASSERT_EQ(b.children.size(), 1u);
    EXPECT_EQ(b.children[0].symbol->qualified_name, "A");
    EXPECT_TRUE(b.children[0].children.empty());
    EXPECT_EQ(count_nodes(root), 3u);
}

TEST(CallTreeTest, SelfRecursionTerminates) {
    SymbolUniverse universe;
    auto loop = AddSymbol(universe, "loop", {"loop"});

    auto trees = build_call_trees({loop}, universe);
    ASSERT_EQ(trees[0].children.size(), 1u);
    EXPECT_TRUE(trees[0].children[0].children.empty());
}

TEST(CallTreeTest, SharedCalleeAppearsOnEveryBranch) {
    SymbolUniverse universe;
    auto root = AddSymbol(universe, "root", {"left", "right"});
    AddSymbol(universe, "left", {"shared"});
    AddSymbol(universe, "right", {"shared"});
    AddSymbol(universe, "shared", {});

    auto trees = build_call_trees({root}, universe);
    ASSERT_EQ(trees[0].children.size(), 2u);
    EXPECT_EQ(trees[0].children[0].children[0].symbol->qualified_name, "shared");
    EXPECT_EQ(trees[0].children[1].children[0].symbol->qualified_name, "shared");
    EXPECT_EQ(count_nodes(trees[0]), 5u);
}

TEST(CallTreeTest, UnknownTargetsAreSkipped) {
    SymbolUniverse universe;
    auto caller = AddSymbol(universe, "caller", {"os.path.join", "known"});
    AddSymbol(universe, "known", {});

    auto trees = build_call_trees({caller}, universe);
    ASSERT_EQ(trees[0].children.size(), 1u);
    EXPECT_EQ(trees[0].children[0].symbol->qualified_name, "known");
}

TEST(CallTreeTest, DefaultDepthExpandsShallowNodes) {
    SymbolUniverse universe = MakeChain(10);

    CallTreeBuilder builder(universe, 6);
    auto trees = builder.build({universe.at("f0")});
    EXPECT_EQ(builder.max_changed_depth(), 0);
    EXPECT_EQ(builder.expansion_depth(), 6);

    EXPECT_TRUE(NodeAtDepth(trees[0], 5)->is_expanded);
    EXPECT_FALSE(NodeAtDepth(trees[0], 6)->is_expanded);
}

TEST(CallTreeTest, DeepChangeForcesExpansion) {
    SymbolUniverse universe = MakeChain(10);
    universe.at("f8")->has_changes = true;

    CallTreeBuilder builder(universe, 6);
    auto trees = builder.build({universe.at("f0")});
    EXPECT_EQ(builder.max_changed_depth(), 8);
    EXPECT_EQ(builder.expansion_depth(), 8);

    for (int depth = 0; depth < 10; ++depth) {
        const CallTreeNode *node = NodeAtDepth(trees[0], depth);
        ASSERT_NE(node, nullptr) << depth;
        EXPECT_EQ(node->is_expanded, depth < 8) << depth;
    }
}

TEST(CallTreeTest, ChangeDepthIsGlobalAcrossTrees) {
    SymbolUniverse universe = MakeChain(10);
    universe.at("f9")->has_changes = true;
    auto other = AddSymbol(universe, "other", {"f0"});

    // f9 sits at depth 9 under f0 and depth 10 under other
    auto trees = build_call_trees({universe.at("f0"), other}, universe, 6);
    EXPECT_TRUE(NodeAtDepth(trees[0], 8)->is_expanded);
    EXPECT_TRUE(NodeAtDepth(trees[0], 9)->is_expanded);
    EXPECT_FALSE(NodeAtDepth(trees[1], 10)->is_expanded);
}

TEST(CallTreeTest, DefaultDepthIsClamped) {
    SymbolUniverse universe = MakeChain(3);
    CallTreeBuilder builder(universe, 0);
    builder.build({universe.at("f0")});
    EXPECT_EQ(builder.expansion_depth(), MIN_EXPANSION_DEPTH);
}

} // namespace
} // namespace flowdiff
