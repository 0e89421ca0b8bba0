#include "flowdiff/call_tree.hpp"
#include "flowdiff/flowdiff.hpp"
#include "flowdiff/serialization.hpp"
#include "test_support/temporary_project.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace flowdiff {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;

class CrossLanguageTest : public ::testing::Test {
protected:

    void SetUp() override {
        project_.AddFile("api.py",
                         "from fastapi import FastAPI\n"
                         "from engine import Engine\n"
                         "\n"
                         "app = FastAPI()\n"
                         "\n"
                         "@app.post(\"/analyze\")\n"
                         "def analyze(payload: dict):\n"
                         "    engine = Engine()\n"
                         "    return engine.process(payload)\n");
        project_.AddFile("engine.py",
                         "class Engine:\n"
                         "    def process(self, payload):\n"
                         "        return self.normalize(payload)\n"
                         "\n"
                         "    def normalize(self, payload):\n"
                         "        return payload\n");
        project_.AddFile("scripts/analyze.sh",
                         "#!/bin/bash\n"
                         "curl -X POST http://localhost:8000/analyze -d @payload.json\n");
    }

    test::TemporaryProject project_;
};

TEST_F(CrossLanguageTest, ShellRequestReachesPythonHandler) {
    SymbolTableMap tables = analyze(project_.root());

    const Symbol *script = tables.at(SHELL_LANGUAGE)->get_symbol("scripts.analyze");
    ASSERT_NE(script, nullptr);
    EXPECT_THAT(script->raw_calls, ElementsAre("HTTP:POST:/analyze"));
    EXPECT_THAT(script->resolved_calls, ElementsAre("api.analyze"));

    const Symbol *handler = tables.at(PYTHON_LANGUAGE)->get_symbol("api.analyze");
    ASSERT_NE(handler, nullptr);
    EXPECT_TRUE(handler->is_entry_point);
    EXPECT_THAT(handler->resolved_calls, ElementsAre("engine.Engine", "engine.Engine.process"));
}

TEST_F(CrossLanguageTest, CallTreeSpansBothLanguages) {
    SymbolTableMap tables = analyze(project_.root());
    SymbolUniverse universe = flatten_symbols(tables);

    auto trees = build_call_trees({universe.at("scripts.analyze")}, universe);
    ASSERT_EQ(trees.size(), 1u);

    // analyze.sh -> api.analyze -> Engine.process -> Engine.normalize
    const CallTreeNode &root = trees[0];
    EXPECT_EQ(root.symbol->language, SHELL_LANGUAGE);
    ASSERT_EQ(root.children.size(), 1u);
    const CallTreeNode &handler = root.children[0];
    EXPECT_EQ(handler.symbol->qualified_name, "api.analyze");
    EXPECT_EQ(handler.depth, 1);
    ASSERT_EQ(handler.children.size(), 1u);
    EXPECT_EQ(handler.children[0].symbol->qualified_name, "engine.Engine.process");
    ASSERT_EQ(handler.children[0].children.size(), 1u);
    EXPECT_EQ(handler.children[0].children[0].depth, 3);
    EXPECT_EQ(count_nodes(root), 4u);
}

TEST_F(CrossLanguageTest, CalledByIndexInvertsResolvedCalls) {
    SymbolUniverse universe = flatten_symbols(analyze(project_.root()));
    auto called_by = build_called_by(universe);

    EXPECT_THAT(called_by.at("api.analyze"), ElementsAre("scripts.analyze"));
    EXPECT_THAT(called_by.at("engine.Engine.normalize"), ElementsAre("engine.Engine.process"));
    EXPECT_EQ(called_by.count("engine.Engine"), 0u);
}

TEST_F(CrossLanguageTest, SerializesTablesAndTrees) {
    SymbolTableMap tables = analyze(project_.root());
    json j = tables_to_json(tables);

    ASSERT_TRUE(j.contains(SHELL_LANGUAGE));
    ASSERT_EQ(j[SHELL_LANGUAGE].size(), 1u);
    EXPECT_EQ(j[SHELL_LANGUAGE][0]["file_name"], "analyze.sh");
    EXPECT_EQ(j[SHELL_LANGUAGE][0]["metadata"]["interpreter"], "/bin/bash");

    bool found = false;
    for (const auto &symbol : j[PYTHON_LANGUAGE]) {
        if (symbol["qualified_name"] == "api.analyze") {
            found = true;
            EXPECT_EQ(symbol["metadata"]["http_method"], "POST");
            EXPECT_EQ(symbol["metadata"]["http_route"], "/analyze");
            EXPECT_TRUE(symbol["documentation"].is_null());
        }
    }
    EXPECT_TRUE(found);

    SymbolUniverse universe = flatten_symbols(tables);
    auto trees = build_call_trees({universe.at("scripts.analyze")}, universe);
    json tree = tree_to_json(trees[0], 1);
    EXPECT_EQ(tree["children"][0]["qualified_name"], "api.analyze");
    EXPECT_TRUE(tree["children"][0]["children"].empty());
    EXPECT_EQ(tree["children"][0]["truncated_children"], 1);
}

} // namespace
} // namespace flowdiff
