/**
 * @file test_resolve.cpp
 * @brief Unit tests for turning actions into concrete diffs (GoogleTest)
 */

#include <gtest/gtest.h>
#include "treemerge/Resolve.hpp"
#include "treemerge/Errors.hpp"

using namespace treemerge;

namespace {

MergeDecision make_decision(Action action, Diff local, Diff remote) {
    MergeDecision dec;
    dec.action = action;
    dec.local_diff = std::move(local);
    dec.remote_diff = std::move(remote);
    return dec;
}

} // namespace

class ResolveTest : public ::testing::Test {
protected:
    Value node = Value::parse(R"({"a": [1, 2, 3], "b": 2})");
    Diff local{op_replace("b", 3)};
    Diff remote{op_remove("b")};
};

// ============================================================================
// Side selection
// ============================================================================

TEST_F(ResolveTest, BaseResolvesToNothing) {
    EXPECT_TRUE(resolve_action(node, make_decision(Action::Base, local, remote)).empty());
}

TEST_F(ResolveTest, SingleSides) {
    EXPECT_EQ(resolve_action(node, make_decision(Action::Local, local, remote)), local);
    EXPECT_EQ(resolve_action(node, make_decision(Action::Remote, local, remote)), remote);
    EXPECT_EQ(resolve_action(node, make_decision(Action::Either, local, local)), local);
}

TEST_F(ResolveTest, SequentialConcatenation) {
    EXPECT_EQ(resolve_action(node, make_decision(Action::LocalThenRemote, local, remote)),
              (Diff{op_replace("b", 3), op_remove("b")}));
    EXPECT_EQ(resolve_action(node, make_decision(Action::RemoteThenLocal, local, remote)),
              (Diff{op_remove("b"), op_replace("b", 3)}));
}

TEST_F(ResolveTest, CustomUsesCustomDiff) {
    auto dec = make_decision(Action::Custom, local, remote);
    dec.custom_diff = Diff{op_add("c", 1)};
    EXPECT_EQ(resolve_action(node, dec), (Diff{op_add("c", 1)}));
}

// ============================================================================
// Clear
// ============================================================================

TEST_F(ResolveTest, ClearEmptiesTargetedChild) {
    auto dec = make_decision(Action::Clear,
                             {op_replace("a", Value::array({1, 2, 4}))},
                             {op_remove("a")});
    EXPECT_EQ(resolve_action(node, dec), (Diff{op_replace("a", Value::array())}));
}

TEST_F(ResolveTest, ClearKeepsValueKind) {
    Value doc = Value::parse(R"({"s": "text", "m": {"k": 1}, "n": 4})");
    EXPECT_EQ(resolve_action(doc, make_decision(Action::Clear, {op_remove("s")}, {})),
              (Diff{op_replace("s", "")}));
    EXPECT_EQ(resolve_action(doc, make_decision(Action::Clear, {}, {op_remove("m")})),
              (Diff{op_replace("m", Value::object())}));
    EXPECT_EQ(resolve_action(doc, make_decision(Action::Clear, {op_remove("n")}, {})),
              (Diff{op_replace("n", nullptr)}));
}

TEST_F(ResolveTest, ClearWithTwoKeysThrows) {
    try {
        resolve_action(node, make_decision(Action::Clear, {op_remove("a")}, {op_remove("b")}));
        FAIL() << "Expected InconsistentClearKey";
    } catch (const InconsistentClearKey& e) {
        EXPECT_EQ(e.first(), "a");
        EXPECT_EQ(e.second(), "b");
    }
}

TEST_F(ResolveTest, ClearWithoutDiffsThrows) {
    EXPECT_THROW(resolve_action(node, make_decision(Action::Clear, {}, {})),
                 InvalidDecisionShape);
}

TEST_F(ResolveTest, ClearOfMissingChildThrows) {
    EXPECT_THROW(resolve_action(node, make_decision(Action::Clear, {op_add("z", 1)}, {})),
                 PathResolutionError);
}

// ============================================================================
// ClearParent
// ============================================================================

TEST_F(ResolveTest, ClearParentRemovesEveryKey) {
    auto ops = resolve_action(node, make_decision(Action::ClearParent, local, remote));
    EXPECT_EQ(ops, (Diff{op_remove("a"), op_remove("b")}));
}

TEST_F(ResolveTest, ClearParentOnSequenceAndText) {
    auto dec = make_decision(Action::ClearParent, {op_remove(0)}, {});
    EXPECT_EQ(resolve_action(Value::parse("[1, 2, 3]"), dec), (Diff{op_removerange(0, 3)}));
    EXPECT_EQ(resolve_action(Value("x\ny\n"), dec), (Diff{op_removerange(0, 2)}));
}

TEST_F(ResolveTest, ClearParentOnScalarThrows) {
    EXPECT_THROW(resolve_action(Value(1), make_decision(Action::ClearParent, local, {})),
                 InvalidDecisionShape);
}

TEST_F(ResolveTest, UndefinedActionThrows) {
    auto dec = make_decision(static_cast<Action>(99), local, remote);
    EXPECT_THROW(resolve_action(node, dec), UnknownAction);
}

// ============================================================================
// Decisions inside a text line
// ============================================================================

TEST(ResolveLineTest, ClearParentCountsCharacters) {
    auto dec = make_decision(Action::ClearParent, {op_removerange(0, 1)}, {});
    EXPECT_EQ(resolve_line_action("abc\n", dec), (Diff{op_removerange(0, 4)}));
}

TEST(ResolveLineTest, ClearEmptiesOneCharacter) {
    auto dec = make_decision(Action::Clear, {op_replace(2, "X")}, {op_remove(2)});
    EXPECT_EQ(resolve_line_action("abc\n", dec), (Diff{op_replace(2, "")}));
}

TEST(ResolveLineTest, ClearOutOfRangeThrows) {
    auto dec = make_decision(Action::Clear, {op_remove(4)}, {});
    EXPECT_THROW(resolve_line_action("abc\n", dec), PathResolutionError);
}

TEST(ResolveLineTest, OtherActionsUseTheirDiffs) {
    Diff local{op_addrange(1, {"z"})};
    EXPECT_EQ(resolve_line_action("ab\n", make_decision(Action::Local, local, {})), local);
}
