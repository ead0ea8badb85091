/**
 * @file test_apply.cpp
 * @brief Tests for applying merge decisions to a base document (GoogleTest)
 *
 * Tests cover:
 * - Single decisions on mappings, sequences and text lines
 * - Deeper decisions applied before their ancestors
 * - Clear and ClearParent, including the parent override
 * - Applicator state and error propagation
 */

#include <gtest/gtest.h>
#include "treemerge/Apply.hpp"
#include "treemerge/Builder.hpp"
#include "treemerge/Errors.hpp"

using namespace treemerge;

// ============================================================================
// Basic application
// ============================================================================

TEST(ApplyTest, LocalReplaceInNestedMapping) {
    Value base = Value::parse(R"({"a": {"b": [1, 2, 3]}})");

    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a"}, {op_replace("b", Value::array({1, 2, 9}))}, {});

    Value merged = apply_decisions(base, builder.finalize());
    EXPECT_EQ(merged, Value::parse(R"({"a": {"b": [1, 2, 9]}})"));
    EXPECT_EQ(base, Value::parse(R"({"a": {"b": [1, 2, 3]}})"));
}

TEST(ApplyTest, RemoteEditInsideTextLine) {
    Value base = Value::parse(R"({"a": "x\ny\nz"})");

    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a", 1}, {}, {op_addrange(0, {"Y"}), op_removerange(0, 1)});

    EXPECT_EQ(apply_decisions(base, builder.finalize()), Value::parse(R"({"a": "x\nY\nz"})"));
}

TEST(ApplyTest, NoDecisionsLeavesBase) {
    Value base = Value::parse(R"({"a": 1})");
    EXPECT_EQ(apply_decisions(base, {}), base);
}

TEST(ApplyTest, BaseActionIsNoOp) {
    Value base = Value::parse(R"({"a": {"b": 1}})");

    MergeDecisionBuilder builder;
    builder.keep(Path{"a"}, {}, {});
    builder.conflict(Path{"a"}, {op_replace("b", 2)}, {op_replace("b", 3)});

    EXPECT_EQ(apply_decisions(base, builder.finalize()), base);
}

TEST(ApplyTest, DeeperDecisionsApplyFirst) {
    Value base = Value::parse(R"({"a": {"b": 1, "c": [1, 2]}})");

    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a"}, {}, {op_replace("b", 2)});
    builder.one_sided(Path{"a", "c"}, {op_addrange(2, {3})}, {});

    EXPECT_EQ(apply_decisions(base, builder.finalize()),
              Value::parse(R"({"a": {"b": 2, "c": [1, 2, 3]}})"));
}

TEST(ApplyTest, SequenceIndicesReferToBase) {
    Value base = Value::parse(R"({"l": [[1], [2], [3]]})");

    MergeDecisionBuilder builder;
    builder.one_sided(Path{"l"}, {op_removerange(1, 1)}, {});
    builder.one_sided(Path{"l", 0}, {}, {op_replace(0, 9)});
    builder.one_sided(Path{"l", 2}, {op_addrange(1, {4})}, {});

    EXPECT_EQ(apply_decisions(base, builder.finalize()),
              Value::parse(R"({"l": [[9], [3, 4]]})"));
}

TEST(ApplyTest, SequentialActionsKeepSideOrder) {
    Value base = Value::parse(R"({"l": [1, 2]})");
    Diff local{op_addrange(2, {3})};
    Diff remote{op_addrange(2, {4})};

    MergeDecisionBuilder ltr;
    ltr.local_then_remote(Path{"l"}, local, remote);
    EXPECT_EQ(apply_decisions(base, ltr.finalize()), Value::parse(R"({"l": [1, 2, 3, 4]})"));

    MergeDecisionBuilder rtl;
    rtl.remote_then_local(Path{"l"}, local, remote);
    EXPECT_EQ(apply_decisions(base, rtl.finalize()), Value::parse(R"({"l": [1, 2, 4, 3]})"));
}

TEST(ApplyTest, EditsOfSameLineCombine) {
    Value base = Value::parse(R"({"s": "ab\ncd\n"})");

    MergeDecisionBuilder builder;
    builder.one_sided(Path{"s", 0}, {op_addrange(0, {"X"})}, {});
    builder.one_sided(Path{"s", 0}, {}, {op_addrange(2, {"Y"})});

    EXPECT_EQ(apply_decisions(base, builder.finalize()),
              Value::parse(R"({"s": "XabY\ncd\n"})"));
}

TEST(ApplyTest, LinesOfOneTextApplyTogether) {
    Value base = Value::parse(R"({"s": "a\nb\nc\n"})");

    MergeDecisionBuilder builder;
    builder.one_sided(Path{"s", 0}, {op_removerange(0, 1)}, {});
    builder.one_sided(Path{"s", 2}, {}, {op_addrange(0, {"C"})});
    builder.one_sided(Path{"s"}, {op_addrange(3, {"d\n"})}, {});

    EXPECT_EQ(apply_decisions(base, builder.finalize()),
              Value::parse(R"({"s": "\nb\nCc\nd\n"})"));
}

// ============================================================================
// Clear / ClearParent
// ============================================================================

TEST(ApplyClearTest, ClearEmptiesChild) {
    Value base = Value::parse(R"({"a": [1, 2, 3]})");

    MergeDecisionBuilder builder;
    builder.add(Path{}, Action::Clear,
                {op_replace("a", Value::array({1, 2, 4}))}, {op_remove("a")}, true);

    EXPECT_EQ(apply_decisions(base, builder.finalize()), Value::parse(R"({"a": []})"));
}

TEST(ApplyClearTest, ClearParentEmptiesMapping) {
    Value base = Value::parse(R"({"a": 1, "b": 2})");

    MergeDecisionBuilder builder;
    builder.add(Path{}, Action::ClearParent, {op_remove("a")}, {op_replace("b", 3)}, true);

    EXPECT_EQ(apply_decisions(base, builder.finalize()), Value::object());
}

TEST(ApplyClearTest, ClearParentOverridesEarlierDecisionsInGroup) {
    Value base = Value::parse(R"({"a": 1, "b": 2})");

    MergeDecisionBuilder builder;
    builder.one_sided(Path{}, {op_add("c", 1)}, {});
    builder.add(Path{}, Action::ClearParent, {op_remove("a")}, {op_remove("b")}, true);

    EXPECT_EQ(apply_decisions(base, builder.finalize()), Value::object());
}

TEST(ApplyClearTest, ClearParentDropsLaterDecisionsInGroup) {
    Value base = Value::parse(R"({"a": 1, "b": 2})");

    MergeDecisionBuilder builder;
    builder.add(Path{}, Action::ClearParent, {op_remove("a")}, {op_remove("b")}, true);
    builder.one_sided(Path{}, {op_add("c", 1)}, {});

    EXPECT_EQ(apply_decisions(base, builder.finalize()), Value::object());
}

TEST(ApplyClearTest, RepeatedClearParentAppliesOnce) {
    Value base = Value::parse(R"({"a": 1})");

    MergeDecisionBuilder builder;
    builder.add(Path{}, Action::ClearParent, {op_remove("a")}, {}, true);
    builder.add(Path{}, Action::ClearParent, {}, {op_replace("a", 2)}, true);

    EXPECT_EQ(apply_decisions(base, builder.finalize()), Value::object());
}

TEST(ApplyClearTest, ClearParentAfterChildEdits) {
    Value base = Value::parse(R"({"a": {"x": {"k": 1}, "y": 2}, "z": 0})");

    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a", "x"}, {op_replace("k", 2)}, {});
    builder.add(Path{"a"}, Action::ClearParent, {op_remove("y")}, {op_replace("y", 3)}, true);

    EXPECT_EQ(apply_decisions(base, builder.finalize()),
              Value::parse(R"({"a": {}, "z": 0})"));
}

TEST(ApplyClearTest, ClearParentOnText) {
    Value base = Value::parse(R"({"s": "a\nb\n"})");

    MergeDecisionBuilder builder;
    builder.add(Path{"s"}, Action::ClearParent, {op_removerange(0, 1)}, {op_addrange(2, {"c\n"})}, true);

    EXPECT_EQ(apply_decisions(base, builder.finalize()), Value::parse(R"({"s": ""})"));
}

TEST(ApplyClearTest, ClearParentOnTextLineEmptiesLine) {
    Value base = Value::parse(R"({"s": "abc\nd\n"})");

    MergeDecisionBuilder builder;
    builder.add(Path{"s", 0}, Action::ClearParent,
                {op_removerange(0, 1)}, {op_addrange(3, {"x"})}, true);

    EXPECT_EQ(apply_decisions(base, builder.finalize()), Value::parse(R"({"s": "d\n"})"));
}

TEST(ApplyClearTest, ClearOnTextLineEmptiesCharacter) {
    Value base = Value::parse(R"({"s": "abc\nd\n"})");

    MergeDecisionBuilder builder;
    builder.add(Path{"s", 0}, Action::Clear, {op_replace(1, "X")}, {op_remove(1)}, true);

    EXPECT_EQ(apply_decisions(base, builder.finalize()), Value::parse(R"({"s": "ac\nd\n"})"));
}

TEST(ApplyClearTest, ClearOnTextLineOutOfRange) {
    Value base = Value::parse(R"({"s": "abc\n"})");

    MergeDecisionBuilder builder;
    builder.add(Path{"s", 0}, Action::Clear, {op_replace(7, "X")}, {}, true);

    EXPECT_THROW(apply_decisions(base, builder.finalize()), PathResolutionError);
}

TEST(ApplyClearTest, ClearParentOnTextLineKeepsOtherLines) {
    Value base = Value::parse(R"({"s": "abc\nd\ne\n"})");

    MergeDecisionBuilder builder;
    builder.one_sided(Path{"s", 0}, {op_addrange(0, {"Y"})}, {});
    builder.add(Path{"s", 0}, Action::ClearParent, {op_removerange(0, 1)}, {}, true);
    builder.one_sided(Path{"s", 0}, {}, {op_addrange(0, {"Z"})});
    builder.one_sided(Path{"s", 2}, {op_addrange(0, {"E"})}, {});

    EXPECT_EQ(apply_decisions(base, builder.finalize()), Value::parse(R"({"s": "d\nEe\n"})"));
}

// ============================================================================
// Applicator state and errors
// ============================================================================

TEST(MergeApplicatorTest, StateTransitions) {
    MergeApplicator applicator(Value::parse(R"({"a": 1})"));
    EXPECT_EQ(applicator.state(), ApplyState::Ready);
    EXPECT_THROW(applicator.merged(), MergeError);

    MergeDecisionBuilder builder;
    builder.one_sided(Path{}, {op_replace("a", 2)}, {});
    applicator.apply(builder.finalize());

    EXPECT_EQ(applicator.state(), ApplyState::Done);
    EXPECT_EQ(applicator.merged(), Value::parse(R"({"a": 2})"));
    EXPECT_THROW(applicator.apply({}), MergeError);
}

TEST(MergeApplicatorTest, MissingPathFails) {
    MergeApplicator applicator(Value::parse(R"({"a": 1})"));

    MergeDecisionBuilder builder;
    builder.one_sided(Path{"missing"}, {op_add("x", 1)}, {});

    EXPECT_THROW(applicator.apply(builder.finalize()), PathResolutionError);
    EXPECT_EQ(applicator.state(), ApplyState::Failed);
    EXPECT_THROW(applicator.merged(), MergeError);
}

TEST(MergeApplicatorTest, InapplicableDiffFails) {
    MergeDecisionBuilder builder;
    builder.one_sided(Path{}, {op_remove("b")}, {});

    EXPECT_THROW(apply_decisions(Value::parse(R"({"a": 1})"), builder.finalize()), PatchError);
}
