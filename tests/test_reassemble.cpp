/**
 * @file test_reassemble.cpp
 * @brief Tests for rebuilding one diff from a decision list (GoogleTest)
 *
 * The merged-side diff must patch the base into the same document that
 * apply_decisions() produces; most tests here check exactly that.
 */

#include <gtest/gtest.h>
#include "treemerge/Reassemble.hpp"
#include "treemerge/Apply.hpp"
#include "treemerge/Builder.hpp"
#include "treemerge/Patch.hpp"
#include "treemerge/Errors.hpp"

#include <stdexcept>

using namespace treemerge;

namespace {

void expect_consistent(const Value& base, const std::vector<MergeDecision>& decisions) {
    auto diff = build_diffs(base, decisions, Side::Merged);
    ASSERT_TRUE(diff.has_value());
    EXPECT_EQ(patch(base, *diff), apply_decisions(base, decisions));
}

} // namespace

// ============================================================================
// Side names
// ============================================================================

TEST(SideTest, ParseAndName) {
    EXPECT_EQ(parse_side("local"), Side::Local);
    EXPECT_EQ(parse_side("remote"), Side::Remote);
    EXPECT_EQ(parse_side("merged"), Side::Merged);
    EXPECT_STREQ(side_name(Side::Remote), "remote");
    EXPECT_THROW(parse_side("base"), std::invalid_argument);
}

// ============================================================================
// Local / remote sides
// ============================================================================

TEST(BuildDiffsTest, NoDecisionsGivesNothing) {
    EXPECT_FALSE(build_diffs(Value::object(), {}, Side::Merged).has_value());
}

TEST(BuildDiffsTest, SideWithoutEditsGivesNothing) {
    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a"}, {op_remove("b")}, {});
    EXPECT_FALSE(build_diffs(Value::parse(R"({"a": {"b": 1}})"),
                             builder.finalize(), Side::Remote).has_value());
}

TEST(BuildDiffsTest, LocalDiffIsRewrappedFromRoot) {
    Value base = Value::parse(R"({"a": {"b": 1}})");
    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a"}, {op_replace("b", 2)}, {});

    auto diff = build_diffs(base, builder.finalize(), Side::Local);
    ASSERT_TRUE(diff.has_value());
    EXPECT_EQ(*diff, (Diff{op_patch("a", {op_replace("b", 2)})}));
}

TEST(BuildDiffsTest, SiblingBranchesShareParentPatch) {
    Value base = Value::parse(R"({"a": {"x": {"k": 1}, "y": {"k": 1}}})");
    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a", "x"}, {op_remove("k")}, {});
    builder.one_sided(Path{"a", "y"}, {op_replace("k", 2)}, {});

    auto diff = build_diffs(base, builder.finalize(), Side::Local);
    ASSERT_TRUE(diff.has_value());
    Diff expected{op_patch("a", {
        op_patch("x", {op_remove("k")}),
        op_patch("y", {op_replace("k", 2)})
    })};
    EXPECT_EQ(*diff, expected);
}

TEST(BuildDiffsTest, ConflictsContributeBothSides) {
    Value base = Value::parse(R"({"a": {"b": 1}})");
    MergeDecisionBuilder builder;
    builder.conflict(Path{"a"}, {op_replace("b", 2)}, {op_replace("b", 3)});
    auto ds = builder.finalize();

    EXPECT_EQ(*build_diffs(base, ds, Side::Local), (Diff{op_patch("a", {op_replace("b", 2)})}));
    EXPECT_EQ(*build_diffs(base, ds, Side::Remote), (Diff{op_patch("a", {op_replace("b", 3)})}));
    EXPECT_EQ(patch(base, *build_diffs(base, ds, Side::Merged)), base);
}

// ============================================================================
// Merged side matches the applicator
// ============================================================================

TEST(BuildDiffsConsistencyTest, NestedReplace) {
    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a"}, {op_replace("b", Value::array({1, 2, 9}))}, {});
    expect_consistent(Value::parse(R"({"a": {"b": [1, 2, 3]}})"), builder.finalize());
}

TEST(BuildDiffsConsistencyTest, TextLineEdit) {
    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a", 1}, {}, {op_addrange(0, {"Y"}), op_removerange(0, 1)});
    expect_consistent(Value::parse(R"({"a": "x\ny\nz"})"), builder.finalize());
}

TEST(BuildDiffsConsistencyTest, DeeperAndShallowerDecisions) {
    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a"}, {}, {op_replace("b", 2)});
    builder.one_sided(Path{"a", "c"}, {op_addrange(2, {3})}, {});
    builder.one_sided(Path{}, {op_add("d", true)}, {});
    expect_consistent(Value::parse(R"({"a": {"b": 1, "c": [1, 2]}})"), builder.finalize());
}

TEST(BuildDiffsConsistencyTest, SequenceElements) {
    MergeDecisionBuilder builder;
    builder.one_sided(Path{"l"}, {op_removerange(1, 1)}, {});
    builder.one_sided(Path{"l", 0}, {}, {op_replace(0, 9)});
    builder.one_sided(Path{"l", 2}, {op_addrange(1, {4})}, {});
    expect_consistent(Value::parse(R"({"l": [[1], [2], [3]]})"), builder.finalize());
}

TEST(BuildDiffsConsistencyTest, LinesAndWholeText) {
    MergeDecisionBuilder builder;
    builder.one_sided(Path{"s", 0}, {op_addrange(0, {"X"})}, {});
    builder.one_sided(Path{"s", 0}, {}, {op_addrange(2, {"Y"})});
    builder.one_sided(Path{"s", 2}, {}, {op_addrange(0, {"C"})});
    builder.one_sided(Path{"s"}, {op_addrange(3, {"d\n"})}, {});
    expect_consistent(Value::parse(R"({"s": "ab\nb\nc\n"})"), builder.finalize());
}

TEST(BuildDiffsConsistencyTest, SequentialAndCustom) {
    MergeDecisionBuilder builder;
    builder.local_then_remote(Path{"l"}, {op_addrange(2, {3})}, {op_addrange(2, {4})});
    builder.add(Path{"m"}, Action::Custom, {op_remove("k")}, {op_replace("k", 5)}, true,
                Diff{op_replace("k", 6)});
    expect_consistent(Value::parse(R"({"l": [1, 2], "m": {"k": 0}})"), builder.finalize());
}

TEST(BuildDiffsConsistencyTest, Clear) {
    MergeDecisionBuilder builder;
    builder.add(Path{}, Action::Clear,
                {op_replace("a", Value::array({1, 2, 4}))}, {op_remove("a")}, true);
    expect_consistent(Value::parse(R"({"a": [1, 2, 3], "b": 0})"), builder.finalize());
}

TEST(BuildDiffsConsistencyTest, ClearParentWithChildEdits) {
    Value base = Value::parse(R"({"a": {"x": {"k": 1}, "y": 2}, "z": 0})");
    MergeDecisionBuilder builder;
    builder.one_sided(Path{"a", "x"}, {op_replace("k", 2)}, {});
    builder.add(Path{"a"}, Action::ClearParent, {op_remove("y")}, {op_replace("y", 3)}, true);
    builder.one_sided(Path{"a"}, {op_add("w", 1)}, {});
    builder.one_sided(Path{}, {op_replace("z", 1)}, {});

    auto ds = builder.finalize();
    expect_consistent(base, ds);
    EXPECT_EQ(patch(base, *build_diffs(base, ds, Side::Merged)),
              Value::parse(R"({"a": {}, "z": 1})"));
}

TEST(BuildDiffsConsistencyTest, ClearsInsideTextLines) {
    Value base = Value::parse(R"({"s": "abc\nd\ne\n", "t": "xyz\n"})");
    MergeDecisionBuilder builder;
    builder.one_sided(Path{"s", 0}, {op_addrange(0, {"Y"})}, {});
    builder.add(Path{"s", 0}, Action::ClearParent, {op_removerange(0, 1)}, {}, true);
    builder.one_sided(Path{"s", 0}, {}, {op_addrange(0, {"Z"})});
    builder.one_sided(Path{"s", 2}, {op_addrange(0, {"E"})}, {});
    builder.add(Path{"t", 0}, Action::Clear, {op_replace(2, "Q")}, {op_remove(2)}, true);

    auto ds = builder.finalize();
    expect_consistent(base, ds);
    EXPECT_EQ(patch(base, *build_diffs(base, ds, Side::Merged)),
              Value::parse(R"({"s": "d\nEe\n", "t": "xy\n"})"));
}
