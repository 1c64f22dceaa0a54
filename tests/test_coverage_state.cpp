#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "core/CoverageState.hpp"

using namespace AgpAssembler;

namespace {

AgpRecord make_record(const std::string& obj, int64_t beg, int64_t end, int64_t pid) {
    AgpRecord rec;
    rec.object_id = obj;
    rec.object_begin = beg;
    rec.object_end = end;
    rec.part_number = pid;
    rec.component_type = ComponentType::W;
    ComponentPart part;
    part.component_id = obj + "_ctg" + std::to_string(pid);
    part.component_begin = 1;
    part.component_end = end - beg + 1;
    rec.part = part;
    return rec;
}

}  // namespace

// ============================================================================
// is_covered
// ============================================================================

TEST(IsCoveredTest, ContiguousIntervalsInAnyOrder) {
    EXPECT_TRUE(is_covered({}));
    EXPECT_TRUE(is_covered({{0, 10}}));
    EXPECT_TRUE(is_covered({{0, 10}, {10, 60}, {60, 61}}));
    EXPECT_TRUE(is_covered({{60, 61}, {0, 10}, {10, 60}}));
}

TEST(IsCoveredTest, GapOrOverlapIsRejected) {
    EXPECT_FALSE(is_covered({{0, 10}, {11, 20}}));  // position 10 missing
    EXPECT_FALSE(is_covered({{0, 10}, {9, 20}}));   // position 9 twice
    EXPECT_FALSE(is_covered({{0, 10}, {0, 10}}));   // duplicated record
    EXPECT_FALSE(is_covered({{5, 10}}));            // does not start at 0
}

// ============================================================================
// apply_record / finish_state
// ============================================================================

class CoverageFoldTest : public ::testing::Test {
protected:
    // Folds a record into state_ and returns the result flags
    FoldResult fold(const AgpRecord& rec, size_t line) {
        FoldResult r = apply_record(std::move(state_), rec, line);
        state_ = r.state;
        return r;
    }

    BuilderState state_;
};

TEST_F(CoverageFoldTest, FirstRecordOpensObject) {
    FoldResult r = fold(make_record("scaf1", 1, 10, 1), 1);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.starts_object);
    ASSERT_TRUE(state_.current.has_value());
    EXPECT_EQ(state_.current->object_id, "scaf1");
    EXPECT_EQ(state_.current->previous_part_number, 1);
    ASSERT_EQ(state_.current->intervals.size(), 1u);
    EXPECT_EQ(state_.current->intervals[0].begin, 0);
    EXPECT_EQ(state_.current->intervals[0].end, 10);
    EXPECT_EQ(state_.seen_objects.count("scaf1"), 1u);
}

TEST_F(CoverageFoldTest, SameObjectContinues) {
    ASSERT_TRUE(fold(make_record("scaf1", 1, 10, 1), 1).ok());
    FoldResult r = fold(make_record("scaf1", 11, 60, 2), 2);
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.starts_object);
    EXPECT_EQ(state_.current->intervals.size(), 2u);
    EXPECT_FALSE(finish_state(state_, 2).has_value());
}

TEST_F(CoverageFoldTest, NewObjectResetsPartNumbers) {
    ASSERT_TRUE(fold(make_record("scaf1", 1, 10, 1), 1).ok());
    FoldResult r = fold(make_record("scaf2", 1, 5, 1), 2);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.starts_object);
    EXPECT_EQ(state_.current->object_id, "scaf2");
    EXPECT_EQ(state_.current->intervals.size(), 1u);
    EXPECT_EQ(state_.seen_objects.size(), 2u);
}

TEST_F(CoverageFoldTest, ObjectMustStartAtOne) {
    FoldResult r = fold(make_record("scaf1", 2, 10, 1), 1);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ORDERING);
    EXPECT_EQ(r.error->reason, "all objects should start with '1'");
    EXPECT_FALSE(r.starts_object);
}

TEST_F(CoverageFoldTest, PartNumberSkip) {
    ASSERT_TRUE(fold(make_record("scaf1", 1, 10, 1), 1).ok());
    FoldResult r = fold(make_record("scaf1", 11, 20, 3), 2);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ORDERING);
    EXPECT_EQ(r.error->line_number, 2u);
    EXPECT_EQ(r.error->reason.rfind("non-sequential part_numbers", 0), 0u);
}

TEST_F(CoverageFoldTest, PartNumberGoingBackwards) {
    ASSERT_TRUE(fold(make_record("scaf1", 1, 10, 1), 1).ok());
    ASSERT_TRUE(fold(make_record("scaf1", 11, 20, 2), 2).ok());
    FoldResult r = fold(make_record("scaf1", 21, 30, 1), 3);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ORDERING);
}

TEST_F(CoverageFoldTest, ZeroPartNumberAfterFirstPart) {
    ASSERT_TRUE(fold(make_record("scaf1", 1, 10, 1), 1).ok());
    FoldResult r = fold(make_record("scaf1", 11, 20, 0), 2);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ORDERING);
    EXPECT_EQ(r.error->line_number, 2u);
    EXPECT_EQ(r.error->reason, "non-sequential part_numbers (1 followed by 0)");
}

TEST_F(CoverageFoldTest, NegativePartNumberOpeningObject) {
    FoldResult r = fold(make_record("scaf1", 1, 10, -1), 1);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ORDERING);
    EXPECT_EQ(r.error->reason, "non-sequential part_numbers (0 followed by -1)");
}

TEST_F(CoverageFoldTest, FirstPartMustBeOne) {
    FoldResult r = fold(make_record("scaf1", 1, 10, 2), 1);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ORDERING);
    // The object itself was accepted before the part number was checked
    EXPECT_TRUE(r.starts_object);
}

TEST_F(CoverageFoldTest, ObjectReappearingIsOutOfOrder) {
    ASSERT_TRUE(fold(make_record("A", 1, 10, 1), 1).ok());
    ASSERT_TRUE(fold(make_record("A", 11, 20, 2), 2).ok());
    ASSERT_TRUE(fold(make_record("B", 1, 10, 1), 3).ok());
    FoldResult r = fold(make_record("A", 1, 10, 1), 4);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ORDERING);
    EXPECT_EQ(r.error->line_number, 4u);
    EXPECT_EQ(r.error->reason.rfind("object identifier out of order", 0), 0u);
}

TEST_F(CoverageFoldTest, IncompleteObjectFailsAtTransition) {
    ASSERT_TRUE(fold(make_record("scaf1", 1, 10, 1), 1).ok());
    // Positions 11-14 are never placed
    ASSERT_TRUE(fold(make_record("scaf1", 15, 20, 2), 2).ok());
    FoldResult r = fold(make_record("scaf2", 1, 10, 1), 3);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::COVERAGE);
    EXPECT_EQ(r.error->reason, "some positions in scaf1 are not accounted for or overlap");
    EXPECT_FALSE(r.starts_object);
    EXPECT_EQ(state_.current->object_id, "scaf1");
}

TEST_F(CoverageFoldTest, OverlapFailsAtEndOfInput) {
    ASSERT_TRUE(fold(make_record("scaf1", 1, 10, 1), 1).ok());
    ASSERT_TRUE(fold(make_record("scaf1", 5, 20, 2), 2).ok());
    auto err = finish_state(state_, 2);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, ErrorKind::COVERAGE);
    EXPECT_EQ(err->line_number, 2u);
}

TEST_F(CoverageFoldTest, EmptyStateFinishesCleanly) {
    EXPECT_FALSE(finish_state(state_, 0).has_value());
}
