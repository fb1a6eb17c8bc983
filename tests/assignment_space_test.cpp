#include "scheduler/assignment_space.h"
#include "scheduler/key_filter.h"
#include "test_util.h"

#include <gtest/gtest.h>

namespace lexsched
{
    namespace
    {
        using test::make_course;
        using test::make_room;
        using test::make_slot;

        TEST(AssignmentSpaceTest, CapacityFilterRemovesKeys)
        {
            Catalog catalog = test::make_catalog({make_course("small", "I1", 20), make_course("big", "I2", 25)},
                                                 {make_room("R30", 30), make_room("R20", 20)},
                                                 {make_slot("S1", "MWF", "8:00", "8:50"), make_slot("S2", "MWF", "10:00", "10:50")});
            AssignmentSpace space = AssignmentSpace::build(catalog);

            EXPECT_EQ(space.size(), 6u);
            EXPECT_FALSE(space.index_of({"big", "R20", "S1"}).has_value());
            EXPECT_TRUE(space.index_of({"big", "R30", "S1"}).has_value());
            for (const auto &k : space.keys())
                EXPECT_LE(catalog.enrollment(k.course), catalog.capacity(k.room));
        }

        TEST(AssignmentSpaceTest, TypeFilterAppliesWhenBothSidesDeclareOne)
        {
            Catalog catalog = test::make_catalog({make_course("lec", "I1", 10, "Lecture"), make_course("lab", "I1", 10, "Lab"),
                                                  make_course("any", "I1", 10)},
                                                 {make_room("R", 30)},
                                                 {make_slot("L", "MWF", "9:00", "9:50", "Lecture"),
                                                  make_slot("B", "T", "14:00", "16:50", "Lab"),
                                                  make_slot("O", "F", "13:00", "13:50")});
            AssignmentSpace space = AssignmentSpace::build(catalog);

            EXPECT_EQ(space.filter_keys(match_course("lec")).size(), 2u);
            EXPECT_FALSE(space.index_of({"lec", "R", "B"}).has_value());
            EXPECT_FALSE(space.index_of({"lab", "R", "L"}).has_value());
            EXPECT_EQ(space.filter_keys(match_course("any")).size(), 3u);
        }

        TEST(AssignmentSpaceTest, VariablesFollowKeyOrder)
        {
            Catalog catalog = test::make_catalog({make_course("C", "I", 5)}, {make_room("R", 10)},
                                                 {make_slot("S1", "M", "9:00", "9:50"), make_slot("S2", "W", "9:00", "9:50")});
            AssignmentSpace space = AssignmentSpace::build(catalog);

            ASSERT_EQ(space.size(), 2u);
            EXPECT_EQ(space.key(1), (AssignmentKey{"C", "R", "S2"}));
            EXPECT_EQ(space.variable_name(0), "x[C,R,S1]");
            EXPECT_EQ(*space.index_of({"C", "R", "S2"}), 1u);
            EXPECT_EQ(space.filter_indices(match_time_slot("S2")), (std::vector<VarIndex>{1}));
        }

        TEST(AssignmentSpaceTest, WeightedSumScalesByWeight)
        {
            Catalog catalog = test::make_catalog({make_course("A", "I", 5), make_course("B", "I", 7)}, {make_room("R", 10)},
                                                 {make_slot("S", "M", "9:00", "9:50")});
            AssignmentSpace space = AssignmentSpace::build(catalog);
            LinearExpression expr = space.weighted_sum(match_everything(), [&catalog](const AssignmentKey &k)
                                                       { return static_cast<std::int64_t>(catalog.enrollment(k.course)); });
            EXPECT_EQ(expr.evaluate({1, 1}), 12);
            EXPECT_EQ(expr.evaluate({0, 1}), 7);
        }

        TEST(AssignmentSpaceTest, CourseWithoutFittingRoomHasNoKeys)
        {
            Catalog catalog = test::make_catalog({make_course("huge", "I", 500)}, {make_room("R", 10)},
                                                 {make_slot("S", "M", "9:00", "9:50")});
            AssignmentSpace space = AssignmentSpace::build(catalog);
            EXPECT_EQ(space.size(), 0u);
        }
    }
}
