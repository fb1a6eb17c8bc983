#include "scheduler/constraints.h"
#include "scheduler/model_builder.h"
#include "test_util.h"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

namespace lexsched
{
    namespace
    {
        using test::find_constraint;
        using test::make_course;
        using test::make_room;
        using test::make_slot;

        // One instructor, one room, two back-to-back MWF slots and one TTH slot.
        class ConstraintsTest : public ::testing::Test
        {
        protected:
            ConstraintsTest()
                : catalog_(test::make_catalog({make_course("C1", "I", 10), make_course("C2", "I", 10)},
                                              {make_room("R", 100)},
                                              {make_slot("S1", "MWF", "8:00", "8:50"),
                                               make_slot("S2", "MWF", "9:00", "9:50"),
                                               make_slot("S3", "TTH", "9:00", "10:15")})),
                  space_(AssignmentSpace::build(catalog_)),
                  model_(space_),
                  context_(catalog_, space_, model_, 0)
            {
            }

            Catalog catalog_;
            AssignmentSpace space_;
            Model model_;
            ModelContext context_;
        };

        TEST_F(ConstraintsTest, AssignAllCoursesIsOneEqualityPerCourse)
        {
            std::vector<LinearConstraint> out = AssignAllCourses().generate(context_);
            ASSERT_EQ(out.size(), 2u);
            EXPECT_EQ(out[0].name, "assign_course[C1]");
            EXPECT_EQ(out[0].relation, Relation::Equal);
            EXPECT_DOUBLE_EQ(out[0].rhs, 1.0);
            EXPECT_EQ(out[0].expression.terms().size(), 3u);
        }

        TEST_F(ConstraintsTest, InstructorOverlapCoversBufferedSlots)
        {
            std::vector<LinearConstraint> out = NoInstructorOverlap().generate(context_);
            ASSERT_EQ(out.size(), 3u);
            EXPECT_EQ(out[0].name, "no_instructor_overlap[I,S1]");
            EXPECT_EQ(out[0].expression.terms().size(), 2u);
            // S1 ends within the buffer before S2 starts
            EXPECT_EQ(out[1].name, "no_instructor_overlap[I,S2]");
            EXPECT_EQ(out[1].expression.terms().size(), 4u);
            EXPECT_EQ(out[1].relation, Relation::LessOrEqual);
            EXPECT_DOUBLE_EQ(out[1].rhs, 1.0);

            std::vector<LinearConstraint> strict = NoInstructorOverlap(0).generate(context_);
            ASSERT_EQ(strict.size(), 3u);
            EXPECT_EQ(strict[1].expression.terms().size(), 2u);
        }

        TEST_F(ConstraintsTest, RoomOverlapPerRoomAndSlot)
        {
            std::vector<LinearConstraint> out = NoRoomOverlap().generate(context_);
            ASSERT_EQ(out.size(), 3u);
            EXPECT_EQ(out[2].name, "no_room_overlap[R,S3]");
            EXPECT_EQ(out[2].expression.terms().size(), 2u);
        }

        TEST(ConstraintsSingleTest, SingleTermRelationsAreSkipped)
        {
            Catalog catalog = test::make_catalog({make_course("C1", "I", 10)}, {make_room("R", 100)},
                                                 {make_slot("S1", "MWF", "8:00", "8:50")});
            AssignmentSpace space = AssignmentSpace::build(catalog);
            Model model(space);
            ModelContext context(catalog, space, model, 0);
            EXPECT_TRUE(NoInstructorOverlap().generate(context).empty());
            EXPECT_TRUE(NoRoomOverlap().generate(context).empty());
            EXPECT_EQ(AssignAllCourses().generate(context).size(), 1u);
        }

        TEST(ConstraintsSingleTest, ForcedPlacementsPinCourses)
        {
            Course pinned = make_course("P", "I", 10);
            pinned.force_room = "Big";
            pinned.force_time_slot = "S2";
            Course too_big = make_course("Q", "I", 50);
            too_big.force_room = "Small";

            Catalog catalog = test::make_catalog({pinned, too_big, make_course("free", "I", 5)},
                                                 {make_room("Small", 20), make_room("Big", 60)},
                                                 {make_slot("S1", "M", "8:00", "8:50"), make_slot("S2", "W", "8:00", "8:50")});
            AssignmentSpace space = AssignmentSpace::build(catalog);
            Model model(space);
            ModelContext context(catalog, space, model, 0);

            std::vector<LinearConstraint> rooms = ForceRooms().generate(context);
            ASSERT_EQ(rooms.size(), 2u);
            EXPECT_EQ(rooms[0].name, "force_room[P]");
            EXPECT_EQ(rooms[0].expression.terms().size(), 2u);
            // Q cannot fit in Small, so the pin is unsatisfiable
            EXPECT_EQ(rooms[1].name, "force_room[Q]");
            EXPECT_FALSE(rooms[1].expression.has_terms());

            std::vector<LinearConstraint> slots = ForceTimeSlots().generate(context);
            ASSERT_EQ(slots.size(), 1u);
            EXPECT_EQ(slots[0].name, "force_time_slot[P]");
            EXPECT_EQ(slots[0].expression.terms().size(), 2u);
        }

        TEST_F(ConstraintsTest, BuilderAppendsEveryPluginInOrder)
        {
            Model base = ModelBuilder(default_constraints()).build(catalog_, space_);
            EXPECT_EQ(base.decision_count(), space_.size());
            EXPECT_EQ(base.variable_count(), space_.size());
            // 2 assign + 3 instructor + 3 room
            ASSERT_EQ(base.constraints().size(), 8u);
            EXPECT_EQ(base.constraints().front().name, "assign_course[C1]");
            EXPECT_NE(find_constraint(base, "no_room_overlap[R,S2]"), nullptr);
            EXPECT_FALSE(base.has_objective());
        }

        TEST_F(ConstraintsTest, ViolatedConstraintsNamesBrokenRelations)
        {
            Model base = ModelBuilder({std::make_shared<AssignAllCourses>()}).build(catalog_, space_);
            std::vector<std::int64_t> values(base.variable_count(), 0);
            values[*space_.index_of({"C1", "R", "S1"})] = 1;
            EXPECT_EQ(base.violated_constraints(values), (std::vector<std::string>{"assign_course[C2]"}));
        }

        class ThrowingConstraint : public ConstraintPlugin
        {
        public:
            std::string name() const override { return "Broken"; }
            std::vector<LinearConstraint> generate(ModelContext &) const override
            {
                throw std::runtime_error("boom");
            }
        };

        TEST_F(ConstraintsTest, PluginFailureIsWrapped)
        {
            ModelBuilder builder({std::make_shared<AssignAllCourses>(), std::make_shared<ThrowingConstraint>()});
            try
            {
                builder.build(catalog_, space_);
                FAIL() << "expected PluginEvaluationError";
            }
            catch (const PluginEvaluationError &e)
            {
                EXPECT_EQ(e.plugin(), "Broken");
                EXPECT_EQ(e.stage(), 0u);
                EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
            }
        }

        TEST(ModelBuilderTest, RejectsNullPlugin)
        {
            EXPECT_THROW(ModelBuilder({nullptr}), std::invalid_argument);
        }
    }
}
