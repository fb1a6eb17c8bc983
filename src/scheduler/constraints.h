#pragma once

#include "scheduler/model.h"

#include <memory>
#include <string>
#include <vector>

namespace lexsched
{
    /**
     * Hard-constraint plugin. generate() reads the catalog and assignment
     * space through the context and returns the linear relations to add to
     * the base model. Implementations keep configuration only.
     */
    class ConstraintPlugin
    {
    public:
        virtual ~ConstraintPlugin() = default;

        virtual std::string name() const = 0;
        virtual std::vector<LinearConstraint> generate(ModelContext &context) const = 0;
    };

    using ConstraintPtr = std::shared_ptr<const ConstraintPlugin>;

    // Every course is taught exactly once.
    class AssignAllCourses : public ConstraintPlugin
    {
    public:
        std::string name() const override { return "Assign all courses"; }
        std::vector<LinearConstraint> generate(ModelContext &context) const override;
    };

    // An instructor teaches at most one course among overlapping slots.
    class NoInstructorOverlap : public ConstraintPlugin
    {
    public:
        explicit NoInstructorOverlap(int buffer_minutes = 15) : buffer_minutes_(buffer_minutes) {}

        std::string name() const override { return "No instructor overlap"; }
        std::vector<LinearConstraint> generate(ModelContext &context) const override;

    private:
        int buffer_minutes_;
    };

    // A room hosts at most one course among overlapping slots.
    class NoRoomOverlap : public ConstraintPlugin
    {
    public:
        explicit NoRoomOverlap(int buffer_minutes = 15) : buffer_minutes_(buffer_minutes) {}

        std::string name() const override { return "No room overlap"; }
        std::vector<LinearConstraint> generate(ModelContext &context) const override;

    private:
        int buffer_minutes_;
    };

    // Courses declaring force_room are placed in that room.
    class ForceRooms : public ConstraintPlugin
    {
    public:
        std::string name() const override { return "Force rooms"; }
        std::vector<LinearConstraint> generate(ModelContext &context) const override;
    };

    // Courses declaring force_time_slot are placed in that slot.
    class ForceTimeSlots : public ConstraintPlugin
    {
    public:
        std::string name() const override { return "Force time slots"; }
        std::vector<LinearConstraint> generate(ModelContext &context) const override;
    };

    // assign all, no instructor overlap, no room overlap, forced rooms and slots
    std::vector<ConstraintPtr> default_constraints(int buffer_minutes = 15);
}
