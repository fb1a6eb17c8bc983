#pragma once

#include "scheduler/model.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lexsched
{
    /**
     * Soft objective optimized in lexicographic order.
     *
     * tolerance is the fractional slack allowed on this objective once it is
     * frozen for later stages (0.0 = keep the optimum exactly, 0.05 = allow 5%).
     * evaluate() must depend only on the context; the engine calls it once
     * per stage and reuses the expression for the frozen bound.
     */
    class ObjectivePlugin
    {
    public:
        // Throws std::invalid_argument for a negative or non-finite tolerance.
        ObjectivePlugin(std::string name, Sense sense, double tolerance);
        virtual ~ObjectivePlugin() = default;

        const std::string &name() const { return name_; }
        Sense sense() const { return sense_; }
        double tolerance() const { return tolerance_; }

        virtual LinearExpression evaluate(ModelContext &context) const = 0;

    private:
        std::string name_;
        Sense sense_;
        double tolerance_;
    };

    using ObjectivePtr = std::shared_ptr<const ObjectivePlugin>;

    // Optional restriction of an objective to one instructor and/or course type.
    struct ObjectiveScope
    {
        std::optional<std::string> instructor;
        std::optional<std::string> course_type;
    };

    KeyPredicate scope_predicate(const Catalog &catalog, const ObjectiveScope &scope);

    // Classes starting before a time of day ("9:00").
    class MinimizeClassesBefore : public ObjectivePlugin
    {
    public:
        MinimizeClassesBefore(const std::string &time, ObjectiveScope scope = {},
                              Sense sense = Sense::Minimize, double tolerance = 0.0);

        LinearExpression evaluate(ModelContext &context) const override;

    private:
        int time_minutes_;
        ObjectiveScope scope_;
    };

    // Classes starting after a time of day ("16:00").
    class MinimizeClassesAfter : public ObjectivePlugin
    {
    public:
        MinimizeClassesAfter(const std::string &time, ObjectiveScope scope = {},
                             Sense sense = Sense::Minimize, double tolerance = 0.0);

        LinearExpression evaluate(ModelContext &context) const override;

    private:
        int time_minutes_;
        ObjectiveScope scope_;
    };

    class MaximizePreferredRooms : public ObjectivePlugin
    {
    public:
        MaximizePreferredRooms(const std::vector<std::string> &rooms, ObjectiveScope scope = {},
                               double tolerance = 0.0);

        LinearExpression evaluate(ModelContext &context) const override;

    private:
        std::vector<std::string> rooms_;
        ObjectiveScope scope_;
    };

    class MaximizePreferredTimeSlots : public ObjectivePlugin
    {
    public:
        MaximizePreferredTimeSlots(const std::vector<std::string> &time_slots, ObjectiveScope scope = {},
                                   double tolerance = 0.0);

        LinearExpression evaluate(ModelContext &context) const override;

    private:
        std::vector<std::string> time_slots_;
        ObjectiveScope scope_;
    };

    /**
     * Number of rooms each instructor teaches in beyond their first one,
     * summed over instructors. Uses one indicator per (instructor, room).
     * Only meaningful when minimized.
     */
    class MinimizeRoomChanges : public ObjectivePlugin
    {
    public:
        explicit MinimizeRoomChanges(ObjectiveScope scope = {}, double tolerance = 0.0);

        LinearExpression evaluate(ModelContext &context) const override;

    private:
        ObjectiveScope scope_;
    };

    // Enrollment routed through a subset of rooms.
    class MaximizeEnrollmentInRooms : public ObjectivePlugin
    {
    public:
        MaximizeEnrollmentInRooms(const std::vector<std::string> &rooms, Sense sense = Sense::Maximize,
                                  double tolerance = 0.0);

        LinearExpression evaluate(ModelContext &context) const override;

    private:
        std::vector<std::string> rooms_;
    };
}
