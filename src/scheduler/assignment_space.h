#pragma once

#include "catalog/catalog.h"
#include "scheduler/linear.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace lexsched
{
    struct AssignmentKey
    {
        std::string course;
        std::string room;
        std::string time_slot;

        bool operator==(const AssignmentKey &other) const
        {
            return course == other.course && room == other.room && time_slot == other.time_slot;
        }
        bool operator!=(const AssignmentKey &other) const { return !(*this == other); }
        bool operator<(const AssignmentKey &other) const
        {
            return std::tie(course, room, time_slot) < std::tie(other.course, other.room, other.time_slot);
        }
    };

    using KeyPredicate = std::function<bool(const AssignmentKey &)>;
    using KeyWeight = std::function<std::int64_t(const AssignmentKey &)>;

    /**
     * Universe of (course, room, time-slot) keys that survive the structural
     * filters, with one binary decision variable per key. A key exists only if
     *   enrollment(course) <= capacity(room)
     * and, when both sides declare a type, type(course) == type(slot).
     * Variable i of the model is the decision variable of keys()[i].
     * The key set is fixed once built.
     */
    class AssignmentSpace
    {
    public:
        static AssignmentSpace build(const Catalog &catalog);

        const std::vector<AssignmentKey> &keys() const { return keys_; }
        std::size_t size() const { return keys_.size(); }

        const AssignmentKey &key(VarIndex var) const { return keys_.at(var); }
        const std::string &variable_name(VarIndex var) const { return names_.at(var); }
        std::optional<VarIndex> index_of(const AssignmentKey &key) const;

        std::vector<AssignmentKey> filter_keys(const KeyPredicate &predicate) const;
        std::vector<VarIndex> filter_indices(const KeyPredicate &predicate) const;

        // sum of the decision variables of matching keys
        LinearExpression sum(const KeyPredicate &predicate) const;
        LinearExpression weighted_sum(const KeyPredicate &predicate, const KeyWeight &weight) const;

    private:
        AssignmentSpace() = default;

        std::vector<AssignmentKey> keys_;
        std::vector<std::string> names_;
        std::map<AssignmentKey, VarIndex> index_;
    };
}
