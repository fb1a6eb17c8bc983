#pragma once

#include "scheduler/assignment_space.h"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lexsched
{
    // Exact-match filter; an unset field matches everything.
    struct KeyMatch
    {
        std::optional<std::string> course;
        std::optional<std::string> room;
        std::optional<std::string> time_slot;
    };

    // Pure filter over any key collection, order preserved.
    std::vector<AssignmentKey> filter_keys(const std::vector<AssignmentKey> &keys, const KeyPredicate &predicate);
    std::vector<AssignmentKey> filter_keys(const std::vector<AssignmentKey> &keys, const KeyMatch &match);

    KeyPredicate matches(const KeyMatch &match);
    KeyPredicate match_everything();
    KeyPredicate match_course(std::string course);
    KeyPredicate match_room(std::string room);
    KeyPredicate match_time_slot(std::string time_slot);

    KeyPredicate in_rooms(std::set<std::string> rooms);
    KeyPredicate in_time_slots(std::set<std::string> time_slots);

    // The predicates below keep a reference to the catalog, which must outlive them.
    KeyPredicate taught_by(const Catalog &catalog, std::string instructor);
    KeyPredicate of_course_type(const Catalog &catalog, std::string type);
    KeyPredicate starts_before(const Catalog &catalog, int minutes);
    KeyPredicate starts_after(const Catalog &catalog, int minutes);

    /**
     * True for keys whose slot is still running when the reference slot starts:
     * the day sets intersect, the key's slot starts no later than the reference
     * slot, and it ends after (reference start - buffer_minutes). The reference
     * slot always overlaps itself. When room is set, only keys in that room match.
     */
    KeyPredicate overlaps_slot(const Catalog &catalog, const std::string &time_slot,
                               int buffer_minutes, std::optional<std::string> room = std::nullopt);

    KeyPredicate all_of_predicates(std::vector<KeyPredicate> predicates);
    KeyPredicate any_of_predicates(std::vector<KeyPredicate> predicates);
    KeyPredicate negated(KeyPredicate predicate);
}
