#pragma once

#include "scheduler/linear.h"

#include <cstddef>
#include <string>
#include <vector>

namespace lexsched
{
    // Audit record of one successfully solved lexicographic stage.
    struct StageOutcome
    {
        std::size_t index = 0; // 1-based objective position
        std::string name;
        Sense sense = Sense::Minimize;
        double value = 0.0;
        double tolerance = 0.0;
        double bound = 0.0;               // bound frozen (or that would be frozen) for later stages
        bool frozen = false;              // false for the last objective
        std::size_t constraint_count = 0; // length of the constraint log the stage was solved under
    };

    struct FailureContext
    {
        std::size_t stage = 0; // 0 = model construction / objective-less solve
        std::string objective_name;
        std::vector<StageOutcome> completed;
    };
}
