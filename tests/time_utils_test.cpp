#include "catalog/time_utils.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace lexsched
{
    namespace
    {
        TEST(TimeUtilsTest, ParsesTimesOfDay)
        {
            EXPECT_EQ(time_to_minutes("0:00"), 0);
            EXPECT_EQ(time_to_minutes("9:00"), 540);
            EXPECT_EQ(time_to_minutes("09:05"), 545);
            EXPECT_EQ(time_to_minutes("13:45"), 825);
            EXPECT_EQ(time_to_minutes("23:59"), 1439);
        }

        TEST(TimeUtilsTest, RejectsMalformedTimes)
        {
            EXPECT_THROW(time_to_minutes(""), std::invalid_argument);
            EXPECT_THROW(time_to_minutes("900"), std::invalid_argument);
            EXPECT_THROW(time_to_minutes("9:5"), std::invalid_argument);
            EXPECT_THROW(time_to_minutes("24:00"), std::invalid_argument);
            EXPECT_THROW(time_to_minutes("9:60"), std::invalid_argument);
            EXPECT_THROW(time_to_minutes("ab:cd"), std::invalid_argument);
            EXPECT_THROW(time_to_minutes("-0:30"), std::invalid_argument);
            EXPECT_THROW(time_to_minutes("+9:00"), std::invalid_argument);
            EXPECT_THROW(time_to_minutes(" 9:00"), std::invalid_argument);
            EXPECT_THROW(time_to_minutes("9: 05"), std::invalid_argument);
            EXPECT_THROW(time_to_minutes("009:00"), std::invalid_argument);
        }

        TEST(TimeUtilsTest, FormatsMinutes)
        {
            EXPECT_EQ(minutes_to_time(545), "09:05");
            EXPECT_EQ(minutes_to_time(780), "13:00");
        }

        TEST(TimeUtilsTest, ExpandsDayPatterns)
        {
            EXPECT_EQ(expand_days("MWF"), (std::vector<std::string>{"M", "W", "F"}));
            EXPECT_EQ(expand_days("TTH"), (std::vector<std::string>{"T", "TH"}));
            EXPECT_EQ(expand_days("th"), (std::vector<std::string>{"TH"}));
            EXPECT_EQ(expand_days("SASU"), (std::vector<std::string>{"SA", "SU"}));
        }

        TEST(TimeUtilsTest, DayMasksIntersectOnSharedDays)
        {
            EXPECT_TRUE(days_intersect(parse_days("MWF"), parse_days("W")));
            EXPECT_FALSE(days_intersect(parse_days("MWF"), parse_days("TTH")));
            EXPECT_FALSE(days_intersect(parse_days("T"), parse_days("TH")));
        }

        TEST(TimeUtilsTest, RejectsUnknownDays)
        {
            EXPECT_THROW(parse_days(""), std::invalid_argument);
            EXPECT_THROW(parse_days("MX"), std::invalid_argument);
        }
    }
}
