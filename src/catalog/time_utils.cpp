#include "catalog/time_utils.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

using namespace std;

namespace lexsched
{
    namespace
    {
        const char *const DAY_TOKENS[] = {"M", "T", "W", "TH", "F", "SA", "SU"};
        constexpr int DAY_COUNT = 7;

        // two-letter tokens first so that "TTH" reads as T + TH
        int match_day(const string &pattern, size_t pos, size_t &length)
        {
            if (pos + 1 < pattern.size())
            {
                string two = pattern.substr(pos, 2);
                for (int d = 0; d < DAY_COUNT; ++d)
                    if (two == DAY_TOKENS[d])
                    {
                        length = 2;
                        return d;
                    }
            }
            string one = pattern.substr(pos, 1);
            for (int d = 0; d < DAY_COUNT; ++d)
                if (one == DAY_TOKENS[d])
                {
                    length = 1;
                    return d;
                }
            return -1;
        }

        string normalize(const string &pattern)
        {
            string out;
            for (char ch : pattern)
            {
                if (isspace(static_cast<unsigned char>(ch)))
                    continue;
                out.push_back(static_cast<char>(toupper(static_cast<unsigned char>(ch))));
            }
            return out;
        }

        bool all_digits(const string &s)
        {
            return all_of(s.begin(), s.end(), [](char ch)
                          { return isdigit(static_cast<unsigned char>(ch)) != 0; });
        }
    } // anonymous namespace

    int time_to_minutes(const string &hhmm)
    {
        size_t colon = hhmm.find(':');
        if (colon == string::npos || colon == 0 || colon + 1 >= hhmm.size())
            throw invalid_argument("Invalid time '" + hhmm + "', expected H:MM");

        string h = hhmm.substr(0, colon);
        string m = hhmm.substr(colon + 1);
        if (h.size() > 2 || m.size() != 2 || !all_digits(h) || !all_digits(m))
            throw invalid_argument("Invalid time '" + hhmm + "', expected H:MM");

        int hours = stoi(h);
        int minutes = stoi(m);

        if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59)
            throw invalid_argument("Time out of range: '" + hhmm + "'");
        return hours * 60 + minutes;
    }

    string minutes_to_time(int minutes)
    {
        char buf[8];
        snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
        return buf;
    }

    DayMask parse_days(const string &pattern)
    {
        string p = normalize(pattern);
        if (p.empty())
            throw invalid_argument("Empty day pattern");

        DayMask mask = 0;
        size_t pos = 0;
        while (pos < p.size())
        {
            size_t length = 0;
            int day = match_day(p, pos, length);
            if (day < 0)
                throw invalid_argument("Unknown day in pattern '" + pattern + "' at position " + std::to_string(pos));
            mask |= (1u << day);
            pos += length;
        }
        return mask;
    }

    vector<string> expand_days(const string &pattern)
    {
        DayMask mask = parse_days(pattern);
        vector<string> days;
        for (int d = 0; d < DAY_COUNT; ++d)
            if (mask & (1u << d))
                days.push_back(DAY_TOKENS[d]);
        return days;
    }
}
