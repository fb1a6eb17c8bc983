#include "scheduler/linear.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace lexsched
{
    namespace
    {
        // slack for comparing integer-valued expressions against real bounds
        constexpr double EPS = 1e-9;
    }

    string sense_name(Sense sense)
    {
        return sense == Sense::Minimize ? "minimize" : "maximize";
    }

    Sense parse_sense(const string &text)
    {
        string lower = text;
        transform(lower.begin(), lower.end(), lower.begin(),
                  [](unsigned char ch)
                  { return static_cast<char>(tolower(ch)); });
        if (lower == "minimize")
            return Sense::Minimize;
        if (lower == "maximize")
            return Sense::Maximize;
        throw invalid_argument("sense must be 'minimize' or 'maximize', got '" + text + "'");
    }

    string relation_symbol(Relation relation)
    {
        switch (relation)
        {
        case Relation::LessOrEqual:
            return "<=";
        case Relation::GreaterOrEqual:
            return ">=";
        case Relation::Equal:
            return "==";
        }
        return "?";
    }

    LinearExpression &LinearExpression::add_term(VarIndex var, int64_t coeff)
    {
        terms_.push_back({var, coeff});
        return *this;
    }

    LinearExpression &LinearExpression::add_constant(int64_t value)
    {
        constant_ += value;
        return *this;
    }

    LinearExpression &LinearExpression::operator+=(const LinearExpression &other)
    {
        terms_.insert(terms_.end(), other.terms_.begin(), other.terms_.end());
        constant_ += other.constant_;
        return *this;
    }

    int64_t LinearExpression::evaluate(const vector<int64_t> &values) const
    {
        int64_t total = constant_;
        for (const auto &t : terms_)
        {
            if (t.var >= values.size())
                throw out_of_range("Variable index " + std::to_string(t.var) + " has no value");
            total += t.coeff * values[t.var];
        }
        return total;
    }

    string LinearExpression::describe() const
    {
        ostringstream oss;
        bool first = true;
        for (const auto &t : terms_)
        {
            if (!first)
                oss << " + ";
            oss << t.coeff << "*x" << t.var;
            first = false;
        }
        if (constant_ != 0 || first)
        {
            if (!first)
                oss << " + ";
            oss << constant_;
        }
        return oss.str();
    }

    LinearConstraint make_less_or_equal(string name, LinearExpression expression, double rhs)
    {
        return {std::move(name), std::move(expression), Relation::LessOrEqual, rhs};
    }

    LinearConstraint make_greater_or_equal(string name, LinearExpression expression, double rhs)
    {
        return {std::move(name), std::move(expression), Relation::GreaterOrEqual, rhs};
    }

    LinearConstraint make_equal(string name, LinearExpression expression, double rhs)
    {
        return {std::move(name), std::move(expression), Relation::Equal, rhs};
    }

    bool is_satisfied(const LinearConstraint &constraint, const vector<int64_t> &values)
    {
        double lhs = static_cast<double>(constraint.expression.evaluate(values));
        switch (constraint.relation)
        {
        case Relation::LessOrEqual:
            return lhs <= constraint.rhs + EPS;
        case Relation::GreaterOrEqual:
            return lhs >= constraint.rhs - EPS;
        case Relation::Equal:
            return lhs >= constraint.rhs - EPS && lhs <= constraint.rhs + EPS;
        }
        return false;
    }

    string describe(const LinearConstraint &constraint)
    {
        ostringstream oss;
        oss << constraint.name << ": " << constraint.expression.describe() << " "
            << relation_symbol(constraint.relation) << " " << constraint.rhs;
        return oss.str();
    }
}
