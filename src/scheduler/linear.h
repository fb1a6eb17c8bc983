#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lexsched
{
    using VarIndex = std::size_t;

    enum class Sense
    {
        Minimize,
        Maximize
    };

    enum class Relation
    {
        LessOrEqual,
        GreaterOrEqual,
        Equal
    };

    std::string sense_name(Sense sense);

    // "minimize" / "maximize" (case-insensitive); throws std::invalid_argument
    Sense parse_sense(const std::string &text);

    std::string relation_symbol(Relation relation);

    struct LinearTerm
    {
        VarIndex var;
        std::int64_t coeff;
    };

    /**
     * Integer linear expression over binary model variables:
     *   constant + sum(coeff * x[var])
     * Terms are kept in insertion order; repeated variables are allowed and
     * simply add up when evaluated or handed to a solver.
     */
    class LinearExpression
    {
    public:
        LinearExpression() = default;
        explicit LinearExpression(std::int64_t constant) : constant_(constant) {}

        LinearExpression &add_term(VarIndex var, std::int64_t coeff = 1);
        LinearExpression &add_constant(std::int64_t value);
        LinearExpression &operator+=(const LinearExpression &other);

        const std::vector<LinearTerm> &terms() const { return terms_; }
        std::int64_t constant() const { return constant_; }
        bool has_terms() const { return !terms_.empty(); }

        // values[i] is the value of variable i
        std::int64_t evaluate(const std::vector<std::int64_t> &values) const;

        std::string describe() const;

    private:
        std::vector<LinearTerm> terms_;
        std::int64_t constant_ = 0;
    };

    struct LinearConstraint
    {
        std::string name;
        LinearExpression expression;
        Relation relation = Relation::LessOrEqual;
        double rhs = 0.0;
    };

    LinearConstraint make_less_or_equal(std::string name, LinearExpression expression, double rhs);
    LinearConstraint make_greater_or_equal(std::string name, LinearExpression expression, double rhs);
    LinearConstraint make_equal(std::string name, LinearExpression expression, double rhs);

    bool is_satisfied(const LinearConstraint &constraint, const std::vector<std::int64_t> &values);

    // "name: 1*x3 + 1*x7 <= 4.5"
    std::string describe(const LinearConstraint &constraint);
}
