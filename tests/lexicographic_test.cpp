#include "scheduler/lexicographic.h"
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
        using test::ScriptedSolver;

        class ThrowingObjective : public ObjectivePlugin
        {
        public:
            ThrowingObjective() : ObjectivePlugin("Exploding objective", Sense::Minimize, 0.0) {}

            LinearExpression evaluate(ModelContext &) const override
            {
                throw std::runtime_error("no such room");
            }
        };

        class LexicographicEngineTest : public ::testing::Test
        {
        protected:
            LexicographicEngineTest()
                : catalog_(test::make_catalog({make_course("C1", "I1", 10), make_course("C2", "I2", 10)},
                                              {make_room("R1", 30), make_room("R2", 30)},
                                              {make_slot("S1", "MWF", "8:00", "8:50"), make_slot("S2", "MWF", "10:00", "10:50")})),
                  space_(AssignmentSpace::build(catalog_)),
                  base_(ModelBuilder(default_constraints()).build(catalog_, space_))
            {
            }

            ObjectivePtr before(double tolerance = 0.0)
            {
                return std::make_shared<MinimizeClassesBefore>("9:00", ObjectiveScope{}, Sense::Minimize, tolerance);
            }

            ObjectivePtr preferred(double tolerance = 0.0)
            {
                return std::make_shared<MaximizePreferredRooms>(std::vector<std::string>{"R2"}, ObjectiveScope{}, tolerance);
            }

            Catalog catalog_;
            AssignmentSpace space_;
            Model base_;
        };

        TEST(FrozenBoundTest, RelaxesInTheObjectiveDirection)
        {
            EXPECT_DOUBLE_EQ(LexicographicEngine::frozen_bound(Sense::Minimize, 10.0, 0.1), 11.0);
            EXPECT_DOUBLE_EQ(LexicographicEngine::frozen_bound(Sense::Maximize, 5.0, 0.1), 4.5);
            EXPECT_DOUBLE_EQ(LexicographicEngine::frozen_bound(Sense::Minimize, 0.0, 0.5), 0.0);
            // negative optima still relax outward
            EXPECT_DOUBLE_EQ(LexicographicEngine::frozen_bound(Sense::Minimize, -10.0, 0.1), -9.0);
            EXPECT_DOUBLE_EQ(LexicographicEngine::frozen_bound(Sense::Maximize, -10.0, 0.1), -11.0);
        }

        TEST(EngineStateTest, Names)
        {
            EXPECT_EQ(state_name(EngineState::Idle), "idle");
            EXPECT_EQ(state_name(EngineState::Constraining), "constraining");
            EXPECT_EQ(state_name(EngineState::Failed), "failed");
        }

        TEST_F(LexicographicEngineTest, FreezesEachObjectiveBeforeTheNext)
        {
            ScriptedSolver solver({ScriptedSolver::optimal(0.0), ScriptedSolver::optimal(2.0)});
            LexicographicEngine engine(catalog_, space_, base_, solver);

            LexicographicResult result = engine.optimize({before(), preferred()});

            EXPECT_EQ(engine.state(), EngineState::Done);
            ASSERT_EQ(solver.calls(), 2u);
            const std::size_t base_count = base_.constraints().size();

            // stage 1 sees only the base constraints
            EXPECT_EQ(solver.seen()[0].constraints().size(), base_count);
            EXPECT_EQ(solver.seen()[0].objective_sense(), Sense::Minimize);

            // stage 2 sees exactly one more: expr(O1) <= 0
            const Model &second = solver.seen()[1];
            ASSERT_EQ(second.constraints().size(), base_count + 1);
            const LinearConstraint &lock = second.constraints().back();
            EXPECT_EQ(lock.name, "lock_objective_1");
            EXPECT_EQ(lock.relation, Relation::LessOrEqual);
            EXPECT_DOUBLE_EQ(lock.rhs, 0.0);
            EXPECT_EQ(describe(lock).rfind("lock_objective_1: ", 0), 0u);
            EXPECT_EQ(second.objective_sense(), Sense::Maximize);

            ASSERT_EQ(result.stages.size(), 2u);
            EXPECT_EQ(result.stages[0].index, 1u);
            EXPECT_TRUE(result.stages[0].frozen);
            EXPECT_EQ(result.stages[0].constraint_count, base_count);
            EXPECT_DOUBLE_EQ(result.stages[1].value, 2.0);
            EXPECT_FALSE(result.stages[1].frozen);
            EXPECT_EQ(result.stages[1].constraint_count, base_count + 1);
            EXPECT_EQ(result.values.size(), base_.variable_count());
        }

        TEST_F(LexicographicEngineTest, LastObjectiveIsReportedButNotFrozen)
        {
            ScriptedSolver solver({ScriptedSolver::optimal(5.0)});
            LexicographicEngine engine(catalog_, space_, base_, solver);

            LexicographicResult result = engine.optimize({preferred(0.1)});

            ASSERT_EQ(result.stages.size(), 1u);
            EXPECT_DOUBLE_EQ(result.stages[0].bound, 4.5);
            EXPECT_FALSE(result.stages[0].frozen);
            EXPECT_EQ(find_constraint(engine.last_model(), "lock_objective_1"), nullptr);
        }

        TEST_F(LexicographicEngineTest, ToleranceWidensTheFrozenBound)
        {
            ScriptedSolver solver({ScriptedSolver::optimal(4.0), ScriptedSolver::optimal(1.0)});
            LexicographicEngine engine(catalog_, space_, base_, solver);

            engine.optimize({before(0.25), preferred()});

            const LinearConstraint *lock = find_constraint(engine.last_model(), "lock_objective_1");
            ASSERT_NE(lock, nullptr);
            EXPECT_DOUBLE_EQ(lock->rhs, 5.0);
        }

        TEST_F(LexicographicEngineTest, BaseInfeasibilityFailsAtStageOne)
        {
            ScriptedSolver solver({ScriptedSolver::with_status(SolverStatus::Infeasible)});
            LexicographicEngine engine(catalog_, space_, base_, solver);

            try
            {
                engine.optimize({before(), preferred()});
                FAIL() << "expected InfeasibleModelError";
            }
            catch (const InfeasibleModelError &e)
            {
                EXPECT_EQ(e.stage(), 1u);
                EXPECT_EQ(e.context().objective_name, "Minimize classes before 9:00");
                EXPECT_TRUE(e.context().completed.empty());
                EXPECT_STREQ(e.kind(), "infeasible_model");
            }
            EXPECT_EQ(engine.state(), EngineState::Failed);
            EXPECT_EQ(solver.calls(), 1u);
        }

        TEST_F(LexicographicEngineTest, LaterInfeasibilityIsStaged)
        {
            ScriptedSolver solver({ScriptedSolver::optimal(3.0), ScriptedSolver::optimal(1.0),
                                   ScriptedSolver::with_status(SolverStatus::Infeasible)});
            LexicographicEngine engine(catalog_, space_, base_, solver);

            auto third = std::make_shared<MinimizeClassesAfter>("9:00", ObjectiveScope{}, Sense::Minimize, 0.0);
            try
            {
                engine.optimize({before(0.5), preferred(0.0), third});
                FAIL() << "expected StagedInfeasibilityError";
            }
            catch (const StagedInfeasibilityError &e)
            {
                EXPECT_EQ(e.stage(), 3u);
                EXPECT_EQ(e.frozen_stage(), 2u);
                EXPECT_DOUBLE_EQ(e.frozen_bound(), 1.0);
                ASSERT_EQ(e.context().completed.size(), 2u);
                EXPECT_DOUBLE_EQ(e.context().completed[0].value, 3.0);
                EXPECT_DOUBLE_EQ(e.context().completed[0].bound, 4.5);
                EXPECT_EQ(e.context().objective_name, third->name());
            }
            EXPECT_EQ(engine.state(), EngineState::Failed);
            EXPECT_EQ(engine.stage(), 3u);
        }

        TEST_F(LexicographicEngineTest, TimeoutStopsRemainingStages)
        {
            ScriptedSolver solver({ScriptedSolver::optimal(0.0), ScriptedSolver::with_status(SolverStatus::Timeout),
                                   ScriptedSolver::optimal(0.0)});
            LexicographicEngine engine(catalog_, space_, base_, solver);

            try
            {
                engine.optimize({before(), preferred(), before()});
                FAIL() << "expected SolverTimeoutError";
            }
            catch (const SolverTimeoutError &e)
            {
                EXPECT_EQ(e.stage(), 2u);
                EXPECT_EQ(e.context().completed.size(), 1u);
            }
            EXPECT_EQ(solver.calls(), 2u);
        }

        TEST_F(LexicographicEngineTest, UnboundedAndAdapterFailuresAreSolverFailures)
        {
            ScriptedSolver unbounded({ScriptedSolver::with_status(SolverStatus::Unbounded)});
            LexicographicEngine first(catalog_, space_, base_, unbounded);
            EXPECT_THROW(first.optimize({before()}), SolverFailureError);

            ScriptedSolver broken({ScriptedSolver::optimal(0.0), ScriptedSolver::failing()});
            LexicographicEngine second(catalog_, space_, base_, broken);
            try
            {
                second.optimize({before(), preferred()});
                FAIL() << "expected SolverFailureError";
            }
            catch (const SolverFailureError &e)
            {
                EXPECT_EQ(e.stage(), 2u);
                EXPECT_STREQ(e.kind(), "solver_failure");
            }
        }

        TEST_F(LexicographicEngineTest, ObjectiveFailureIsWrappedWithStage)
        {
            ScriptedSolver solver({ScriptedSolver::optimal(0.0)});
            LexicographicEngine engine(catalog_, space_, base_, solver);

            try
            {
                engine.optimize({before(), std::make_shared<ThrowingObjective>()});
                FAIL() << "expected PluginEvaluationError";
            }
            catch (const PluginEvaluationError &e)
            {
                EXPECT_EQ(e.plugin(), "Exploding objective");
                EXPECT_EQ(e.stage(), 2u);
                EXPECT_EQ(e.context().completed.size(), 1u);
                EXPECT_NE(std::string(e.what()).find("no such room"), std::string::npos);
            }
            EXPECT_EQ(solver.calls(), 1u);
        }

        TEST_F(LexicographicEngineTest, NoObjectivesSolvesForFeasibility)
        {
            ScriptedSolver solver({ScriptedSolver::optimal(0.0)});
            LexicographicEngine engine(catalog_, space_, base_, solver);

            LexicographicResult result = engine.optimize({});

            EXPECT_TRUE(result.stages.empty());
            EXPECT_EQ(engine.stage(), 0u);
            ASSERT_EQ(solver.calls(), 1u);
            EXPECT_FALSE(solver.seen()[0].has_objective());
        }

        TEST_F(LexicographicEngineTest, InfeasibleFeasibilitySolveIsBaseInfeasibility)
        {
            ScriptedSolver solver({ScriptedSolver::with_status(SolverStatus::Infeasible)});
            LexicographicEngine engine(catalog_, space_, base_, solver);
            try
            {
                engine.optimize({});
                FAIL() << "expected InfeasibleModelError";
            }
            catch (const InfeasibleModelError &e)
            {
                EXPECT_EQ(e.stage(), 0u);
            }
        }

        TEST_F(LexicographicEngineTest, EveryRunStartsFromTheBaseModel)
        {
            ScriptedSolver solver({ScriptedSolver::optimal(1.0), ScriptedSolver::optimal(1.0),
                                   ScriptedSolver::optimal(1.0), ScriptedSolver::optimal(1.0)});
            LexicographicEngine engine(catalog_, space_, base_, solver);

            engine.optimize({before(), preferred()});
            engine.optimize({before(), preferred()});

            ASSERT_EQ(solver.calls(), 4u);
            EXPECT_EQ(solver.seen()[2].constraints().size(), base_.constraints().size());
            EXPECT_EQ(solver.seen()[3].constraints().size(), base_.constraints().size() + 1);
            EXPECT_EQ(base_.constraints().size(), solver.seen()[0].constraints().size());
        }

        TEST_F(LexicographicEngineTest, ValueFallsBackToEvaluatingTheExpression)
        {
            ScriptedSolver::Step step;
            std::vector<std::int64_t> values(base_.variable_count(), 0);
            values[*space_.index_of({"C1", "R1", "S1"})] = 1;
            values[*space_.index_of({"C2", "R2", "S1"})] = 1;
            step.values = values;
            ScriptedSolver solver({step});
            LexicographicEngine engine(catalog_, space_, base_, solver);

            LexicographicResult result = engine.optimize({before()});

            EXPECT_DOUBLE_EQ(result.stages[0].value, 2.0);
            ASSERT_EQ(result.schedule.size(), 2u);
            EXPECT_EQ(result.schedule.find("C2")->room, "R2");
        }

        TEST_F(LexicographicEngineTest, RejectsNullObjective)
        {
            ScriptedSolver solver(std::vector<ScriptedSolver::Step>{});
            LexicographicEngine engine(catalog_, space_, base_, solver);
            EXPECT_THROW(engine.optimize({nullptr}), std::invalid_argument);
            EXPECT_EQ(solver.calls(), 0u);
        }
    }
}
