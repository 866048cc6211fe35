#include <arm_ik/solve_scheduler.hpp>
#include <gtest/gtest.h>

using namespace arm_ik;
using std::chrono::milliseconds;

/* ---------- helpers ---------------------------------------------------- */
static const TimePoint t0 = TimePoint() + std::chrono::seconds(10);

/* ---------- tests ------------------------------------------------------ */
TEST(SolveScheduler, FirstSolveRunsWithBaseBudget)
{
  SolveScheduler scheduler;
  SchedulerState state;
  SolverConfig base;

  SolvePlan plan = scheduler.plan(state, t0, base);
  EXPECT_TRUE(plan.run);
  EXPECT_EQ(plan.max_iterations, 40);
  EXPECT_DOUBLE_EQ(plan.position_tolerance, 0.005);
  EXPECT_EQ(plan.gap, GapLevel::Normal);
  ASSERT_TRUE(state.last_attempt.has_value());
  EXPECT_EQ(*state.last_attempt, t0);
}

TEST(SolveScheduler, ThrottlesWithinMinimumInterval)
{
  SolveScheduler scheduler;
  SchedulerState state;
  SolverConfig base;

  ASSERT_TRUE(scheduler.plan(state, t0, base).run);
  EXPECT_FALSE(scheduler.plan(state, t0 + milliseconds(149), base).run);
  EXPECT_EQ(*state.last_attempt, t0);
  EXPECT_TRUE(scheduler.plan(state, t0 + milliseconds(150), base).run);
}

TEST(SolveScheduler, EscalatesBudgetWithGap)
{
  SolveScheduler scheduler;
  SchedulerState state;
  SolverConfig base;

  scheduler.plan(state, t0, base);
  scheduler.recordOutcome(state, true, t0);

  SolvePlan normal = scheduler.plan(state, t0 + milliseconds(200), base);
  EXPECT_EQ(normal.gap, GapLevel::Normal);
  EXPECT_EQ(normal.max_iterations, 40);

  SolvePlan moderate = scheduler.plan(state, t0 + milliseconds(450), base);
  EXPECT_EQ(moderate.gap, GapLevel::Moderate);
  EXPECT_EQ(moderate.max_iterations, 50);
  EXPECT_DOUBLE_EQ(moderate.position_tolerance, 0.005);
  EXPECT_EQ(moderate.since_accepted, milliseconds(450));

  SolvePlan longer = scheduler.plan(state, t0 + milliseconds(700), base);
  EXPECT_EQ(longer.gap, GapLevel::Long);
  EXPECT_EQ(longer.max_iterations, 60);
  EXPECT_DOUBLE_EQ(longer.position_tolerance, 0.01);
}

TEST(SolveScheduler, RejectedSolveDoesNotResetGap)
{
  SolveScheduler scheduler;
  SchedulerState state;
  SolverConfig base;

  scheduler.plan(state, t0, base);
  scheduler.recordOutcome(state, true, t0);

  scheduler.plan(state, t0 + milliseconds(300), base);
  scheduler.recordOutcome(state, false, t0 + milliseconds(300));
  EXPECT_EQ(*state.last_accepted, t0);

  EXPECT_EQ(scheduler.plan(state, t0 + milliseconds(600), base).gap, GapLevel::Long);
}

TEST(SolveScheduler, NoAcceptedSolveCountsAsNoGap)
{
  SolveScheduler scheduler;
  SchedulerState state;
  SolverConfig base;

  scheduler.plan(state, t0, base);
  scheduler.recordOutcome(state, false, t0);

  SolvePlan plan = scheduler.plan(state, t0 + milliseconds(5000), base);
  EXPECT_TRUE(plan.run);
  EXPECT_EQ(plan.gap, GapLevel::Normal);
  EXPECT_EQ(plan.max_iterations, 40);
}

TEST(SolveScheduler, RejectsInvalidConfig)
{
  SchedulerConfig config;
  config.moderate_gap = milliseconds(800);
  EXPECT_THROW(SolveScheduler{config}, ConfigurationError);

  config = SchedulerConfig();
  config.long_iteration_multiplier = 0.5;
  EXPECT_THROW(SolveScheduler{config}, ConfigurationError);

  config = SchedulerConfig();
  config.min_interval = milliseconds(-1);
  EXPECT_THROW(SolveScheduler{config}, ConfigurationError);
}
