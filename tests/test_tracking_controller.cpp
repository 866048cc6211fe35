#include <arm_ik/tracking_controller.hpp>
#include <gtest/gtest.h>

#include <initializer_list>

using namespace arm_ik;
using std::chrono::milliseconds;

/* ---------- helpers ---------------------------------------------------- */
static const TimePoint t0 = TimePoint() + std::chrono::seconds(10);
static const WallClock::time_point wall0 = WallClock::time_point(std::chrono::seconds(1700000000));

static TrackingController makeController(SolverStrategy strategy = SolverStrategy::DampedLeastSquares)
{
  rig::RigCalibration calibration;
  return TrackingController(rig::makeChain(), rig::makeSolverConfig(calibration),
                            SchedulerConfig(), rig::makeGeometricConfig(calibration),
                            calibration, strategy);
}

/* Keypoints of the rig at q, seen by a camera whose origin is shifted */
static ArmKeypoints observe(const KinematicChain& chain, const Eigen::VectorXd& q,
                            const Eigen::Vector3d& shift)
{
  ArmKeypoints kp;
  kp.shoulder = chain.worldPose(q, rig::kShoulderLift).position + shift;
  kp.elbow = chain.worldPose(q, rig::kElbowFlex).position + shift;
  kp.wrist = chain.worldPose(q, rig::kWristFlex).position + shift;
  kp.hand = chain.worldPose(q, rig::kEndEffector).position + shift;
  return kp;
}

static Eigen::VectorXd trackedPose()
{
  Eigen::VectorXd q(4);
  q << degToRad(20.0), degToRad(60.0), degToRad(-100.0), degToRad(-60.0);
  return q;
}

/* ---------- anchoring -------------------------------------------------- */
TEST(TrackingController, AnchorsShoulderOntoChain)
{
  auto controller = makeController();
  const Eigen::Vector3d shift(1.0, -2.0, 0.5);
  const auto kp = observe(controller.chain(), trackedPose(), shift);

  auto targets = controller.targetsFromKeypoints(kp);
  ASSERT_EQ(targets.size(), 3u);
  EXPECT_EQ(targets[0].point, rig::kElbowFlex);
  EXPECT_EQ(targets[2].point, rig::kEndEffector);
  EXPECT_TRUE(targets[1].position.isApprox(
      controller.chain().worldPose(trackedPose(), rig::kWristFlex).position, 1e-12));
}

TEST(TrackingController, PartialKeypointsGivePartialTargets)
{
  auto controller = makeController();
  auto kp = observe(controller.chain(), trackedPose(), Eigen::Vector3d::Zero());
  kp.wrist.reset();
  EXPECT_EQ(controller.targetsFromKeypoints(kp).size(), 2u);

  kp.shoulder.reset();
  EXPECT_TRUE(controller.targetsFromKeypoints(kp).empty());
}

/* ---------- DLS tracking ----------------------------------------------- */
TEST(TrackingController, ConvergesOverSuccessiveFrames)
{
  auto controller = makeController();
  const auto kp = observe(controller.chain(), trackedPose(), Eigen::Vector3d(0.3, 0.0, -0.2));

  TrackingUpdate update;
  for (int frame = 0; frame < 4; ++frame) {
    update = controller.onKeypoints(kp, t0 + milliseconds(200 * frame), wall0);
    ASSERT_TRUE(update.attempted);
    ASSERT_TRUE(update.committed);
  }

  ASSERT_TRUE(update.result.has_value());
  EXPECT_LT(update.result->max_error, 0.01);
  EXPECT_TRUE(controller.chain().isWithinLimits(controller.chain().angles()));
  EXPECT_EQ(controller.getStatistics().committed_calls, 4);
}

TEST(TrackingController, CommittedUpdateCarriesCommand)
{
  auto controller = makeController();
  const auto kp = observe(controller.chain(), trackedPose(), Eigen::Vector3d::Zero());

  auto update = controller.onKeypoints(kp, t0, wall0);
  ASSERT_TRUE(update.committed);
  ASSERT_TRUE(update.command.has_value());
  ASSERT_EQ(update.command->joints.size(), 5u);
  EXPECT_EQ(update.command->joints.back().joint, rig::kGripper);
  EXPECT_EQ(update.command->joints.back().axis, Axis::Z);
  EXPECT_NEAR(update.command->degreesOf(rig::kShoulderLift),
              radToDeg(controller.chain().angles()(1)), 1e-9);
}

TEST(TrackingController, ThrottledFrameLeavesPoseAlone)
{
  auto controller = makeController();
  const auto kp = observe(controller.chain(), trackedPose(), Eigen::Vector3d::Zero());

  ASSERT_TRUE(controller.onKeypoints(kp, t0, wall0).committed);
  const Eigen::VectorXd after_first = controller.chain().angles();

  auto update = controller.onKeypoints(kp, t0 + milliseconds(100), wall0);
  EXPECT_FALSE(update.attempted);
  EXPECT_FALSE(update.incomplete);
  EXPECT_FALSE(update.command.has_value());
  EXPECT_TRUE(controller.chain().angles() == after_first);
}

TEST(TrackingController, FarTargetKeepsPreviousPose)
{
  auto controller = makeController();
  const Eigen::VectorXd before = controller.chain().angles();

  auto update = controller.onTargets({Target(rig::kEndEffector, Eigen::Vector3d(0.0, 2.0, 0.0))},
                                     t0, wall0);
  EXPECT_TRUE(update.attempted);
  EXPECT_FALSE(update.committed);
  EXPECT_FALSE(update.command.has_value());
  EXPECT_TRUE(controller.chain().angles() == before);
  EXPECT_FALSE(controller.schedulerState().last_accepted.has_value());
}

TEST(TrackingController, MissingShoulderSkipsWithoutThrottling)
{
  auto controller = makeController();
  auto kp = observe(controller.chain(), trackedPose(), Eigen::Vector3d::Zero());
  kp.shoulder.reset();

  auto update = controller.onKeypoints(kp, t0, wall0);
  EXPECT_TRUE(update.incomplete);
  EXPECT_FALSE(update.missingClosedFormInput());
  EXPECT_FALSE(update.attempted);
  EXPECT_FALSE(controller.schedulerState().last_attempt.has_value());
}

/* ---------- closed-form strategy -------------------------------------- */
TEST(TrackingController, GeometricStrategyCommitsByJointName)
{
  auto controller = makeController(SolverStrategy::Geometric);

  ArmKeypoints kp;
  kp.shoulder = Eigen::Vector3d(0.0, 0.0, 0.0);
  kp.elbow = Eigen::Vector3d(0.0, 0.1, 0.0);
  kp.wrist = Eigen::Vector3d(0.0, 0.2, 0.0);
  kp.hand = Eigen::Vector3d(0.0, 0.3, 0.0);

  auto update = controller.onKeypoints(kp, t0, wall0);
  ASSERT_TRUE(update.committed);
  ASSERT_TRUE(update.command.has_value());
  EXPECT_NEAR(update.command->degreesOf(rig::kShoulderLift), 90.0, 1e-9);
  EXPECT_NEAR(update.command->degreesOf(rig::kElbowFlex), -180.0, 1e-6);
  EXPECT_NEAR(update.command->degreesOf(rig::kWristFlex), -85.0, 1e-6);
  EXPECT_EQ(controller.getStatistics().total_calls, 0);

  kp.hand.reset();
  auto skipped = controller.onKeypoints(kp, t0 + milliseconds(500), wall0);
  EXPECT_TRUE(skipped.incomplete);
  EXPECT_TRUE(skipped.missingClosedFormInput());
  EXPECT_FALSE(skipped.attempted);
  EXPECT_NEAR(radToDeg(controller.chain().angles()(1)), 90.0, 1e-9);
}

TEST(TrackingController, StrategiesAgreeOnRigKeypoints)
{
  Eigen::VectorXd reach_left(4);
  reach_left << degToRad(-35.0), degToRad(40.0), degToRad(-120.0), degToRad(-30.0);
  const Eigen::Vector3d shift(0.3, 0.0, -0.2);

  for (const Eigen::VectorXd& q : {trackedPose(), reach_left}) {
    auto closed_form = makeController(SolverStrategy::Geometric);
    const auto kp = observe(closed_form.chain(), q, shift);

    auto geometric = closed_form.onKeypoints(kp, t0, wall0);
    ASSERT_TRUE(geometric.committed);
    for (int i = 0; i < 4; ++i) {
      EXPECT_NEAR(radToDeg(closed_form.chain().angles()(i)), radToDeg(q(i)), 1e-6) << "joint " << i;
    }

    auto iterative = makeController();
    auto dls = iterative.onKeypoints(kp, t0, wall0);
    ASSERT_TRUE(dls.committed);
    EXPECT_EQ(dls.result->status, SolveStatus::Converged);
    const Eigen::VectorXd& a = iterative.chain().angles();
    const Eigen::VectorXd& b = closed_form.chain().angles();
    EXPECT_NEAR(radToDeg(a(0)), radToDeg(b(0)), 0.5);
    EXPECT_NEAR(radToDeg(a(1)), radToDeg(b(1)), 2.0);
    EXPECT_NEAR(radToDeg(a(2)), radToDeg(b(2)), 2.0);
  }
}

TEST(TrackingController, StrategyNames)
{
  EXPECT_EQ(strategyFromName("dls"), SolverStrategy::DampedLeastSquares);
  EXPECT_EQ(strategyFromName("geometric"), SolverStrategy::Geometric);
  EXPECT_STREQ(toString(SolverStrategy::Geometric), "geometric");
  EXPECT_THROW(strategyFromName("jacobian"), ConfigurationError);
}

TEST(TrackingController, UnknownAnchorThrows)
{
  rig::RigCalibration calibration;
  calibration.anchor_point = "Collarbone";
  EXPECT_THROW(TrackingController(rig::makeChain(), rig::makeSolverConfig(calibration),
                                  SchedulerConfig(), rig::makeGeometricConfig(calibration),
                                  calibration),
               StructuralError);
}
