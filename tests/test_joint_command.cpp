#include <arm_ik/joint_command.hpp>
#include <arm_ik/rig_presets.hpp>
#include <boost/json.hpp>
#include <gtest/gtest.h>

#include <cmath>
#include <iterator>

using namespace arm_ik;

/* ---------- helpers ---------------------------------------------------- */
static WallClock::time_point stampAt(long long millis)
{
  return WallClock::time_point(std::chrono::milliseconds(millis));
}

static double angleOf(const boost::json::object& joints, const char* joint, const char* axis)
{
  return joints.at(joint).as_object().at(axis).as_double();
}

/* ---------- tests ------------------------------------------------------ */
TEST(JointCommand, TimestampIsIsoUtcWithMillis)
{
  EXPECT_EQ(formatIsoTimestamp(stampAt(1234)), "1970-01-01T00:00:01.234Z");
  EXPECT_EQ(formatIsoTimestamp(stampAt(1700000000005LL)), "2023-11-14T22:13:20.005Z");
}

TEST(JointCommand, EncodesRigPoseInDegrees)
{
  auto chain = rig::makeChain();
  Eigen::VectorXd q(4);
  q << degToRad(20.0), degToRad(60.0), degToRad(-100.0), degToRad(-60.0);

  JointCommand cmd = JointCommand::fromAngles(chain, q, stampAt(1234));
  cmd.addPassthrough(rig::kGripper, Axis::Z, 0.0);

  const boost::json::object root = boost::json::parse(cmd.toJson()).as_object();
  EXPECT_EQ(root.at("method").as_string(), "set_joint_angles");
  EXPECT_EQ(root.at("timestamp").as_string(), "1970-01-01T00:00:01.234Z");

  const auto& params = root.at("params").as_object();
  EXPECT_EQ(params.at("units").as_string(), "degrees");
  EXPECT_EQ(params.at("mode").as_string(), "follower");

  const auto& joints = params.at("joints").as_object();
  ASSERT_EQ(joints.size(), 5u);
  EXPECT_DOUBLE_EQ(angleOf(joints, "Base_Rotation", "y"), 20.0);
  EXPECT_DOUBLE_EQ(angleOf(joints, "Shoulder_Lift", "x"), 60.0);
  EXPECT_DOUBLE_EQ(angleOf(joints, "Elbow_Flex", "x"), -100.0);
  EXPECT_DOUBLE_EQ(angleOf(joints, "Wrist_Flex", "x"), -60.0);
  EXPECT_DOUBLE_EQ(angleOf(joints, "Gripper", "z"), 0.0);

  // Chain order, gripper last
  auto it = joints.begin();
  EXPECT_EQ(it->key(), "Base_Rotation");
  std::advance(it, 4);
  EXPECT_EQ(it->key(), "Gripper");
}

TEST(JointCommand, RoundsToThreeDecimalsWithoutNegativeZero)
{
  auto chain = rig::makeChain();
  Eigen::VectorXd q = Eigen::VectorXd::Zero(4);
  q(0) = degToRad(-0.0001);
  q(1) = degToRad(12.34567);

  JointCommand cmd = JointCommand::fromAngles(chain, q, stampAt(0));
  const auto root = boost::json::parse(cmd.toJson()).as_object();
  const auto& joints = root.at("params").as_object().at("joints").as_object();

  const double base = angleOf(joints, "Base_Rotation", "y");
  EXPECT_EQ(base, 0.0);
  EXPECT_FALSE(std::signbit(base));
  EXPECT_DOUBLE_EQ(angleOf(joints, "Shoulder_Lift", "x"), 12.346);
}

TEST(JointCommand, LooksUpDegreesByName)
{
  auto chain = rig::makeChain(true);
  Eigen::VectorXd q = Eigen::VectorXd::Zero(5);
  q(4) = degToRad(45.0);

  JointCommand cmd = JointCommand::fromAngles(chain, q, stampAt(0));
  ASSERT_EQ(cmd.joints.size(), 5u);
  EXPECT_NEAR(cmd.degreesOf(rig::kWristRoll), 45.0, 1e-9);
  EXPECT_EQ(cmd.joints[4].axis, Axis::Y);
  EXPECT_THROW(cmd.degreesOf(rig::kGripper), StructuralError);
  EXPECT_THROW(JointCommand::fromAngles(chain, Eigen::VectorXd::Zero(4), stampAt(0)),
               StructuralError);
}
