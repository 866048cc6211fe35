#ifndef ARM_IK_TEST_ARM_HPP
#define ARM_IK_TEST_ARM_HPP

#include "arm_ik/kinematic_chain.hpp"

#include <vector>

/* 3-joint arm: base yaw (y), shoulder pitch (x), elbow pitch (x).
   At rest the tool points along +Z, 0.4 forward of a shoulder 0.1 up. */
inline arm_ik::KinematicChain makeTestArm(bool reversed_base = false)
{
  using arm_ik::AngleRange;
  using arm_ik::Axis;

  std::vector<arm_ik::JointSpec> joints(3);
  joints[0].name = "base";
  joints[0].axis = Axis::Y;
  joints[0].range = AngleRange(-M_PI, M_PI);
  joints[0].reversed = reversed_base;

  joints[1].name = "shoulder";
  joints[1].axis = Axis::X;
  joints[1].range = AngleRange(-M_PI / 2.0, M_PI / 2.0);
  joints[1].origin = Eigen::Vector3d(0.0, 0.1, 0.0);

  joints[2].name = "elbow";
  joints[2].axis = Axis::X;
  joints[2].range = AngleRange(-2.5, 2.5);
  joints[2].origin = Eigen::Vector3d(0.0, 0.0, 0.2);

  std::vector<arm_ik::ControlPoint> points = {
      {"upper", 1, Eigen::Vector3d(0.0, 0.0, 0.2)},
      {"ee", 2, Eigen::Vector3d(0.0, 0.0, 0.2)},
      {"mount", arm_ik::ControlPoint::kBase, Eigen::Vector3d(0.0, 0.05, 0.0)},
  };

  return arm_ik::KinematicChain(joints, points);
}

#endif  // ARM_IK_TEST_ARM_HPP
