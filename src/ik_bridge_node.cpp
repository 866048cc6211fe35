/**
 * @file ik_bridge_node.cpp
 * @brief ROS 2 node bridging observed arm keypoints to joint angle commands
 *
 * - Keypoints in, anchored onto the SO-ARM101 style chain
 * - Adaptive solve scheduling driven by the message stamp
 * - set_joint_angles JSON and JointState out after every committed solve
 */

#include <rclcpp/rclcpp.hpp>
#include <geometry_msgs/msg/point_stamped.hpp>
#include <geometry_msgs/msg/pose_array.hpp>
#include <sensor_msgs/msg/joint_state.hpp>
#include <std_msgs/msg/string.hpp>

#include "arm_ik/rig_presets.hpp"
#include "arm_ik/tracking_controller.hpp"

#include <Eigen/Dense>
#include <chrono>
#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arm_ik {

/**
 * @brief Keypoint to joint-command bridge
 */
class IKBridgeNode : public rclcpp::Node {
public:
    IKBridgeNode() : Node("ik_bridge") {
        // Solver
        this->declare_parameter("solver", "dls");
        this->declare_parameter("with_wrist_roll", false);
        this->declare_parameter("max_iterations", 40);
        this->declare_parameter("position_tolerance", 0.005);
        this->declare_parameter("orientation_tolerance", 0.02);
        this->declare_parameter("damping", 0.05);
        this->declare_parameter("step_scale", 0.7);
        this->declare_parameter("default_max_step", 0.15);
        this->declare_parameter("acceptance_threshold", 0.6);
        this->declare_parameter("inverted_joints", std::vector<std::string>{rig::kBaseRotation});

        // Scheduling
        this->declare_parameter("min_solve_interval_ms", 150);
        this->declare_parameter("moderate_gap_ms", 200);
        this->declare_parameter("long_gap_ms", 500);
        this->declare_parameter("moderate_iteration_multiplier", 1.25);
        this->declare_parameter("long_iteration_multiplier", 1.5);
        this->declare_parameter("long_gap_tolerance_multiplier", 2.0);

        // Rig calibration
        this->declare_parameter("wrist_neutral_offset_deg", 95.0);
        this->declare_parameter("gripper_deg", 0.0);
        this->declare_parameter("anchor_point", rig::kShoulderLift);
        this->declare_parameter("elbow_point", rig::kElbowFlex);
        this->declare_parameter("wrist_point", rig::kWristFlex);
        this->declare_parameter("end_effector_point", rig::kEndEffector);

        // Topics
        this->declare_parameter("keypoints_topic", "arm_keypoints");
        this->declare_parameter("target_topic", "end_effector_target");
        this->declare_parameter("command_topic", "joint_angle_command");
        this->declare_parameter("joint_state_topic", "ik_joint_states");

        KinematicChain chain = rig::makeChain(this->get_parameter("with_wrist_roll").as_bool());

        rig::RigCalibration calibration;
        calibration.wrist_neutral_offset =
            degToRad(this->get_parameter("wrist_neutral_offset_deg").as_double());
        calibration.gripper_degrees = this->get_parameter("gripper_deg").as_double();
        calibration.anchor_point = this->get_parameter("anchor_point").as_string();
        calibration.elbow_point = this->get_parameter("elbow_point").as_string();
        calibration.wrist_point = this->get_parameter("wrist_point").as_string();
        calibration.end_effector_point = this->get_parameter("end_effector_point").as_string();
        calibration.inverted_joints.clear();
        for (const auto& joint : this->get_parameter("inverted_joints").as_string_array()) {
            calibration.inverted_joints.insert(joint);
        }

        SolverConfig config = rig::makeSolverConfig(calibration);
        config.max_iterations = static_cast<int>(this->get_parameter("max_iterations").as_int());
        config.position_tolerance = this->get_parameter("position_tolerance").as_double();
        config.orientation_tolerance = this->get_parameter("orientation_tolerance").as_double();
        config.damping = this->get_parameter("damping").as_double();
        config.step_scale = this->get_parameter("step_scale").as_double();
        config.default_max_step = this->get_parameter("default_max_step").as_double();
        config.acceptance_threshold = this->get_parameter("acceptance_threshold").as_double();

        // Per-joint overrides: max_step.<joint>, limits_deg.<joint> = [lower, upper]
        for (const auto& joint : chain.joints()) {
            const std::string step_name = "max_step." + joint.name;
            auto preset = config.max_step_per_joint.find(joint.name);
            this->declare_parameter(step_name,
                preset != config.max_step_per_joint.end() ? preset->second : config.default_max_step);
            config.max_step_per_joint[joint.name] = this->get_parameter(step_name).as_double();

            const std::string limit_name = "limits_deg." + joint.name;
            this->declare_parameter(limit_name, std::vector<double>());
            const auto limits = this->get_parameter(limit_name).as_double_array();
            if (limits.size() == 2) {
                config.joint_limit_overrides[joint.name] =
                    AngleRange::fromDegrees(limits[0], limits[1]);
            } else if (!limits.empty()) {
                RCLCPP_WARN(this->get_logger(), "Ignoring %s: expected [lower, upper]",
                            limit_name.c_str());
            }
        }

        // weight.<point>
        for (const auto& point : chain.controlPoints()) {
            const std::string weight_name = "weight." + point.name;
            auto preset = config.target_weights.find(point.name);
            this->declare_parameter(weight_name,
                preset != config.target_weights.end() ? preset->second : 1.0);
            config.target_weights[point.name] = this->get_parameter(weight_name).as_double();
        }

        SchedulerConfig scheduler;
        scheduler.min_interval = std::chrono::milliseconds(
            this->get_parameter("min_solve_interval_ms").as_int());
        scheduler.moderate_gap = std::chrono::milliseconds(
            this->get_parameter("moderate_gap_ms").as_int());
        scheduler.long_gap = std::chrono::milliseconds(
            this->get_parameter("long_gap_ms").as_int());
        scheduler.moderate_iteration_multiplier =
            this->get_parameter("moderate_iteration_multiplier").as_double();
        scheduler.long_iteration_multiplier =
            this->get_parameter("long_iteration_multiplier").as_double();
        scheduler.long_gap_tolerance_multiplier =
            this->get_parameter("long_gap_tolerance_multiplier").as_double();

        const SolverStrategy strategy =
            strategyFromName(this->get_parameter("solver").as_string());

        controller_ = std::make_unique<TrackingController>(
            std::move(chain), config, scheduler,
            rig::makeGeometricConfig(calibration), calibration, strategy);

        keypoints_sub_ = this->create_subscription<geometry_msgs::msg::PoseArray>(
            this->get_parameter("keypoints_topic").as_string(), 10,
            std::bind(&IKBridgeNode::keypointsCallback, this, std::placeholders::_1));

        target_sub_ = this->create_subscription<geometry_msgs::msg::PointStamped>(
            this->get_parameter("target_topic").as_string(), 10,
            std::bind(&IKBridgeNode::targetCallback, this, std::placeholders::_1));

        command_pub_ = this->create_publisher<std_msgs::msg::String>(
            this->get_parameter("command_topic").as_string(), 10);

        joint_state_pub_ = this->create_publisher<sensor_msgs::msg::JointState>(
            this->get_parameter("joint_state_topic").as_string(), 10);

        RCLCPP_INFO(this->get_logger(), "IK bridge initialized: SO-ARM101, %d joints, solver=%s",
                    controller_->chain().numJoints(), toString(strategy));
        RCLCPP_INFO(this->get_logger(), "Listening on '%s' and '%s', commanding on '%s'",
                    keypoints_sub_->get_topic_name(), target_sub_->get_topic_name(),
                    command_pub_->get_topic_name());
    }

private:
    static std::optional<Eigen::Vector3d> toKeypoint(const geometry_msgs::msg::Pose& pose) {
        const auto& p = pose.position;
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) {
            return std::nullopt;
        }
        return Eigen::Vector3d(p.x, p.y, p.z);
    }

    // Zero stamps fall back to the node clock
    std::chrono::nanoseconds stampOf(const builtin_interfaces::msg::Time& stamp) {
        rclcpp::Time time(stamp);
        if (time.nanoseconds() == 0) {
            time = this->now();
        }
        return std::chrono::nanoseconds(time.nanoseconds());
    }

    static TimePoint toSteady(std::chrono::nanoseconds stamp) {
        return TimePoint(std::chrono::duration_cast<Clock::duration>(stamp));
    }

    static WallClock::time_point toWall(std::chrono::nanoseconds stamp) {
        return WallClock::time_point(std::chrono::duration_cast<WallClock::duration>(stamp));
    }

    void keypointsCallback(const geometry_msgs::msg::PoseArray::SharedPtr msg) {
        ArmKeypoints keypoints;
        const auto& poses = msg->poses;
        if (poses.size() != 4) {
            RCLCPP_WARN(this->get_logger(), "Expected 4 keypoints, got %zu", poses.size());
        }
        if (poses.size() > 0) keypoints.shoulder = toKeypoint(poses[0]);
        if (poses.size() > 1) keypoints.elbow = toKeypoint(poses[1]);
        if (poses.size() > 2) keypoints.wrist = toKeypoint(poses[2]);
        if (poses.size() > 3) keypoints.hand = toKeypoint(poses[3]);

        const auto stamp = stampOf(msg->header.stamp);
        try {
            handleUpdate(controller_->onKeypoints(keypoints, toSteady(stamp), toWall(stamp)));
        } catch (const IKError& e) {
            RCLCPP_ERROR(this->get_logger(), "Keypoint solve failed: %s", e.what());
        }
    }

    void targetCallback(const geometry_msgs::msg::PointStamped::SharedPtr msg) {
        const Eigen::Vector3d position(msg->point.x, msg->point.y, msg->point.z);
        if (!position.allFinite()) {
            RCLCPP_WARN(this->get_logger(), "Ignoring non-finite end-effector target");
            return;
        }

        std::vector<Target> targets;
        targets.emplace_back(controller_->calibration().end_effector_point, position);

        const auto stamp = stampOf(msg->header.stamp);
        try {
            handleUpdate(controller_->onTargets(targets, toSteady(stamp), toWall(stamp)));
        } catch (const IKError& e) {
            RCLCPP_ERROR(this->get_logger(), "Target solve failed: %s", e.what());
        }
    }

    void handleUpdate(const TrackingUpdate& update) {
        if (update.missingClosedFormInput()) {
            RCLCPP_WARN(this->get_logger(),
                        "Closed-form solve needs shoulder, elbow, wrist and hand, frame skipped");
            return;
        }
        if (!update.attempted) {
            RCLCPP_DEBUG(this->get_logger(), "Frame skipped (%s)",
                         update.incomplete ? "incomplete keypoints" : "throttled");
            return;
        }

        if (update.result) {
            logStatistics();
        }

        if (update.plan.gap != GapLevel::Normal) {
            RCLCPP_DEBUG(this->get_logger(), "Gap %s (%ld ms): %d iterations, tol %.4f",
                         toString(update.plan.gap),
                         static_cast<long>(update.plan.since_accepted.count()),
                         update.plan.max_iterations, update.plan.position_tolerance);
        }

        if (update.result && !update.committed) {
            std::string errors;
            for (double e : update.result->target_errors) {
                if (!errors.empty()) errors += ", ";
                errors += std::to_string(e);
            }
            RCLCPP_WARN(this->get_logger(),
                        "Solve rejected (%s), max error %.3f > %.3f [%s], pose kept",
                        toString(update.result->status), update.result->max_error,
                        controller_->solver().getConfig().acceptance_threshold, errors.c_str());
            return;
        }
        if (!update.committed) {
            RCLCPP_WARN(this->get_logger(), "Closed-form solve found no pose, pose kept");
            return;
        }

        if (update.result) {
            RCLCPP_DEBUG(this->get_logger(), "Committed after %d iterations (%s), residual %.4f",
                         update.result->iterations, toString(update.result->status),
                         update.result->position_residual);
        }

        auto command_msg = std::make_unique<std_msgs::msg::String>();
        command_msg->data = update.command->toJson();
        command_pub_->publish(std::move(command_msg));

        const auto& chain = controller_->chain();
        auto state_msg = std::make_unique<sensor_msgs::msg::JointState>();
        state_msg->header.stamp = this->now();
        for (int i = 0; i < chain.numJoints(); ++i) {
            state_msg->name.push_back(chain.joint(i).name);
            state_msg->position.push_back(chain.angles()(i));
        }
        joint_state_pub_->publish(std::move(state_msg));
    }

    void logStatistics() {
        const auto& stats = controller_->getStatistics();
        if (stats.summaryDue(kStatisticsInterval)) {
            RCLCPP_INFO(this->get_logger(), "Solves: %d, success rate %.1f%%, mean iterations %.1f",
                        stats.total_calls, stats.success_rate * 100.0, stats.mean_iterations);
        }
    }

    static constexpr int kStatisticsInterval = 100;

    std::unique_ptr<TrackingController> controller_;

    // ROS interfaces
    rclcpp::Subscription<geometry_msgs::msg::PoseArray>::SharedPtr keypoints_sub_;
    rclcpp::Subscription<geometry_msgs::msg::PointStamped>::SharedPtr target_sub_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr command_pub_;
    rclcpp::Publisher<sensor_msgs::msg::JointState>::SharedPtr joint_state_pub_;
};

}  // namespace arm_ik


int main(int argc, char** argv) {
    rclcpp::init(argc, argv);
    try {
        auto node = std::make_shared<arm_ik::IKBridgeNode>();
        rclcpp::spin(node);
    } catch (const arm_ik::IKError& e) {
        RCLCPP_FATAL(rclcpp::get_logger("ik_bridge"), "Configuration rejected: %s", e.what());
        rclcpp::shutdown();
        return 1;
    }
    rclcpp::shutdown();
    return 0;
}
