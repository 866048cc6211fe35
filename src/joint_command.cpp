/**
 * @file joint_command.cpp
 * @brief JSON encoding of the joint angle command
 */

#include "arm_ik/joint_command.hpp"

#include <boost/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace arm_ik {

namespace {

// Three decimals without a negative zero
double roundAngle(double degrees) {
    const double rounded = std::round(degrees * 1000.0) / 1000.0;
    return rounded == 0.0 ? 0.0 : rounded;
}

}  // namespace

JointCommand JointCommand::fromAngles(
    const KinematicChain& chain,
    const Eigen::VectorXd& q,
    WallClock::time_point stamp
) {
    chain.checkAngleVector(q);

    JointCommand cmd;
    cmd.timestamp = stamp;
    for (int i = 0; i < chain.numJoints(); ++i) {
        const auto& joint = chain.joint(i);
        cmd.joints.push_back({joint.name, joint.axis, radToDeg(q(i))});
    }
    return cmd;
}

void JointCommand::addPassthrough(const std::string& joint, Axis axis, double degrees) {
    joints.push_back({joint, axis, degrees});
}

double JointCommand::degreesOf(const std::string& joint) const {
    for (const auto& entry : joints) {
        if (entry.joint == joint) {
            return entry.degrees;
        }
    }
    throw StructuralError("joint '" + joint + "' not in command");
}

std::string JointCommand::toJson() const {
    boost::json::object joint_map;
    for (const auto& entry : joints) {
        boost::json::object axis_value;
        axis_value[std::string(1, axisName(entry.axis))] = roundAngle(entry.degrees);
        joint_map[entry.joint] = std::move(axis_value);
    }

    boost::json::object params;
    params["units"] = units;
    params["mode"] = mode;
    params["joints"] = std::move(joint_map);

    boost::json::object command;
    command["method"] = method;
    command["timestamp"] = formatIsoTimestamp(timestamp);
    command["params"] = std::move(params);

    return boost::json::serialize(command);
}

std::string formatIsoTimestamp(WallClock::time_point stamp) {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    const auto since_epoch = duration_cast<milliseconds>(stamp.time_since_epoch());
    auto seconds = since_epoch.count() / 1000;
    auto millis = since_epoch.count() % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    const std::time_t t = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream os;
    os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return os.str();
}

}  // namespace arm_ik
