#include "control/DriveKinematics.hpp"
#include "control/DrivetrainErrors.hpp"

namespace control {

void TankKinematics::command(hardware::Motor& left, hardware::Motor& right,
                             double leftBias, double rightBias, double speed) const {
    left.setVelocity(speed + leftBias);
    right.setVelocity(speed + rightBias);
}

void TankKinematics::drive(hardware::Motor& left, hardware::Motor& right,
                           double leftSpeed, double rightSpeed) const {
    left.setVelocity(leftSpeed);
    right.setVelocity(rightSpeed);
}

void XDriveKinematics::command(hardware::Motor& left, hardware::Motor& right,
                               double leftBias, double rightBias, double speed) const {
    // TODO: build an X-drive robot and validate the right side inversion
    left.setVelocity(speed + leftBias);
    right.setVelocity(-(speed + rightBias));
}

void XDriveKinematics::drive(hardware::Motor&, hardware::Motor&, double, double) const {
    throw ConfigurationError("Driver control is not implemented for DrivetrainType::X_DRIVE");
}

std::unique_ptr<DriveKinematics> makeKinematics(DrivetrainType type) {
    switch (type) {
        case DrivetrainType::TANK:
            return std::make_unique<TankKinematics>();
        case DrivetrainType::X_DRIVE:
            return std::make_unique<XDriveKinematics>();
    }
    throw ConfigurationError("Invalid drivetrain type, use DrivetrainType::TANK or DrivetrainType::X_DRIVE");
}

} // namespace control
