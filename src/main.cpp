#include "main.h"
#include "control/Drivetrain.hpp"
#include "control/DrivetrainErrors.hpp"
#include "platform/ProsDevices.hpp"
#include "platform/ProsScheduler.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>

#define LEFT_MOTOR_FRONT 11
#define LEFT_MOTOR_REAR 2
#define RIGHT_MOTOR_FRONT -20
#define RIGHT_MOTOR_REAR -9
#define IMU_PORT 1

// Green cartridges
constexpr double DRIVE_MAX_RPM = 200.0;

namespace {

/**
 * @brief Everything the competition callbacks share
 *
 * Built once in initialize(). Devices are declared before the objects that
 * hold references to them.
 */
struct RobotContext {
	pros::MotorGroup prosLeftMotors{{LEFT_MOTOR_FRONT, LEFT_MOTOR_REAR}, pros::MotorGearset::green};
	pros::MotorGroup prosRightMotors{{RIGHT_MOTOR_FRONT, RIGHT_MOTOR_REAR}, pros::MotorGearset::green};
	pros::Imu prosImu{IMU_PORT};
	pros::Controller prosController{pros::E_CONTROLLER_MASTER};

	platform::ProsMotorGroup leftMotors{prosLeftMotors, DRIVE_MAX_RPM};
	platform::ProsMotorGroup rightMotors{prosRightMotors, DRIVE_MAX_RPM};
	platform::ProsInertial imu{prosImu};
	platform::ProsController controller{prosController};
	platform::ProsScheduler scheduler;
	utils::ConsoleLogger logger{[] { return pros::millis(); }};

	control::Drivetrain drivetrain{leftMotors, rightMotors, imu, scheduler, makeConfig(), logger};

	static control::DrivetrainConfig makeConfig() {
		control::DrivetrainConfig config(
			1_stDeg, // headingOffsetTolerance
			50_mm);  // wheelRadius
		config.driverSlewRate = 400.0;
		return config;
	}
};

std::unique_ptr<RobotContext> robot;

// Drive a square-ish test path: out 1 m, about-face, back 1 m, then reverse 1 m
void drivetrainTest(control::Drivetrain& drivetrain) {
	drivetrain.turnToHeading(from_cDeg(0));
	drivetrain.moveTowardsHeading(from_cDeg(0), 50, 1_m);
	drivetrain.turnToHeading(from_cDeg(180));
	drivetrain.moveTowardsHeading(from_cDeg(180), 50, 1_m);
	drivetrain.turnToHeading(from_cDeg(180));
	drivetrain.moveTowardsHeading(from_cDeg(180), -50, 1_m);
}

// Cancel whatever is running and stop the wheels, a failing motor only gets reported
void stopDrive() {
	if (!robot) {
		return;
	}
	robot->drivetrain.cancelMotion();
	try {
		robot->drivetrain.stop();
	} catch (const std::exception& e) {
		std::cout << "[stopDrive] " << e.what() << std::endl;
	}
	robot->drivetrain.clearCancellation();
}

} // namespace

/**
 * Runs initialization code. This occurs as soon as the program is started.
 *
 * All other competition modes are blocked by initialize; it is recommended
 * to keep execution time for this mode under a few seconds.
 */
void initialize() {
	try {
		robot = std::make_unique<RobotContext>();
		robot->leftMotors.setBrakeMode(hardware::BrakeMode::BRAKE);
		robot->rightMotors.setBrakeMode(hardware::BrakeMode::BRAKE);
	} catch (const std::exception& e) {
		// Unplugged drive motors fail here, the robot stays disabled
		std::cout << "[initialize] Drivetrain unavailable: " << e.what() << std::endl;
		robot.reset();
		return;
	}

	std::cout << "Calibrating inertial sensor..." << std::endl;
	try {
		robot->imu.calibrate();
		robot->prosController.rumble(".");
	} catch (const std::runtime_error& e) {
		std::cout << "[initialize] " << e.what() << std::endl;
		robot->prosController.rumble("---");
	}

	std::cout << "Initializing robot...Done!" << std::endl;
}

/**
 * Runs while the robot is in the disabled state of Field Management System or
 * the VEX Competition Switch, following either autonomous or opcontrol. When
 * the robot is enabled, this task will exit.
 */
void disabled() {
	stopDrive();
}

void competition_initialize() {}

/**
 * Runs the user autonomous code. If the robot is disabled or communications is
 * lost, the autonomous task will be stopped.
 */
void autonomous() {
	std::cout << "Autonomous mode started" << std::endl;
	if (!robot) {
		std::cout << "[autonomous] Drivetrain unavailable, skipping" << std::endl;
		return;
	}
	uint32_t autonStartMs = pros::millis();

	try {
		robot->drivetrain.reset();
		drivetrainTest(robot->drivetrain);
	} catch (const control::MotionTimeout& e) {
		std::cout << "[autonomous] " << e.what() << std::endl;
	} catch (const control::MotionCancelled& e) {
		std::cout << "[autonomous] " << e.what() << std::endl;
	} catch (const std::exception& e) {
		// Sensor faults and bad commands end the routine, not the program
		std::cout << "[autonomous] Routine aborted: " << e.what() << std::endl;
	}

	stopDrive();
	std::cout << "Autonomous routine completed in " << pros::millis() - autonStartMs << " ms" << std::endl;
}

/**
 * Runs the operator control code. This function will be started in its own
 * task whenever the robot is enabled via the Field Management System or the
 * VEX Competition Switch in the operator control mode.
 */
void opcontrol() {
	if (!robot) {
		std::cout << "[opcontrol] Drivetrain unavailable, skipping" << std::endl;
		return;
	}
	stopDrive();
	uint32_t lastTimeRun = pros::millis();
	while (true) {
		try {
			robot->drivetrain.moveWithController(robot->controller);
		} catch (const std::exception& e) {
			// Drop this update and try again next tick
			std::cout << "[opcontrol] " << e.what() << std::endl;
			stopDrive();
		}
		pros::c::task_delay_until(&lastTimeRun, 10);
	}
}
