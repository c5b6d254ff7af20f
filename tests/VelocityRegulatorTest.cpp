#include "regulation/VelocityRegulator.hpp"
#include "rtos/ThreadScheduler.hpp"
#include "sim/SimulatedChassis.hpp"
#include <atomic>
#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using regulation::VelocityLoopState;
using regulation::VelocityRegulator;

namespace {

// Run the loop by hand against a motor that lags its command
std::vector<double> runLoop(VelocityRegulator& regulator, sim::SimMotor& motor, int ticks) {
    std::vector<double> errors;
    for (int i = 0; i < ticks; ++i) {
        regulator.update();
        errors.push_back(regulator.getState().error);
        motor.advance(0.01);
    }
    return errors;
}

// Motor whose velocity reading fails once its allowance runs out
class FailingMotor : public sim::SimMotor {
public:
    explicit FailingMotor(int readsBeforeFault) : m_readsLeft(readsBeforeFault) {}

    double getVelocity(hardware::VelocityUnit unit = hardware::VelocityUnit::PERCENT) const override {
        if (m_readsLeft.fetch_sub(1) <= 0) {
            throw std::runtime_error("Motor disconnected");
        }
        return sim::SimMotor::getVelocity(unit);
    }

    void stop() override {
        sim::SimMotor::stop();
        if (failStop) {
            throw std::runtime_error("brake failed");
        }
    }

    void allowReads(int reads) { m_readsLeft = reads; }

    bool failStop = false;

private:
    mutable std::atomic<int> m_readsLeft;
};

// Poll until the loop reports a fault, up to one second
bool waitForFault(VelocityRegulator& regulator, rtos::Scheduler& scheduler) {
    for (int i = 0; i < 100 && !regulator.getState().faulted; ++i) {
        scheduler.delay(10);
    }
    return regulator.getState().faulted;
}

} // namespace

TEST(VelocityRegulator, SetVelocityOnlyStoresTarget) {
    sim::SimMotor motor;
    VelocityRegulator regulator(motor);

    regulator.setVelocity(60.0);

    EXPECT_DOUBLE_EQ(regulator.getTargetVelocity(), 60.0);
    EXPECT_EQ(motor.setVelocityCalls, 0);
    EXPECT_FALSE(regulator.isRunning());
}

TEST(VelocityRegulator, RejectsUnitsOtherThanPercent) {
    sim::SimMotor motor;
    VelocityRegulator regulator(motor);
    EXPECT_THROW(regulator.setVelocity(100.0, hardware::VelocityUnit::RPM), std::invalid_argument);
}

TEST(VelocityRegulator, RejectsNonPositivePeriod) {
    sim::SimMotor motor;
    EXPECT_THROW(VelocityRegulator(motor, 0.4, 0.05, 0_msec), std::invalid_argument);
}

TEST(VelocityRegulator, ForwardsEverythingElse) {
    sim::SimMotor motor;
    VelocityRegulator regulator(motor);

    regulator.setBrakeMode(hardware::BrakeMode::HOLD);
    EXPECT_EQ(motor.brakeMode, hardware::BrakeMode::HOLD);

    regulator.spin(hardware::SpinDirection::FORWARD);
    EXPECT_TRUE(motor.isSpinning());

    motor.setVelocity(50.0);
    motor.advance(0.5);
    EXPECT_DOUBLE_EQ(to_stDeg(regulator.getPosition()), to_stDeg(motor.getPosition()));
    EXPECT_NEAR(to_stDeg(regulator.getPosition()), 300.0, 1e-6);
    EXPECT_DOUBLE_EQ(regulator.getVelocity(hardware::VelocityUnit::RPM), 100.0);

    regulator.stop();
    EXPECT_FALSE(motor.isSpinning());
}

TEST(VelocityRegulator, FirstTickHasNoDerivativeKick) {
    sim::SimMotor motor;
    VelocityRegulator regulator(motor, 0.4, 0.05, 10_msec);
    regulator.setVelocity(50.0);

    regulator.update();
    VelocityLoopState state = regulator.getState();

    EXPECT_DOUBLE_EQ(state.targetVelocity, 50.0);
    EXPECT_DOUBLE_EQ(state.measuredVelocity, 0.0);
    EXPECT_DOUBLE_EQ(state.error, 50.0);
    EXPECT_DOUBLE_EQ(state.previousError, 50.0);
    EXPECT_DOUBLE_EQ(state.derivative, 0.0);
    EXPECT_DOUBLE_EQ(state.output, 20.0);
    EXPECT_DOUBLE_EQ(state.command, 20.0);
    EXPECT_DOUBLE_EQ(motor.getCommanded(), 20.0);
    EXPECT_DOUBLE_EQ(state.kp, 0.4);
    EXPECT_DOUBLE_EQ(state.kd, 0.05);
    EXPECT_NEAR(to_msec(state.period), 10.0, 1e-9);
    EXPECT_FALSE(state.faulted);
}

TEST(VelocityRegulator, ErrorShrinksTowardsTarget) {
    sim::SimMotor motor(1.0, 0.08);
    VelocityRegulator regulator(motor);
    regulator.spin(hardware::SpinDirection::FORWARD);
    regulator.setVelocity(50.0);

    std::vector<double> errors = runLoop(regulator, motor, 300);

    for (size_t i = 1; i < errors.size(); ++i) {
        EXPECT_LE(std::abs(errors[i]), std::abs(errors[i - 1]) + 1e-9) << "tick " << i;
    }
    EXPECT_LT(std::abs(errors.back()), 1.0);
    EXPECT_NEAR(motor.getVelocity(), 50.0, 1.0);
}

TEST(VelocityRegulator, NegativeTargetDrivesBackward) {
    sim::SimMotor motor(1.0, 0.08);
    VelocityRegulator regulator(motor);
    regulator.spin(hardware::SpinDirection::FORWARD);
    regulator.setVelocity(-40.0);

    std::vector<double> errors = runLoop(regulator, motor, 300);

    for (size_t i = 1; i < errors.size(); ++i) {
        EXPECT_LE(std::abs(errors[i]), std::abs(errors[i - 1]) + 1e-9) << "tick " << i;
    }
    EXPECT_LT(regulator.getState().command, 0.0);
    EXPECT_NEAR(motor.getVelocity(), -40.0, 1.0);
}

TEST(VelocityRegulator, CommandStaysWithinPercentRange) {
    sim::SimMotor motor(0.5, 0.08);
    VelocityRegulator regulator(motor, 2.0, 0.05, 10_msec);
    regulator.spin(hardware::SpinDirection::FORWARD);
    regulator.setVelocity(100.0);

    for (int i = 0; i < 200; ++i) {
        regulator.update();
        double command = regulator.getState().command;
        EXPECT_LE(command, 100.0);
        EXPECT_GE(command, -100.0);
        motor.advance(0.01);
    }
    EXPECT_DOUBLE_EQ(regulator.getState().command, 100.0);
}

TEST(VelocityRegulator, AttachRunsLoopUntilDetached) {
    rtos::ThreadScheduler scheduler;
    sim::SimMotor motor;
    VelocityRegulator regulator(motor);
    regulator.setVelocity(30.0);

    regulator.attach(scheduler);
    regulator.attach(scheduler);
    EXPECT_TRUE(regulator.isRunning());
    EXPECT_TRUE(regulator.getState().running);
    scheduler.delay(100);
    regulator.detach();

    EXPECT_FALSE(regulator.isRunning());
    EXPECT_FALSE(regulator.getState().running);
    EXPECT_GT(motor.setVelocityCalls, 0);

    // Detached, so nothing writes the motor any more
    int calls = motor.setVelocityCalls;
    scheduler.delay(50);
    EXPECT_EQ(motor.setVelocityCalls, calls);
}

TEST(VelocityRegulator, ReattachPicksUpNewTarget) {
    rtos::ThreadScheduler scheduler;
    sim::SimMotor motor;
    VelocityRegulator regulator(motor);
    regulator.setVelocity(30.0);
    regulator.attach(scheduler);
    scheduler.delay(30);
    regulator.detach();

    regulator.setVelocity(80.0);
    regulator.attach(scheduler);
    scheduler.delay(30);
    regulator.detach();

    EXPECT_DOUBLE_EQ(regulator.getState().targetVelocity, 80.0);
}

TEST(VelocityRegulator, DestructorDetaches) {
    rtos::ThreadScheduler scheduler;
    sim::SimMotor motor;
    {
        VelocityRegulator regulator(motor);
        regulator.attach(scheduler);
        scheduler.delay(20);
    }
    int calls = motor.setVelocityCalls;
    scheduler.delay(30);
    EXPECT_EQ(motor.setVelocityCalls, calls);
}

TEST(VelocityRegulator, MotorFaultStopsMotorAndEndsLoop) {
    rtos::ThreadScheduler scheduler;
    FailingMotor motor(3);
    VelocityRegulator regulator(motor);
    regulator.spin(hardware::SpinDirection::FORWARD);
    regulator.setVelocity(30.0);

    regulator.attach(scheduler);
    ASSERT_TRUE(waitForFault(regulator, scheduler));

    VelocityLoopState state = regulator.getState();
    EXPECT_NE(state.faultMessage.find("Motor disconnected"), std::string::npos);
    EXPECT_FALSE(state.running);
    EXPECT_FALSE(regulator.isRunning());

    regulator.detach();
    EXPECT_EQ(motor.setVelocityCalls, 3);
    EXPECT_GE(motor.stopCalls, 1);
    EXPECT_FALSE(motor.isSpinning());
}

TEST(VelocityRegulator, FaultRecordsFailedStop) {
    rtos::ThreadScheduler scheduler;
    FailingMotor motor(0);
    motor.failStop = true;
    VelocityRegulator regulator(motor);

    regulator.attach(scheduler);
    ASSERT_TRUE(waitForFault(regulator, scheduler));
    regulator.detach();

    std::string message = regulator.getState().faultMessage;
    EXPECT_NE(message.find("Motor disconnected"), std::string::npos);
    EXPECT_NE(message.find("brake failed"), std::string::npos);
}

TEST(VelocityRegulator, AttachAfterFaultRestartsLoop) {
    rtos::ThreadScheduler scheduler;
    FailingMotor motor(1);
    VelocityRegulator regulator(motor);
    regulator.setVelocity(30.0);
    regulator.attach(scheduler);
    ASSERT_TRUE(waitForFault(regulator, scheduler));

    motor.allowReads(1000000);
    regulator.attach(scheduler);
    scheduler.delay(30);

    EXPECT_TRUE(regulator.isRunning());
    VelocityLoopState state = regulator.getState();
    EXPECT_FALSE(state.faulted);
    EXPECT_TRUE(state.faultMessage.empty());
    regulator.detach();
}

TEST(ThreadScheduler, SpawnedTaskRunsAndJoins) {
    rtos::ThreadScheduler scheduler;
    std::atomic<int> runs{0};
    auto task = scheduler.spawn([&runs]() { ++runs; }, "test task");
    task->join();
    EXPECT_EQ(runs.load(), 1);

    uint32_t before = scheduler.millis();
    scheduler.delay(20);
    EXPECT_GE(scheduler.millis() - before, 20u);
}
