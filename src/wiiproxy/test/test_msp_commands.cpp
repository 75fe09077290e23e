#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <string>

#include "wiiproxy/MSPCommands.hpp"

using namespace wiiproxy;

TEST(CommandRegistry, CodesAreUnique) {
  std::set<uint8_t> seen;
  for (const auto& c : allCommands()) {
    EXPECT_TRUE(seen.insert(c.code).second) << "duplicate code " << int(c.code);
  }
  EXPECT_EQ(seen.size(), allCommands().size());
}

TEST(CommandRegistry, LookupByCode) {
  const CommandDescriptor* d = lookupCommand(MSP_IDENT);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->code, 100);
  EXPECT_STREQ(d->name, "MSP_IDENT");
  EXPECT_EQ(d->direction, Direction::Response);
  EXPECT_EQ(d->payload->name, "ident");

  for (const auto& c : allCommands()) EXPECT_EQ(lookupCommand(c.code), &c);
}

TEST(CommandRegistry, UnknownCodeIsNotFound) {
  EXPECT_EQ(lookupCommand(0), nullptr);
  EXPECT_EQ(lookupCommand(99), nullptr);
  EXPECT_EQ(lookupCommand(213), nullptr);
  EXPECT_STREQ(commandName(213), "MSP_UNKNOWN");
}

TEST(CommandRegistry, Directions) {
  EXPECT_EQ(lookupCommand(MSP_ATTITUDE)->direction, Direction::Response);
  EXPECT_EQ(lookupCommand(MSP_ACC_TRIM)->direction, Direction::Response);
  EXPECT_EQ(lookupCommand(MSP_WP)->direction, Direction::Bidirectional);
  for (uint8_t code : {MSP_SET_RAW_RC, MSP_SET_PID, MSP_ACC_CALIBRATION, MSP_EEPROM_WRITE,
                       MSP_SET_WP, MSP_SET_HEAD, MSP_BIND}) {
    EXPECT_EQ(lookupCommand(code)->direction, Direction::Request) << commandName(code);
  }
}

TEST(CommandRegistry, FixedLayoutSizes) {
  EXPECT_EQ(lookupCommand(MSP_IDENT)->payload->fixedSize(), 7u);
  EXPECT_EQ(lookupCommand(MSP_STATUS)->payload->fixedSize(), 11u);
  EXPECT_EQ(lookupCommand(MSP_RAW_IMU)->payload->fixedSize(), 18u);
  EXPECT_EQ(lookupCommand(MSP_RAW_GPS)->payload->fixedSize(), 16u);
  EXPECT_EQ(lookupCommand(MSP_COMP_GPS)->payload->fixedSize(), 5u);
  EXPECT_EQ(lookupCommand(MSP_ATTITUDE)->payload->fixedSize(), 6u);
  EXPECT_EQ(lookupCommand(MSP_ALTITUDE)->payload->fixedSize(), 6u);
  EXPECT_EQ(lookupCommand(MSP_ANALOG)->payload->fixedSize(), 7u);
  EXPECT_EQ(lookupCommand(MSP_RC_TUNING)->payload->fixedSize(), 7u);
  EXPECT_EQ(lookupCommand(MSP_MISC)->payload->fixedSize(), 22u);
  EXPECT_EQ(lookupCommand(MSP_WP)->payload->fixedSize(), 18u);
  EXPECT_EQ(lookupCommand(MSP_SET_RAW_GPS)->payload->fixedSize(), 14u);
  EXPECT_EQ(lookupCommand(MSP_DEBUG)->payload->fixedSize(), 8u);
  EXPECT_FALSE(lookupCommand(MSP_ATTITUDE)->payload->isVariable());
}

TEST(CommandRegistry, VariableLayoutRecords) {
  const FieldLayout& pid = *lookupCommand(MSP_PID)->payload;
  EXPECT_TRUE(pid.isVariable());
  EXPECT_EQ(pid.fixedSize(), 0u);
  EXPECT_EQ(pid.recordSize(), 3u);
  EXPECT_EQ(pid.recordCount(), 3u);
  EXPECT_STREQ(pid.fieldAt(4).name, "i");

  const FieldLayout& servo = *lookupCommand(MSP_SERVO_CONF)->payload;
  EXPECT_EQ(servo.recordSize(), 7u);
  EXPECT_STREQ(servo.fieldAt(7).name, "rate");

  EXPECT_EQ(lookupCommand(MSP_RC)->payload->recordSize(), 2u);
}

TEST(CommandRegistry, FieldAtWalksRepeatedFields) {
  const FieldLayout& imu = *lookupCommand(MSP_RAW_IMU)->payload;
  EXPECT_STREQ(imu.fieldAt(0).name, "acc");
  EXPECT_STREQ(imu.fieldAt(3).name, "gyro");
  EXPECT_STREQ(imu.fieldAt(8).name, "mag");
  EXPECT_THROW(imu.fieldAt(9), std::out_of_range);
}

TEST(CommandRegistry, RequestAndResponseLayouts) {
  const CommandDescriptor& ident = *lookupCommand(MSP_IDENT);
  EXPECT_TRUE(requestLayout(ident).empty());
  EXPECT_EQ(responseLayout(ident).name, "ident");

  const CommandDescriptor& set_pid = *lookupCommand(MSP_SET_PID);
  EXPECT_EQ(requestLayout(set_pid).name, "pid");
  EXPECT_TRUE(responseLayout(set_pid).empty());

  const CommandDescriptor& wp = *lookupCommand(MSP_WP);
  EXPECT_EQ(requestLayout(wp).name, "wp_query");
  EXPECT_EQ(responseLayout(wp).name, "waypoint");
}

TEST(CommandRegistry, SetCommandsShareLayoutWithTheirGet) {
  EXPECT_EQ(lookupCommand(MSP_SET_PID)->payload, lookupCommand(MSP_PID)->payload);
  EXPECT_EQ(lookupCommand(MSP_SET_BOX)->payload, lookupCommand(MSP_BOX)->payload);
  EXPECT_EQ(lookupCommand(MSP_SET_MISC)->payload, lookupCommand(MSP_MISC)->payload);
  EXPECT_EQ(lookupCommand(MSP_SET_RC_TUNING)->payload, lookupCommand(MSP_RC_TUNING)->payload);
  EXPECT_EQ(lookupCommand(MSP_SET_SERVO_CONF)->payload, lookupCommand(MSP_SERVO_CONF)->payload);
  EXPECT_EQ(lookupCommand(MSP_SET_ACC_TRIM)->payload, lookupCommand(MSP_ACC_TRIM)->payload);
}
