#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wiiproxy {

// MSP v1 command IDs (MultiWii 2.3 set)
enum : uint8_t {
  MSP_IDENT           = 100,
  MSP_STATUS          = 101,
  MSP_RAW_IMU         = 102,
  MSP_SERVO           = 103,
  MSP_MOTOR           = 104,
  MSP_RC              = 105,
  MSP_RAW_GPS         = 106,
  MSP_COMP_GPS        = 107,
  MSP_ATTITUDE        = 108,
  MSP_ALTITUDE        = 109,
  MSP_ANALOG          = 110,
  MSP_RC_TUNING       = 111,
  MSP_PID             = 112,
  MSP_BOX             = 113,
  MSP_MISC            = 114,
  MSP_MOTOR_PINS      = 115,
  MSP_BOXNAMES        = 116,
  MSP_PIDNAMES        = 117,
  MSP_WP              = 118,
  MSP_BOXIDS          = 119,
  MSP_SERVO_CONF      = 120,

  MSP_SET_RAW_RC      = 200,
  MSP_SET_RAW_GPS     = 201,
  MSP_SET_PID         = 202,
  MSP_SET_BOX         = 203,
  MSP_SET_RC_TUNING   = 204,
  MSP_ACC_CALIBRATION = 205,
  MSP_MAG_CALIBRATION = 206,
  MSP_SET_MISC        = 207,
  MSP_RESET_CONF      = 208,
  MSP_SET_WP          = 209,
  MSP_SELECT_SETTING  = 210,
  MSP_SET_HEAD        = 211,
  MSP_SET_SERVO_CONF  = 212,
  MSP_SET_MOTOR       = 214,
  MSP_SET_ACC_TRIM    = 239,
  MSP_ACC_TRIM        = 240,
  MSP_BIND            = 241,
  MSP_EEPROM_WRITE    = 250,
  MSP_DEBUGMSG        = 253,
  MSP_DEBUG           = 254,
};

// Response: GET, empty request and a payload reply.
// Request: SET/ACTION, payload request and an empty ack.
// Bidirectional: query payload request and a payload reply.
enum class Direction : uint8_t { Request, Response, Bidirectional };

// Marks the trailing record that repeats until the payload is consumed.
constexpr uint16_t kRepeatRemaining = 0;

struct FieldDescriptor {
  const char* name;
  uint8_t width;        // 1, 2 or 4 bytes
  bool is_signed;
  double scale;         // raw * scale = value in typed units
  uint16_t repeat;      // fixed count, or kRepeatRemaining
};

struct FieldLayout {
  std::string name;
  std::vector<FieldDescriptor> fields;

  bool empty() const { return fields.empty(); }
  // bytes taken by fields with a fixed repeat count
  size_t fixedSize() const;
  // values produced by the fixed part
  size_t fixedCount() const;
  // bytes of one trailing repeated record (0 if the layout has none)
  size_t recordSize() const;
  // fields in one trailing repeated record
  size_t recordCount() const;
  bool isVariable() const { return recordSize() != 0; }
  // descriptor of the field that holds the i-th flat value
  const FieldDescriptor& fieldAt(size_t value_index) const;
};

struct CommandDescriptor {
  uint8_t code;
  const char* name;
  Direction direction;
  const FieldLayout* payload;
  const FieldLayout* query;
};

// nullptr when the code is not registered
const CommandDescriptor* lookupCommand(uint8_t code);
const char* commandName(uint8_t code);
const std::vector<CommandDescriptor>& allCommands();

// schema carried by the outgoing request / the firmware reply
const FieldLayout& requestLayout(const CommandDescriptor& desc);
const FieldLayout& responseLayout(const CommandDescriptor& desc);

} // namespace wiiproxy
