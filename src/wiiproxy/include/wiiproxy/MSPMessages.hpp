#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace wiiproxy {

// Vehicle configuration reported by MSP_IDENT
enum class MultiType : uint8_t {
  Tri           = 1,
  QuadP         = 2,
  QuadX         = 3,
  Bi            = 4,
  Gimbal        = 5,
  Y6            = 6,
  Hex6          = 7,
  FlyingWing    = 8,
  Y4            = 9,
  Hex6X         = 10,
  OctoX8        = 11,
  OctoFlatP     = 12,
  OctoFlatX     = 13,
  Airplane      = 14,
  Heli120Ccpm   = 15,
  Heli90Deg     = 16,
  VTail4        = 17,
  Hex6H         = 18,
  PpmToServo    = 19,
  DualCopter    = 20,
  SingleCopter  = 21,
};
constexpr uint8_t kMultiTypeMin = 1;
constexpr uint8_t kMultiTypeMax = 21;

// Permanent box (flight mode switch) ids, as returned by MSP_BOXIDS
enum class BoxId : uint8_t {
  Arm = 0, Angle, Horizon, Baro, Vario, Mag, HeadFree, HeadAdj, CamStab, CamTrig,
  GpsHome, GpsHold, Passthru, Beeper, LedMax, LedLow, LLights, Calib, Governor,
  OsdSwitch, Mission, Land,
};
constexpr uint8_t kBoxIdMax = 21;

// Aux switch position a box is bound to
enum class BoxState : uint8_t { Empty = 0, Low = 1, Mid = 2, High = 3 };

enum class Sensor : uint16_t { Acc = 1 << 0, Baro = 1 << 1, Mag = 1 << 2, Gps = 1 << 3, Sonar = 1 << 4 };

enum class Capability : uint32_t {
  Bind = 1u << 0, DynBal = 1u << 2, Flap = 1u << 3, NavCap = 1u << 4, ExtAux = 1u << 5,
};

const char* multiTypeName(MultiType t);
const char* boxIdName(BoxId id);

// Typed payloads. kLayout binds a structure to the registry layout of the same name.

struct Empty {
  static constexpr const char* kLayout = "empty";
};

struct Ident {
  static constexpr const char* kLayout = "ident";
  uint8_t version = 0;
  MultiType multitype = MultiType::QuadX;
  uint8_t msp_version = 0;
  uint32_t capability = 0;

  bool hasCapability(Capability c) const { return (capability & static_cast<uint32_t>(c)) != 0; }
  uint8_t naviVersion() const { return static_cast<uint8_t>(capability >> 28); }
};

// MSP_STATUS
struct FcStatus {
  static constexpr const char* kLayout = "status";
  uint16_t cycle_time_us = 0;
  uint16_t i2c_errors = 0;
  uint16_t sensors = 0;
  uint32_t flags = 0;   // bit n set when box n is active
  uint8_t current_set = 0;

  bool hasSensor(Sensor s) const { return (sensors & static_cast<uint16_t>(s)) != 0; }
  bool isBoxActive(uint8_t box_index) const { return box_index < 32 && (flags >> box_index) & 1u; }
};

struct RawImu {
  static constexpr const char* kLayout = "raw_imu";
  std::array<int16_t, 3> acc{};
  std::array<int16_t, 3> gyro{};
  std::array<int16_t, 3> mag{};
};

// MSP_SERVO, MSP_MOTOR, MSP_RC, MSP_BOX and their SET counterparts
struct U16List {
  static constexpr const char* kLayout = "u16_list";
  std::vector<uint16_t> values;
};

struct RawGps {
  static constexpr const char* kLayout = "raw_gps";
  uint8_t fix = 0;
  uint8_t num_sat = 0;
  double latitude_deg = 0.0;
  double longitude_deg = 0.0;
  uint16_t altitude_m = 0;
  double speed_mps = 0.0;
  double ground_course_deg = 0.0;
};

struct CompGps {
  static constexpr const char* kLayout = "comp_gps";
  uint16_t distance_to_home_m = 0;
  int16_t direction_to_home_deg = 0;
  uint8_t update = 0;
};

struct Attitude {
  static constexpr const char* kLayout = "attitude";
  double roll_deg = 0.0;
  double pitch_deg = 0.0;
  int16_t heading_deg = 0;
};

struct Altitude {
  static constexpr const char* kLayout = "altitude";
  double altitude_m = 0.0;
  double vario_mps = 0.0;
};

struct Analog {
  static constexpr const char* kLayout = "analog";
  double vbat_v = 0.0;
  uint16_t power_meter_sum = 0;
  uint16_t rssi = 0;
  uint16_t amperage = 0;
};

struct RcTuning {
  static constexpr const char* kLayout = "rc_tuning";
  uint8_t rc_rate = 0;
  uint8_t rc_expo = 0;
  uint8_t roll_pitch_rate = 0;
  uint8_t yaw_rate = 0;
  uint8_t dyn_thr_pid = 0;
  uint8_t throttle_mid = 0;
  uint8_t throttle_expo = 0;
};

struct PidTerm {
  uint8_t p = 0;
  uint8_t i = 0;
  uint8_t d = 0;
};

struct Pid {
  static constexpr const char* kLayout = "pid";
  std::vector<PidTerm> items;
};

struct Misc {
  static constexpr const char* kLayout = "misc";
  uint16_t power_trigger = 0;
  uint16_t min_throttle = 0;
  uint16_t max_throttle = 0;
  uint16_t min_command = 0;
  uint16_t failsafe_throttle = 0;
  uint16_t arm_count = 0;
  uint32_t lifetime = 0;
  double mag_declination_deg = 0.0;
  uint8_t vbat_scale = 0;
  double vbat_warn1_v = 0.0;
  double vbat_warn2_v = 0.0;
  double vbat_crit_v = 0.0;
};

// MSP_MOTOR_PINS
struct U8List {
  static constexpr const char* kLayout = "u8_list";
  std::vector<uint8_t> values;
};

// MSP_BOXNAMES, MSP_PIDNAMES, MSP_DEBUGMSG
struct Names {
  static constexpr const char* kLayout = "names";
  std::vector<std::string> names;
};

struct WaypointQuery {
  static constexpr const char* kLayout = "wp_query";
  uint8_t wp_no = 0;
};

struct Waypoint {
  static constexpr const char* kLayout = "waypoint";
  uint8_t wp_no = 0;
  double latitude_deg = 0.0;
  double longitude_deg = 0.0;
  double alt_hold_m = 0.0;
  int16_t heading_deg = 0;
  uint16_t time_to_stay = 0;
  uint8_t nav_flag = 0;
};

struct BoxIds {
  static constexpr const char* kLayout = "box_ids";
  std::vector<BoxId> ids;
};

struct ServoConfItem {
  uint16_t min = 0;
  uint16_t max = 0;
  uint16_t middle = 0;
  uint8_t rate = 0;
};

struct ServoConf {
  static constexpr const char* kLayout = "servo_conf";
  std::vector<ServoConfItem> servos;
};

struct SetRawGps {
  static constexpr const char* kLayout = "set_raw_gps";
  uint8_t fix = 0;
  uint8_t num_sat = 0;
  double latitude_deg = 0.0;
  double longitude_deg = 0.0;
  uint16_t altitude_m = 0;
  double speed_mps = 0.0;
};

struct Setting {
  static constexpr const char* kLayout = "setting";
  uint8_t setting = 0;
};

struct Heading {
  static constexpr const char* kLayout = "heading";
  int16_t heading_deg = 0;
};

struct AccTrim {
  static constexpr const char* kLayout = "acc_trim";
  int16_t pitch = 0;
  int16_t roll = 0;
};

struct Debug {
  static constexpr const char* kLayout = "debug";
  std::array<int16_t, 4> values{};
};

// Position of aux channel 1..4 that activates a box, from one MSP_BOX activation word.
// Each aux channel takes three bits (low, mid, high); the lowest set position wins.
BoxState auxState(uint16_t activation, uint8_t aux);

} // namespace wiiproxy
