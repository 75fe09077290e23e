#include "wiiproxy/MSPCommands.hpp"

#include <array>
#include <stdexcept>
#include <string>

namespace wiiproxy {

size_t FieldLayout::fixedSize() const {
  size_t n = 0;
  for (const auto& f : fields)
    if (f.repeat != kRepeatRemaining) n += static_cast<size_t>(f.width) * f.repeat;
  return n;
}

size_t FieldLayout::fixedCount() const {
  size_t n = 0;
  for (const auto& f : fields)
    if (f.repeat != kRepeatRemaining) n += f.repeat;
  return n;
}

size_t FieldLayout::recordSize() const {
  size_t n = 0;
  for (const auto& f : fields)
    if (f.repeat == kRepeatRemaining) n += f.width;
  return n;
}

size_t FieldLayout::recordCount() const {
  size_t n = 0;
  for (const auto& f : fields)
    if (f.repeat == kRepeatRemaining) ++n;
  return n;
}

const FieldDescriptor& FieldLayout::fieldAt(size_t value_index) const {
  size_t i = value_index;
  size_t first_record = fields.size();
  for (size_t k = 0; k < fields.size(); ++k) {
    if (fields[k].repeat == kRepeatRemaining) { first_record = k; break; }
    if (i < fields[k].repeat) return fields[k];
    i -= fields[k].repeat;
  }
  if (first_record == fields.size()) throw std::out_of_range("value index past fixed layout " + name);
  return fields[first_record + i % (fields.size() - first_record)];
}

namespace {

FieldDescriptor u8(const char* n, uint16_t rep = 1, double scale = 1.0) { return {n, 1, false, scale, rep}; }
FieldDescriptor u16(const char* n, uint16_t rep = 1, double scale = 1.0) { return {n, 2, false, scale, rep}; }
FieldDescriptor i16(const char* n, uint16_t rep = 1, double scale = 1.0) { return {n, 2, true, scale, rep}; }
FieldDescriptor u32(const char* n, uint16_t rep = 1, double scale = 1.0) { return {n, 4, false, scale, rep}; }
FieldDescriptor i32(const char* n, uint16_t rep = 1, double scale = 1.0) { return {n, 4, true, scale, rep}; }

struct Registry {
  std::vector<CommandDescriptor> commands;
  std::array<const CommandDescriptor*, 256> index{};
};

const FieldLayout& emptyLayout() {
  static const FieldLayout kEmpty{"empty", {}};
  return kEmpty;
}

Registry buildRegistry() {
  static const FieldLayout kIdent{"ident", {
    u8("version"), u8("multitype"), u8("msp_version"), u32("capability")}};
  static const FieldLayout kStatus{"status", {
    u16("cycle_time"), u16("i2c_errors"), u16("sensors"), u32("flags"), u8("current_set")}};
  static const FieldLayout kRawImu{"raw_imu", {
    i16("acc", 3), i16("gyro", 3), i16("mag", 3)}};
  static const FieldLayout kU16List{"u16_list", {u16("value", kRepeatRemaining)}};
  static const FieldLayout kRawGps{"raw_gps", {
    u8("fix"), u8("num_sat"), i32("lat", 1, 1e-7), i32("lon", 1, 1e-7),
    u16("altitude"), u16("speed", 1, 0.01), u16("ground_course", 1, 0.1)}};
  static const FieldLayout kCompGps{"comp_gps", {
    u16("distance_to_home"), i16("direction_to_home"), u8("update")}};
  static const FieldLayout kAttitude{"attitude", {
    i16("roll", 1, 0.1), i16("pitch", 1, 0.1), i16("heading")}};
  static const FieldLayout kAltitude{"altitude", {
    i32("altitude", 1, 0.01), i16("vario", 1, 0.01)}};
  static const FieldLayout kAnalog{"analog", {
    u8("vbat", 1, 0.1), u16("power_meter_sum"), u16("rssi"), u16("amperage")}};
  static const FieldLayout kRcTuning{"rc_tuning", {
    u8("rc_rate"), u8("rc_expo"), u8("roll_pitch_rate"), u8("yaw_rate"),
    u8("dyn_thr_pid"), u8("throttle_mid"), u8("throttle_expo")}};
  static const FieldLayout kPid{"pid", {
    u8("p", kRepeatRemaining), u8("i", kRepeatRemaining), u8("d", kRepeatRemaining)}};
  static const FieldLayout kMisc{"misc", {
    u16("power_trigger"), u16("min_throttle"), u16("max_throttle"), u16("min_command"),
    u16("failsafe_throttle"), u16("arm_count"), u32("lifetime"),
    i16("mag_declination", 1, 0.1), u8("vbat_scale"), u8("vbat_warn1", 1, 0.1),
    u8("vbat_warn2", 1, 0.1), u8("vbat_crit", 1, 0.1)}};
  static const FieldLayout kU8List{"u8_list", {u8("value", kRepeatRemaining)}};
  static const FieldLayout kNames{"names", {u8("text", kRepeatRemaining)}};
  static const FieldLayout kWpQuery{"wp_query", {u8("wp_no")}};
  static const FieldLayout kWaypoint{"waypoint", {
    u8("wp_no"), i32("lat", 1, 1e-7), i32("lon", 1, 1e-7), i32("alt_hold", 1, 0.01),
    i16("heading"), u16("time_to_stay"), u8("nav_flag")}};
  static const FieldLayout kBoxIds{"box_ids", {u8("box_id", kRepeatRemaining)}};
  static const FieldLayout kServoConf{"servo_conf", {
    u16("min", kRepeatRemaining), u16("max", kRepeatRemaining),
    u16("middle", kRepeatRemaining), u8("rate", kRepeatRemaining)}};
  static const FieldLayout kSetRawGps{"set_raw_gps", {
    u8("fix"), u8("num_sat"), i32("lat", 1, 1e-7), i32("lon", 1, 1e-7),
    u16("altitude"), u16("speed", 1, 0.01)}};
  static const FieldLayout kSetting{"setting", {u8("setting")}};
  static const FieldLayout kHeading{"heading", {i16("heading")}};
  static const FieldLayout kAccTrim{"acc_trim", {i16("pitch"), i16("roll")}};
  static const FieldLayout kDebug{"debug", {i16("debug", 4)}};
  const FieldLayout* kNone = &emptyLayout();

  Registry r;
  r.commands = {
    {MSP_IDENT,           "MSP_IDENT",           Direction::Response,      &kIdent,     kNone},
    {MSP_STATUS,          "MSP_STATUS",          Direction::Response,      &kStatus,    kNone},
    {MSP_RAW_IMU,         "MSP_RAW_IMU",         Direction::Response,      &kRawImu,    kNone},
    {MSP_SERVO,           "MSP_SERVO",           Direction::Response,      &kU16List,   kNone},
    {MSP_MOTOR,           "MSP_MOTOR",           Direction::Response,      &kU16List,   kNone},
    {MSP_RC,              "MSP_RC",              Direction::Response,      &kU16List,   kNone},
    {MSP_RAW_GPS,         "MSP_RAW_GPS",         Direction::Response,      &kRawGps,    kNone},
    {MSP_COMP_GPS,        "MSP_COMP_GPS",        Direction::Response,      &kCompGps,   kNone},
    {MSP_ATTITUDE,        "MSP_ATTITUDE",        Direction::Response,      &kAttitude,  kNone},
    {MSP_ALTITUDE,        "MSP_ALTITUDE",        Direction::Response,      &kAltitude,  kNone},
    {MSP_ANALOG,          "MSP_ANALOG",          Direction::Response,      &kAnalog,    kNone},
    {MSP_RC_TUNING,       "MSP_RC_TUNING",       Direction::Response,      &kRcTuning,  kNone},
    {MSP_PID,             "MSP_PID",             Direction::Response,      &kPid,       kNone},
    {MSP_BOX,             "MSP_BOX",             Direction::Response,      &kU16List,   kNone},
    {MSP_MISC,            "MSP_MISC",            Direction::Response,      &kMisc,      kNone},
    {MSP_MOTOR_PINS,      "MSP_MOTOR_PINS",      Direction::Response,      &kU8List,    kNone},
    {MSP_BOXNAMES,        "MSP_BOXNAMES",        Direction::Response,      &kNames,     kNone},
    {MSP_PIDNAMES,        "MSP_PIDNAMES",        Direction::Response,      &kNames,     kNone},
    {MSP_WP,              "MSP_WP",              Direction::Bidirectional, &kWaypoint,  &kWpQuery},
    {MSP_BOXIDS,          "MSP_BOXIDS",          Direction::Response,      &kBoxIds,    kNone},
    {MSP_SERVO_CONF,      "MSP_SERVO_CONF",      Direction::Response,      &kServoConf, kNone},

    {MSP_SET_RAW_RC,      "MSP_SET_RAW_RC",      Direction::Request,       &kU16List,   kNone},
    {MSP_SET_RAW_GPS,     "MSP_SET_RAW_GPS",     Direction::Request,       &kSetRawGps, kNone},
    {MSP_SET_PID,         "MSP_SET_PID",         Direction::Request,       &kPid,       kNone},
    {MSP_SET_BOX,         "MSP_SET_BOX",         Direction::Request,       &kU16List,   kNone},
    {MSP_SET_RC_TUNING,   "MSP_SET_RC_TUNING",   Direction::Request,       &kRcTuning,  kNone},
    {MSP_ACC_CALIBRATION, "MSP_ACC_CALIBRATION", Direction::Request,       kNone,       kNone},
    {MSP_MAG_CALIBRATION, "MSP_MAG_CALIBRATION", Direction::Request,       kNone,       kNone},
    {MSP_SET_MISC,        "MSP_SET_MISC",        Direction::Request,       &kMisc,      kNone},
    {MSP_RESET_CONF,      "MSP_RESET_CONF",      Direction::Request,       kNone,       kNone},
    {MSP_SET_WP,          "MSP_SET_WP",          Direction::Request,       &kWaypoint,  kNone},
    {MSP_SELECT_SETTING,  "MSP_SELECT_SETTING",  Direction::Request,       &kSetting,   kNone},
    {MSP_SET_HEAD,        "MSP_SET_HEAD",        Direction::Request,       &kHeading,   kNone},
    {MSP_SET_SERVO_CONF,  "MSP_SET_SERVO_CONF",  Direction::Request,       &kServoConf, kNone},
    {MSP_SET_MOTOR,       "MSP_SET_MOTOR",       Direction::Request,       &kU16List,   kNone},
    {MSP_SET_ACC_TRIM,    "MSP_SET_ACC_TRIM",    Direction::Request,       &kAccTrim,   kNone},
    {MSP_ACC_TRIM,        "MSP_ACC_TRIM",        Direction::Response,      &kAccTrim,   kNone},
    {MSP_BIND,            "MSP_BIND",            Direction::Request,       kNone,       kNone},
    {MSP_EEPROM_WRITE,    "MSP_EEPROM_WRITE",    Direction::Request,       kNone,       kNone},
    {MSP_DEBUGMSG,        "MSP_DEBUGMSG",        Direction::Response,      &kNames,     kNone},
    {MSP_DEBUG,           "MSP_DEBUG",           Direction::Response,      &kDebug,     kNone},
  };

  for (const auto& c : r.commands) {
    if (r.index[c.code] != nullptr)
      throw std::logic_error(std::string("duplicate MSP command code ") + std::to_string(c.code));
    r.index[c.code] = &c;
  }
  return r;
}

const Registry& registry() {
  static const Registry r = buildRegistry();
  return r;
}

} // namespace

const CommandDescriptor* lookupCommand(uint8_t code) {
  return registry().index[code];
}

const char* commandName(uint8_t code) {
  const CommandDescriptor* d = lookupCommand(code);
  return d ? d->name : "MSP_UNKNOWN";
}

const std::vector<CommandDescriptor>& allCommands() {
  return registry().commands;
}

const FieldLayout& requestLayout(const CommandDescriptor& desc) {
  switch (desc.direction) {
    case Direction::Request:       return *desc.payload;
    case Direction::Bidirectional: return *desc.query;
    case Direction::Response:      break;
  }
  return emptyLayout();
}

const FieldLayout& responseLayout(const CommandDescriptor& desc) {
  if (desc.direction == Direction::Request) return emptyLayout();
  return *desc.payload;
}

} // namespace wiiproxy
