#include "wiiproxy/MSPMessages.hpp"

namespace wiiproxy {

const char* multiTypeName(MultiType t) {
  switch (t) {
    case MultiType::Tri:          return "TRI";
    case MultiType::QuadP:        return "QUADP";
    case MultiType::QuadX:        return "QUADX";
    case MultiType::Bi:           return "BI";
    case MultiType::Gimbal:       return "GIMBAL";
    case MultiType::Y6:           return "Y6";
    case MultiType::Hex6:         return "HEX6";
    case MultiType::FlyingWing:   return "FLYING_WING";
    case MultiType::Y4:           return "Y4";
    case MultiType::Hex6X:        return "HEX6X";
    case MultiType::OctoX8:       return "OCTOX8";
    case MultiType::OctoFlatP:    return "OCTOFLATP";
    case MultiType::OctoFlatX:    return "OCTOFLATX";
    case MultiType::Airplane:     return "AIRPLANE";
    case MultiType::Heli120Ccpm:  return "HELI_120_CCPM";
    case MultiType::Heli90Deg:    return "HELI_90_DEG";
    case MultiType::VTail4:       return "VTAIL4";
    case MultiType::Hex6H:        return "HEX6H";
    case MultiType::PpmToServo:   return "PPM_TO_SERVO";
    case MultiType::DualCopter:   return "DUALCOPTER";
    case MultiType::SingleCopter: return "SINGLECOPTER";
  }
  return "UNKNOWN";
}

const char* boxIdName(BoxId id) {
  static const char* const kNames[] = {
    "ARM", "ANGLE", "HORIZON", "BARO", "VARIO", "MAG", "HEADFREE", "HEADADJ",
    "CAMSTAB", "CAMTRIG", "GPS HOME", "GPS HOLD", "PASSTHRU", "BEEPER", "LEDMAX",
    "LEDLOW", "LLIGHTS", "CALIB", "GOVERNOR", "OSD SW", "MISSION", "LAND",
  };
  const uint8_t i = static_cast<uint8_t>(id);
  return i <= kBoxIdMax ? kNames[i] : "UNKNOWN";
}

BoxState auxState(uint16_t activation, uint8_t aux) {
  if (aux < 1 || aux > 4) return BoxState::Empty;
  const uint16_t bits = (activation >> (3 * (aux - 1))) & 0x7;
  if (bits & 0x1) return BoxState::Low;
  if (bits & 0x2) return BoxState::Mid;
  if (bits & 0x4) return BoxState::High;
  return BoxState::Empty;
}

} // namespace wiiproxy
