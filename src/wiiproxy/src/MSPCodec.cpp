#include "wiiproxy/MSPCodec.hpp"

#include <cmath>
#include <utility>

namespace wiiproxy {

namespace {

bool fits(const FieldDescriptor& f, int64_t v) {
  const unsigned bits = 8u * f.width;
  if (f.is_signed) {
    const int64_t lo = -(int64_t(1) << (bits - 1));
    const int64_t hi = (int64_t(1) << (bits - 1)) - 1;
    return v >= lo && v <= hi;
  }
  return v >= 0 && v <= (int64_t(1) << bits) - 1;
}

void writeLe(std::vector<uint8_t>& out, uint64_t v, uint8_t width) {
  for (uint8_t i = 0; i < width; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

int64_t readLe(const uint8_t* p, const FieldDescriptor& f) {
  uint64_t raw = 0;
  for (uint8_t i = 0; i < f.width; ++i) raw |= static_cast<uint64_t>(p[i]) << (8 * i);
  if (f.is_signed) {
    const unsigned bits = 8u * f.width;
    const uint64_t sign = uint64_t(1) << (bits - 1);
    if (raw & sign) return static_cast<int64_t>(raw) - (int64_t(1) << bits);
  }
  return static_cast<int64_t>(raw);
}

// Sequential access to raw values with the descriptor of the field each one belongs to.
class FieldReader {
public:
  FieldReader(const FieldLayout& l, const RawValues& v) : layout_(l), values_(v) {}

  int64_t next() { return values_.at(pos_++); }
  double nextScaled() {
    const double scale = layout_.fieldAt(pos_).scale;
    return static_cast<double>(values_.at(pos_++)) * scale;
  }
  bool done() const { return pos_ >= values_.size(); }
  size_t remaining() const { return values_.size() - pos_; }

private:
  const FieldLayout& layout_;
  const RawValues& values_;
  size_t pos_ = 0;
};

class FieldWriter {
public:
  FieldWriter(const FieldLayout& l, RawValues& out) : layout_(l), out_(out) { out_.clear(); }

  void put(int64_t v) { out_.push_back(v); }
  void putScaled(double v) {
    const double scale = layout_.fieldAt(out_.size()).scale;
    out_.push_back(static_cast<int64_t>(std::llround(v / scale)));
  }

private:
  const FieldLayout& layout_;
  RawValues& out_;
};

} // namespace

// ---------- layout level ----------

Status packFields(const FieldLayout& layout, const RawValues& values, std::vector<uint8_t>& out) {
  const size_t fixed = layout.fixedCount();
  const size_t per_record = layout.recordCount();
  size_t records = 0;
  if (per_record == 0) {
    if (values.size() != fixed) return Status::SchemaMismatch;
  } else {
    if (values.size() < fixed || (values.size() - fixed) % per_record != 0) return Status::SchemaMismatch;
    records = (values.size() - fixed) / per_record;
  }
  if (layout.fixedSize() + records * layout.recordSize() > kMaxPayloadSize) return Status::PayloadTooLarge;

  std::vector<uint8_t> buf;
  buf.reserve(layout.fixedSize() + records * layout.recordSize());
  for (size_t i = 0; i < values.size(); ++i) {
    const FieldDescriptor& f = layout.fieldAt(i);
    if (!fits(f, values[i])) return Status::SchemaMismatch;
    writeLe(buf, static_cast<uint64_t>(values[i]), f.width);
  }
  out = std::move(buf);
  return Status::Ok;
}

Status unpackFields(const FieldLayout& layout, const std::vector<uint8_t>& bytes, RawValues& out) {
  const size_t fixed_size = layout.fixedSize();
  const size_t record_size = layout.recordSize();
  if (bytes.size() < fixed_size) return Status::PayloadLengthMismatch;
  if (record_size == 0) {
    if (bytes.size() != fixed_size) return Status::PayloadLengthMismatch;
  } else if ((bytes.size() - fixed_size) % record_size != 0) {
    return Status::PayloadLengthMismatch;
  }

  const size_t count = layout.fixedCount() +
      (record_size ? (bytes.size() - fixed_size) / record_size * layout.recordCount() : 0);
  RawValues values;
  values.reserve(count);
  size_t off = 0;
  for (size_t i = 0; i < count; ++i) {
    const FieldDescriptor& f = layout.fieldAt(i);
    values.push_back(readLe(&bytes[off], f));
    off += f.width;
  }
  out = std::move(values);
  return Status::Ok;
}

// ---------- typed level ----------

Status toFields(const FieldLayout&, const Empty&, RawValues& out) {
  out.clear();
  return Status::Ok;
}

Status fromFields(const FieldLayout&, const RawValues&, Empty&) { return Status::Ok; }

Status toFields(const FieldLayout& l, const Ident& v, RawValues& out) {
  const uint8_t type = static_cast<uint8_t>(v.multitype);
  if (type < kMultiTypeMin || type > kMultiTypeMax) return Status::EnumOutOfRange;
  FieldWriter w(l, out);
  w.put(v.version);
  w.put(type);
  w.put(v.msp_version);
  w.put(v.capability);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Ident& v) {
  FieldReader r(l, in);
  const uint8_t version = static_cast<uint8_t>(r.next());
  const int64_t type = r.next();
  if (type < kMultiTypeMin || type > kMultiTypeMax) return Status::EnumOutOfRange;
  v.version = version;
  v.multitype = static_cast<MultiType>(type);
  v.msp_version = static_cast<uint8_t>(r.next());
  v.capability = static_cast<uint32_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const FcStatus& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.cycle_time_us);
  w.put(v.i2c_errors);
  w.put(v.sensors);
  w.put(v.flags);
  w.put(v.current_set);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, FcStatus& v) {
  FieldReader r(l, in);
  v.cycle_time_us = static_cast<uint16_t>(r.next());
  v.i2c_errors = static_cast<uint16_t>(r.next());
  v.sensors = static_cast<uint16_t>(r.next());
  v.flags = static_cast<uint32_t>(r.next());
  v.current_set = static_cast<uint8_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const RawImu& v, RawValues& out) {
  FieldWriter w(l, out);
  for (auto a : v.acc) w.put(a);
  for (auto g : v.gyro) w.put(g);
  for (auto m : v.mag) w.put(m);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, RawImu& v) {
  FieldReader r(l, in);
  for (auto& a : v.acc) a = static_cast<int16_t>(r.next());
  for (auto& g : v.gyro) g = static_cast<int16_t>(r.next());
  for (auto& m : v.mag) m = static_cast<int16_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const U16List& v, RawValues& out) {
  FieldWriter w(l, out);
  for (auto x : v.values) w.put(x);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, U16List& v) {
  FieldReader r(l, in);
  v.values.clear();
  while (!r.done()) v.values.push_back(static_cast<uint16_t>(r.next()));
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const RawGps& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.fix);
  w.put(v.num_sat);
  w.putScaled(v.latitude_deg);
  w.putScaled(v.longitude_deg);
  w.put(v.altitude_m);
  w.putScaled(v.speed_mps);
  w.putScaled(v.ground_course_deg);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, RawGps& v) {
  FieldReader r(l, in);
  v.fix = static_cast<uint8_t>(r.next());
  v.num_sat = static_cast<uint8_t>(r.next());
  v.latitude_deg = r.nextScaled();
  v.longitude_deg = r.nextScaled();
  v.altitude_m = static_cast<uint16_t>(r.next());
  v.speed_mps = r.nextScaled();
  v.ground_course_deg = r.nextScaled();
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const CompGps& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.distance_to_home_m);
  w.put(v.direction_to_home_deg);
  w.put(v.update);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, CompGps& v) {
  FieldReader r(l, in);
  v.distance_to_home_m = static_cast<uint16_t>(r.next());
  v.direction_to_home_deg = static_cast<int16_t>(r.next());
  v.update = static_cast<uint8_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const Attitude& v, RawValues& out) {
  FieldWriter w(l, out);
  w.putScaled(v.roll_deg);
  w.putScaled(v.pitch_deg);
  w.put(v.heading_deg);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Attitude& v) {
  FieldReader r(l, in);
  v.roll_deg = r.nextScaled();
  v.pitch_deg = r.nextScaled();
  v.heading_deg = static_cast<int16_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const Altitude& v, RawValues& out) {
  FieldWriter w(l, out);
  w.putScaled(v.altitude_m);
  w.putScaled(v.vario_mps);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Altitude& v) {
  FieldReader r(l, in);
  v.altitude_m = r.nextScaled();
  v.vario_mps = r.nextScaled();
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const Analog& v, RawValues& out) {
  FieldWriter w(l, out);
  w.putScaled(v.vbat_v);
  w.put(v.power_meter_sum);
  w.put(v.rssi);
  w.put(v.amperage);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Analog& v) {
  FieldReader r(l, in);
  v.vbat_v = r.nextScaled();
  v.power_meter_sum = static_cast<uint16_t>(r.next());
  v.rssi = static_cast<uint16_t>(r.next());
  v.amperage = static_cast<uint16_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const RcTuning& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.rc_rate);
  w.put(v.rc_expo);
  w.put(v.roll_pitch_rate);
  w.put(v.yaw_rate);
  w.put(v.dyn_thr_pid);
  w.put(v.throttle_mid);
  w.put(v.throttle_expo);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, RcTuning& v) {
  FieldReader r(l, in);
  v.rc_rate = static_cast<uint8_t>(r.next());
  v.rc_expo = static_cast<uint8_t>(r.next());
  v.roll_pitch_rate = static_cast<uint8_t>(r.next());
  v.yaw_rate = static_cast<uint8_t>(r.next());
  v.dyn_thr_pid = static_cast<uint8_t>(r.next());
  v.throttle_mid = static_cast<uint8_t>(r.next());
  v.throttle_expo = static_cast<uint8_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const Pid& v, RawValues& out) {
  FieldWriter w(l, out);
  for (const auto& t : v.items) {
    w.put(t.p);
    w.put(t.i);
    w.put(t.d);
  }
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Pid& v) {
  FieldReader r(l, in);
  v.items.clear();
  while (r.remaining() >= 3) {
    PidTerm t;
    t.p = static_cast<uint8_t>(r.next());
    t.i = static_cast<uint8_t>(r.next());
    t.d = static_cast<uint8_t>(r.next());
    v.items.push_back(t);
  }
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const Misc& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.power_trigger);
  w.put(v.min_throttle);
  w.put(v.max_throttle);
  w.put(v.min_command);
  w.put(v.failsafe_throttle);
  w.put(v.arm_count);
  w.put(v.lifetime);
  w.putScaled(v.mag_declination_deg);
  w.put(v.vbat_scale);
  w.putScaled(v.vbat_warn1_v);
  w.putScaled(v.vbat_warn2_v);
  w.putScaled(v.vbat_crit_v);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Misc& v) {
  FieldReader r(l, in);
  v.power_trigger = static_cast<uint16_t>(r.next());
  v.min_throttle = static_cast<uint16_t>(r.next());
  v.max_throttle = static_cast<uint16_t>(r.next());
  v.min_command = static_cast<uint16_t>(r.next());
  v.failsafe_throttle = static_cast<uint16_t>(r.next());
  v.arm_count = static_cast<uint16_t>(r.next());
  v.lifetime = static_cast<uint32_t>(r.next());
  v.mag_declination_deg = r.nextScaled();
  v.vbat_scale = static_cast<uint8_t>(r.next());
  v.vbat_warn1_v = r.nextScaled();
  v.vbat_warn2_v = r.nextScaled();
  v.vbat_crit_v = r.nextScaled();
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const U8List& v, RawValues& out) {
  FieldWriter w(l, out);
  for (auto x : v.values) w.put(x);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, U8List& v) {
  FieldReader r(l, in);
  v.values.clear();
  while (!r.done()) v.values.push_back(static_cast<uint8_t>(r.next()));
  return Status::Ok;
}

// MultiWii terminates each name with ';'
Status toFields(const FieldLayout& l, const Names& v, RawValues& out) {
  FieldWriter w(l, out);
  for (const auto& name : v.names) {
    for (char c : name) {
      if (c == ';') return Status::SchemaMismatch;
      w.put(static_cast<uint8_t>(c));
    }
    w.put(';');
  }
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Names& v) {
  FieldReader r(l, in);
  v.names.clear();
  std::string cur;
  while (!r.done()) {
    const char c = static_cast<char>(r.next());
    if (c == ';') {
      v.names.push_back(cur);
      cur.clear();
    } else if (c != '\0') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) v.names.push_back(cur);
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const WaypointQuery& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.wp_no);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, WaypointQuery& v) {
  FieldReader r(l, in);
  v.wp_no = static_cast<uint8_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const Waypoint& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.wp_no);
  w.putScaled(v.latitude_deg);
  w.putScaled(v.longitude_deg);
  w.putScaled(v.alt_hold_m);
  w.put(v.heading_deg);
  w.put(v.time_to_stay);
  w.put(v.nav_flag);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Waypoint& v) {
  FieldReader r(l, in);
  v.wp_no = static_cast<uint8_t>(r.next());
  v.latitude_deg = r.nextScaled();
  v.longitude_deg = r.nextScaled();
  v.alt_hold_m = r.nextScaled();
  v.heading_deg = static_cast<int16_t>(r.next());
  v.time_to_stay = static_cast<uint16_t>(r.next());
  v.nav_flag = static_cast<uint8_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const BoxIds& v, RawValues& out) {
  FieldWriter w(l, out);
  for (auto id : v.ids) {
    if (static_cast<uint8_t>(id) > kBoxIdMax) return Status::EnumOutOfRange;
    w.put(static_cast<uint8_t>(id));
  }
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, BoxIds& v) {
  FieldReader r(l, in);
  std::vector<BoxId> ids;
  while (!r.done()) {
    const int64_t id = r.next();
    if (id > kBoxIdMax) return Status::EnumOutOfRange;
    ids.push_back(static_cast<BoxId>(id));
  }
  v.ids = std::move(ids);
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const ServoConf& v, RawValues& out) {
  FieldWriter w(l, out);
  for (const auto& s : v.servos) {
    w.put(s.min);
    w.put(s.max);
    w.put(s.middle);
    w.put(s.rate);
  }
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, ServoConf& v) {
  FieldReader r(l, in);
  v.servos.clear();
  while (r.remaining() >= 4) {
    ServoConfItem s;
    s.min = static_cast<uint16_t>(r.next());
    s.max = static_cast<uint16_t>(r.next());
    s.middle = static_cast<uint16_t>(r.next());
    s.rate = static_cast<uint8_t>(r.next());
    v.servos.push_back(s);
  }
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const SetRawGps& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.fix);
  w.put(v.num_sat);
  w.putScaled(v.latitude_deg);
  w.putScaled(v.longitude_deg);
  w.put(v.altitude_m);
  w.putScaled(v.speed_mps);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, SetRawGps& v) {
  FieldReader r(l, in);
  v.fix = static_cast<uint8_t>(r.next());
  v.num_sat = static_cast<uint8_t>(r.next());
  v.latitude_deg = r.nextScaled();
  v.longitude_deg = r.nextScaled();
  v.altitude_m = static_cast<uint16_t>(r.next());
  v.speed_mps = r.nextScaled();
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const Setting& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.setting);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Setting& v) {
  FieldReader r(l, in);
  v.setting = static_cast<uint8_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const Heading& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.heading_deg);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Heading& v) {
  FieldReader r(l, in);
  v.heading_deg = static_cast<int16_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const AccTrim& v, RawValues& out) {
  FieldWriter w(l, out);
  w.put(v.pitch);
  w.put(v.roll);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, AccTrim& v) {
  FieldReader r(l, in);
  v.pitch = static_cast<int16_t>(r.next());
  v.roll = static_cast<int16_t>(r.next());
  return Status::Ok;
}

Status toFields(const FieldLayout& l, const Debug& v, RawValues& out) {
  FieldWriter w(l, out);
  for (auto d : v.values) w.put(d);
  return Status::Ok;
}

Status fromFields(const FieldLayout& l, const RawValues& in, Debug& v) {
  FieldReader r(l, in);
  for (auto& d : v.values) d = static_cast<int16_t>(r.next());
  return Status::Ok;
}

} // namespace wiiproxy
