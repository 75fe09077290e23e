#pragma once
#include <cstdint>
#include <vector>

#include "wiiproxy/MSPCommands.hpp"
#include "wiiproxy/MSPMessages.hpp"
#include "wiiproxy/MSPStatus.hpp"

namespace wiiproxy {

// Largest payload an MSP v1 frame can carry (length is one byte)
constexpr size_t kMaxPayloadSize = 255;

// Raw field values in wire order, before any scaling.
using RawValues = std::vector<int64_t>;

// ---- layout level: bytes <-> raw integers ----
Status packFields(const FieldLayout& layout, const RawValues& values, std::vector<uint8_t>& out);
Status unpackFields(const FieldLayout& layout, const std::vector<uint8_t>& bytes, RawValues& out);

// ---- typed level: raw integers <-> structures (scale and enums applied here) ----
Status toFields(const FieldLayout& l, const Empty& v, RawValues& out);
Status toFields(const FieldLayout& l, const Ident& v, RawValues& out);
Status toFields(const FieldLayout& l, const FcStatus& v, RawValues& out);
Status toFields(const FieldLayout& l, const RawImu& v, RawValues& out);
Status toFields(const FieldLayout& l, const U16List& v, RawValues& out);
Status toFields(const FieldLayout& l, const RawGps& v, RawValues& out);
Status toFields(const FieldLayout& l, const CompGps& v, RawValues& out);
Status toFields(const FieldLayout& l, const Attitude& v, RawValues& out);
Status toFields(const FieldLayout& l, const Altitude& v, RawValues& out);
Status toFields(const FieldLayout& l, const Analog& v, RawValues& out);
Status toFields(const FieldLayout& l, const RcTuning& v, RawValues& out);
Status toFields(const FieldLayout& l, const Pid& v, RawValues& out);
Status toFields(const FieldLayout& l, const Misc& v, RawValues& out);
Status toFields(const FieldLayout& l, const U8List& v, RawValues& out);
Status toFields(const FieldLayout& l, const Names& v, RawValues& out);
Status toFields(const FieldLayout& l, const WaypointQuery& v, RawValues& out);
Status toFields(const FieldLayout& l, const Waypoint& v, RawValues& out);
Status toFields(const FieldLayout& l, const BoxIds& v, RawValues& out);
Status toFields(const FieldLayout& l, const ServoConf& v, RawValues& out);
Status toFields(const FieldLayout& l, const SetRawGps& v, RawValues& out);
Status toFields(const FieldLayout& l, const Setting& v, RawValues& out);
Status toFields(const FieldLayout& l, const Heading& v, RawValues& out);
Status toFields(const FieldLayout& l, const AccTrim& v, RawValues& out);
Status toFields(const FieldLayout& l, const Debug& v, RawValues& out);

Status fromFields(const FieldLayout& l, const RawValues& in, Empty& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Ident& v);
Status fromFields(const FieldLayout& l, const RawValues& in, FcStatus& v);
Status fromFields(const FieldLayout& l, const RawValues& in, RawImu& v);
Status fromFields(const FieldLayout& l, const RawValues& in, U16List& v);
Status fromFields(const FieldLayout& l, const RawValues& in, RawGps& v);
Status fromFields(const FieldLayout& l, const RawValues& in, CompGps& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Attitude& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Altitude& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Analog& v);
Status fromFields(const FieldLayout& l, const RawValues& in, RcTuning& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Pid& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Misc& v);
Status fromFields(const FieldLayout& l, const RawValues& in, U8List& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Names& v);
Status fromFields(const FieldLayout& l, const RawValues& in, WaypointQuery& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Waypoint& v);
Status fromFields(const FieldLayout& l, const RawValues& in, BoxIds& v);
Status fromFields(const FieldLayout& l, const RawValues& in, ServoConf& v);
Status fromFields(const FieldLayout& l, const RawValues& in, SetRawGps& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Setting& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Heading& v);
Status fromFields(const FieldLayout& l, const RawValues& in, AccTrim& v);
Status fromFields(const FieldLayout& l, const RawValues& in, Debug& v);

template <class T>
Status encodePayload(const FieldLayout& layout, const T& value, std::vector<uint8_t>& out) {
  if (layout.name != T::kLayout) return Status::SchemaMismatch;
  RawValues values;
  Status st = toFields(layout, value, values);
  if (st != Status::Ok) return st;
  return packFields(layout, values, out);
}

template <class T>
Status decodePayload(const FieldLayout& layout, const std::vector<uint8_t>& bytes, T& out) {
  if (layout.name != T::kLayout) return Status::SchemaMismatch;
  RawValues values;
  Status st = unpackFields(layout, bytes, values);
  if (st != Status::Ok) return st;
  return fromFields(layout, values, out);
}

// Request payload for a command (empty for GET commands).
template <class T>
Status encode(const CommandDescriptor& desc, const T& value, std::vector<uint8_t>& out) {
  return encodePayload(requestLayout(desc), value, out);
}

// Reply payload of a command (empty ack for SET commands).
template <class T>
Status decode(const CommandDescriptor& desc, const std::vector<uint8_t>& bytes, T& out) {
  return decodePayload(responseLayout(desc), bytes, out);
}

// little-endian append helpers
inline void push_u16(std::vector<uint8_t>& v, uint16_t x) {
  v.push_back(x & 0xFF);
  v.push_back((x >> 8) & 0xFF);
}
inline void push_u32(std::vector<uint8_t>& v, uint32_t x) {
  push_u16(v, (uint16_t)(x & 0xFFFF));
  push_u16(v, (uint16_t)(x >> 16));
}

} // namespace wiiproxy
