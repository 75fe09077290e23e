#pragma once
#include <cstdint>

namespace wiiproxy {

// Result of every engine operation. Values are delivered through out-parameters.
enum class Status : uint8_t {
  Ok = 0,
  // codec
  SchemaMismatch,
  PayloadTooLarge,
  PayloadLengthMismatch,
  EnumOutOfRange,
  UnknownCommand,
  // deframer / dispatcher
  ChecksumError,
  TransportDesync,
  Timeout,
  RequestAlreadyInFlight,
  NoPendingRequest,
  CommandRejected,
  // session / transport
  SessionClosed,
  IoError,
};

const char* statusToString(Status s);

inline bool ok(Status s) { return s == Status::Ok; }

} // namespace wiiproxy
