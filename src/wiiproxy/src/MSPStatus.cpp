#include "wiiproxy/MSPStatus.hpp"

namespace wiiproxy {

const char* statusToString(Status s) {
  switch (s) {
    case Status::Ok:                     return "Ok";
    case Status::SchemaMismatch:         return "SchemaMismatch";
    case Status::PayloadTooLarge:        return "PayloadTooLarge";
    case Status::PayloadLengthMismatch:  return "PayloadLengthMismatch";
    case Status::EnumOutOfRange:         return "EnumOutOfRange";
    case Status::UnknownCommand:         return "UnknownCommand";
    case Status::ChecksumError:          return "ChecksumError";
    case Status::TransportDesync:        return "TransportDesync";
    case Status::Timeout:                return "Timeout";
    case Status::RequestAlreadyInFlight: return "RequestAlreadyInFlight";
    case Status::NoPendingRequest:       return "NoPendingRequest";
    case Status::CommandRejected:        return "CommandRejected";
    case Status::SessionClosed:          return "SessionClosed";
    case Status::IoError:                return "IoError";
  }
  return "Unknown";
}

} // namespace wiiproxy
