#include "core/model/types.hpp"

namespace mural {

std::string error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "None";
    case ErrorKind::InvalidInput:
      return "InvalidInput";
    case ErrorKind::Authorization:
      return "Authorization";
    case ErrorKind::DuplicateId:
      return "DuplicateId";
    case ErrorKind::PeerUnreachable:
      return "PeerUnreachable";
    case ErrorKind::ReconciliationPartial:
      return "ReconciliationPartial";
    case ErrorKind::Persistence:
      return "Persistence";
    case ErrorKind::Unavailable:
      return "Unavailable";
    case ErrorKind::Protocol:
      return "Protocol";
  }
  return "Protocol";
}

ErrorKind error_kind_from_string(std::string_view text) {
  if (text == "None") {
    return ErrorKind::None;
  }
  if (text == "InvalidInput") {
    return ErrorKind::InvalidInput;
  }
  if (text == "Authorization") {
    return ErrorKind::Authorization;
  }
  if (text == "DuplicateId") {
    return ErrorKind::DuplicateId;
  }
  if (text == "PeerUnreachable") {
    return ErrorKind::PeerUnreachable;
  }
  if (text == "ReconciliationPartial") {
    return ErrorKind::ReconciliationPartial;
  }
  if (text == "Persistence") {
    return ErrorKind::Persistence;
  }
  if (text == "Unavailable") {
    return ErrorKind::Unavailable;
  }
  return ErrorKind::Protocol;
}

}  // namespace mural
