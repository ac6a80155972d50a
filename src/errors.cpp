// -----------------------------------------------------------------------------
// errors.cpp - log tokens for ErrorCode.
// -----------------------------------------------------------------------------
#include "xtoc/errors.hpp"

namespace xtoc {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:                         return "ok";
    case ErrorCode::MalformedWrapper:           return "malformed_wrapper";
    case ErrorCode::UnsupportedVersion:         return "unsupported_version";
    case ErrorCode::InvalidEncoding:            return "invalid_encoding";
    case ErrorCode::MalformedBuffer:            return "malformed_buffer";
    case ErrorCode::FieldOutOfRange:            return "field_out_of_range";
    case ErrorCode::UnsupportedTemplate:        return "unsupported_template";
    case ErrorCode::InconsistentParts:          return "inconsistent_parts";
    case ErrorCode::MissingPart:                return "missing_part";
    case ErrorCode::ReassemblyIntegrityFailure: return "reassembly_integrity_failure";
    case ErrorCode::NoPackets:                  return "no_packets";
  }
  return "unknown";
}

} // namespace xtoc
