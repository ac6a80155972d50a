/**
 * @file errors.hpp
 * @brief XTOC status codes shared by the codec, framer and reassembler.
 *
 * Every fallible XTOC call reports one of these codes. Nothing in the
 * protocol engine throws for bad input: single-line parsers return an
 * empty std::optional, codec calls return an ErrorCode, and the
 * reassembler returns a result object carrying the code plus a readable
 * reason string.
 *
 * The taxonomy:
 *   - MalformedWrapper      line does not match the X1 wrapper grammar
 *   - UnsupportedVersion    wrapper or record version not recognized
 *   - InvalidEncoding       payload text is not valid base64url
 *   - MalformedBuffer       record shorter than its layout, truncated
 *                           optional section, or bad extension count
 *   - FieldOutOfRange       required field missing or unusable
 *   - UnsupportedTemplate   template id has no binary codec
 *   - InconsistentParts     chunk set mixes messages
 *   - MissingPart           chunk set has a gap (see missing_part)
 *   - ReassemblyIntegrityFailure  rebuilt wrapper failed to re-parse
 *   - NoPackets             nothing usable was supplied
 *
 * @authors
 * @author Leo
 */
#ifndef XTOC_ERRORS_HPP
#define XTOC_ERRORS_HPP

#include <stdint.h>

namespace xtoc {

enum class ErrorCode : uint8_t {
  Ok = 0,
  MalformedWrapper,
  UnsupportedVersion,
  InvalidEncoding,
  MalformedBuffer,
  FieldOutOfRange,
  UnsupportedTemplate,
  InconsistentParts,
  MissingPart,
  ReassemblyIntegrityFailure,
  NoPackets,
};

/// Stable lowercase token for logs (e.g. "malformed_buffer").
const char* to_string(ErrorCode code);

} // namespace xtoc

#endif // XTOC_ERRORS_HPP
