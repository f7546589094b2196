#pragma once
/**
 * @file status.hpp
 * @brief One status taxonomy for every fallible TP90x operation.
 *
 * @details
 * The engine never throws across its API. Each operation returns a Status and
 * hands results back through out-parameters; the CLI prints them as
 * `status=error reason=<why>`.
 *
 * Grouping (how callers should react):
 *  - Framing:  TooShort, ChecksumMismatch         (inbound: drop the frame)
 *  - Catalog:  UnexpectedPayloadLength             (inbound: log and drop)
 *  - Codec:    PayloadTooLarge, InvalidBcd         (caller bug or corrupt data)
 *  - Request:  Timeout                             (session still usable)
 *              Cancelled                           (session is gone)
 *              InvalidArgument, InvalidState       (rejected before any I/O)
 *  - Link:     TransportError                      (fatal to the session)
 *  - Discovery: NotFound
 *
 * @author Leo
 */

#include <cstdint>

namespace tp90x {

enum class Status : uint8_t {
  Ok = 0,
  TooShort,
  ChecksumMismatch,
  PayloadTooLarge,
  InvalidBcd,
  UnexpectedPayloadLength,
  Timeout,
  Cancelled,
  InvalidArgument,
  InvalidState,
  TransportError,
  NotFound
};

/**
 * @brief Stable snake_case reason string, e.g. "checksum_mismatch".
 *
 * Used verbatim in log lines and CLI output; scripts grep for these.
 */
const char* to_string(Status s);

inline bool ok(Status s) { return s == Status::Ok; }

} // namespace tp90x
