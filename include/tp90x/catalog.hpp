#pragma once
/**
 * @page tp90x-catalog TP90x Command Catalog
 * @file catalog.hpp
 * @brief Immutable table of every known opcode: directions, lengths, decoders.
 *
 * @details
 * PURPOSE
 * -------
 * The catalog is the single place that knows what each opcode looks like on
 * the wire. The session asks it two questions:
 *   1) Outbound: "is this payload length legal for this opcode?" (before send)
 *   2) Inbound:  "what does this frame mean?" (after every notification)
 *
 * The table is built once on first use and never changes afterwards, so any
 * thread may read it without locking.
 *
 * TABLE
 * -----
 * @code
 *   op    dir     out len   in len    meaning
 *   0x01  out/in  9         2         auth handshake / reply
 *   0x02  out/in  0         0         backlight on / unclassified
 *   0x03  in      -         1         unclassified
 *   0x20  out     1         -         set units
 *   0x21  out     1         -         alarm sound on/off
 *   0x23  out     6         -         set alarm
 *   0x24  out/in  1         6         read alarm / alarm config
 *   0x25  in      -         14|6      temperature snapshot (6|2 probes)
 *   0x26  out/in  0         5         get status / status
 *   0x27  out     0         -         snooze alarm
 *   0x28  out     4         -         time sync
 *   0x29  in      -         9         unclassified
 *   0x30  in      -         15|7      temperature broadcast (6|2 probes)
 *   0x41  out/in  0         3         firmware version
 *   0x42  in      -         1         unclassified
 *   0xe0  in      -         2         unclassified (device error?)
 * @endcode
 *
 * DECODE POLICY
 * -------------
 * - Known opcode, inbound direction, wrong length -> UnexpectedPayloadLength.
 * - Unknown opcode, or a known opcode arriving in a direction the table does
 *   not list -> RawFrame. Undocumented opcodes are normal in the wild.
 * - Unclassified rows decode to RawFrame too; only their length is checked.
 */

#include <cstddef>
#include <cstdint>

#include "tp90x/frame.hpp"
#include "tp90x/messages.hpp"
#include "tp90x/status.hpp"

namespace tp90x {

enum : uint8_t {
  DIR_OUT = 0x01,
  DIR_IN  = 0x02
};

/// Up to two legal payload lengths (most opcodes have one).
struct LengthSet {
  uint8_t count{0};
  uint8_t v[2]{0, 0};

  bool contains(size_t len) const {
    for (uint8_t i = 0; i < count; ++i)
      if (v[i] == len) return true;
    return false;
  }
};

using PayloadDecoder = Status (*)(const Payload& payload, InboundMessage& out);

/**
 * @struct CommandDescriptor
 * @brief One catalog row.
 *
 * Outbound payloads are produced by the typed builders in commands.hpp; the
 * descriptor only carries the lengths those builders must produce.
 */
struct CommandDescriptor {
  uint8_t        opcode{0};
  const char*    name{""};
  uint8_t        directions{0};      ///< DIR_OUT | DIR_IN
  LengthSet      out_len;
  LengthSet      in_len;
  bool           has_response{false};
  uint8_t        response_opcode{0}; ///< valid when has_response
  PayloadDecoder decode{nullptr};    ///< inbound decoder (nullptr if out-only)

  bool outbound() const { return (directions & DIR_OUT) != 0; }
  bool inbound()  const { return (directions & DIR_IN)  != 0; }
};

/// Row for @p opcode, or nullptr if the opcode is unknown.
const CommandDescriptor* find_command(uint8_t opcode);

/// Number of rows (for diagnostics and tests).
size_t catalog_size();

/**
 * @brief Check an outbound payload before it reaches the transport.
 *
 * @return InvalidArgument if the opcode is unknown or not sendable,
 *         UnexpectedPayloadLength if the length is not a catalog length.
 */
Status validate_outbound(uint8_t opcode, size_t payload_len);

/**
 * @brief Turn a decoded frame into a typed value.
 *
 * @return Ok (typed value or RawFrame in @p out), UnexpectedPayloadLength,
 *         or InvalidBcd when a temperature field is corrupt.
 */
Status decode_inbound(const Frame& f, InboundMessage& out);

} // namespace tp90x
