/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#ifndef YAPP_PACKET_H
#define YAPP_PACKET_H

#include <stddef.h>
#include <stdint.h>

#include <etl/expected.h>
#include <etl/span.h>
#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/vector.h>

#include "yapp_protocol.h"

namespace yapp {

enum class PacketKind : uint8_t {
  SEND_INIT,
  RECEIVE_READY,
  RECEIVE_FILE,
  ACK_EOF,
  ACK_EOT,
  CANCEL_ACK,
  RECEIVE_TPK,
  HEADER,
  DATA,
  END_OF_FILE,
  END_OF_TRANSMISSION,
  NOT_READY,
  RESUME,
  CANCEL,
  TEXT
};

using Payload = etl::vector<uint8_t, kMaxPayloadSize>;

struct Packet {
  PacketKind kind;
  Payload payload;

  Packet() : kind(PacketKind::SEND_INIT), payload() {}
  explicit Packet(PacketKind k) : kind(k), payload() {}
  Packet(PacketKind k, etl::span<const uint8_t> data) : kind(k), payload() {
    payload.assign(data.begin(), data.end());
  }

  etl::span<const uint8_t> bytes() const {
    return etl::span<const uint8_t>(payload.data(), payload.size());
  }
  etl::string_view text() const {
    return etl::string_view(reinterpret_cast<const char*>(payload.data()), payload.size());
  }
};

enum class DecodeError : uint8_t {
  NEED_MORE_DATA,  // Declared length exceeds what is buffered; consume nothing.
  INVALID          // Unrecognized leading byte; caller skips exactly one byte.
};

struct DecodedPacket {
  Packet packet;
  size_t consumed;
};

using DecodeResult = etl::expected<DecodedPacket, DecodeError>;

// Class byte of a kind (ENQ, ACK, SOH...).
uint8_t class_byte(PacketKind kind);

// Short protocol mnemonic used in log lines ("SI (Send Init)").
const char* packet_name(PacketKind kind);

// True for the ACK-class packets whose second byte is a subtype.
bool is_acknowledgement(PacketKind kind);

// Writes the wire form of (kind, payload) into out. Returns the number of
// bytes written, or 0 when the payload does not fit the kind (a fixed-form
// packet with a payload, an empty or >256 byte Data packet, a >255 byte
// length-prefixed payload) or out is too small.
size_t encode(PacketKind kind, etl::span<const uint8_t> payload, etl::span<uint8_t> out);

inline size_t encode(const Packet& packet, etl::span<uint8_t> out) {
  return encode(packet.kind, packet.bytes(), out);
}

// Decodes the packet at the front of buffer. Never consumes on error.
DecodeResult decode_one(etl::span<const uint8_t> buffer);

// --- Payload helpers ---

struct HeaderInfo {
  etl::string<kMaxFilenameLength> filename;
  uint32_t file_size;
  bool well_formed;  // At least name NUL size-field were present.
};

// "<filename> NUL <decimal size> NUL". Returns false if it cannot fit.
bool build_header_payload(etl::string_view filename, uint32_t file_size, Payload& out);

// Missing or unparsable size falls back to 0; the size is advisory.
HeaderInfo parse_header_payload(etl::span<const uint8_t> payload);

// "R NUL <decimal offset> NUL"
bool build_resume_payload(uint32_t offset, Payload& out);
uint32_t parse_resume_offset(etl::span<const uint8_t> payload);

bool is_resume_payload(etl::span<const uint8_t> payload);

}  // namespace yapp

#endif  // YAPP_PACKET_H
