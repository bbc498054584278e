/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#include "yapp_packet.h"

#include <string.h>

#include "PacketBuilder.h"
#include "util/string_utils.h"

namespace yapp {

namespace {

struct KindInfo {
  uint8_t class_byte;
  uint8_t subtype;  // Second header byte for fixed-form packets, 0 otherwise.
  const char* name;
};

// Indexed by PacketKind.
const KindInfo kKindTable[] = {
    {YAPP_ENQ, YAPP_FIXED_LENGTH, "SI (Send Init)"},
    {YAPP_ACK, YAPP_ACK_RECEIVE_READY, "RR (Receive Ready)"},
    {YAPP_ACK, YAPP_ACK_RECEIVE_FILE, "RF (Receive File)"},
    {YAPP_ACK, YAPP_ACK_EOF, "AF (Ack End of File)"},
    {YAPP_ACK, YAPP_ACK_EOT, "AT (Ack End of Transmission)"},
    {YAPP_ACK, YAPP_ACK_CANCEL, "CA (Cancel Ack)"},
    {YAPP_ACK, YAPP_ACK_RECEIVE_TPK, "RT (Receive TPK)"},
    {YAPP_SOH, 0, "HD (Header)"},
    {YAPP_STX, 0, "DT (Data)"},
    {YAPP_ETX, YAPP_FIXED_LENGTH, "EF (End of File)"},
    {YAPP_EOT, YAPP_FIXED_LENGTH, "ET (End of Transmission)"},
    {YAPP_NAK, 0, "NR (Not Ready)"},
    {YAPP_NAK, 0, "RE (Resume)"},
    {YAPP_CAN, 0, "CN (Cancel)"},
    {YAPP_DLE, 0, "TX (Text)"},
};

static_assert(sizeof(kKindTable) / sizeof(kKindTable[0]) ==
                  static_cast<size_t>(PacketKind::TEXT) + 1,
              "kKindTable must cover every PacketKind");

const KindInfo& info(PacketKind kind) {
  return kKindTable[static_cast<size_t>(kind)];
}

bool is_fixed_form(PacketKind kind) {
  return info(kind).subtype != 0;
}

bool ack_kind_from_subtype(uint8_t subtype, PacketKind& out) {
  switch (subtype) {
    case YAPP_ACK_RECEIVE_READY: out = PacketKind::RECEIVE_READY; return true;
    case YAPP_ACK_RECEIVE_FILE:  out = PacketKind::RECEIVE_FILE; return true;
    case YAPP_ACK_EOF:           out = PacketKind::ACK_EOF; return true;
    case YAPP_ACK_EOT:           out = PacketKind::ACK_EOT; return true;
    case YAPP_ACK_CANCEL:        out = PacketKind::CANCEL_ACK; return true;
    case YAPP_ACK_RECEIVE_TPK:   out = PacketKind::RECEIVE_TPK; return true;
    default: return false;
  }
}

// Splits the next NUL-terminated field starting at offset. A missing
// terminator makes the rest of the payload the field.
etl::string_view next_field(etl::span<const uint8_t> payload, size_t& offset, bool& terminated) {
  const size_t start = offset;
  while (offset < payload.size() && payload[offset] != 0) {
    ++offset;
  }
  terminated = offset < payload.size();
  etl::string_view field(reinterpret_cast<const char*>(payload.data()) + start, offset - start);
  if (terminated) {
    ++offset;
  }
  return field;
}

}  // namespace

uint8_t class_byte(PacketKind kind) { return info(kind).class_byte; }

const char* packet_name(PacketKind kind) { return info(kind).name; }

bool is_acknowledgement(PacketKind kind) { return info(kind).class_byte == YAPP_ACK; }

size_t encode(PacketKind kind, etl::span<const uint8_t> payload, etl::span<uint8_t> out) {
  const KindInfo& k = info(kind);

  if (is_fixed_form(kind)) {
    if (!payload.empty() || out.size() < kHeaderSize) {
      return 0;
    }
    out[0] = k.class_byte;
    out[1] = k.subtype;
    return kHeaderSize;
  }

  size_t length_limit = kMaxFieldPayloadSize;
  if (kind == PacketKind::DATA) {
    if (payload.empty()) {
      return 0;  // A zero length byte would announce 256 bytes.
    }
    length_limit = kMaxPayloadSize;
  }
  if (payload.size() > length_limit || out.size() < kHeaderSize + payload.size()) {
    return 0;
  }
  if (kind == PacketKind::RESUME && !is_resume_payload(payload)) {
    return 0;
  }

  out[0] = k.class_byte;
  out[1] = static_cast<uint8_t>(payload.size() & 0xFF);  // 256 -> 0 for Data.
  if (!payload.empty()) {
    memcpy(out.data() + kHeaderSize, payload.data(), payload.size());
  }
  return kHeaderSize + payload.size();
}

DecodeResult decode_one(etl::span<const uint8_t> buffer) {
  if (buffer.empty()) {
    return etl::unexpected<DecodeError>(DecodeError::NEED_MORE_DATA);
  }

  const uint8_t first = buffer[0];
  switch (first) {
    case YAPP_ENQ:
    case YAPP_ACK:
    case YAPP_ETX:
    case YAPP_EOT:
    case YAPP_SOH:
    case YAPP_STX:
    case YAPP_NAK:
    case YAPP_CAN:
    case YAPP_DLE:
      break;
    default:
      return etl::unexpected<DecodeError>(DecodeError::INVALID);
  }

  if (buffer.size() < kHeaderSize) {
    return etl::unexpected<DecodeError>(DecodeError::NEED_MORE_DATA);
  }
  const uint8_t second = buffer[1];

  DecodedPacket decoded;
  decoded.consumed = kHeaderSize;

  switch (first) {
    case YAPP_ENQ:
      if (second != YAPP_FIXED_LENGTH) {
        return etl::unexpected<DecodeError>(DecodeError::INVALID);
      }
      decoded.packet.kind = PacketKind::SEND_INIT;
      return decoded;

    case YAPP_ETX:
      if (second != YAPP_FIXED_LENGTH) {
        return etl::unexpected<DecodeError>(DecodeError::INVALID);
      }
      decoded.packet.kind = PacketKind::END_OF_FILE;
      return decoded;

    case YAPP_EOT:
      if (second != YAPP_FIXED_LENGTH) {
        return etl::unexpected<DecodeError>(DecodeError::INVALID);
      }
      decoded.packet.kind = PacketKind::END_OF_TRANSMISSION;
      return decoded;

    case YAPP_ACK:
      if (!ack_kind_from_subtype(second, decoded.packet.kind)) {
        return etl::unexpected<DecodeError>(DecodeError::INVALID);
      }
      return decoded;

    default:
      break;
  }

  // Length-prefixed forms.
  const size_t length = (first == YAPP_STX && second == 0) ? kMaxPayloadSize : second;
  if (buffer.size() < kHeaderSize + length) {
    return etl::unexpected<DecodeError>(DecodeError::NEED_MORE_DATA);
  }
  etl::span<const uint8_t> body(buffer.data() + kHeaderSize, length);

  switch (first) {
    case YAPP_SOH: decoded.packet.kind = PacketKind::HEADER; break;
    case YAPP_STX: decoded.packet.kind = PacketKind::DATA; break;
    case YAPP_CAN: decoded.packet.kind = PacketKind::CANCEL; break;
    case YAPP_DLE: decoded.packet.kind = PacketKind::TEXT; break;
    default:
      decoded.packet.kind = is_resume_payload(body) ? PacketKind::RESUME : PacketKind::NOT_READY;
      break;
  }
  decoded.packet.payload.assign(body.begin(), body.end());
  decoded.consumed = kHeaderSize + length;
  return decoded;
}

bool build_header_payload(etl::string_view filename, uint32_t file_size, Payload& out) {
  PacketBuilder builder(out);
  builder.add_field(filename).add_decimal_field(file_size);
  return !builder.overflowed() && builder.size() <= kMaxFieldPayloadSize;
}

HeaderInfo parse_header_payload(etl::span<const uint8_t> payload) {
  HeaderInfo header;
  header.file_size = 0;
  header.well_formed = false;

  size_t offset = 0;
  bool terminated = false;
  const etl::string_view name = next_field(payload, offset, terminated);
  if (!terminated) {
    return header;
  }
  if (name.size() <= header.filename.capacity()) {
    header.filename.assign(name.begin(), name.end());
  }

  const etl::string_view size_field = next_field(payload, offset, terminated);
  header.well_formed = true;
  uint32_t size = 0;
  if (util::parse_decimal(size_field, size)) {
    header.file_size = size;
  }
  // Any further fields (YAPP date extension) are ignored.
  return header;
}

bool build_resume_payload(uint32_t offset, Payload& out) {
  PacketBuilder builder(out);
  builder.add(YAPP_RESUME_MARKER).add(uint8_t{0}).add_decimal_field(offset);
  return !builder.overflowed();
}

uint32_t parse_resume_offset(etl::span<const uint8_t> payload) {
  if (!is_resume_payload(payload)) {
    return 0;
  }
  size_t offset = 1;
  if (offset < payload.size() && payload[offset] == 0) {
    ++offset;
  }
  bool terminated = false;
  const etl::string_view field = next_field(payload, offset, terminated);
  uint32_t value = 0;
  return util::parse_decimal(field, value) ? value : 0;
}

bool is_resume_payload(etl::span<const uint8_t> payload) {
  return !payload.empty() && payload[0] == YAPP_RESUME_MARKER;
}

}  // namespace yapp
