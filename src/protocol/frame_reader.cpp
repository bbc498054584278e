/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#include "frame_reader.h"

#include <etl/algorithm.h>

namespace yapp {

FrameReader::FrameReader() : _rx_buffer(), _discarded_bytes(0) {}

void FrameReader::reset() {
  _rx_buffer.clear();
}

size_t FrameReader::feed(etl::span<const uint8_t> bytes, PacketSink& sink) {
  size_t dispatched = 0;
  size_t offset = 0;

  while (offset < bytes.size()) {
    // drain() always leaves less than one maximum frame behind, so there is
    // room for at least kMaxFrameSize new bytes on every pass.
    const size_t room = _rx_buffer.capacity() - _rx_buffer.size();
    const size_t take = etl::min(room, bytes.size() - offset);
    _rx_buffer.insert(_rx_buffer.end(), bytes.begin() + offset, bytes.begin() + offset + take);
    offset += take;

    if (!drain(sink, dispatched)) {
      return dispatched;
    }
  }
  return dispatched;
}

bool FrameReader::drain(PacketSink& sink, size_t& dispatched) {
  while (!_rx_buffer.empty()) {
    DecodeResult result =
        decode_one(etl::span<const uint8_t>(_rx_buffer.data(), _rx_buffer.size()));

    if (result.has_value()) {
      const DecodedPacket& decoded = result.value();
      ++dispatched;
      switch (sink.onPacket(decoded.packet)) {
        case PacketSink::Disposition::CONSUMED:
          consumeFront(decoded.consumed);
          break;
        case PacketSink::Disposition::REJECTED:
          consumeFront(1);
          ++_discarded_bytes;
          break;
        case PacketSink::Disposition::STOP:
          _rx_buffer.clear();
          return false;
      }
      continue;
    }

    if (result.error() == DecodeError::NEED_MORE_DATA) {
      return true;
    }

    // Unrecognized leading byte: skip exactly one and retry.
    const uint8_t garbage = _rx_buffer.front();
    consumeFront(1);
    ++_discarded_bytes;
    if (sink.onUnrecognized(garbage) == PacketSink::Disposition::STOP) {
      _rx_buffer.clear();
      return false;
    }
  }
  return true;
}

void FrameReader::consumeFront(size_t count) {
  if (count >= _rx_buffer.size()) {
    _rx_buffer.clear();
    return;
  }
  _rx_buffer.erase(_rx_buffer.begin(), _rx_buffer.begin() + count);
}

}  // namespace yapp
