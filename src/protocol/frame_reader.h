/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#ifndef YAPP_FRAME_READER_H
#define YAPP_FRAME_READER_H

#include <stddef.h>
#include <stdint.h>

#include <etl/span.h>
#include <etl/vector.h>

#include "yapp_packet.h"

namespace yapp {

// Receiver of the packets reassembled by FrameReader.
class PacketSink {
 public:
  enum class Disposition : uint8_t {
    CONSUMED,  // Packet handled; drop its bytes.
    REJECTED,  // Not acceptable here; drop one byte and resynchronize.
    STOP       // Session is over; discard everything still buffered.
  };

  virtual ~PacketSink() {}
  virtual Disposition onPacket(const Packet& packet) = 0;
  virtual Disposition onUnrecognized(uint8_t byte) = 0;
};

/**
 * @brief Reassembles YAPP packets from an arbitrarily chunked byte stream.
 *
 * Bytes are only ever consumed from the front of the buffer: a whole packet
 * at a time, or a single byte on corruption recovery. Incomplete trailing
 * bytes wait for the next feed().
 */
class FrameReader {
 public:
  FrameReader();

  // Appends bytes and dispatches every complete packet. Returns the number
  // of packets handed to the sink.
  size_t feed(etl::span<const uint8_t> bytes, PacketSink& sink);

  void reset();

  size_t buffered() const { return _rx_buffer.size(); }
  uint32_t discardedBytes() const { return _discarded_bytes; }
  void clearStats() { _discarded_bytes = 0; }

#if defined(YAPP_HOST_TEST)
 public:
#else
 private:
#endif
  // Returns false once the sink asked to stop.
  bool drain(PacketSink& sink, size_t& dispatched);
  void consumeFront(size_t count);

  etl::vector<uint8_t, kRxBufferSize> _rx_buffer;
  uint32_t _discarded_bytes;
};

}  // namespace yapp

#endif  // YAPP_FRAME_READER_H
