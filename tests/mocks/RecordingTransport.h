#ifndef YAPP_MOCK_RECORDING_TRANSPORT_H
#define YAPP_MOCK_RECORDING_TRANSPORT_H

#include <stddef.h>
#include <stdint.h>

#include <etl/span.h>

#include "protocol/yapp_packet.h"
#include "transport/ByteTransport.h"
#include "test_support.h"

// Records every byte the session writes. Written frames can be decoded back
// for assertions, or drained into another session.
class RecordingTransport : public yapp::ByteTransport {
 public:
  enum class WriteMode { Normal, ShortAlways, FailAfter };

  ByteBuffer<16384> tx;
  WriteMode mode = WriteMode::Normal;
  size_t writes_before_failure = 0;
  int write_calls = 0;
  int flush_calls = 0;

  size_t write(const uint8_t* data, size_t length) override {
    write_calls++;
    if (mode == WriteMode::ShortAlways) {
      const size_t n = (length > 0) ? (length - 1) : 0;
      TEST_ASSERT(tx.append(data, n));
      return n;
    }
    if (mode == WriteMode::FailAfter) {
      if (writes_before_failure == 0) {
        return 0;
      }
      writes_before_failure--;
    }
    TEST_ASSERT(tx.append(data, length));
    return length;
  }

  void flush() override { flush_calls++; }

  void clear() { tx.clear(); }

  // Bytes written since the last drain().
  etl::span<const uint8_t> pending() const {
    return etl::span<const uint8_t>(tx.data + tx.pos, tx.remaining());
  }
  void drain() { tx.pos = tx.len; }

  // Decodes everything written so far. Returns the number of packets.
  size_t packetCount() const {
    size_t count = 0;
    size_t offset = 0;
    yapp::Packet packet;
    while (next(offset, packet)) {
      count++;
    }
    return count;
  }

  bool packetAt(size_t index, yapp::Packet& out) const {
    size_t offset = 0;
    for (size_t i = 0; next(offset, out); ++i) {
      if (i == index) {
        return true;
      }
    }
    return false;
  }

  yapp::PacketKind kindAt(size_t index) const {
    yapp::Packet packet;
    TEST_ASSERT(packetAt(index, packet));
    return packet.kind;
  }

  bool lastPacket(yapp::Packet& out) const {
    const size_t count = packetCount();
    return count > 0 && packetAt(count - 1, out);
  }

 private:
  bool next(size_t& offset, yapp::Packet& out) const {
    if (offset >= tx.len) {
      return false;
    }
    yapp::DecodeResult result =
        yapp::decode_one(etl::span<const uint8_t>(tx.data + offset, tx.len - offset));
    TEST_ASSERT(result.has_value());
    out = result.value().packet;
    offset += result.value().consumed;
    return true;
  }
};

#endif  // YAPP_MOCK_RECORDING_TRANSPORT_H
