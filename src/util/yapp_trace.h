/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#ifndef YAPP_TRACE_H
#define YAPP_TRACE_H

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#include "config/yapp_config.h"
#include "protocol/yapp_packet.h"

namespace yapp {

constexpr bool kYappDebugFrames = (YAPP_DEBUG_FRAMES != 0);

namespace trace {

// One stderr line per frame when YAPP_DEBUG_FRAMES is set:
//   [YAPP] TX DT (Data) len=250
inline void frame(const char* direction, PacketKind kind, size_t payload_length) {
  if (kYappDebugFrames) {
    fprintf(stderr, "[YAPP] %s %s len=%u\n", direction, packet_name(kind),
            static_cast<unsigned>(payload_length));
  }
}

inline void discarded(uint8_t byte) {
  if (kYappDebugFrames) {
    fprintf(stderr, "[YAPP] RX skip 0x%02X\n", static_cast<unsigned>(byte));
  }
}

inline void transition(const char* from, const char* to) {
  if (kYappDebugFrames) {
    fprintf(stderr, "[YAPP] state %s -> %s\n", from, to);
  }
}

}  // namespace trace
}  // namespace yapp

#endif  // YAPP_TRACE_H
