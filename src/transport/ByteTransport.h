/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#ifndef YAPP_BYTE_TRANSPORT_H
#define YAPP_BYTE_TRANSPORT_H

#include <stddef.h>
#include <stdint.h>

namespace yapp {

// Outbound half of the byte stream (serial port, TNC socket...). Inbound
// bytes reach the engine through YappSession::feedBytes().
class ByteTransport {
 public:
  virtual ~ByteTransport() {}

  // Returns the number of bytes accepted. Short writes count as failures;
  // the engine does not retry.
  virtual size_t write(const uint8_t* data, size_t length) = 0;
  virtual void flush() {}
};

}  // namespace yapp

#endif  // YAPP_BYTE_TRANSPORT_H
