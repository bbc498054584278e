/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#ifndef YAPP_PROTOCOL_H
#define YAPP_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>

#include "config/yapp_config.h"

// YAPP (WA7MBL Rev 1.1) wire constants.
//
//   SI  Send_Init   ENQ 01
//   RR  Rcv_Rdy     ACK 01
//   RF  Rcv_File    ACK 02
//   AF  Ack_EOF     ACK 03
//   AT  Ack_EOT     ACK 04
//   CA  Can_Ack     ACK 05
//   RT  Rcv_TPK     ACK ACK
//   HD  Send_Hdr    SOH len (Filename) NUL (FileSize ASCII) NUL
//   DT  Send_Data   STX len (Data)   {len=0 means 256 bytes}
//   EF  Send_EOF    ETX 01
//   ET  Send_EOT    EOT 01
//   NR  Not_Rdy     NAK len (Reason ASCII)
//   RE  Resume      NAK len R NUL (ReceivedSize ASCII) NUL
//   CN  Cancel      CAN len (Reason ASCII)
//   TX  Text        DLE len (ASCII text for display)

namespace yapp {

constexpr uint8_t YAPP_SOH = 0x01;
constexpr uint8_t YAPP_STX = 0x02;
constexpr uint8_t YAPP_ETX = 0x03;
constexpr uint8_t YAPP_EOT = 0x04;
constexpr uint8_t YAPP_ENQ = 0x05;
constexpr uint8_t YAPP_ACK = 0x06;
constexpr uint8_t YAPP_DLE = 0x10;
constexpr uint8_t YAPP_NAK = 0x15;
constexpr uint8_t YAPP_CAN = 0x18;

// Second header byte of the fixed-form packets.
constexpr uint8_t YAPP_FIXED_LENGTH = 0x01;

// ACK subtypes.
constexpr uint8_t YAPP_ACK_RECEIVE_READY = 0x01;
constexpr uint8_t YAPP_ACK_RECEIVE_FILE = 0x02;
constexpr uint8_t YAPP_ACK_EOF = 0x03;
constexpr uint8_t YAPP_ACK_EOT = 0x04;
constexpr uint8_t YAPP_ACK_CANCEL = 0x05;
constexpr uint8_t YAPP_ACK_RECEIVE_TPK = YAPP_ACK;

// Leading payload byte of a NAK that carries a resume request.
constexpr uint8_t YAPP_RESUME_MARKER = 'R';

constexpr size_t kHeaderSize = 2;
constexpr size_t kMaxPayloadSize = 256;
constexpr size_t kMaxFieldPayloadSize = 255;
constexpr size_t kMaxFrameSize = kHeaderSize + kMaxPayloadSize;

// Runtime configuration bounds.
constexpr uint32_t kTimeoutMinMs = 100;
constexpr uint32_t kTimeoutMaxMs = 600000;
constexpr uint8_t kSiRetryLimitMax = 16;
constexpr size_t kDataLengthMin = 1;
constexpr size_t kDataLengthMax = kMaxPayloadSize;

constexpr size_t kMaxFilenameLength = YAPP_MAX_FILENAME_LENGTH;
constexpr size_t kMaxPathLength = YAPP_MAX_PATH_LENGTH;
constexpr size_t kMaxMessageLength = YAPP_MAX_MESSAGE_LENGTH;
constexpr size_t kRxBufferSize = YAPP_RX_BUFFER_SIZE;

}  // namespace yapp

static_assert(yapp::kMaxFrameSize == 258, "YAPP frame is 2 header bytes + up to 256 data bytes");
static_assert(YAPP_MAX_DATA_LENGTH >= yapp::kDataLengthMin &&
                  YAPP_MAX_DATA_LENGTH <= yapp::kDataLengthMax,
              "YAPP_MAX_DATA_LENGTH out of range");
static_assert(YAPP_RX_BUFFER_SIZE >= 2 * yapp::kMaxFrameSize,
              "YAPP_RX_BUFFER_SIZE must hold two maximum-size frames");
static_assert(YAPP_MAX_FILENAME_LENGTH + 12 <= yapp::kMaxFieldPayloadSize,
              "Header payload (name NUL size NUL) must fit in 255 bytes");

#endif  // YAPP_PROTOCOL_H
