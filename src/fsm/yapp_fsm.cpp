/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#include "yapp_fsm.h"

namespace yapp {
namespace fsm {

const char* state_name(StateId id) {
  switch (id) {
    case STATE_IDLE:            return "Idle";
    case STATE_SENDER_INIT:     return "SenderInit";
    case STATE_SENDER_HEADER:   return "SenderHeader";
    case STATE_SENDER_DATA:     return "SenderData";
    case STATE_SENDER_EOF:      return "SenderEof";
    case STATE_SENDER_EOT:      return "SenderEot";
    case STATE_RECEIVER_WAIT:   return "ReceiverWait";
    case STATE_RECEIVER_HEADER: return "ReceiverHeader";
    case STATE_RECEIVER_DATA:   return "ReceiverData";
    case STATE_DONE:            return "Done";
    case STATE_FAILED:          return "Failed";
    case NUMBER_OF_STATES:      break;
  }
  return "Unknown";
}

}  // namespace fsm
}  // namespace yapp
