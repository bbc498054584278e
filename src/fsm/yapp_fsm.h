/**
 * @file yapp_fsm.h
 * @brief ETL-based transfer state machine for the YAPP engine.
 *
 * The machine only owns the legal transition table. Side effects (packets,
 * file I/O, callbacks) are performed by YappSession around each trigger, so
 * an event that is not legal in the current state never changes anything.
 *
 * States:
 *   - Idle (0): No transfer. Re-entered through EvReset.
 *   - SenderInit (1): SendInit sent, waiting for ReceiveReady.
 *   - SenderHeader (2): Header sent, waiting for ReceiveFile.
 *   - SenderData (3): Emitting Data packets.
 *   - SenderEof (4): Eof sent, waiting for AckEof.
 *   - SenderEot (5): Eot sent, waiting for AckEot.
 *   - ReceiverWait (6): Waiting for SendInit.
 *   - ReceiverHeader (7): ReceiveReady sent, waiting for Header or Eot.
 *   - ReceiverData (8): Writing Data packets to the open file.
 *   - Done (9) / Failed (10): Terminal.
 *
 * Events:
 *   - EvStartSend / EvStartReceive: caller starts a session.
 *   - EvReceiverReady: ReceiveReady while SenderInit.
 *   - EvFileAccepted: ReceiveFile or ReceiveTpk.
 *   - EvDataExhausted: last Data packet sent, Eof sent.
 *   - EvEofAcked: AckEof while SenderEof.
 *   - EvSendInit: SendInit seen by the receiver.
 *   - EvHeaderReceived: Header accepted and target file opened.
 *   - EvFileEnded: Eof seen by the receiver.
 *   - EvComplete: session succeeded.
 *   - EvFail: session failed (remote, local, timeout, I/O).
 *   - EvReset: back to Idle.
 */
#ifndef YAPP_FSM_H
#define YAPP_FSM_H

#include <stdint.h>

#include "etl/fsm.h"
#include "etl/message.h"
#include "etl/callback_timer.h"

namespace yapp {
namespace fsm {

class TransferFsm;

// ============================================================================
// State IDs - Must be sequential starting from 0
// ============================================================================
enum StateId : etl::fsm_state_id_t {
  STATE_IDLE = 0,
  STATE_SENDER_INIT = 1,
  STATE_SENDER_HEADER = 2,
  STATE_SENDER_DATA = 3,
  STATE_SENDER_EOF = 4,
  STATE_SENDER_EOT = 5,
  STATE_RECEIVER_WAIT = 6,
  STATE_RECEIVER_HEADER = 7,
  STATE_RECEIVER_DATA = 8,
  STATE_DONE = 9,
  STATE_FAILED = 10,
  NUMBER_OF_STATES = 11
};

// ============================================================================
// Event IDs
// ============================================================================
enum EventId : etl::message_id_t {
  EVENT_START_SEND = 0,
  EVENT_START_RECEIVE = 1,
  EVENT_RECEIVER_READY = 2,
  EVENT_FILE_ACCEPTED = 3,
  EVENT_DATA_EXHAUSTED = 4,
  EVENT_EOF_ACKED = 5,
  EVENT_SEND_INIT = 6,
  EVENT_HEADER_RECEIVED = 7,
  EVENT_FILE_ENDED = 8,
  EVENT_COMPLETE = 9,
  EVENT_FAIL = 10,
  EVENT_RESET = 11
};

// ============================================================================
// Event Messages
// ============================================================================
struct EvStartSend : public etl::message<EVENT_START_SEND> {};
struct EvStartReceive : public etl::message<EVENT_START_RECEIVE> {};
struct EvReceiverReady : public etl::message<EVENT_RECEIVER_READY> {};
struct EvFileAccepted : public etl::message<EVENT_FILE_ACCEPTED> {};
struct EvDataExhausted : public etl::message<EVENT_DATA_EXHAUSTED> {};
struct EvEofAcked : public etl::message<EVENT_EOF_ACKED> {};
struct EvSendInit : public etl::message<EVENT_SEND_INIT> {};
struct EvHeaderReceived : public etl::message<EVENT_HEADER_RECEIVED> {};
struct EvFileEnded : public etl::message<EVENT_FILE_ENDED> {};
struct EvComplete : public etl::message<EVENT_COMPLETE> {};
struct EvFail : public etl::message<EVENT_FAIL> {};
struct EvReset : public etl::message<EVENT_RESET> {};

// ============================================================================
// State: Idle (Initial State)
// ============================================================================
class StateIdle : public etl::fsm_state<TransferFsm, StateIdle, STATE_IDLE,
                                        EvStartSend, EvStartReceive, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event(const EvStartSend&) {
    return STATE_SENDER_INIT;
  }

  etl::fsm_state_id_t on_event(const EvStartReceive&) {
    return STATE_RECEIVER_WAIT;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return No_State_Change;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// Sender states
// Flattened hierarchy: EvFail and EvReset are handled explicitly everywhere.
// ============================================================================
class StateSenderInit : public etl::fsm_state<TransferFsm, StateSenderInit, STATE_SENDER_INIT,
                                              EvReceiverReady, EvFileAccepted, EvFail, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_SENDER_INIT;
  }

  etl::fsm_state_id_t on_event(const EvReceiverReady&) {
    return STATE_SENDER_HEADER;
  }

  // Some receivers answer SendInit with ReceiveFile directly.
  etl::fsm_state_id_t on_event(const EvFileAccepted&) {
    return STATE_SENDER_DATA;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class StateSenderHeader : public etl::fsm_state<TransferFsm, StateSenderHeader, STATE_SENDER_HEADER,
                                                EvFileAccepted, EvFail, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_SENDER_HEADER;
  }

  etl::fsm_state_id_t on_event(const EvFileAccepted&) {
    return STATE_SENDER_DATA;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class StateSenderData : public etl::fsm_state<TransferFsm, StateSenderData, STATE_SENDER_DATA,
                                              EvDataExhausted, EvFail, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_SENDER_DATA;
  }

  etl::fsm_state_id_t on_event(const EvDataExhausted&) {
    return STATE_SENDER_EOF;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class StateSenderEof : public etl::fsm_state<TransferFsm, StateSenderEof, STATE_SENDER_EOF,
                                             EvEofAcked, EvFail, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_SENDER_EOF;
  }

  etl::fsm_state_id_t on_event(const EvEofAcked&) {
    return STATE_SENDER_EOT;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class StateSenderEot : public etl::fsm_state<TransferFsm, StateSenderEot, STATE_SENDER_EOT,
                                             EvComplete, EvFail, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_SENDER_EOT;
  }

  etl::fsm_state_id_t on_event(const EvComplete&) {
    return STATE_DONE;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// Receiver states
// ============================================================================
class StateReceiverWait : public etl::fsm_state<TransferFsm, StateReceiverWait, STATE_RECEIVER_WAIT,
                                                EvSendInit, EvHeaderReceived, EvComplete, EvFail, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_RECEIVER_WAIT;
  }

  etl::fsm_state_id_t on_event(const EvSendInit&) {
    return STATE_RECEIVER_HEADER;
  }

  // Sender skipped SendInit.
  etl::fsm_state_id_t on_event(const EvHeaderReceived&) {
    return STATE_RECEIVER_DATA;
  }

  etl::fsm_state_id_t on_event(const EvComplete&) {
    return STATE_DONE;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class StateReceiverHeader : public etl::fsm_state<TransferFsm, StateReceiverHeader, STATE_RECEIVER_HEADER,
                                                  EvSendInit, EvHeaderReceived, EvComplete, EvFail, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_RECEIVER_HEADER;
  }

  // Duplicate SendInit: our ReceiveReady was lost.
  etl::fsm_state_id_t on_event(const EvSendInit&) {
    return No_State_Change;
  }

  etl::fsm_state_id_t on_event(const EvHeaderReceived&) {
    return STATE_RECEIVER_DATA;
  }

  etl::fsm_state_id_t on_event(const EvComplete&) {
    return STATE_DONE;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class StateReceiverData : public etl::fsm_state<TransferFsm, StateReceiverData, STATE_RECEIVER_DATA,
                                                EvFileEnded, EvComplete, EvFail, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_RECEIVER_DATA;
  }

  etl::fsm_state_id_t on_event(const EvFileEnded&) {
    return STATE_RECEIVER_HEADER;
  }

  etl::fsm_state_id_t on_event(const EvComplete&) {
    return STATE_DONE;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// Terminal states
// ============================================================================
class StateDone : public etl::fsm_state<TransferFsm, StateDone, STATE_DONE, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_DONE;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class StateFailed : public etl::fsm_state<TransferFsm, StateFailed, STATE_FAILED, EvReset>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// FSM Class
// ============================================================================
class TransferFsm : public etl::fsm
{
public:
  TransferFsm()
    : etl::fsm(NUMBER_OF_STATES)
    , state_list_{}
  {
  }

  // State objects hold a back pointer to their fsm, so they are members
  // rather than statics: several sessions may coexist in one process.
  void begin() {
    state_list_[STATE_IDLE] = &state_idle_;
    state_list_[STATE_SENDER_INIT] = &state_sender_init_;
    state_list_[STATE_SENDER_HEADER] = &state_sender_header_;
    state_list_[STATE_SENDER_DATA] = &state_sender_data_;
    state_list_[STATE_SENDER_EOF] = &state_sender_eof_;
    state_list_[STATE_SENDER_EOT] = &state_sender_eot_;
    state_list_[STATE_RECEIVER_WAIT] = &state_receiver_wait_;
    state_list_[STATE_RECEIVER_HEADER] = &state_receiver_header_;
    state_list_[STATE_RECEIVER_DATA] = &state_receiver_data_;
    state_list_[STATE_DONE] = &state_done_;
    state_list_[STATE_FAILED] = &state_failed_;

    set_states(state_list_, NUMBER_OF_STATES);
    start();
  }

  StateId state() const { return static_cast<StateId>(get_state_id()); }

  bool isIdle() const { return state() == STATE_IDLE; }
  bool isTerminal() const { return state() == STATE_DONE || state() == STATE_FAILED; }
  bool isActive() const { return !isIdle() && !isTerminal(); }
  bool isSending() const {
    return state() >= STATE_SENDER_INIT && state() <= STATE_SENDER_EOT;
  }
  bool isReceiving() const {
    return state() >= STATE_RECEIVER_WAIT && state() <= STATE_RECEIVER_DATA;
  }
  // States in which the peer owes us a packet and the deadline runs.
  bool isWaitingForPeer() const { return isActive() && state() != STATE_SENDER_DATA; }

  // Event Triggers
  void startSend() { receive(EvStartSend()); }
  void startReceive() { receive(EvStartReceive()); }
  void receiverReady() { receive(EvReceiverReady()); }
  void fileAccepted() { receive(EvFileAccepted()); }
  void dataExhausted() { receive(EvDataExhausted()); }
  void eofAcked() { receive(EvEofAcked()); }
  void sendInit() { receive(EvSendInit()); }
  void headerReceived() { receive(EvHeaderReceived()); }
  void fileEnded() { receive(EvFileEnded()); }
  void complete() { receive(EvComplete()); }
  void fail() { receive(EvFail()); }
  void resetFsm() { receive(EvReset()); }

private:
  etl::ifsm_state* state_list_[NUMBER_OF_STATES];

  StateIdle state_idle_;
  StateSenderInit state_sender_init_;
  StateSenderHeader state_sender_header_;
  StateSenderData state_sender_data_;
  StateSenderEof state_sender_eof_;
  StateSenderEot state_sender_eot_;
  StateReceiverWait state_receiver_wait_;
  StateReceiverHeader state_receiver_header_;
  StateReceiverData state_receiver_data_;
  StateDone state_done_;
  StateFailed state_failed_;
};

const char* state_name(StateId id);

}  // namespace fsm

// ============================================================================
// Timer IDs - ETL Callback Timer Service
// ============================================================================
namespace scheduler {

enum TimerId : uint8_t {
  TIMER_PEER_DEADLINE = 0,
  NUMBER_OF_TIMERS = 1
};

using YappTimerService = etl::callback_timer<NUMBER_OF_TIMERS>;

}  // namespace scheduler
}  // namespace yapp

#endif  // YAPP_FSM_H
