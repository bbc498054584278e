/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#ifndef YAPP_SESSION_H
#define YAPP_SESSION_H

#include <stddef.h>
#include <stdint.h>

#include <etl/delegate.h>
#include <etl/mutex.h>
#include <etl/span.h>
#include <etl/string.h>
#include <etl/string_view.h>

#include "config/yapp_config.h"
#include "fsm/yapp_fsm.h"
#include "protocol/frame_reader.h"
#include "protocol/yapp_packet.h"
#include "protocol/yapp_protocol.h"
#include "storage/FileStore.h"
#include "transport/ByteTransport.h"

namespace yapp {

namespace test {
class TestAccessor;
}

enum class EventKind : uint8_t { INFO, SENT, RECEIVED, ERROR, SUCCESS };

const char* event_kind_name(EventKind kind);

using Message = etl::string<kMaxMessageLength>;

struct OperationResult {
  bool ok;
  Message message;
};

struct TransferConfig {
  uint32_t timeout_ms;
  uint8_t max_si_retries;
  uint16_t max_data_length;
  uint16_t data_burst_blocks;  // 0 = unlimited

  static TransferConfig defaults() {
    TransferConfig config;
    config.timeout_ms = YAPP_TIMEOUT_MS;
    config.max_si_retries = YAPP_MAX_SI_RETRIES;
    config.max_data_length = YAPP_MAX_DATA_LENGTH;
    config.data_burst_blocks = YAPP_DATA_BURST_BLOCKS;
    return config;
  }

  bool isValid() const {
    return timeout_ms >= kTimeoutMinMs && timeout_ms <= kTimeoutMaxMs &&
           max_si_retries <= kSiRetryLimitMax &&
           max_data_length >= kDataLengthMin && max_data_length <= kDataLengthMax;
  }
};

/**
 * @brief One YAPP transfer endpoint bound to a byte transport and a file store.
 *
 * Inbound bytes arrive through feedBytes(); elapsed time through tick().
 * Every public call takes the session lock for its whole duration, so the
 * two can come from different threads. Handlers run under that lock and
 * must not call back into the session.
 */
class YappSession : private PacketSink {
  friend class yapp::test::TestAccessor;

 public:
  using ProgressHandler = etl::delegate<void(uint32_t, uint32_t)>;
  using EventHandler = etl::delegate<void(EventKind, etl::string_view)>;
  using FinishedHandler = etl::delegate<void(bool, etl::string_view)>;
  using PassthroughHandler = etl::delegate<void(etl::span<const uint8_t>)>;

  YappSession(ByteTransport& transport, FileStore& store);
  YappSession(ByteTransport& transport, FileStore& store, const TransferConfig& config);
  ~YappSession();

  YappSession(const YappSession&) = delete;
  YappSession& operator=(const YappSession&) = delete;

  // Rejects out-of-range values and keeps the current configuration.
  bool applyConfig(const TransferConfig& config);
  TransferConfig config() const;

  OperationResult startSend(etl::string_view path);
  OperationResult startReceive(etl::string_view directory);

  void feedBytes(etl::span<const uint8_t> bytes);
  void feedBytes(const uint8_t* data, size_t length) {
    feedBytes(etl::span<const uint8_t>(data, length));
  }

  // Advances the peer deadline and, when sending is paced, emits the next
  // burst of Data packets.
  void tick(uint32_t elapsed_ms);

  // No-op unless a transfer is active.
  void cancel();
  // Back to Idle. Cancels first if a transfer is active.
  void reset();

  bool isActive() const;
  fsm::StateId state() const;
  etl::string<kMaxFilenameLength> filename() const;
  uint32_t fileSize() const;
  uint32_t bytesTransferred() const;

  void onProgress(ProgressHandler handler);
  void onEvent(EventHandler handler);
  void onFinished(FinishedHandler handler);
  void onPassthrough(PassthroughHandler handler);

  struct FrameDebugSnapshot {
    uint32_t packets_sent;
    uint32_t packets_received;
    uint32_t discarded_bytes;
    uint32_t send_failures;
    uint32_t timeouts;
    uint32_t si_retries;
  };

  FrameDebugSnapshot getDebugSnapshot() const;
  void resetDebugStats();

#if defined(YAPP_HOST_TEST)
 public:
#else
 private:
#endif
  ByteTransport& _transport;
  FileStore& _store;
  TransferConfig _config;

  mutable etl::mutex _mutex;

  FrameReader _reader;
  fsm::TransferFsm _fsm;

  scheduler::YappTimerService _timer_service;
  etl::delegate<void()> _cb_peer_deadline;
  bool _deadline_armed;
  bool _deadline_expired;

  // Session
  etl::string<kMaxPathLength> _location;  // Source file or target directory.
  etl::string<kMaxFilenameLength> _filename;
  uint32_t _file_size;
  uint32_t _bytes_transferred;
  FileHandle _file;
  uint8_t _si_retries;
  uint16_t _files_received;
  bool _finished;

  ProgressHandler _progress_handler;
  EventHandler _event_handler;
  FinishedHandler _finished_handler;
  PassthroughHandler _passthrough_handler;

  FrameDebugSnapshot _debug;

  // PacketSink
  Disposition onPacket(const Packet& packet) override;
  Disposition onUnrecognized(uint8_t byte) override;

  // Dispatch per role
  Disposition _handleSenderPacket(const Packet& packet);
  Disposition _handleReceiverPacket(const Packet& packet);
  Disposition _handleCancel(const Packet& packet);
  void _handleText(const Packet& packet);
  void _handleHeader(const Packet& packet);
  Disposition _handleData(const Packet& packet);

  // Sender actions
  bool _sendHeader();
  void _pumpData();

  // Receiver actions
  void _closeFile();

  // Deadline
  void _onPeerDeadline();
  void _processDeadline();
  void _armDeadline();
  void _disarmDeadline();
  void _settleDeadline();

  // Output
  bool _send(PacketKind kind, etl::span<const uint8_t> payload = etl::span<const uint8_t>());
  bool _sendText(PacketKind kind, etl::string_view text);
  void _emit(EventKind kind, etl::string_view message);
  void _emitPacket(EventKind kind, PacketKind packet, etl::string_view detail = etl::string_view());
  void _notifyProgress();

  // Terminal transitions
  void _complete(etl::string_view message);
  void _fail(etl::string_view message);
  void _abort(etl::string_view cancel_reason, etl::string_view message);
  void _failTransport();
  void _finish(bool success, etl::string_view message);
  void _resetLocked();
};

}  // namespace yapp

#endif  // YAPP_SESSION_H
