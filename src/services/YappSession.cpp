/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#include "YappSession.h"

#include <etl/algorithm.h>
#include <etl/array.h>

#include "util/scoped_lock.h"
#include "util/string_utils.h"
#include "util/yapp_trace.h"

namespace yapp {

namespace {

constexpr const char kMsgAlreadyActive[] = "Transfer already in progress";
constexpr const char kMsgTransportError[] = "Transport error: unable to send packet";
constexpr const char kMsgUserCancel[] = "Cancelled by user";
constexpr const char kMsgUserCancelled[] = "Transfer cancelled by user";

Message make_message(etl::string_view prefix, etl::string_view detail) {
  Message message;
  util::append(message, prefix);
  util::append(message, detail);
  return message;
}

etl::string_view view_of(const etl::istring& text) {
  return etl::string_view(text.data(), text.size());
}

}  // namespace

const char* event_kind_name(EventKind kind) {
  switch (kind) {
    case EventKind::INFO:     return "INFO";
    case EventKind::SENT:     return "SENT";
    case EventKind::RECEIVED: return "RECEIVED";
    case EventKind::ERROR:    return "ERROR";
    case EventKind::SUCCESS:  return "SUCCESS";
  }
  return "UNKNOWN";
}

YappSession::YappSession(ByteTransport& transport, FileStore& store)
    : YappSession(transport, store, TransferConfig::defaults()) {}

YappSession::YappSession(ByteTransport& transport, FileStore& store,
                         const TransferConfig& config)
    : _transport(transport),
      _store(store),
      _config(config.isValid() ? config : TransferConfig::defaults()),
      _mutex(),
      _reader(),
      _fsm(),
      _timer_service(),
      _cb_peer_deadline(),
      _deadline_armed(false),
      _deadline_expired(false),
      _location(),
      _filename(),
      _file_size(0),
      _bytes_transferred(0),
      _file(kInvalidFileHandle),
      _si_retries(0),
      _files_received(0),
      _finished(false),
      _progress_handler(),
      _event_handler(),
      _finished_handler(),
      _passthrough_handler(),
      _debug{}
{
  _fsm.begin();

  _timer_service.clear();
  // callback_timer keeps a pointer to the delegate, so it lives in the session.
  _cb_peer_deadline =
      etl::delegate<void()>::create<YappSession, &YappSession::_onPeerDeadline>(*this);
  _timer_service.register_timer(_cb_peer_deadline, _config.timeout_ms, false);
  _timer_service.enable(true);
}

YappSession::~YappSession() {
  _closeFile();
}

bool YappSession::applyConfig(const TransferConfig& config) {
  util::ScopedLock lock(_mutex);
  if (!config.isValid()) {
    return false;
  }
  _config = config;
  _timer_service.set_period(scheduler::TIMER_PEER_DEADLINE, _config.timeout_ms);
  // set_period stops the timer.
  if (_fsm.isWaitingForPeer()) {
    _armDeadline();
  }
  return true;
}

TransferConfig YappSession::config() const {
  util::ScopedLock lock(_mutex);
  return _config;
}

// ============================================================================
// Session start
// ============================================================================

OperationResult YappSession::startSend(etl::string_view path) {
  util::ScopedLock lock(_mutex);
  OperationResult result;
  result.ok = false;

  if (_fsm.isActive()) {
    result.message = kMsgAlreadyActive;
    return result;
  }
  if (_fsm.isTerminal()) {
    _resetLocked();
  }

  if (path.empty() || path.size() > _location.capacity()) {
    result.message = make_message("Invalid path: ", path);
    return result;
  }
  const etl::string_view name = util::path_basename(path);
  if (!util::is_usable_filename(name) || name.size() > _filename.capacity()) {
    result.message = make_message("Invalid filename: ", name);
    return result;
  }

  etl::expected<ReadableFile, StorageError> opened = _store.openRead(path);
  if (!opened.has_value()) {
    if (opened.error() == StorageError::NOT_FOUND) {
      result.message = make_message("File not found: ", path);
    } else {
      result.message = make_message("Error: ", storage_error_message(opened.error()));
    }
    return result;
  }

  _location.assign(path.begin(), path.end());
  _filename.assign(name.begin(), name.end());
  _file = opened.value().handle;
  _file_size = opened.value().size;
  _bytes_transferred = 0;
  _si_retries = 0;
  _files_received = 0;
  _finished = false;

  _fsm.startSend();

  Message started = make_message("Starting send: ", view_of(_filename));
  util::append(started, " (");
  util::append(started, _file_size);
  util::append(started, " bytes)");
  _emit(EventKind::INFO, view_of(started));

  if (!_send(PacketKind::SEND_INIT)) {
    _failTransport();
    result.message = kMsgTransportError;
    return result;
  }
  _armDeadline();

  result.ok = true;
  result.message = make_message("Sending ", view_of(_filename));
  return result;
}

OperationResult YappSession::startReceive(etl::string_view directory) {
  util::ScopedLock lock(_mutex);
  OperationResult result;
  result.ok = false;

  if (_fsm.isActive()) {
    result.message = kMsgAlreadyActive;
    return result;
  }
  if (_fsm.isTerminal()) {
    _resetLocked();
  }

  // Leaves room for "/" and the longest accepted filename.
  if (directory.empty() ||
      directory.size() + 1 + kMaxFilenameLength > _location.capacity()) {
    result.message = make_message("Cannot use directory: ", "invalid path");
    return result;
  }

  etl::expected<bool, StorageError> prepared = _store.prepareDirectory(directory);
  if (!prepared.has_value()) {
    result.message = make_message("Cannot use directory: ",
                                  storage_error_message(prepared.error()));
    return result;
  }

  _location.assign(directory.begin(), directory.end());
  _filename.clear();
  _file = kInvalidFileHandle;
  _file_size = 0;
  _bytes_transferred = 0;
  _si_retries = 0;
  _files_received = 0;
  _finished = false;

  _fsm.startReceive();
  _emit(EventKind::INFO, "Waiting for sender (SI)...");
  _armDeadline();

  result.ok = true;
  result.message = "Waiting for file transfer";
  return result;
}

// ============================================================================
// Inbound bytes and time
// ============================================================================

void YappSession::feedBytes(etl::span<const uint8_t> bytes) {
  util::ScopedLock lock(_mutex);
  if (bytes.empty()) {
    return;
  }
  if (_fsm.isIdle()) {
    if (_passthrough_handler.is_valid()) {
      _passthrough_handler(bytes);
    }
    return;
  }
  if (_fsm.isTerminal()) {
    return;
  }
  _reader.feed(bytes, *this);
}

void YappSession::tick(uint32_t elapsed_ms) {
  util::ScopedLock lock(_mutex);

  if (_fsm.state() == fsm::STATE_SENDER_DATA) {
    _pumpData();
    if (_fsm.state() != fsm::STATE_SENDER_DATA) {
      _settleDeadline();
    }
  }

  if (elapsed_ms > 0U && _fsm.isActive()) {
    _timer_service.tick(elapsed_ms);
  }
  if (_deadline_expired) {
    _deadline_expired = false;
    _processDeadline();
  }
}

void YappSession::cancel() {
  util::ScopedLock lock(_mutex);
  if (!_fsm.isActive()) {
    return;
  }
  _abort(kMsgUserCancel, kMsgUserCancelled);
}

void YappSession::reset() {
  util::ScopedLock lock(_mutex);
  _resetLocked();
}

// ============================================================================
// Accessors
// ============================================================================

bool YappSession::isActive() const {
  util::ScopedLock lock(_mutex);
  return _fsm.isActive();
}

fsm::StateId YappSession::state() const {
  util::ScopedLock lock(_mutex);
  return _fsm.state();
}

etl::string<kMaxFilenameLength> YappSession::filename() const {
  util::ScopedLock lock(_mutex);
  return _filename;
}

uint32_t YappSession::fileSize() const {
  util::ScopedLock lock(_mutex);
  return _file_size;
}

uint32_t YappSession::bytesTransferred() const {
  util::ScopedLock lock(_mutex);
  return _bytes_transferred;
}

void YappSession::onProgress(ProgressHandler handler) {
  util::ScopedLock lock(_mutex);
  _progress_handler = handler;
}

void YappSession::onEvent(EventHandler handler) {
  util::ScopedLock lock(_mutex);
  _event_handler = handler;
}

void YappSession::onFinished(FinishedHandler handler) {
  util::ScopedLock lock(_mutex);
  _finished_handler = handler;
}

void YappSession::onPassthrough(PassthroughHandler handler) {
  util::ScopedLock lock(_mutex);
  _passthrough_handler = handler;
}

YappSession::FrameDebugSnapshot YappSession::getDebugSnapshot() const {
  util::ScopedLock lock(_mutex);
  FrameDebugSnapshot snapshot = _debug;
  snapshot.discarded_bytes = _reader.discardedBytes();
  return snapshot;
}

void YappSession::resetDebugStats() {
  util::ScopedLock lock(_mutex);
  _debug = {};
  _reader.clearStats();
}

// ============================================================================
// Packet dispatch
// ============================================================================

PacketSink::Disposition YappSession::onPacket(const Packet& packet) {
  ++_debug.packets_received;
  trace::frame("RX", packet.kind, packet.payload.size());

  if (!_fsm.isActive()) {
    return Disposition::STOP;
  }

  Disposition disposition = Disposition::CONSUMED;
  if (packet.kind == PacketKind::CANCEL) {
    // Cancel wins in every state, ahead of role dispatch.
    disposition = _handleCancel(packet);
  } else if (packet.kind == PacketKind::TEXT) {
    _handleText(packet);
  } else if (_fsm.isSending()) {
    disposition = _handleSenderPacket(packet);
  } else {
    disposition = _handleReceiverPacket(packet);
  }

  if (_fsm.isTerminal()) {
    return Disposition::STOP;
  }
  if (disposition == Disposition::CONSUMED) {
    _settleDeadline();
  }
  return disposition;
}

PacketSink::Disposition YappSession::onUnrecognized(uint8_t byte) {
  trace::discarded(byte);

  if (_fsm.state() == fsm::STATE_SENDER_DATA) {
    _abort("Unexpected data during send", "Protocol error: unexpected data during send");
    return Disposition::STOP;
  }

  Message message("Discarded unrecognized byte ");
  util::append_hex_byte(message, byte);
  _emit(EventKind::INFO, view_of(message));
  return Disposition::REJECTED;
}

PacketSink::Disposition YappSession::_handleCancel(const Packet& packet) {
  const etl::string_view reason = packet.text();
  _emitPacket(EventKind::RECEIVED, PacketKind::CANCEL, reason);

  // The session ends either way; a lost CancelAck only shows in the stats.
  (void)_send(PacketKind::CANCEL_ACK);

  if (reason.empty()) {
    _fail("Cancelled by remote");
  } else {
    _fail(view_of(make_message("Cancelled by remote: ", reason)));
  }
  return Disposition::CONSUMED;
}

void YappSession::_handleText(const Packet& packet) {
  _emit(EventKind::RECEIVED, view_of(make_message("TX: ", packet.text())));
}

PacketSink::Disposition YappSession::_handleSenderPacket(const Packet& packet) {
  const fsm::StateId state = _fsm.state();

  // Mid-stream there is no way to resynchronize with the receiver.
  if (state == fsm::STATE_SENDER_DATA) {
    _abort("Unexpected data during send", "Protocol error: unexpected data during send");
    return Disposition::CONSUMED;
  }

  switch (packet.kind) {
    case PacketKind::RECEIVE_READY:
      _emitPacket(EventKind::RECEIVED, packet.kind);
      if (state == fsm::STATE_SENDER_INIT) {
        _fsm.receiverReady();
        (void)_sendHeader();
      }
      return Disposition::CONSUMED;

    case PacketKind::RECEIVE_FILE:
    case PacketKind::RECEIVE_TPK:
      if (packet.kind == PacketKind::RECEIVE_TPK) {
        _emitPacket(EventKind::RECEIVED, packet.kind, "- checksum mode not supported, using standard");
      } else {
        _emitPacket(EventKind::RECEIVED, packet.kind);
      }
      if (state == fsm::STATE_SENDER_INIT || state == fsm::STATE_SENDER_HEADER) {
        _fsm.fileAccepted();
        _emit(EventKind::INFO, "Sending data...");
        _pumpData();
      }
      return Disposition::CONSUMED;

    case PacketKind::ACK_EOF:
      _emitPacket(EventKind::RECEIVED, packet.kind);
      if (state == fsm::STATE_SENDER_EOF) {
        _fsm.eofAcked();
        if (!_send(PacketKind::END_OF_TRANSMISSION)) {
          _failTransport();
        }
      }
      return Disposition::CONSUMED;

    case PacketKind::ACK_EOT:
      _emitPacket(EventKind::RECEIVED, packet.kind);
      if (state == fsm::STATE_SENDER_EOT) {
        _complete(view_of(make_message("File sent successfully: ", view_of(_filename))));
      }
      return Disposition::CONSUMED;

    case PacketKind::CANCEL_ACK:
      // Unsolicited: a local cancel has already finalized the session.
      _emitPacket(EventKind::RECEIVED, packet.kind);
      _fail("Transfer cancelled");
      return Disposition::CONSUMED;

    case PacketKind::NOT_READY:
      _emitPacket(EventKind::RECEIVED, packet.kind, packet.text());
      _fail(view_of(make_message("Remote not ready: ", packet.text())));
      return Disposition::CONSUMED;

    case PacketKind::RESUME: {
      Message detail("offset=");
      util::append(detail, parse_resume_offset(packet.bytes()));
      util::append(detail, " - not supported, restarting");
      _emitPacket(EventKind::RECEIVED, packet.kind, view_of(detail));
      if (state != fsm::STATE_SENDER_HEADER) {
        return Disposition::CONSUMED;
      }
      if (!_store.rewind(_file)) {
        _abort("Read error: cannot rewind", "File read error: cannot rewind");
        return Disposition::CONSUMED;
      }
      _bytes_transferred = 0;
      _notifyProgress();
      (void)_sendHeader();
      return Disposition::CONSUMED;
    }

    default:
      return Disposition::REJECTED;
  }
}

PacketSink::Disposition YappSession::_handleReceiverPacket(const Packet& packet) {
  const fsm::StateId state = _fsm.state();

  switch (packet.kind) {
    case PacketKind::SEND_INIT:
      if (state == fsm::STATE_RECEIVER_DATA) {
        return Disposition::REJECTED;
      }
      _emitPacket(EventKind::RECEIVED, packet.kind);
      _fsm.sendInit();
      if (!_send(PacketKind::RECEIVE_READY)) {
        _failTransport();
      }
      return Disposition::CONSUMED;

    case PacketKind::HEADER:
      if (state == fsm::STATE_RECEIVER_DATA) {
        return Disposition::REJECTED;
      }
      _handleHeader(packet);
      return Disposition::CONSUMED;

    case PacketKind::DATA:
      if (state != fsm::STATE_RECEIVER_DATA) {
        return Disposition::REJECTED;
      }
      return _handleData(packet);

    case PacketKind::END_OF_FILE: {
      if (state != fsm::STATE_RECEIVER_DATA) {
        return Disposition::REJECTED;
      }
      _emitPacket(EventKind::RECEIVED, packet.kind);
      _closeFile();
      ++_files_received;
      if (!_send(PacketKind::ACK_EOF)) {
        _failTransport();
        return Disposition::CONSUMED;
      }
      _fsm.fileEnded();
      Message received = make_message("File received: ", view_of(_filename));
      util::append(received, " (");
      util::append(received, _bytes_transferred);
      util::append(received, " bytes)");
      _emit(EventKind::SUCCESS, view_of(received));
      return Disposition::CONSUMED;
    }

    case PacketKind::END_OF_TRANSMISSION: {
      _emitPacket(EventKind::RECEIVED, packet.kind);
      if (state == fsm::STATE_RECEIVER_DATA) {
        // Eot without Eof still ends the file that was open.
        _closeFile();
        ++_files_received;
      }
      if (!_send(PacketKind::ACK_EOT)) {
        _failTransport();
        return Disposition::CONSUMED;
      }
      if (_files_received == 0U) {
        _complete("Transfer complete (no files)");
        return Disposition::CONSUMED;
      }
      Message received = make_message("Received ", view_of(_filename));
      util::append(received, " (");
      util::append(received, _bytes_transferred);
      util::append(received, " bytes)");
      _complete(view_of(received));
      return Disposition::CONSUMED;
    }

    default:
      return Disposition::REJECTED;
  }
}

void YappSession::_handleHeader(const Packet& packet) {
  const HeaderInfo header = parse_header_payload(packet.bytes());
  const etl::string_view name = util::path_basename(view_of(header.filename));

  Message detail("file=");
  util::append(detail, view_of(header.filename));
  util::append(detail, " size=");
  util::append(detail, header.file_size);
  _emitPacket(EventKind::RECEIVED, packet.kind, view_of(detail));

  if (!header.well_formed || !util::is_usable_filename(name)) {
    if (!_sendText(PacketKind::NOT_READY, "Invalid filename")) {
      _failTransport();
      return;
    }
    _fail("Invalid filename in header");
    return;
  }

  etl::string<kMaxPathLength> target(_location);
  if (!target.empty() && target.back() != '/') {
    target.push_back('/');
  }
  util::append(target, name);

  etl::expected<FileHandle, StorageError> opened = _store.openWrite(view_of(target));
  if (!opened.has_value()) {
    const Message reason =
        make_message("Cannot create file: ", storage_error_message(opened.error()));
    if (!_sendText(PacketKind::NOT_READY, view_of(reason))) {
      _failTransport();
      return;
    }
    _fail(view_of(reason));
    return;
  }

  // Counters are per file.
  _file = opened.value();
  _filename.assign(name.begin(), name.end());
  _file_size = header.file_size;
  _bytes_transferred = 0;

  _fsm.headerReceived();
  if (!_send(PacketKind::RECEIVE_FILE)) {
    _failTransport();
    return;
  }
  _emit(EventKind::INFO, view_of(make_message("Receiving ", view_of(_filename))));
  _notifyProgress();
}

PacketSink::Disposition YappSession::_handleData(const Packet& packet) {
  const size_t length = packet.payload.size();

  if (_file_size > 0U && length > static_cast<size_t>(_file_size - _bytes_transferred)) {
    _abort("Data exceeds file size", "Protocol error: data exceeds declared file size");
    return Disposition::CONSUMED;
  }

  etl::expected<size_t, StorageError> written = _store.writeChunk(_file, packet.bytes());
  if (!written.has_value() || written.value() != length) {
    const char* reason = written.has_value() ? "short write"
                                             : storage_error_message(written.error());
    _abort(view_of(make_message("Write error: ", reason)),
           view_of(make_message("File write error: ", reason)));
    return Disposition::CONSUMED;
  }

  _bytes_transferred += static_cast<uint32_t>(length);
  _notifyProgress();
  return Disposition::CONSUMED;
}

// ============================================================================
// Sender actions
// ============================================================================

bool YappSession::_sendHeader() {
  Payload payload;
  if (!build_header_payload(view_of(_filename), _file_size, payload)) {
    _abort("Invalid filename", "Invalid filename");
    return false;
  }
  if (!_send(PacketKind::HEADER, etl::span<const uint8_t>(payload.data(), payload.size()))) {
    _failTransport();
    return false;
  }
  return true;
}

void YappSession::_pumpData() {
  etl::array<uint8_t, kMaxPayloadSize> chunk;
  uint16_t sent = 0;

  while (_fsm.state() == fsm::STATE_SENDER_DATA &&
         (_config.data_burst_blocks == 0U || sent < _config.data_burst_blocks)) {
    const uint32_t remaining = _file_size - _bytes_transferred;
    const size_t want = etl::min(static_cast<size_t>(_config.max_data_length),
                                 static_cast<size_t>(remaining));
    size_t got = 0;

    if (want > 0U) {
      etl::expected<size_t, StorageError> read =
          _store.readChunk(_file, etl::span<uint8_t>(chunk.data(), want));
      if (!read.has_value()) {
        const char* reason = storage_error_message(read.error());
        _abort(view_of(make_message("Read error: ", reason)),
               view_of(make_message("File read error: ", reason)));
        return;
      }
      got = read.value();
    }

    if (got == 0U) {
      _closeFile();
      if (!_send(PacketKind::END_OF_FILE)) {
        _failTransport();
        return;
      }
      _fsm.dataExhausted();
      return;
    }

    if (!_send(PacketKind::DATA, etl::span<const uint8_t>(chunk.data(), got))) {
      _failTransport();
      return;
    }
    _bytes_transferred += static_cast<uint32_t>(got);
    ++sent;
    _notifyProgress();
  }
}

void YappSession::_closeFile() {
  if (_file != kInvalidFileHandle) {
    _store.close(_file);
    _file = kInvalidFileHandle;
  }
}

// ============================================================================
// Peer deadline
// ============================================================================

void YappSession::_onPeerDeadline() {
  // Runs inside callback_timer::tick(); handled once tick() has returned.
  _deadline_armed = false;
  _deadline_expired = true;
}

void YappSession::_processDeadline() {
  if (!_fsm.isWaitingForPeer()) {
    return;
  }
  ++_debug.timeouts;

  if (_fsm.state() == fsm::STATE_SENDER_INIT && _si_retries < _config.max_si_retries) {
    ++_si_retries;
    ++_debug.si_retries;
    Message retry("Timeout, retrying SI (");
    util::append(retry, static_cast<uint32_t>(_si_retries));
    util::append(retry, "/");
    util::append(retry, static_cast<uint32_t>(_config.max_si_retries));
    util::append(retry, ")...");
    _emit(EventKind::INFO, view_of(retry));
    if (!_send(PacketKind::SEND_INIT)) {
      _failTransport();
      return;
    }
    _armDeadline();
    return;
  }

  _abort("Timeout", "Timeout: no response from remote station");
}

void YappSession::_armDeadline() {
  _deadline_expired = false;
  _deadline_armed = _timer_service.start(scheduler::TIMER_PEER_DEADLINE, false);
}

void YappSession::_disarmDeadline() {
  _deadline_expired = false;
  _deadline_armed = false;
  _timer_service.stop(scheduler::TIMER_PEER_DEADLINE);
}

void YappSession::_settleDeadline() {
  if (_fsm.isWaitingForPeer()) {
    _armDeadline();
  } else {
    _disarmDeadline();
  }
}

// ============================================================================
// Output
// ============================================================================

bool YappSession::_send(PacketKind kind, etl::span<const uint8_t> payload) {
  etl::array<uint8_t, kMaxFrameSize> frame;
  const size_t length = encode(kind, payload, etl::span<uint8_t>(frame.data(), frame.size()));
  if (length == 0U) {
    ++_debug.send_failures;
    return false;
  }
  if (_transport.write(frame.data(), length) != length) {
    ++_debug.send_failures;
    return false;
  }
  _transport.flush();
  ++_debug.packets_sent;
  trace::frame("TX", kind, payload.size());

  switch (kind) {
    case PacketKind::DATA:
      break;
    case PacketKind::HEADER: {
      Message detail("file=");
      util::append(detail, view_of(_filename));
      util::append(detail, " size=");
      util::append(detail, _file_size);
      _emitPacket(EventKind::SENT, kind, view_of(detail));
      break;
    }
    case PacketKind::NOT_READY:
    case PacketKind::CANCEL:
    case PacketKind::TEXT:
      _emitPacket(EventKind::SENT, kind,
                  etl::string_view(reinterpret_cast<const char*>(payload.data()), payload.size()));
      break;
    default:
      _emitPacket(EventKind::SENT, kind);
      break;
  }
  return true;
}

bool YappSession::_sendText(PacketKind kind, etl::string_view text) {
  const size_t length = etl::min(text.size(), kMaxFieldPayloadSize);
  return _send(kind, etl::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), length));
}

void YappSession::_emit(EventKind kind, etl::string_view message) {
  if (_event_handler.is_valid()) {
    _event_handler(kind, message);
  }
}

void YappSession::_emitPacket(EventKind kind, PacketKind packet, etl::string_view detail) {
  Message line(packet_name(packet));
  if (!detail.empty()) {
    line.push_back(' ');
    util::append(line, detail);
  }
  _emit(kind, view_of(line));
}

void YappSession::_notifyProgress() {
  if (_progress_handler.is_valid()) {
    _progress_handler(_bytes_transferred, _file_size);
  }
}

// ============================================================================
// Terminal transitions
// ============================================================================

void YappSession::_complete(etl::string_view message) {
  const fsm::StateId from = _fsm.state();
  _fsm.complete();
  trace::transition(fsm::state_name(from), fsm::state_name(_fsm.state()));
  _finish(true, message);
}

void YappSession::_fail(etl::string_view message) {
  const fsm::StateId from = _fsm.state();
  _fsm.fail();
  trace::transition(fsm::state_name(from), fsm::state_name(_fsm.state()));
  _finish(false, message);
}

void YappSession::_abort(etl::string_view cancel_reason, etl::string_view message) {
  // Best effort: the local outcome does not depend on the peer hearing it.
  (void)_sendText(PacketKind::CANCEL, cancel_reason);
  _fail(message);
}

void YappSession::_failTransport() {
  _fail(kMsgTransportError);
}

void YappSession::_finish(bool success, etl::string_view message) {
  _disarmDeadline();
  _closeFile();
  _reader.reset();
  if (_finished) {
    return;
  }
  _finished = true;
  _emit(success ? EventKind::SUCCESS : EventKind::ERROR, message);
  if (_finished_handler.is_valid()) {
    _finished_handler(success, message);
  }
}

void YappSession::_resetLocked() {
  if (_fsm.isActive()) {
    _abort(kMsgUserCancel, kMsgUserCancelled);
  }
  _disarmDeadline();
  _closeFile();
  _reader.reset();
  if (!_fsm.isIdle()) {
    _fsm.resetFsm();
  }
  _location.clear();
  _filename.clear();
  _file_size = 0;
  _bytes_transferred = 0;
  _si_retries = 0;
  _files_received = 0;
  _finished = false;
}

}  // namespace yapp
