#include <stdio.h>
#include <stdint.h>
#include <string.h>

#define YAPP_ENABLE_TEST_INTERFACE 1
#include "YappSession.h"
#include "YappTestInterface.h"
#include "mocks/MemoryFileStore.h"
#include "mocks/RecordingTransport.h"
#include "session_fixture.h"
#include "test_constants.h"
#include "test_support.h"

using namespace yapp;

static const uint8_t kRR[] = {YAPP_ACK, YAPP_ACK_RECEIVE_READY};
static const uint8_t kCA[] = {YAPP_ACK, YAPP_ACK_CANCEL};

static void append_packet(ByteBuffer<1024>& stream, PacketKind kind,
                          etl::span<const uint8_t> payload = etl::span<const uint8_t>()) {
  uint8_t frame[kMaxFrameSize];
  const size_t length = encode(kind, payload, etl::span<uint8_t>(frame, sizeof(frame)));
  TEST_ASSERT(length > 0);
  TEST_ASSERT(stream.append(frame, length));
}

// A complete one-file transmission as a sender would put it on the wire.
static void build_sender_stream(ByteBuffer<1024>& stream) {
  append_packet(stream, PacketKind::SEND_INIT);
  Payload header;
  TEST_ASSERT(build_header_payload("a.txt", 10, header));
  append_packet(stream, PacketKind::HEADER, etl::span<const uint8_t>(header.data(), header.size()));
  append_packet(stream, PacketKind::DATA,
                etl::span<const uint8_t>(reinterpret_cast<const uint8_t*>(TEST_FILE_CONTENT), 10));
  append_packet(stream, PacketKind::END_OF_FILE);
  append_packet(stream, PacketKind::END_OF_TRANSMISSION);
}

static void test_second_start_rejected() {
  MemoryFileStore store;
  TEST_ASSERT(store.addFile(TEST_SOURCE_PATH, TEST_FILE_CONTENT));
  TEST_ASSERT(store.addFile("/outbox/b.txt", "b"));
  RecordingTransport transport;
  YappSession session(transport, store);

  TEST_ASSERT(session.startSend(TEST_SOURCE_PATH).ok);
  const size_t written = transport.tx.len;

  OperationResult second = session.startSend("/outbox/b.txt");
  TEST_ASSERT(!second.ok);
  TEST_ASSERT_EQ_STR(etl::string_view(second.message.data(), second.message.size()),
                     "Transfer already in progress");
  OperationResult receive = session.startReceive(TEST_TARGET_DIR);
  TEST_ASSERT(!receive.ok);

  TEST_ASSERT(session.state() == fsm::STATE_SENDER_INIT);
  const etl::string<kMaxFilenameLength> name = session.filename();
  TEST_ASSERT_EQ_STR(etl::string_view(name.data(), name.size()), "a.txt");
  TEST_ASSERT_EQ_UINT(session.fileSize(), 10);
  TEST_ASSERT_EQ_UINT(transport.tx.len, written);
  TEST_ASSERT_EQ_UINT(store.openHandles(), 1);
  TEST_ASSERT(store.directories.empty());
  printf("  -> Second start rejected: OK\n");
}

static void test_cancel_is_idempotent() {
  MemoryFileStore store;
  TEST_ASSERT(store.addFile(TEST_SOURCE_PATH, TEST_FILE_CONTENT));
  RecordingTransport transport;
  YappSession session(transport, store);
  SessionObserver observer;
  observer.attach(session);

  session.cancel();
  TEST_ASSERT(session.state() == fsm::STATE_IDLE);
  TEST_ASSERT_EQ_UINT(transport.tx.len, 0);

  TEST_ASSERT(session.startSend(TEST_SOURCE_PATH).ok);
  session.feedBytes(kRR, sizeof(kRR));
  session.cancel();
  TEST_ASSERT(session.state() == fsm::STATE_FAILED);
  Packet last;
  TEST_ASSERT(transport.lastPacket(last));
  TEST_ASSERT(last.kind == PacketKind::CANCEL);
  TEST_ASSERT_EQ_STR(last.text(), "Cancelled by user");
  TEST_ASSERT_EQ_STR(observer.message(), "Transfer cancelled by user");
  TEST_ASSERT_EQ_UINT(store.openHandles(), 0);

  const size_t written = transport.tx.len;
  session.cancel();
  // The peer's CancelAck arrives after the session already ended.
  session.feedBytes(kCA, sizeof(kCA));
  TEST_ASSERT_EQ_UINT(transport.tx.len, written);
  TEST_ASSERT_EQ_UINT(observer.finished_calls, 1);
  TEST_ASSERT(session.state() == fsm::STATE_FAILED);
  printf("  -> Cancel is idempotent: OK\n");
}

static void test_reset() {
  MemoryFileStore store;
  TEST_ASSERT(store.addFile(TEST_SOURCE_PATH, TEST_FILE_CONTENT));
  RecordingTransport transport;
  YappSession session(transport, store);
  SessionObserver observer;
  observer.attach(session);
  auto accessor = test::TestAccessor::create(session);

  // Reset of an active transfer cancels it first.
  TEST_ASSERT(session.startSend(TEST_SOURCE_PATH).ok);
  session.reset();
  TEST_ASSERT(session.state() == fsm::STATE_IDLE);
  TEST_ASSERT(!session.isActive());
  TEST_ASSERT_EQ_UINT(observer.finished_calls, 1);
  TEST_ASSERT(!observer.last_success);
  TEST_ASSERT(transport.kindAt(transport.packetCount() - 1) == PacketKind::CANCEL);
  TEST_ASSERT(session.filename().empty());
  TEST_ASSERT_EQ_UINT(session.fileSize(), 0);
  TEST_ASSERT_EQ_UINT(session.bytesTransferred(), 0);
  TEST_ASSERT(!accessor.hasOpenFile());
  TEST_ASSERT(!accessor.isDeadlineArmed());
  TEST_ASSERT_EQ_UINT(store.openHandles(), 0);

  // Reset while idle does nothing visible.
  const size_t written = transport.tx.len;
  session.reset();
  TEST_ASSERT(session.state() == fsm::STATE_IDLE);
  TEST_ASSERT_EQ_UINT(transport.tx.len, written);
  TEST_ASSERT_EQ_UINT(observer.finished_calls, 1);
  printf("  -> Reset: OK\n");
}

static void test_start_after_terminal_state() {
  MemoryFileStore store;
  TEST_ASSERT(store.addFile(TEST_SOURCE_PATH, TEST_FILE_CONTENT));
  RecordingTransport transport;
  YappSession session(transport, store);
  SessionObserver observer;
  observer.attach(session);

  TEST_ASSERT(session.startSend(TEST_SOURCE_PATH).ok);
  session.cancel();
  TEST_ASSERT(session.state() == fsm::STATE_FAILED);

  TEST_ASSERT(session.startReceive(TEST_TARGET_DIR).ok);
  TEST_ASSERT(session.state() == fsm::STATE_RECEIVER_WAIT);
  TEST_ASSERT(session.filename().empty());
  session.cancel();
  TEST_ASSERT_EQ_UINT(observer.finished_calls, 2);
  printf("  -> Start after terminal state: OK\n");
}

static void test_passthrough_while_idle() {
  MemoryFileStore store;
  RecordingTransport transport;
  YappSession session(transport, store);
  SessionObserver observer;
  observer.attach(session);

  const uint8_t chat[] = {'h', 'i', '\r', YAPP_ENQ, YAPP_FIXED_LENGTH};
  session.feedBytes(chat, sizeof(chat));
  TEST_ASSERT_EQ_UINT(observer.passthrough.len, sizeof(chat));
  TEST_ASSERT(test_memeq(observer.passthrough.data, chat, sizeof(chat)));
  TEST_ASSERT(session.state() == fsm::STATE_IDLE);
  TEST_ASSERT_EQ_UINT(transport.tx.len, 0);

  // Once a transfer runs the same bytes belong to the protocol.
  TEST_ASSERT(session.startReceive(TEST_TARGET_DIR).ok);
  const uint8_t si[] = {YAPP_ENQ, YAPP_FIXED_LENGTH};
  session.feedBytes(si, sizeof(si));
  TEST_ASSERT_EQ_UINT(observer.passthrough.len, sizeof(chat));
  TEST_ASSERT(session.state() == fsm::STATE_RECEIVER_HEADER);

  // No handler: bytes are dropped.
  MemoryFileStore store2;
  RecordingTransport transport2;
  YappSession silent(transport2, store2);
  silent.feedBytes(chat, sizeof(chat));
  TEST_ASSERT(silent.state() == fsm::STATE_IDLE);
  printf("  -> Passthrough while idle: OK\n");
}

static void test_terminal_discards_input() {
  MemoryFileStore store;
  RecordingTransport transport;
  YappSession session(transport, store);
  SessionObserver observer;
  observer.attach(session);
  auto accessor = test::TestAccessor::create(session);

  ByteBuffer<1024> stream;
  build_sender_stream(stream);
  TEST_ASSERT(session.startReceive(TEST_TARGET_DIR).ok);
  session.feedBytes(stream.data, stream.len);
  TEST_ASSERT(session.state() == fsm::STATE_DONE);

  const size_t written = transport.tx.len;
  session.feedBytes(stream.data, stream.len);
  TEST_ASSERT_EQ_UINT(transport.tx.len, written);
  TEST_ASSERT_EQ_UINT(accessor.getBufferedBytes(), 0);
  TEST_ASSERT_EQ_UINT(observer.passthrough.len, 0);
  TEST_ASSERT_EQ_UINT(observer.finished_calls, 1);
  printf("  -> Terminal discards input: OK\n");
}

static void test_trailing_bytes_dropped_on_finish() {
  MemoryFileStore store;
  RecordingTransport transport;
  YappSession session(transport, store);
  auto accessor = test::TestAccessor::create(session);

  ByteBuffer<1024> stream;
  build_sender_stream(stream);
  // Half of a second SendInit rides along behind the EndOfTransmission.
  TEST_ASSERT(stream.push(YAPP_ENQ));
  TEST_ASSERT(session.startReceive(TEST_TARGET_DIR).ok);
  session.feedBytes(stream.data, stream.len);
  TEST_ASSERT(session.state() == fsm::STATE_DONE);
  TEST_ASSERT_EQ_UINT(accessor.getBufferedBytes(), 0);

  TEST_ASSERT(session.startReceive(TEST_TARGET_DIR).ok);
  const uint8_t partial[] = {YAPP_SOH, 0x09, 'a'};
  session.feedBytes(partial, sizeof(partial));
  TEST_ASSERT_EQ_UINT(accessor.getBufferedBytes(), sizeof(partial));
  session.cancel();
  TEST_ASSERT_EQ_UINT(accessor.getBufferedBytes(), 0);
  printf("  -> Trailing bytes dropped on finish: OK\n");
}

static void test_chunking_does_not_matter() {
  ByteBuffer<1024> stream;
  build_sender_stream(stream);

  MemoryFileStore whole_store;
  RecordingTransport whole_transport;
  YappSession whole(whole_transport, whole_store);
  TEST_ASSERT(whole.startReceive(TEST_TARGET_DIR).ok);
  whole.feedBytes(stream.data, stream.len);

  MemoryFileStore split_store;
  RecordingTransport split_transport;
  YappSession split(split_transport, split_store);
  SessionObserver observer;
  observer.attach(split);
  TEST_ASSERT(split.startReceive(TEST_TARGET_DIR).ok);
  for (size_t i = 0; i < stream.len; ++i) {
    split.feedBytes(stream.data + i, 1);
  }

  TEST_ASSERT(whole.state() == fsm::STATE_DONE);
  TEST_ASSERT(split.state() == fsm::STATE_DONE);
  TEST_ASSERT_EQ_UINT(split_transport.tx.len, whole_transport.tx.len);
  TEST_ASSERT(test_memeq(split_transport.tx.data, whole_transport.tx.data, whole_transport.tx.len));
  TEST_ASSERT(whole_store.contentEquals("/inbox/a.txt", TEST_FILE_CONTENT));
  TEST_ASSERT(split_store.contentEquals("/inbox/a.txt", TEST_FILE_CONTENT));
  TEST_ASSERT_EQ_STR(observer.message(), "Received a.txt (10 bytes)");
  printf("  -> Chunking does not matter: OK\n");
}

static void test_debug_snapshot() {
  MemoryFileStore store;
  RecordingTransport transport;
  YappSession session(transport, store);

  ByteBuffer<1024> stream;
  TEST_ASSERT(stream.push(TEST_GARBAGE_BYTE));
  build_sender_stream(stream);
  TEST_ASSERT(session.startReceive(TEST_TARGET_DIR).ok);
  session.feedBytes(stream.data, stream.len);

  YappSession::FrameDebugSnapshot snapshot = session.getDebugSnapshot();
  TEST_ASSERT_EQ_UINT(snapshot.packets_received, 5);
  TEST_ASSERT_EQ_UINT(snapshot.packets_sent, 4);
  TEST_ASSERT_EQ_UINT(snapshot.discarded_bytes, 1);
  TEST_ASSERT_EQ_UINT(snapshot.send_failures, 0);
  TEST_ASSERT_EQ_UINT(snapshot.timeouts, 0);

  session.resetDebugStats();
  snapshot = session.getDebugSnapshot();
  TEST_ASSERT_EQ_UINT(snapshot.packets_received, 0);
  TEST_ASSERT_EQ_UINT(snapshot.packets_sent, 0);
  TEST_ASSERT_EQ_UINT(snapshot.discarded_bytes, 0);
  printf("  -> Debug snapshot: OK\n");
}

static void test_text_and_event_names() {
  MemoryFileStore store;
  RecordingTransport transport;
  YappSession session(transport, store);
  SessionObserver observer;
  observer.attach(session);

  TEST_ASSERT(session.startReceive(TEST_TARGET_DIR).ok);
  feed_text_packet(session, PacketKind::TEXT, "73 de N0CALL");
  TEST_ASSERT(session.state() == fsm::STATE_RECEIVER_WAIT);
  TEST_ASSERT(observer.sawEvent(EventKind::RECEIVED, "TX: 73 de N0CALL"));

  TEST_ASSERT_EQ_STR(event_kind_name(EventKind::INFO), "INFO");
  TEST_ASSERT_EQ_STR(event_kind_name(EventKind::SENT), "SENT");
  TEST_ASSERT_EQ_STR(event_kind_name(EventKind::RECEIVED), "RECEIVED");
  TEST_ASSERT_EQ_STR(event_kind_name(EventKind::ERROR), "ERROR");
  TEST_ASSERT_EQ_STR(event_kind_name(EventKind::SUCCESS), "SUCCESS");
  printf("  -> Text and event names: OK\n");
}

int main() {
  printf("SESSION API TEST SUITE\n");
  test_second_start_rejected();
  test_cancel_is_idempotent();
  test_reset();
  test_start_after_terminal_state();
  test_passthrough_while_idle();
  test_terminal_discards_input();
  test_trailing_bytes_dropped_on_finish();
  test_chunking_does_not_matter();
  test_debug_snapshot();
  test_text_and_event_names();
  printf("ALL TESTS PASSED\n");
  return 0;
}
