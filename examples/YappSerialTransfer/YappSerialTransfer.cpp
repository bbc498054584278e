/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 *
 * Sends or receives one YAPP transmission over a serial device.
 *
 *   YappSerialTransfer /dev/ttyUSB0 send ./outbox/report.txt
 *   YappSerialTransfer /dev/ttyUSB0 receive ./inbox
 */
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <stdio.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

#include "YappSession.h"
#include "storage/PosixFileStore.h"

using namespace yapp;

namespace {

class SerialTransport : public ByteTransport {
 public:
  explicit SerialTransport(int fd) : _fd(fd) {}

  size_t write(const uint8_t* data, size_t length) override {
    size_t written = 0;
    while (written < length) {
      const ssize_t n = ::write(_fd, data + written, length - written);
      if (n < 0) {
        if (errno == EINTR) continue;
        return written;
      }
      written += static_cast<size_t>(n);
    }
    return written;
  }

  void flush() override { tcdrain(_fd); }

 private:
  int _fd;
};

class ConsoleReporter {
 public:
  ConsoleReporter() : _done(false), _success(false) {}

  void attach(YappSession& session) {
    session.onEvent(YappSession::EventHandler::create<ConsoleReporter, &ConsoleReporter::event>(*this));
    session.onProgress(YappSession::ProgressHandler::create<ConsoleReporter, &ConsoleReporter::progress>(*this));
    session.onFinished(YappSession::FinishedHandler::create<ConsoleReporter, &ConsoleReporter::finished>(*this));
    session.onPassthrough(YappSession::PassthroughHandler::create<ConsoleReporter, &ConsoleReporter::passthrough>(*this));
  }

  void event(EventKind kind, etl::string_view message) {
    printf("[%s] %.*s\n", event_kind_name(kind), static_cast<int>(message.size()), message.data());
  }

  void progress(uint32_t transferred, uint32_t total) {
    if (total > 0U) {
      printf("\r%lu / %lu bytes", static_cast<unsigned long>(transferred),
             static_cast<unsigned long>(total));
    } else {
      printf("\r%lu bytes", static_cast<unsigned long>(transferred));
    }
    fflush(stdout);
  }

  void finished(bool success, etl::string_view message) {
    printf("\n%s: %.*s\n", success ? "OK" : "FAILED", static_cast<int>(message.size()),
           message.data());
    _done = true;
    _success = success;
  }

  void passthrough(etl::span<const uint8_t> bytes) {
    fwrite(bytes.data(), 1, bytes.size(), stdout);
  }

  bool done() const { return _done; }
  bool success() const { return _success; }

 private:
  bool _done;
  bool _success;
};

uint64_t monotonic_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1000U + static_cast<uint64_t>(ts.tv_nsec) / 1000000U;
}

speed_t baud_constant(long baud) {
  switch (baud) {
    case 1200:   return B1200;
    case 2400:   return B2400;
    case 4800:   return B4800;
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 115200: return B115200;
    default:     return B0;
  }
}

int open_serial(const char* device, speed_t speed) {
  const int fd = open(device, O_RDWR | O_NOCTTY);
  if (fd < 0) {
    fprintf(stderr, "Cannot open %s: %s\n", device, strerror(errno));
    return -1;
  }
  struct termios tio;
  if (tcgetattr(fd, &tio) != 0) {
    fprintf(stderr, "tcgetattr: %s\n", strerror(errno));
    close(fd);
    return -1;
  }
  cfmakeraw(&tio);
  tio.c_cflag |= CLOCAL | CREAD;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);
  if (tcsetattr(fd, TCSANOW, &tio) != 0) {
    fprintf(stderr, "tcsetattr: %s\n", strerror(errno));
    close(fd);
    return -1;
  }
  return fd;
}

void usage(const char* argv0) {
  fprintf(stderr, "usage: %s <device> send <file> [baud]\n", argv0);
  fprintf(stderr, "       %s <device> receive <directory> [baud]\n", argv0);
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 4) {
    usage(argv[0]);
    return 2;
  }
  const bool sending = strcmp(argv[2], "send") == 0;
  if (!sending && strcmp(argv[2], "receive") != 0) {
    usage(argv[0]);
    return 2;
  }
  const long baud = (argc > 4) ? strtol(argv[4], nullptr, 10) : 9600;
  const speed_t speed = baud_constant(baud);
  if (speed == B0) {
    fprintf(stderr, "Unsupported baud rate: %ld\n", baud);
    return 2;
  }

  const int fd = open_serial(argv[1], speed);
  if (fd < 0) {
    return 1;
  }

  SerialTransport transport(fd);
  PosixFileStore store;
  YappSession session(transport, store);
  ConsoleReporter reporter;
  reporter.attach(session);

  const OperationResult started = sending ? session.startSend(argv[3]) : session.startReceive(argv[3]);
  printf("%.*s\n", static_cast<int>(started.message.size()), started.message.data());
  if (!started.ok) {
    close(fd);
    return 1;
  }

  uint8_t buffer[512];
  uint64_t last = monotonic_ms();
  while (!reporter.done()) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int ready = poll(&pfd, 1, 50);
    if (ready < 0 && errno != EINTR) {
      fprintf(stderr, "poll: %s\n", strerror(errno));
      session.cancel();
      break;
    }
    if (ready > 0 && (pfd.revents & POLLIN)) {
      const ssize_t n = read(fd, buffer, sizeof(buffer));
      if (n > 0) {
        session.feedBytes(buffer, static_cast<size_t>(n));
      } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
        fprintf(stderr, "read: %s\n", strerror(errno));
        session.cancel();
        break;
      }
    }
    const uint64_t now = monotonic_ms();
    session.tick(static_cast<uint32_t>(now - last));
    last = now;
  }

  close(fd);
  return reporter.success() ? 0 : 1;
}
