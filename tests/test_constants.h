#ifndef TEST_CONSTANTS_H
#define TEST_CONSTANTS_H

#include <stdint.h>

constexpr uint32_t TEST_TIMEOUT_MS = 1000;
constexpr uint8_t TEST_PAYLOAD_BYTE = 0xAA;
constexpr uint8_t TEST_GARBAGE_BYTE = 0x7E;
constexpr const char TEST_SOURCE_PATH[] = "/outbox/a.txt";
constexpr const char TEST_TARGET_DIR[] = "/inbox";
constexpr const char TEST_FILE_CONTENT[] = "0123456789";

#endif // TEST_CONSTANTS_H
