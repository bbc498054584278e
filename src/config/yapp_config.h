/*
 * This file is part of the YAPP Transfer Engine.
 * (C) 2025 Ignacio Santolin
 */
#pragma once

// Compile-time defaults for the transfer engine.
//
// Only YAPP_MAX_DATA_LENGTH influences what goes on the wire (block size of
// outgoing Data packets). Everything else is local tuning.

// Crash timer: how long to wait for the peer in any waiting state.
#ifndef YAPP_TIMEOUT_MS
#define YAPP_TIMEOUT_MS 30000UL
#endif

// Automatic retries of the initial SendInit. No other packet is retried.
#ifndef YAPP_MAX_SI_RETRIES
#define YAPP_MAX_SI_RETRIES 5U
#endif

// Data bytes per outgoing Data packet. 256 is legal (length byte 0) but
// several TNC implementations choke on it, so stay conservative.
#ifndef YAPP_MAX_DATA_LENGTH
#define YAPP_MAX_DATA_LENGTH 250U
#endif

// Data packets emitted per dispatch/tick while sending. 0 sends the whole
// file as soon as the receiver accepts it.
#ifndef YAPP_DATA_BURST_BLOCKS
#define YAPP_DATA_BURST_BLOCKS 0U
#endif

// Receive buffer owned by the frame reader. Must hold at least two
// maximum-size frames.
#ifndef YAPP_RX_BUFFER_SIZE
#define YAPP_RX_BUFFER_SIZE 1024U
#endif

#ifndef YAPP_MAX_FILENAME_LENGTH
#define YAPP_MAX_FILENAME_LENGTH 200U
#endif

#ifndef YAPP_MAX_PATH_LENGTH
#define YAPP_MAX_PATH_LENGTH 512U
#endif

// Capacity of lifecycle/event messages handed to callbacks.
#ifndef YAPP_MAX_MESSAGE_LENGTH
#define YAPP_MAX_MESSAGE_LENGTH 160U
#endif

// Frame tracing on stderr (host debugging only).
#ifndef YAPP_DEBUG_FRAMES
#define YAPP_DEBUG_FRAMES 0
#endif
