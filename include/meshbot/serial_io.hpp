#pragma once
/**
 * @page mb-serial-io-hdr MeshBot Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw mode and push bytes through it without surprises.
 *
 * @details
 * PURPOSE
 * -------
 * The bridge that talks to the radio is often a microcontroller or a USB
 * serial adapter. This header declares the minimal POSIX surface to reach it:
 * open in raw 8N1, write a whole buffer, close. Framing (SLIP) and decoding
 * (JSON) live elsewhere; this layer only moves bytes.
 *
 * ROLE IN MESHBOT
 * ---------------
 * - meshbot::open_serial: acquire a descriptor, set raw mode and baud, let a
 *   USB CDC device finish its reset, flush the boot chatter.
 * - meshbot::write_all: write every byte, waiting with poll() when the
 *   kernel buffer is full. Bounded by a timeout.
 * - meshbot::close_serial: close the descriptor if valid.
 *
 * DESIGN CHOICES
 * --------------
 * - Free functions, no class hierarchy, no hidden threads.
 * - POSIX termios + poll only.
 * - Descriptors are non-blocking; every wait goes through poll().
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Prefer /dev/serial/by-id/... paths; /dev/ttyUSB0 moves between boots.
 * - The service user needs the dialout group (or equivalent).
 * - Unsupported baud values are rejected, not silently mapped.
 */

#include <cstddef>
#include <string>

namespace meshbot {

/**
 * @brief Open and configure a serial port.
 *
 * @param dev            Device path, e.g. "/dev/ttyUSB0".
 * @param baud           One of 9600, 19200, 38400, 57600, 115200, 230400, 460800, 921600.
 * @param boot_delay_ms  Sleep after open for USB CDC auto-reset; 0 to skip.
 * @param err            Receives "unsupported_baud", "open_failed:<errno text>" or "termios_failed".
 * @return Non-negative descriptor, or -1 with @p err set.
 */
int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string& err);

/**
 * @brief Write all of @p data to @p fd.
 * @return false on error or when a single wait for writability exceeds @p timeout_ms.
 */
bool write_all(int fd, const std::string& data, int timeout_ms);

/// @brief Close @p fd if it is valid (>= 0).
void close_serial(int fd);

} // namespace meshbot
