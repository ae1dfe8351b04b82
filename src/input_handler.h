#ifndef INPUT_HANDLER_H
#define INPUT_HANDLER_H

#include "command_t.h"

#include <optional>
#include <string>

#ifdef _WIN32
#define NOMINMAX
#include <conio.h>
#include <windows.h>
#else
#include <sys/ioctl.h>
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>
#endif

// ============================================================================
// Input Handler
// ============================================================================

// Puts the terminal in raw mode for its lifetime and decodes key presses
class InputHandler {
#ifndef _WIN32
	termios old_term_ = {};
	bool restore_     = false;
#endif

	[[nodiscard]] bool kbhit() const;

	[[nodiscard]] int getch() const;

	void flush_input() const;

	[[nodiscard]] int read_timeout(const int timeout_ms) const;

	[[nodiscard]] std::optional<Key> decode_escape() const;

	[[nodiscard]] std::optional<Key> decode_utf8(const int lead) const;

public:
	InputHandler();

	~InputHandler();

	InputHandler(const InputHandler&)            = delete;
	InputHandler& operator=(const InputHandler&) = delete;

	[[nodiscard]] std::optional<Key> poll();
};

#endif
