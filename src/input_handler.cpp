#include "input_handler.h"
#include "timing_t.h"

#include <thread>

// ============================================================================
// Input Handler
// ============================================================================

namespace {

[[nodiscard]] int escape_timeout()
{
	return static_cast<int>(Timing::InputTimeout.count());
}

} // namespace

[[nodiscard]] bool InputHandler::kbhit() const
{
#ifdef _WIN32
	return _kbhit() != 0;
#else
	fd_set fds = {};
	timeval tv{0, 0};
	FD_ZERO(&fds);
	FD_SET(STDIN_FILENO, &fds);
	return select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv) > 0;
#endif
}

[[nodiscard]] int InputHandler::getch() const
{
#ifdef _WIN32
	return _getch();
#else
	unsigned char c = {};
	return (read(STDIN_FILENO, &c, 1) > 0) ? c : -1;
#endif
}

void InputHandler::flush_input() const
{
#ifdef _WIN32
	while (_kbhit()) {
		_getch();
	}
#else
	tcflush(STDIN_FILENO, TCIFLUSH);
#endif
}

[[nodiscard]] int InputHandler::read_timeout(const int timeout_ms) const
{
#ifdef _WIN32
	using namespace std::chrono_literals;
	const auto start   = std::chrono::steady_clock::now();
	const auto timeout = std::chrono::milliseconds(timeout_ms);
	while (std::chrono::steady_clock::now() - start < timeout) {
		if (_kbhit()) {
			return _getch();
		}
		std::this_thread::sleep_for(1ms);
	}
	return -1;
#else
	fd_set fds = {};
	FD_ZERO(&fds);
	FD_SET(STDIN_FILENO, &fds);

	timeval tv{0, timeout_ms * 1000};

	if (select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv) > 0) {
		unsigned char c = {};
		if (read(STDIN_FILENO, &c, 1) == 1) {
			return c;
		}
	}
	return -1;
#endif
}

[[nodiscard]] std::optional<Key> InputHandler::decode_escape() const
{
	const int c1 = read_timeout(escape_timeout());
	if (c1 == -1) {
		return Key{KeyCode::Escape};
	}
	if (c1 != '[' && c1 != 'O') {
		flush_input();
		return std::nullopt;
	}

	const int c2 = read_timeout(escape_timeout());
	switch (c2) {
	case 'A': return Key{KeyCode::Up};
	case 'B': return Key{KeyCode::Down};
	case 'C': return Key{KeyCode::Right};
	case 'D': return Key{KeyCode::Left};
	case 'H': return Key{KeyCode::Home};
	case 'F': return Key{KeyCode::End};
	case '1':
	case '4':
	case '5':
	case '6':
	case '7':
	case '8': {
		const int c3 = read_timeout(escape_timeout());
		if (c3 != '~') {
			break;
		}
		switch (c2) {
		case '5': return Key{KeyCode::PageUp};
		case '6': return Key{KeyCode::PageDown};
		case '1':
		case '7': return Key{KeyCode::Home};
		default: return Key{KeyCode::End};
		}
	}
	default: break;
	}

	flush_input();
	return std::nullopt;
}

[[nodiscard]] std::optional<Key> InputHandler::decode_utf8(const int lead) const
{
	const int continuation = (lead >= 0xF0) ? 3 : (lead >= 0xE0) ? 2 : 1;

	std::string text(1, static_cast<char>(lead));
	for (int i = 0; i < continuation; ++i) {
		const int c = read_timeout(escape_timeout());
		if (c == -1 || (c & 0xC0) != 0x80) {
			return std::nullopt;
		}
		text += static_cast<char>(c);
	}
	return Key{KeyCode::Char, std::move(text)};
}

InputHandler::InputHandler()
{
#ifndef _WIN32
	if (tcgetattr(STDIN_FILENO, &old_term_) == 0) {
		termios new_term = old_term_;
		// ISIG off so Ctrl+C arrives as a key and the terminal is restored
		new_term.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG);
		restore_ = tcsetattr(STDIN_FILENO, TCSANOW, &new_term) == 0;
	}
#endif
}

InputHandler::~InputHandler()
{
#ifndef _WIN32
	if (restore_) {
		tcsetattr(STDIN_FILENO, TCSANOW, &old_term_);
	}
#endif
}

[[nodiscard]] std::optional<Key> InputHandler::poll()
{
	if (!kbhit()) {
		return std::nullopt;
	}

	const auto c = getch();

	switch (c) {
	case -1: return std::nullopt;
	case 0x03: return Key{KeyCode::Interrupt}; // Ctrl+C
	case 0x0E: return Key{KeyCode::Next};     // Ctrl+N
	case 0x10: return Key{KeyCode::Previous}; // Ctrl+P
	case 0x08:
	case 0x7F: return Key{KeyCode::Backspace};
	case '\r':
	case '\n': return Key{KeyCode::Enter};
	case 0x1B: return decode_escape();
	default: break;
	}

	if (c >= 32 && c <= 126) { // Printable ASCII
		return Key{KeyCode::Char, std::string(1, static_cast<char>(c))};
	}

	if (c >= 0xC0 && c <= 0xF7) { // UTF-8 lead byte
		return decode_utf8(c);
	}

	return std::nullopt;
}
