#ifndef COMMAND_T
#define COMMAND_T

#include "book_t.h"
#include "bookshelf.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>

namespace Display {
constexpr size_t SeparatorLength   = 60;
constexpr size_t HeaderLines       = 3;
constexpr size_t FooterLines       = 3;
constexpr size_t LinesPerResult    = 2;
constexpr size_t MinVisibleResults = 2;
constexpr size_t MinWidth          = 40;
} // namespace Display

enum class Screen {
	Libraries,
	Loading,
	Books,
	Search,
	Details,
};

struct DisplayMetrics {
	size_t terminal_height     = 0;
	size_t terminal_width      = 0;
	size_t available_lines     = 0;
	size_t max_visible_results = 0;
	bool dirty                 = true;
};

struct DisplayState {
	Screen screen                       = Screen::Libraries;
	bool filtering                      = false;
	bool details_from_search            = false;
	size_t library_scroll               = 0;
	size_t book_scroll                  = 0;
	std::string loading                 = {};
	std::string status                  = {};
	std::optional<BookDetails> details  = {};
	std::set<std::string> offline       = {};
	DisplayMetrics metrics              = {};
	size_t last_terminal_height         = 0;
};

enum class KeyCode {
	Char,
	Enter,
	Escape,
	Backspace,
	Up,
	Down,
	Left,
	Right,
	PageUp,
	PageDown,
	Home,
	End,
	Next,
	Previous,
	Interrupt,
};

struct Key {
	KeyCode code     = KeyCode::Char;
	std::string text = {};
};

struct KeyPressed {
	Key key = {};
};
struct LibraryLoaded {
	uint64_t generation             = {};
	std::string path                = {};
	std::unique_ptr<Bookshelf> shelf = nullptr;
	std::string error               = {};
};
struct RefreshDisplay {};
struct Exit {
	int code = {};
};

using Command = std::variant<KeyPressed, LibraryLoaded, RefreshDisplay, Exit>;

#endif
