#ifndef DISPLAY_MANAGER_H
#define DISPLAY_MANAGER_H

#include "bookshelf.h"
#include "command_t.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// ============================================================================
// Display Manager
// ============================================================================

class DisplayManager {
	const std::vector<std::filesystem::path>& roots_;
	mutable size_t cached_height_                             = 0;
	mutable size_t cached_width_                              = 0;
	mutable std::chrono::steady_clock::time_point last_check_ = {};

	void refresh_size_cache() const;

	[[nodiscard]] size_t terminal_height_cached() const;

	[[nodiscard]] size_t terminal_width_cached() const;

	[[nodiscard]] DisplayMetrics measure_display(const DisplayMetrics& old_metrics) const;

	void render_title(std::ostringstream& buf, const std::string& title,
	                  const std::string& subtitle) const;

	void render_query(std::ostringstream& buf, const std::string_view label,
	                  const std::string& query) const;

	void render_separator(std::ostringstream& buf) const;

	void render_library(std::ostringstream& buf, const LibraryRecord& library,
	                    size_t display_index, bool selected, bool open,
	                    bool offline) const;

	void render_book(std::ostringstream& buf, const BookRecord& book,
	                 size_t display_index, bool selected) const;

	void render_no_libraries(std::ostringstream& buf, size_t lines) const;

	void render_footer(std::ostringstream& buf, size_t scroll_offset,
	                   size_t display_count, size_t total, std::string_view noun,
	                   const std::string& status, std::string_view help) const;

	void render_libraries(std::ostringstream& buf, DisplayState& state,
	                      const LibrarySession& libraries, const Bookshelf* shelf) const;

	void render_loading(std::ostringstream& buf, const DisplayState& state) const;

	void render_books(std::ostringstream& buf, DisplayState& state,
	                  const Bookshelf& shelf) const;

	void render_details(std::ostringstream& buf, const DisplayState& state,
	                    const Bookshelf& shelf) const;

public:
	// roots are listed when no library was found
	explicit DisplayManager(const std::vector<std::filesystem::path>& roots);

	// Keeps scroll offsets following the cursors of both sessions
	[[nodiscard]] DisplayMetrics render(DisplayState& state, const LibrarySession& libraries,
	                                    const Bookshelf* shelf) const;

	// True when the terminal size differs from the one last rendered for
	[[nodiscard]] bool resized(const DisplayMetrics& metrics) const;

	// Moves scroll so that cursor is among the visible rows
	static void follow(size_t& scroll, const std::optional<size_t> cursor,
	                   const size_t count, const size_t visible);
};

#endif
