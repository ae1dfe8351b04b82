#include "display_manager.h"
#include "history_store.h"
#include "timing_t.h"
#include "utilities.h"

#include <algorithm>
#include <iostream>

// ============================================================================
// ANSI Color Codes
// ============================================================================

namespace Color {

using namespace std::string_view_literals;

constexpr auto Reset      = "\033[0m"sv;
constexpr auto Bold       = "\033[1m"sv;
constexpr auto Dim        = "\033[2m"sv;
constexpr auto Cyan       = "\033[96m"sv;
constexpr auto Green      = "\033[92m"sv;
constexpr auto Yellow     = "\033[93m"sv;
constexpr auto Gray       = "\033[90m"sv;
constexpr auto SelectedBg = "\033[48;5;24m\033[97m"sv;
} // namespace Color

using namespace std::string_view_literals;

namespace {

constexpr auto LibraryHelp =
        "↑/↓: Select | PgUp/PgDn: Scroll | Enter: Open | /: Filter | q: Quit"sv;
constexpr auto FilterHelp = "Type to filter | ↑/↓: Select | Enter: Open | Esc: Done"sv;
constexpr auto BookHelp =
        "↑/↓: Select | Enter: Details | o: Open file | /: Search | Esc: Libraries | q: Quit"sv;
constexpr auto SearchHelp = "Type to search | ↑/↓: Select | Enter: Details | Esc: Clear"sv;
constexpr auto DetailsHelp = "Enter/o: Open file | Esc: Back"sv;
constexpr auto LoadingHelp = "Esc: Back | q: Quit"sv;

constexpr size_t DefaultWidth = 80;
constexpr size_t Indent       = 4;

[[nodiscard]] std::vector<std::string> wrap(const std::string_view text, const size_t width)
{
	std::vector<std::string> lines = {};
	std::string line               = {};
	for (const auto& word : Util::tokenize(text)) {
		if (!line.empty() &&
		    Util::display_width(line) + 1 + Util::display_width(word) > width) {
			lines.emplace_back(std::move(line));
			line.clear();
		}
		if (!line.empty()) {
			line += ' ';
		}
		line += word;
	}
	if (!line.empty()) {
		lines.emplace_back(std::move(line));
	}
	return lines;
}

// calibre stores ratings out of ten
[[nodiscard]] std::string stars(const int rating)
{
	std::string result = {};
	for (int i = 0; i < (rating + 1) / 2; ++i) {
		result += "★";
	}
	return result;
}

[[nodiscard]] std::string book_count(const int64_t count)
{
	return std::to_string(count) + (count == 1 ? " book" : " books");
}

} // namespace

// ============================================================================
// Display Manager
// ============================================================================

void DisplayManager::refresh_size_cache() const
{
	const auto now = std::chrono::steady_clock::now();
	if (cached_height_ == 0 || (now - last_check_) > Timing::SizeCache) {
		cached_height_ = Util::terminal_height();
		cached_width_  = Util::terminal_width();
		last_check_    = now;
	}
}

[[nodiscard]] size_t DisplayManager::terminal_height_cached() const
{
	refresh_size_cache();
	return cached_height_;
}

[[nodiscard]] size_t DisplayManager::terminal_width_cached() const
{
	refresh_size_cache();
	return (cached_width_ == 0) ? DefaultWidth : std::max(cached_width_, Display::MinWidth);
}

[[nodiscard]] DisplayMetrics DisplayManager::measure_display(const DisplayMetrics& old_metrics) const
{
	const size_t current_height = terminal_height_cached();
	const size_t current_width  = terminal_width_cached();

	// Reuse if unchanged
	if (!old_metrics.dirty && old_metrics.terminal_height == current_height &&
	    old_metrics.terminal_width == current_width && current_height > 0) {
		return old_metrics;
	}

	DisplayMetrics metrics = {.terminal_height = current_height,
	                          .terminal_width  = current_width,
	                          .dirty           = false};

	constexpr size_t used      = Display::HeaderLines + Display::FooterLines;
	constexpr size_t min_space = Display::MinVisibleResults * Display::LinesPerResult;

	if (current_height > used + min_space) {
		metrics.available_lines     = current_height - used;
		metrics.max_visible_results = std::max(metrics.available_lines /
		                                               Display::LinesPerResult,
		                                       Display::MinVisibleResults);
	} else {
		// Fallback for tiny terminals
		metrics.available_lines     = min_space;
		metrics.max_visible_results = Display::MinVisibleResults;
	}

	return metrics;
}

void DisplayManager::render_title(std::ostringstream& buf, const std::string& title,
                                  const std::string& subtitle) const
{
	buf << Color::Bold << Color::Cyan << title << Color::Reset;
	if (!subtitle.empty()) {
		buf << Color::Dim << "  "sv << subtitle << Color::Reset;
	}
	buf << '\n';
}

void DisplayManager::render_query(std::ostringstream& buf, const std::string_view label,
                                  const std::string& query) const
{
	buf << Color::Bold << Color::Cyan << label << Color::Reset << query << Color::Cyan
	    << "_"sv << Color::Reset << '\n';
}

void DisplayManager::render_separator(std::ostringstream& buf) const
{
	buf << Color::Reset << Color::Gray << std::string(Display::SeparatorLength, '=')
	    << Color::Reset << '\n';
}

void DisplayManager::render_library(std::ostringstream& buf, const LibraryRecord& library,
                                    size_t display_index, bool selected, bool open,
                                    bool offline) const
{
	const size_t width = terminal_width_cached();

	if (selected) {
		buf << Color::SelectedBg;
	}

	buf << (selected ? '>' : ' ') << Color::Bold << "["sv << (display_index + 1) << "] "sv
	    << Color::Reset;

	if (selected) {
		buf << Color::SelectedBg;
	}

	buf << (library.open_count > 0 ? "★ "sv : "  "sv)
	    << Util::truncate(library.display_name, width / 2) << Color::Reset;

	if (open) {
		buf << Color::Green << " (open)"sv << Color::Reset;
	}
	if (library.book_count_hint) {
		buf << Color::Dim << " ("sv << book_count(*library.book_count_hint) << ")"sv
		    << Color::Reset;
	}
	if (offline) {
		buf << Color::Yellow << " (offline)"sv << Color::Reset;
	}

	buf << "\n    "sv << Color::Gray << Util::truncate(library.path, width - Indent)
	    << Color::Reset;
	if (library.last_opened) {
		buf << Color::Dim << "  last opened "sv << Util::format_local(*library.last_opened)
		    << Color::Reset;
	}
	buf << '\n';
}

void DisplayManager::render_book(std::ostringstream& buf, const BookRecord& book,
                                 size_t display_index, bool selected) const
{
	const size_t width = terminal_width_cached();

	if (selected) {
		buf << Color::SelectedBg;
	}

	buf << (selected ? '>' : ' ') << Color::Bold << "["sv << (display_index + 1) << "] "sv
	    << Color::Reset;

	if (selected) {
		buf << Color::SelectedBg;
	}

	buf << Util::truncate(book.title, width - Indent * 2) << Color::Reset << "\n    "sv
	    << Color::Dim;

	std::string byline = book.authors.empty() ? std::string("Unknown")
	                                          : Util::join(book.authors, " & ");
	if (!book.tags.empty()) {
		byline += "  [" + Util::join({book.tags.begin(), book.tags.end()}, ", ") + "]";
	}
	buf << Util::truncate(byline, width - Indent) << Color::Reset << '\n';
}

void DisplayManager::render_no_libraries(std::ostringstream& buf, size_t lines) const
{
	buf << Color::Yellow << "No calibre libraries found."sv << Color::Reset << "\n\n"sv
	    << "Searched:\n"sv;

	const size_t shown = std::min(roots_.size(), lines > 4 ? lines - 4 : 1);
	for (size_t i = 0; i < shown; ++i) {
		buf << Color::Gray << "    "sv << roots_[i].string() << Color::Reset << '\n';
	}
	if (shown < roots_.size()) {
		buf << Color::Gray << "    ... and "sv << (roots_.size() - shown) << " more\n"sv
		    << Color::Reset;
	}
	buf << "\nPass a library directory on the command line or add --scan PATH.\n"sv;
}

void DisplayManager::render_footer(std::ostringstream& buf, size_t scroll_offset,
                                   size_t display_count, size_t total,
                                   std::string_view noun, const std::string& status,
                                   std::string_view help) const
{
	buf << Color::Reset << '\n' << Color::Bold << Color::Cyan;
	if (!noun.empty() && total == 0) {
		buf << "No "sv << noun;
	} else if (!noun.empty()) {
		buf << "Showing "sv << (scroll_offset + 1) << "-"sv
		    << (scroll_offset + display_count) << " of "sv << total << ' ' << noun;
	}
	buf << Color::Reset;
	if (!status.empty()) {
		buf << "  "sv << Color::Yellow << status << Color::Reset;
	}
	buf << '\n' << Color::Dim << help << Color::Reset << '\n';
}

void DisplayManager::render_libraries(std::ostringstream& buf, DisplayState& state,
                                      const LibrarySession& libraries,
                                      const Bookshelf* shelf) const
{
	render_title(buf, "Calibre Libraries", {});
	if (state.filtering || !libraries.query().empty()) {
		render_query(buf, "Filter: "sv, libraries.query());
	}
	render_separator(buf);

	const auto& matches = libraries.matches();
	const size_t visible = state.metrics.max_visible_results;

	if (libraries.index().empty()) {
		render_no_libraries(buf, state.metrics.available_lines);
		render_footer(buf, 0, 0, 0, "libraries"sv, state.status, LibraryHelp);
		return;
	}
	if (matches.empty()) {
		buf << "No matches found.\n"sv;
	}

	follow(state.library_scroll, libraries.cursor(), matches.size(), visible);

	const size_t display_count =
	        std::min(visible, matches.size() - std::min(state.library_scroll, matches.size()));

	for (size_t i = 0; i < display_count; ++i) {
		const size_t idx = state.library_scroll + i;
		if (const auto* library = libraries.at(idx)) {
			render_library(buf,
			               *library,
			               idx,
			               libraries.cursor() == idx,
			               shelf && shelf->path() == library->path,
			               state.offline.contains(library->path));
		}
	}

	render_footer(buf,
	              state.library_scroll,
	              display_count,
	              matches.size(),
	              "libraries"sv,
	              state.status,
	              state.filtering ? FilterHelp : LibraryHelp);
}

void DisplayManager::render_loading(std::ostringstream& buf, const DisplayState& state) const
{
	render_title(buf, "Calibre Libraries", {});
	render_separator(buf);
	buf << "Loading "sv << Color::Bold << HistoryStore::name_for(state.loading)
	    << Color::Reset << "...\n"sv << Color::Gray << "    "sv << state.loading
	    << Color::Reset << '\n';
	render_footer(buf, 0, 0, 0, "books yet"sv, state.status, LoadingHelp);
}

void DisplayManager::render_books(std::ostringstream& buf, DisplayState& state,
                                  const Bookshelf& shelf) const
{
	const auto& session = shelf.session();
	const bool searching = (state.screen == Screen::Search);

	render_title(buf, shelf.name(), book_count(static_cast<int64_t>(shelf.index().size())));
	if (searching) {
		render_query(buf, "Search: "sv, session.query());
	}
	render_separator(buf);

	const auto& matches  = session.matches();
	const size_t visible = state.metrics.max_visible_results;

	if (matches.empty()) {
		buf << (session.query().empty() ? "This library has no books.\n"sv
		                                : "No matches found.\n"sv);
	}

	follow(state.book_scroll, session.cursor(), matches.size(), visible);

	const size_t display_count =
	        std::min(visible, matches.size() - std::min(state.book_scroll, matches.size()));

	for (size_t i = 0; i < display_count; ++i) {
		const size_t idx = state.book_scroll + i;
		if (const auto* book = session.at(idx)) {
			render_book(buf, *book, idx, session.cursor() == idx);
		}
	}

	render_footer(buf,
	              state.book_scroll,
	              display_count,
	              matches.size(),
	              "books"sv,
	              state.status,
	              searching ? SearchHelp : BookHelp);
}

void DisplayManager::render_details(std::ostringstream& buf, const DisplayState& state,
                                    const Bookshelf& shelf) const
{
	const auto* book = shelf.session().selected();
	if (!book) {
		render_footer(buf, 0, 0, 0, "book selected"sv, state.status, DetailsHelp);
		return;
	}

	const size_t width = terminal_width_cached();
	size_t lines       = Display::HeaderLines + Display::FooterLines;

	const auto row = [&](const std::string_view label, const std::string& value) {
		if (value.empty()) {
			return;
		}
		buf << Color::Bold << label << Color::Reset
		    << Util::truncate(value, width - label.size()) << '\n';
		++lines;
	};

	render_title(buf, Util::truncate(book->title, width), {});
	render_separator(buf);

	row("Authors:   "sv, Util::join(book->authors, " & "));
	row("Tags:      "sv, Util::join({book->tags.begin(), book->tags.end()}, ", "));

	std::vector<std::string> formats = {};
	for (const auto& file : book->files) {
		formats.push_back(file.format);
	}
	row("Formats:   "sv, Util::join(formats, ", "));
	row("Added:     "sv, book->timestamp.substr(0, 10));
	row("Path:      "sv, book->path);

	if (const auto& details = state.details) {
		std::string series = details->series;
		if (!series.empty() && !details->series_index.empty()) {
			series += " #" + details->series_index;
		}
		row("Series:    "sv, series);
		row("Publisher: "sv, details->publisher);
		row("Published: "sv, details->published);
		row("Language:  "sv, details->language);
		row("ISBN:      "sv, details->isbn);
		if (details->rating && *details->rating > 0) {
			row("Rating:    "sv, stars(*details->rating));
		}

		if (!details->description.empty()) {
			buf << '\n';
			++lines;
			const size_t height = std::max(state.metrics.terminal_height, lines + 1);
			auto text           = wrap(details->description, width - Indent);
			const size_t room   = height - lines;
			if (text.size() > room) {
				text.resize(room);
				if (!text.empty()) {
					text.back() = Util::truncate(text.back() + " ...", width - Indent);
				}
			}
			for (const auto& line : text) {
				buf << "    "sv << line << '\n';
			}
		}
	}

	render_footer(buf, 0, 0, 0, ""sv, state.status, DetailsHelp);
}

DisplayManager::DisplayManager(const std::vector<std::filesystem::path>& roots)
        : roots_(roots)
{}

[[nodiscard]] DisplayMetrics DisplayManager::render(DisplayState& state,
                                                    const LibrarySession& libraries,
                                                    const Bookshelf* shelf) const
{
	try {
		std::ostringstream buf;
		buf << "\033[2J\033[H"sv; // Clear screen and home

		// Detect terminal resize
		const size_t current_height = terminal_height_cached();
		if (state.last_terminal_height != current_height) {
			state.last_terminal_height = current_height;
			state.metrics.dirty        = true;
		}
		state.metrics = measure_display(state.metrics);

		switch (state.screen) {
		case Screen::Libraries: render_libraries(buf, state, libraries, shelf); break;
		case Screen::Loading: render_loading(buf, state); break;
		case Screen::Books:
		case Screen::Search:
			if (shelf) {
				render_books(buf, state, *shelf);
			}
			break;
		case Screen::Details:
			if (shelf) {
				render_details(buf, state, *shelf);
			}
			break;
		}

		std::cout << buf.str() << std::flush;
		return state.metrics;
	} catch (const std::exception& e) {
		std::cerr << "Display error: "sv << e.what() << '\n';
		return {};
	}
}

[[nodiscard]] bool DisplayManager::resized(const DisplayMetrics& metrics) const
{
	return terminal_height_cached() != metrics.terminal_height ||
	       terminal_width_cached() != metrics.terminal_width;
}

void DisplayManager::follow(size_t& scroll, const std::optional<size_t> cursor,
                            const size_t count, const size_t visible)
{
	if (count == 0 || visible == 0) {
		scroll = 0;
		return;
	}

	if (cursor) {
		if (*cursor < scroll) {
			scroll = *cursor;
		} else if (*cursor >= scroll + visible) {
			scroll = *cursor - visible + 1;
		}
	}

	// Never leave empty rows below the last match
	const size_t last_page = (count > visible) ? count - visible : 0;
	scroll                 = std::min(scroll, last_page);
}
