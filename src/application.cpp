#include "application.h"
#include "launcher.h"
#include "library_locator.h"
#include "timing_t.h"
#include "utilities.h"

#include <iostream>

// ============================================================================
// Application
// ============================================================================

using namespace std::string_view_literals;

void Application::io_worker(const std::stop_token stoken)
{
	while (!stoken.stop_requested() && running_) {
		try {
			auto cmd = queue_.pop(Timing::QueueWait);
			if (!cmd) {
				if (display_.resized(state_.metrics)) {
					render();
				}
				continue;
			}

			std::visit(
			        [this](auto&& arg) {
				        using T = std::decay_t<decltype(arg)>;

				        try {
					        if constexpr (std::is_same_v<T, KeyPressed>) {
						        handle_key(arg.key);
					        } else if constexpr (std::is_same_v<T, LibraryLoaded>) {
						        handle_loaded(arg);
					        } else if constexpr (std::is_same_v<T, RefreshDisplay>) {
						        state_.metrics.dirty = true;
						        render();
					        } else if constexpr (std::is_same_v<T, Exit>) {
						        quit(arg.code);
					        }
				        } catch (const std::exception& e) {
					        std::cerr << "Command error: "sv << e.what() << '\n';
				        }
			        },
			        *cmd);
		} catch (const std::exception& e) {
			std::cerr << "IO worker error: "sv << e.what() << '\n';
		}
	}
}

void Application::render()
{
	state_.metrics = display_.render(state_, *libraries_, shelf_.get());
}

void Application::refresh_libraries()
{
	const auto query = libraries_ ? libraries_->query() : std::string();

	// The session refers to the index, so it goes first
	libraries_.reset();
	auto ranked = history_.ranked();

	std::vector<std::string> paths = {};
	paths.reserve(ranked.size());
	for (const auto& library : ranked) {
		paths.push_back(library.path);
	}
	state_.offline = LibraryLocator::offline(paths);

	library_index_ = std::make_unique<LibraryIndex>(std::move(ranked), translit_);
	libraries_     = std::make_unique<LibrarySession>(*library_index_);
	libraries_->set_query(query);
	state_.library_scroll = 0;
}

void Application::start_load(const std::string& path)
{
	const auto generation = ++generation_;

	state_.screen  = Screen::Loading;
	state_.loading = path;

	loaders_.emplace(generation, std::jthread([this, generation, path] {
		LibraryLoaded loaded = {.generation = generation, .path = path};
		try {
			loaded.shelf = Bookshelf::load(path, translit_);
		} catch (const std::exception& e) {
			loaded.error = e.what();
		}
		queue_.emplace(std::move(loaded));
	}));
}

void Application::handle_loaded(LibraryLoaded& loaded)
{
	// The loader has posted its result and is about to exit
	loaders_.erase(loaded.generation);

	if (loaded.generation != generation_ || state_.screen != Screen::Loading) {
		return;
	}

	if (!loaded.shelf) {
		std::cerr << "Error: "sv << loaded.error << '\n';
		state_.screen = Screen::Libraries;
		state_.status = "Cannot open " + HistoryStore::name_for(loaded.path) + ": " +
		                loaded.error;
		render();
		return;
	}

	shelf_ = std::move(loaded.shelf);
	history_.record_open(shelf_->path(),
	                     std::chrono::system_clock::now(),
	                     static_cast<int64_t>(shelf_->index().size()));
	history_.save();
	refresh_libraries();

	state_.screen      = Screen::Books;
	state_.book_scroll = 0;
	state_.details.reset();
	render();
}

void Application::handle_key(const Key& key)
{
	state_.status.clear();

	// A library screen is shown whenever no shelf backs the book screens
	if (!shelf_ && state_.screen != Screen::Loading) {
		state_.screen = Screen::Libraries;
	}

	switch (state_.screen) {
	case Screen::Libraries: handle_libraries_key(key); break;
	case Screen::Loading: handle_loading_key(key); break;
	case Screen::Books: handle_books_key(key); break;
	case Screen::Search: handle_search_key(key); break;
	case Screen::Details: handle_details_key(key); break;
	}

	if (running_) {
		render();
	}
}

template <typename Session>
bool Application::handle_move(Session& session, const Key& key)
{
	const size_t visible = state_.metrics.max_visible_results;
	const int page       = static_cast<int>((visible > 1) ? visible - 1 : 1);
	const int all = static_cast<int>(session.matches().size());

	switch (key.code) {
	case KeyCode::Up:
	case KeyCode::Previous: session.move_cursor(-1); return true;
	case KeyCode::Down:
	case KeyCode::Next: session.move_cursor(1); return true;
	case KeyCode::PageUp: session.move_cursor(-page); return true;
	case KeyCode::PageDown: session.move_cursor(page); return true;
	case KeyCode::Home: session.move_cursor(-all); return true;
	case KeyCode::End: session.move_cursor(all); return true;
	default: return false;
	}
}

void Application::handle_libraries_key(const Key& key)
{
	if (handle_move(*libraries_, key)) {
		return;
	}

	if (state_.filtering) {
		switch (key.code) {
		case KeyCode::Char:
			libraries_->type(key.text);
			state_.library_scroll = 0;
			break;
		case KeyCode::Backspace:
			if (libraries_->erase()) {
				state_.library_scroll = 0;
			}
			break;
		case KeyCode::Enter: open_selected_library(); break;
		case KeyCode::Escape:
			state_.filtering = false;
			libraries_->clear();
			state_.library_scroll = 0;
			break;
		default: break;
		}
		return;
	}

	switch (key.code) {
	case KeyCode::Enter:
	case KeyCode::Right: open_selected_library(); break;
	case KeyCode::Escape:
		if (shelf_) {
			state_.screen = Screen::Books;
		}
		break;
	case KeyCode::Char:
		if (key.text == "j") {
			libraries_->move_cursor(1);
		} else if (key.text == "k") {
			libraries_->move_cursor(-1);
		} else if (key.text == "/") {
			state_.filtering = true;
		} else if (key.text == "q") {
			quit(ExitSuccess);
		}
		break;
	default: break;
	}
}

void Application::handle_loading_key(const Key& key)
{
	if (key.code == KeyCode::Escape) {
		// The running load becomes stale and its result is dropped
		++generation_;
		state_.screen = Screen::Libraries;
		state_.loading.clear();
	} else if (key.code == KeyCode::Char && key.text == "q") {
		quit(ExitSuccess);
	}
}

void Application::handle_books_key(const Key& key)
{
	auto& session = shelf_->session();
	if (handle_move(session, key)) {
		return;
	}

	switch (key.code) {
	case KeyCode::Enter:
	case KeyCode::Right: show_details(false); break;
	case KeyCode::Escape:
	case KeyCode::Left: state_.screen = Screen::Libraries; break;
	case KeyCode::Char:
		if (key.text == "j") {
			session.move_cursor(1);
		} else if (key.text == "k") {
			session.move_cursor(-1);
		} else if (key.text == "o") {
			open_selected_book();
		} else if (key.text == "/") {
			state_.screen = Screen::Search;
		} else if (key.text == "q") {
			quit(ExitSuccess);
		}
		break;
	default: break;
	}
}

void Application::handle_search_key(const Key& key)
{
	auto& session = shelf_->session();
	if (handle_move(session, key)) {
		return;
	}

	switch (key.code) {
	case KeyCode::Char:
		session.type(key.text);
		state_.book_scroll = 0;
		break;
	case KeyCode::Backspace:
		if (session.erase()) {
			state_.book_scroll = 0;
		}
		break;
	case KeyCode::Enter: show_details(true); break;
	case KeyCode::Escape:
		session.clear();
		state_.book_scroll = 0;
		state_.screen      = Screen::Books;
		break;
	default: break;
	}
}

void Application::handle_details_key(const Key& key)
{
	const bool open = key.code == KeyCode::Enter ||
	                  (key.code == KeyCode::Char && key.text == "o");
	if (open) {
		open_selected_book();
		return;
	}

	if (key.code == KeyCode::Escape || key.code == KeyCode::Left) {
		state_.screen = state_.details_from_search ? Screen::Search : Screen::Books;
		state_.details.reset();
	}
}

void Application::open_selected_library()
{
	const auto* library = libraries_->selected();
	if (!library) {
		return;
	}

	state_.filtering = false;

	if (shelf_ && shelf_->path() == library->path) {
		state_.screen = Screen::Books;
		return;
	}

	if (!LibraryLocator::is_library(library->path)) {
		state_.offline.insert(library->path);
		state_.status = "Library is offline: " + library->path;
		return;
	}

	start_load(library->path);
}

void Application::show_details(const bool from_search)
{
	const auto* book = shelf_->session().selected();
	if (!book) {
		return;
	}

	state_.details             = shelf_->details(*book);
	state_.details_from_search = from_search;
	state_.screen              = Screen::Details;
}

void Application::open_selected_book()
{
	const auto* book = shelf_->session().selected();
	if (!book) {
		state_.status = "No book selected";
		return;
	}

	const auto file = shelf_->book_file(*book);
	if (!file) {
		state_.status = "No file found for " + book->title;
		return;
	}

	if (const auto error = Launcher::open(*file)) {
		std::cerr << "Error: "sv << *error << '\n';
		state_.status = *error;
		return;
	}
	state_.status = "Opened " + file->filename().string();
}

void Application::quit(const int code)
{
	exit_code_ = code;
	running_   = false;
}

Application::Application(HistoryStore& history,
                         std::vector<std::filesystem::path> roots,
                         std::optional<std::string> initial)
        : history_(history),
          roots_(std::move(roots)),
          initial_(std::move(initial)),
          display_(roots_)
{
	refresh_libraries();
}

[[nodiscard]] int Application::run()
{
	try {
		Util::clear_screen();

		if (initial_) {
			start_load(*initial_);
		}
		queue_.emplace(RefreshDisplay{});

		std::jthread io_thread([this](const std::stop_token st) {
			io_worker(st);
		});

		while (running_) {
			try {
				if (auto key = input_.poll()) {
					if (key->code == KeyCode::Interrupt) {
						queue_.emplace(Exit{ExitSuccess});
					} else {
						queue_.emplace(KeyPressed{std::move(*key)});
					}
				}
				std::this_thread::sleep_for(Timing::InputSleep);
			} catch (const std::exception& e) {
				std::cerr << "Input error: "sv << e.what() << '\n';
			}
		}

		queue_.shutdown();
		io_thread.request_stop();
		io_thread.join();

		if (history_.dirty()) {
			history_.save();
		}

		Util::clear_screen();
		return exit_code_;
	} catch (const std::exception& e) {
		std::cerr << "Fatal error: "sv << e.what() << '\n';
		return ExitError;
	}
}
