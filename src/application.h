#ifndef APPLICATION_H
#define APPLICATION_H

#include "bookshelf.h"
#include "command_t.h"
#include "display_manager.h"
#include "exit_codes_t.h"
#include "history_store.h"
#include "input_handler.h"
#include "safe_queue.h"
#include "transliterator.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// Application
// ============================================================================

class Application {
	HistoryStore& history_;
	std::vector<std::filesystem::path> roots_ = {};
	std::optional<std::string> initial_       = {};

	Transliterator translit_ = {};
	std::unique_ptr<LibraryIndex> library_index_ = nullptr;
	std::unique_ptr<LibrarySession> libraries_   = nullptr;
	std::unique_ptr<Bookshelf> shelf_            = nullptr;

	DisplayManager display_;
	InputHandler input_       = {};
	SafeQueue<Command> queue_ = {};

	DisplayState state_ = {};
	std::atomic<bool> running_{true};
	std::atomic<int> exit_code_{ExitSuccess};
	uint64_t generation_ = 0;

	// Declared last so that running loads finish before anything they use
	// is destroyed
	std::map<uint64_t, std::jthread> loaders_ = {};

	void io_worker(const std::stop_token stoken);

	void render();

	void refresh_libraries();

	void start_load(const std::string& path);

	void handle_loaded(LibraryLoaded& loaded);

	void handle_key(const Key& key);

	void handle_libraries_key(const Key& key);

	void handle_loading_key(const Key& key);

	void handle_books_key(const Key& key);

	void handle_search_key(const Key& key);

	void handle_details_key(const Key& key);

	// Cursor movement shared by every list; false if key is not a movement
	template <typename Session>
	bool handle_move(Session& session, const Key& key);

	void open_selected_library();

	void show_details(const bool from_search);

	void open_selected_book();

	void quit(const int code);

public:
	// initial names a library to open right away instead of showing the
	// library selection first
	Application(HistoryStore& history,
	            std::vector<std::filesystem::path> roots,
	            std::optional<std::string> initial);

	[[nodiscard]] int run();
};

#endif
