#ifndef HISTORY_STORE_H
#define HISTORY_STORE_H

#include "library_t.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// History Store
// ============================================================================

// Libraries the user has seen or opened, keyed by canonical path.
// Constructed without a file it is a purely in-memory store.
class HistoryStore {
	std::optional<std::filesystem::path> file_ = {};
	std::vector<LibraryRecord> records_        = {};
	bool dirty_                                = false;

	[[nodiscard]] LibraryRecord* find_mutable(const std::string& path);

	void absorb(LibraryRecord record);

public:
	HistoryStore() = default;

	explicit HistoryStore(std::filesystem::path file);

	[[nodiscard]] static std::optional<std::filesystem::path> default_path();

	// Strict weak order used for presentation: most recently opened first,
	// then most used, then by name, then by path
	[[nodiscard]] static bool ranks_before(const LibraryRecord& a,
	                                       const LibraryRecord& b);

	[[nodiscard]] static std::string name_for(const std::string_view path);

	// Missing file is an empty history. On a read or parse failure the
	// store detaches from its file so the bad file is never overwritten.
	bool load();

	bool save();

	// Adds zero-usage records for unknown candidates and returns every
	// record, ranked
	std::vector<LibraryRecord> merge(const std::vector<std::string>& candidates);

	void record_open(const std::string_view path,
	                 const TimePoint now                      = std::chrono::system_clock::now(),
	                 const std::optional<int64_t> book_count  = std::nullopt);

	// Updates the remembered book count of a known library without
	// counting it as an open
	void set_book_count(const std::string_view path, const int64_t book_count);

	[[nodiscard]] std::vector<LibraryRecord> ranked() const;

	[[nodiscard]] const LibraryRecord* find(const std::string_view path) const;

	[[nodiscard]] size_t size() const;

	[[nodiscard]] bool dirty() const;

	[[nodiscard]] bool persistent() const;
};

#endif
