#ifndef LIBRARY_LOCATOR_H
#define LIBRARY_LOCATOR_H

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

// ============================================================================
// Library Locator
// ============================================================================

// Walks a fixed list of search roots, checking each root and its immediate
// child directories for a calibre database. Yields every library once, as
// a canonical path. Exhausted locators stay exhausted.
class LibraryLocator {
	std::vector<std::filesystem::path> roots_ = {};
	size_t next_root_                         = 0;
	std::optional<std::filesystem::directory_iterator> children_ = {};
	std::set<std::string> seen_               = {};

	[[nodiscard]] std::optional<std::string> accept(const std::filesystem::path& dir);

	[[nodiscard]] std::optional<std::string> next_child();

public:
	explicit LibraryLocator(std::vector<std::filesystem::path> roots);

	// Working directory, home and its usual book folders, OS shared
	// locations, then the extra paths
	[[nodiscard]] static std::vector<std::filesystem::path> standard_roots(
	        const std::vector<std::filesystem::path>& extra = {});

	[[nodiscard]] static bool is_library(const std::filesystem::path& dir);

	// The paths among libraries that no longer hold a readable database
	[[nodiscard]] static std::set<std::string> offline(const std::vector<std::string>& libraries);

	[[nodiscard]] std::optional<std::string> next();

	[[nodiscard]] std::vector<std::string> collect();

	[[nodiscard]] const std::vector<std::filesystem::path>& roots() const;
};

#endif
