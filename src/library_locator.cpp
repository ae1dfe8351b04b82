#include "library_locator.h"
#include "library_t.h"
#include "utilities.h"

#include <cstdlib>
#include <fstream>

// ============================================================================
// Library Locator
// ============================================================================

namespace fs = std::filesystem;

[[nodiscard]] std::optional<std::string> LibraryLocator::accept(const fs::path& dir)
{
	if (!is_library(dir)) {
		return std::nullopt;
	}

	auto canonical = Util::canonical_path(dir);
	if (!seen_.insert(canonical).second) {
		return std::nullopt;
	}
	return canonical;
}

[[nodiscard]] std::optional<std::string> LibraryLocator::next_child()
{
	auto& it = *children_;

	while (it != fs::directory_iterator()) {
		std::error_code ec  = {};
		const auto path     = it->path();
		const bool is_dir   = it->is_directory(ec) && !ec;

		it.increment(ec);
		if (ec) {
			children_.reset();
			return is_dir ? accept(path) : std::nullopt;
		}

		if (is_dir) {
			if (auto found = accept(path)) {
				return found;
			}
		}
	}

	children_.reset();
	return std::nullopt;
}

LibraryLocator::LibraryLocator(std::vector<fs::path> roots) : roots_(std::move(roots)) {}

[[nodiscard]] std::vector<fs::path> LibraryLocator::standard_roots(
        const std::vector<fs::path>& extra)
{
	std::vector<fs::path> roots = {};

	std::error_code ec = {};
	if (auto cwd = fs::current_path(ec); !ec) {
		roots.emplace_back(std::move(cwd));
	}

	if (const auto home = Util::home_directory()) {
		roots.emplace_back(*home);
		for (const auto* sub : {"Documents",
		                        "Calibre Library",
		                        "Calibre Libraries",
		                        "Books",
		                        "Library"}) {
			roots.emplace_back(*home / sub);
		}
	}

#if defined(_WIN32)
	for (const char drive : {'C', 'D', 'E', 'F'}) {
		roots.emplace_back(std::string(1, drive) + ":/");
	}
#elif defined(__APPLE__)
	roots.emplace_back("/Users");
	roots.emplace_back("/Volumes");
#else
	roots.emplace_back("/home");
	roots.emplace_back("/media");
	if (const char* user = std::getenv("USER"); user && *user) {
		roots.emplace_back(fs::path("/media") / user);
		roots.emplace_back(fs::path("/run/media") / user);
	}
	roots.emplace_back("/mnt");
#endif

	roots.insert(roots.end(), extra.begin(), extra.end());
	return roots;
}

[[nodiscard]] bool LibraryLocator::is_library(const fs::path& dir)
{
	std::error_code ec = {};
	const auto db      = dir / Library::DatabaseFile;
	if (!fs::is_regular_file(db, ec) || ec) {
		return false;
	}
	const std::ifstream in(db, std::ios::binary);
	return in.good();
}

[[nodiscard]] std::set<std::string> LibraryLocator::offline(const std::vector<std::string>& libraries)
{
	std::set<std::string> result = {};
	for (const auto& library : libraries) {
		if (!is_library(library)) {
			result.insert(library);
		}
	}
	return result;
}

[[nodiscard]] std::optional<std::string> LibraryLocator::next()
{
	while (true) {
		if (children_) {
			if (auto found = next_child()) {
				return found;
			}
			continue;
		}

		if (next_root_ >= roots_.size()) {
			return std::nullopt;
		}

		const auto& root   = roots_[next_root_++];
		std::error_code ec = {};
		if (!fs::is_directory(root, ec) || ec) {
			continue;
		}

		fs::directory_iterator it(root,
		                          fs::directory_options::skip_permission_denied,
		                          ec);
		if (!ec) {
			children_.emplace(std::move(it));
		}

		if (auto found = accept(root)) {
			return found;
		}
	}
}

[[nodiscard]] std::vector<std::string> LibraryLocator::collect()
{
	std::vector<std::string> found = {};
	while (auto path = next()) {
		found.emplace_back(std::move(*path));
	}
	return found;
}

[[nodiscard]] const std::vector<fs::path>& LibraryLocator::roots() const
{
	return roots_;
}
