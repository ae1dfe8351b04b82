// A terminal browser for calibre libraries
// Copyright (C) 2025 shelfsearch contributors
// Licensed under GNU GPL v3+

#include "application.h"
#include "command_line.h"
#include "history_store.h"
#include "library_database.h"
#include "library_locator.h"
#include "utilities.h"

#include <csignal>
#include <iostream>

// ============================================================================
// Main
// ============================================================================

namespace {

[[nodiscard]] HistoryStore open_history(const Options& options)
{
	if (options.no_history) {
		return HistoryStore();
	}
	if (options.history_file) {
		return HistoryStore(*options.history_file);
	}
	if (const auto file = HistoryStore::default_path()) {
		return HistoryStore(*file);
	}
	std::cerr << "Warning: No home directory, library history kept in memory only\n";
	return HistoryStore();
}

// The library to open at startup: the one named on the command line, or
// the working directory when it is a library
[[nodiscard]] std::optional<std::string> initial_library(const Options& options)
{
	if (options.library) {
		if (LibraryLocator::is_library(*options.library)) {
			return Util::canonical_path(*options.library);
		}
		std::cerr << "Warning: " << *options.library << " is not a calibre library\n";
		return std::nullopt;
	}

	std::error_code ec = {};
	const auto cwd     = std::filesystem::current_path(ec);
	if (!ec && LibraryLocator::is_library(cwd)) {
		return Util::canonical_path(cwd);
	}
	return std::nullopt;
}

} // namespace

int main(const int argc, char* const argv[])
{
	try {
		const std::vector<std::string_view> args(argv + 1, argv + argc);
		const auto options = CommandLine::parse(args);
		if (!options) {
			CommandLine::usage(std::cerr, argv[0]);
			return ExitUsage;
		}
		if (options->help) {
			CommandLine::usage(std::cout, argv[0]);
			return ExitSuccess;
		}
		if (options->version) {
			std::cout << "shelfsearch " << Version << '\n';
			return ExitSuccess;
		}

#ifndef _WIN32
		// Opened books are never waited for
		std::signal(SIGCHLD, SIG_IGN);
#endif

		auto history = open_history(*options);
		history.load();

		LibraryLocator locator(LibraryLocator::standard_roots(options->scan));
		const auto found = locator.collect();
		history.merge(found);
		for (const auto& library : found) {
			if (const auto count = LibraryDatabase::book_count(library)) {
				history.set_book_count(library, *count);
			}
		}

		auto initial = initial_library(*options);

		Application app(history, locator.roots(), std::move(initial));
		return app.run();
	} catch (const std::exception& e) {
		std::cerr << "Fatal error in main: " << e.what() << '\n';
		return ExitError;
	}
}
