#ifndef COMMAND_LINE_H
#define COMMAND_LINE_H

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Command Line
// ============================================================================

constexpr auto Version = "1.0.0";

struct Options {
	std::optional<std::string> library               = {};
	std::vector<std::filesystem::path> scan           = {};
	std::optional<std::filesystem::path> history_file = {};
	bool no_history                                   = false;
	bool help                                         = false;
	bool version                                      = false;
};

class CommandLine {
public:
	// args excludes the program name. Prints the problem to std::cerr
	// and returns nothing on a usage error.
	[[nodiscard]] static std::optional<Options> parse(const std::vector<std::string_view>& args);

	static void usage(std::ostream& out, const std::string_view program);
};

#endif
