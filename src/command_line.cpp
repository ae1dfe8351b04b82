#include "command_line.h"

#include <iostream>

// ============================================================================
// Command Line
// ============================================================================

using namespace std::string_view_literals;

[[nodiscard]] std::optional<Options> CommandLine::parse(const std::vector<std::string_view>& args)
{
	Options options = {};

	const auto set_library = [&](const std::string_view path) {
		if (options.library) {
			std::cerr << "Error: More than one library given\n"sv;
			return false;
		}
		options.library = std::string(path);
		return true;
	};

	for (size_t i = 0; i < args.size(); ++i) {
		std::string_view arg                         = args[i];
		std::optional<std::string_view> inline_value = {};

		if (arg.starts_with("--"sv)) {
			if (const auto eq = arg.find('='); eq != std::string_view::npos) {
				inline_value = arg.substr(eq + 1);
				arg          = arg.substr(0, eq);
			}
		}

		const auto value = [&]() -> std::optional<std::string_view> {
			if (inline_value) {
				return inline_value;
			}
			if (i + 1 < args.size()) {
				return args[++i];
			}
			std::cerr << "Error: Option "sv << arg << " requires an argument\n"sv;
			return std::nullopt;
		};

		if (arg == "-h"sv || arg == "--help"sv) {
			options.help = true;
		} else if (arg == "-V"sv || arg == "--version"sv) {
			options.version = true;
		} else if (arg == "--no-history"sv) {
			options.no_history = true;
		} else if (arg == "-l"sv || arg == "--library"sv) {
			const auto path = value();
			if (!path || !set_library(*path)) {
				return std::nullopt;
			}
		} else if (arg == "-s"sv || arg == "--scan"sv) {
			const auto path = value();
			if (!path) {
				return std::nullopt;
			}
			options.scan.emplace_back(*path);
		} else if (arg == "--history"sv) {
			const auto path = value();
			if (!path) {
				return std::nullopt;
			}
			options.history_file = std::filesystem::path(*path);
		} else if (arg == "--"sv) {
			for (++i; i < args.size(); ++i) {
				if (!set_library(args[i])) {
					return std::nullopt;
				}
			}
		} else if (arg.size() > 1 && arg.front() == '-') {
			std::cerr << "Error: Unknown option "sv << arg << '\n';
			return std::nullopt;
		} else if (!set_library(arg)) {
			return std::nullopt;
		}
	}

	if (options.no_history && options.history_file) {
		std::cerr << "Error: --history and --no-history cannot be combined\n"sv;
		return std::nullopt;
	}

	return options;
}

void CommandLine::usage(std::ostream& out, const std::string_view program)
{
	out << "Usage: "sv << program << " [options] [LIBRARY]\n\n"sv
	    << "Browse and search calibre libraries from the terminal.\n\n"sv
	    << "Options:\n"sv
	    << "  -l, --library PATH   Open the library at PATH\n"sv
	    << "  -s, --scan PATH      Also look for libraries in PATH (repeatable)\n"sv
	    << "      --history FILE   Keep the library history in FILE\n"sv
	    << "      --no-history     Do not read or write the library history\n"sv
	    << "  -h, --help           Show this help\n"sv
	    << "  -V, --version        Show the version\n"sv;
}
