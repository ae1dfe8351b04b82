#include "launcher.h"

#include <cstring>

#ifdef _WIN32
#define NOMINMAX
#include <windows.h>
#include <shellapi.h>
#else
#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;
#endif

// ============================================================================
// Launcher
// ============================================================================

namespace {

#if defined(__APPLE__)
constexpr auto Opener = "open";
#elif !defined(_WIN32)
constexpr auto Opener = "xdg-open";
#endif

} // namespace

[[nodiscard]] std::optional<std::string> Launcher::open(const std::filesystem::path& file)
{
	std::error_code ec = {};
	if (!std::filesystem::exists(file, ec)) {
		return "Book file not found: " + file.string();
	}

#ifdef _WIN32
	const auto result = reinterpret_cast<intptr_t>(ShellExecuteW(
	        nullptr, L"open", file.wstring().c_str(), nullptr, nullptr, SW_SHOWNORMAL));
	if (result <= 32) {
		return "Cannot open " + file.string();
	}
	return std::nullopt;
#else
	// The opener must not draw over the terminal UI
	posix_spawn_file_actions_t actions = {};
	posix_spawn_file_actions_init(&actions);
	posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
	posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
	posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

	const std::string path = file.string();
	std::string program    = Opener;
	char* const argv[]     = {program.data(), const_cast<char*>(path.c_str()), nullptr};

	pid_t pid     = 0;
	const int rc  = posix_spawnp(&pid, Opener, &actions, nullptr, argv, environ);
	posix_spawn_file_actions_destroy(&actions);

	if (rc != 0) {
		return std::string("Cannot run ") + Opener + ": " + std::strerror(rc);
	}
	return std::nullopt;
#endif
}
