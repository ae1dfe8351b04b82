#ifndef LAUNCHER_H
#define LAUNCHER_H

#include <filesystem>
#include <optional>
#include <string>

// ============================================================================
// Launcher
// ============================================================================

// Hands a file to the desktop's default application without waiting for it
class Launcher {
public:
	// Returns a message describing the failure, or nothing on success
	[[nodiscard]] static std::optional<std::string> open(const std::filesystem::path& file);
};

#endif
