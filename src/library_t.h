#ifndef LIBRARY_T
#define LIBRARY_T

#include "utilities.h"

#include <cstdint>
#include <optional>
#include <string>

namespace Library {
constexpr auto DatabaseFile = "metadata.db";
constexpr auto MetadataFile = "metadata.opf";
} // namespace Library

struct LibraryRecord {
	std::string path                       = {};
	std::string display_name               = {};
	std::optional<TimePoint> last_opened   = {};
	uint32_t open_count                    = 0;
	std::optional<int64_t> book_count_hint = {};
};

#endif
