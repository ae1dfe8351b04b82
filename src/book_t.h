#ifndef BOOK_T
#define BOOK_T

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

using BookId = int64_t;

// One row of the calibre "data" table: <name>.<format lowercased> inside
// the book directory
struct BookFile {
	std::string format = {};
	std::string name   = {};
};

struct BookRecord {
	BookId id                         = {};
	std::string title                 = {};
	std::vector<std::string> authors  = {};
	std::set<std::string> tags        = {};
	std::string path                  = {};
	std::string uuid                  = {};
	std::string timestamp             = {};
	bool has_cover                    = false;
	std::vector<BookFile> files       = {};
};

// Sidecar metadata from a book's metadata.opf
struct BookDetails {
	std::string description           = {};
	std::string publisher             = {};
	std::string published             = {};
	std::string language              = {};
	std::string series                = {};
	std::string series_index          = {};
	std::string isbn                  = {};
	std::optional<int> rating         = {};
};

#endif
