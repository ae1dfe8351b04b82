#ifndef OPF_PARSER_H
#define OPF_PARSER_H

#include "book_t.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// ============================================================================
// OPF Parser
// ============================================================================

namespace tinyxml2 { class XMLElement; }

// Reads the metadata.opf calibre keeps beside every book
class OPFParser {
	static constexpr auto get_text = [](const auto* parent, const char* tag) {
		const auto* elem = parent->FirstChildElement(tag);
		return elem ? elem->GetText() : nullptr;
	};

	[[nodiscard]] static std::string find_meta(const tinyxml2::XMLElement* metadata,
	                                           const std::string_view name);

	[[nodiscard]] static std::string find_isbn(const tinyxml2::XMLElement* metadata);

public:
	[[nodiscard]] static std::string strip_html(const std::string_view html);

	[[nodiscard]] static std::optional<BookDetails> parse(const std::filesystem::path& file);
};

#endif
