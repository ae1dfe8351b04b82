#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <tinyxml2.h>
#pragma GCC diagnostic pop

#include "opf_parser.h"

#include <array>
#include <cctype>
#include <charconv>
#include <cstring>
#include <iostream>
#include <utility>

// ============================================================================
// OPF Parser
// ============================================================================

namespace {

// calibre writes this for "no publication date"
constexpr auto UndefinedDate = "0101-01-01";

constexpr std::array<std::pair<std::string_view, std::string_view>, 7> Entities = {{
        {"&amp;", "&"},
        {"&lt;", "<"},
        {"&gt;", ">"},
        {"&quot;", "\""},
        {"&#39;", "'"},
        {"&apos;", "'"},
        {"&nbsp;", " "},
}};

} // namespace

[[nodiscard]] std::string OPFParser::find_meta(const tinyxml2::XMLElement* metadata,
                                               const std::string_view name)
{
	for (const auto* meta = metadata->FirstChildElement("meta"); meta;
	     meta             = meta->NextSiblingElement("meta")) {
		const auto* key = meta->Attribute("name");
		if (key && name == key) {
			const auto* content = meta->Attribute("content");
			return content ? content : "";
		}
	}
	return {};
}

[[nodiscard]] std::string OPFParser::find_isbn(const tinyxml2::XMLElement* metadata)
{
	for (const auto* id = metadata->FirstChildElement("dc:identifier"); id;
	     id             = id->NextSiblingElement("dc:identifier")) {
		const auto* scheme = id->Attribute("opf:scheme");
		if (scheme && id->GetText() &&
		    (std::strcmp(scheme, "ISBN") == 0 || std::strcmp(scheme, "isbn") == 0)) {
			return id->GetText();
		}
	}
	return {};
}

[[nodiscard]] std::string OPFParser::strip_html(const std::string_view html)
{
	std::string text = {};
	text.reserve(html.size());

	bool in_tag = false;
	for (size_t i = 0; i < html.size(); ++i) {
		const char c = html[i];
		if (in_tag) {
			in_tag = (c != '>');
			continue;
		}
		if (c == '<') {
			in_tag = true;
			text += ' ';
			continue;
		}
		if (c == '&') {
			bool decoded = false;
			for (const auto& [entity, replacement] : Entities) {
				if (html.substr(i).starts_with(entity)) {
					text += replacement;
					i += entity.size() - 1;
					decoded = true;
					break;
				}
			}
			if (decoded) {
				continue;
			}
		}
		text += c;
	}

	// Collapse whitespace runs
	std::string result = {};
	result.reserve(text.size());
	for (const char c : text) {
		if (std::isspace(static_cast<unsigned char>(c))) {
			if (!result.empty() && result.back() != ' ') {
				result += ' ';
			}
		} else {
			result += c;
		}
	}
	if (!result.empty() && result.back() == ' ') {
		result.pop_back();
	}
	return result;
}

[[nodiscard]] std::optional<BookDetails> OPFParser::parse(const std::filesystem::path& file)
{
	try {
		tinyxml2::XMLDocument doc = {};
		if (doc.LoadFile(file.string().c_str()) != tinyxml2::XML_SUCCESS) {
			return std::nullopt;
		}

		const auto* package = doc.FirstChildElement("package");
		const auto* metadata = package ? package->FirstChildElement("metadata")
		                               : nullptr;
		if (!metadata) {
			return std::nullopt;
		}

		BookDetails details = {};

		if (const auto* description = get_text(metadata, "dc:description")) {
			details.description = strip_html(description);
		}
		if (const auto* publisher = get_text(metadata, "dc:publisher")) {
			details.publisher = publisher;
		}
		if (const auto* date = get_text(metadata, "dc:date")) {
			const std::string_view day = std::string_view(date).substr(0, 10);
			if (!day.starts_with(UndefinedDate)) {
				details.published = day;
			}
		}
		if (const auto* language = get_text(metadata, "dc:language")) {
			details.language = language;
		}

		details.isbn         = find_isbn(metadata);
		details.series       = find_meta(metadata, "calibre:series");
		details.series_index = find_meta(metadata, "calibre:series_index");

		const auto rating = find_meta(metadata, "calibre:rating");
		int value         = 0;
		if (const auto [ptr, ec] = std::from_chars(rating.data(),
		                                           rating.data() + rating.size(),
		                                           value);
		    ec == std::errc() && !rating.empty()) {
			details.rating = value;
		}

		return details;
	} catch (const std::exception& e) {
		std::cerr << "Error parsing " << file.string() << ": " << e.what() << '\n';
		return std::nullopt;
	}
}
