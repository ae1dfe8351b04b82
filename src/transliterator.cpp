#include "transliterator.h"
#include "utilities.h"

#include <unicode/translit.h>
#include <unicode/uscript.h>
#include <unicode/utf8.h>

#include <iostream>

// ============================================================================
// Transliterator
// ============================================================================

namespace {

constexpr auto TransformId = "Han-Latin; Latin-ASCII; Lower";

[[nodiscard]] bool is_han(const UChar32 c)
{
	UErrorCode status = U_ZERO_ERROR;
	const auto script = uscript_getScript(c, &status);
	return U_SUCCESS(status) && script == USCRIPT_HAN;
}

} // namespace

[[nodiscard]] std::string Transliterator::reading(const int32_t code_point) const
{
	std::scoped_lock lock(mutex_);

	if (const auto it = readings_.find(code_point); it != readings_.end()) {
		return it->second;
	}

	icu::UnicodeString text(static_cast<UChar32>(code_point));
	han_latin_->transliterate(text);

	std::string latin = {};
	text.toUTF8String(latin);

	// Han-Latin pads syllables with spaces and may keep apostrophes
	std::string result = {};
	for (const char c : latin) {
		if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
			result += c;
		}
	}

	if (result.empty()) {
		// No reading known: keep the character itself
		icu::UnicodeString original(static_cast<UChar32>(code_point));
		original.toUTF8String(result);
	}

	readings_.emplace(code_point, result);
	return result;
}

Transliterator::Transliterator()
{
	using namespace std::string_view_literals;

	UErrorCode status = U_ZERO_ERROR;
	han_latin_.reset(icu::Transliterator::createInstance(TransformId,
	                                                     UTRANS_FORWARD,
	                                                     status));
	if (U_FAILURE(status) || !han_latin_) {
		han_latin_.reset();
		std::cerr << "Warning: Han-Latin transliteration unavailable ("sv
		          << u_errorName(status) << "), matching literally\n"sv;
	}
}

Transliterator::~Transliterator() = default;

[[nodiscard]] bool Transliterator::available() const
{
	return han_latin_ != nullptr;
}

[[nodiscard]] bool Transliterator::has_han(const std::string_view text)
{
	const auto* bytes  = reinterpret_cast<const uint8_t*>(text.data());
	const auto length  = static_cast<int32_t>(text.size());
	int32_t i          = 0;

	while (i < length) {
		UChar32 c = 0;
		U8_NEXT(bytes, i, length, c);
		if (c >= 0 && is_han(c)) {
			return true;
		}
	}
	return false;
}

[[nodiscard]] std::string Transliterator::phonetic(const std::string_view text) const
{
	if (!han_latin_ || !has_han(text)) {
		return std::string(text);
	}

	std::string result = {};
	result.reserve(text.size() * 2);

	const auto* bytes  = reinterpret_cast<const uint8_t*>(text.data());
	const auto length  = static_cast<int32_t>(text.size());
	int32_t i          = 0;

	while (i < length) {
		const int32_t start = i;
		UChar32 c           = 0;
		U8_NEXT(bytes, i, length, c);

		if (c >= 0 && is_han(c)) {
			result += reading(c);
		} else {
			result.append(text.substr(static_cast<size_t>(start),
			                          static_cast<size_t>(i - start)));
		}
	}
	return result;
}

[[nodiscard]] SearchableField Transliterator::forms(const std::string_view text) const
{
	SearchableField field = {.normalized = Util::fold_case(text)};
	field.phonetic        = phonetic(field.normalized);
	return field;
}
