#ifndef TRANSLITERATOR_H
#define TRANSLITERATOR_H

#include <unicode/uversion.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

// ============================================================================
// Transliterator
// ============================================================================

U_NAMESPACE_BEGIN
class Transliterator;
U_NAMESPACE_END

// Both forms of one record attribute as stored by the search index.
// phonetic == normalized unless the text contains Han characters.
struct SearchableField {
	std::string normalized = {};
	std::string phonetic   = {};
};

// Renders Han characters as toneless pinyin, one syllable per character
// with no separators: "中国历史" -> "zhongguolishi". Other characters pass
// through unchanged. Safe to share between threads.
class Transliterator {
	std::unique_ptr<icu::Transliterator> han_latin_;
	mutable std::mutex mutex_;
	mutable std::unordered_map<int32_t, std::string> readings_ = {};

	[[nodiscard]] std::string reading(const int32_t code_point) const;

public:
	Transliterator();

	~Transliterator();

	Transliterator(const Transliterator&)            = delete;
	Transliterator& operator=(const Transliterator&) = delete;

	[[nodiscard]] bool available() const;

	[[nodiscard]] static bool has_han(const std::string_view text);

	// Expects text already case folded
	[[nodiscard]] std::string phonetic(const std::string_view text) const;

	[[nodiscard]] SearchableField forms(const std::string_view text) const;
};

#endif
