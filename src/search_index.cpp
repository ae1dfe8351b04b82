#include "search_index.h"
#include "utilities.h"

#include <numeric>

// ============================================================================
// Field Index
// ============================================================================

namespace {

// Queries are split on whitespace, so no term can span two forms
constexpr char FormSeparator = '\n';

} // namespace

void FieldIndex::append(std::string& haystack, const SearchableField& field)
{
	if (field.normalized.empty()) {
		return;
	}
	haystack += field.normalized;
	haystack += FormSeparator;
	if (field.phonetic != field.normalized) {
		haystack += field.phonetic;
		haystack += FormSeparator;
	}
}

void FieldIndex::reserve(const size_t count)
{
	forms_.reserve(count);
}

void FieldIndex::add(const std::vector<FieldText>& fields, const Transliterator& translit)
{
	Forms forms = {};
	for (const auto& field : fields) {
		append(field.primary ? forms.primary : forms.other, translit.forms(field.text));
	}
	forms_.emplace_back(std::move(forms));
}

[[nodiscard]] std::vector<size_t> FieldIndex::query(const std::string_view raw_query) const
{
	const auto terms = Util::tokenize(Util::fold_case(raw_query));

	if (terms.empty()) {
		std::vector<size_t> all(forms_.size());
		std::iota(all.begin(), all.end(), size_t{0});
		return all;
	}

	std::vector<size_t> primary_hits = {};
	std::vector<size_t> other_hits   = {};

	for (size_t slot = 0; slot < forms_.size(); ++slot) {
		const auto& forms = forms_[slot];
		bool matched      = true;
		bool in_primary   = false;

		for (const auto& term : terms) {
			if (forms.primary.find(term) != std::string::npos) {
				in_primary = true;
			} else if (forms.other.find(term) == std::string::npos) {
				matched = false;
				break;
			}
		}

		if (matched) {
			(in_primary ? primary_hits : other_hits).push_back(slot);
		}
	}

	primary_hits.insert(primary_hits.end(), other_hits.begin(), other_hits.end());
	return primary_hits;
}
