#ifndef SEARCH_INDEX_H
#define SEARCH_INDEX_H

#include "transliterator.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// ============================================================================
// Field Index
// ============================================================================

// One textual attribute of a record as handed to the index at build time
struct FieldText {
	std::string_view text = {};
	bool primary          = false;
};

// Precomputed searchable forms of every record, in load order. Queries are
// a linear scan; nothing is recomputed per keystroke except the query
// terms themselves.
class FieldIndex {
	struct Forms {
		std::string primary = {};
		std::string other   = {};
	};

	std::vector<Forms> forms_ = {};

	static void append(std::string& haystack, const SearchableField& field);

public:
	void reserve(const size_t count);

	void add(const std::vector<FieldText>& fields, const Transliterator& translit);

	// Slots of matching records: every term must occur in some field form.
	// Records with a term hit in a primary field come first; load order
	// is kept within each group. An empty query returns every slot.
	[[nodiscard]] std::vector<size_t> query(const std::string_view raw_query) const;
};

// ============================================================================
// Search Index
// ============================================================================

// Fields must provide:
//   using Record, using Id
//   static Id id(const Record&)
//   static std::vector<FieldText> fields(const Record&)
template <typename Fields>
class SearchIndex {
public:
	using Record = typename Fields::Record;
	using Id     = typename Fields::Id;

private:
	std::vector<Record> records_          = {};
	std::unordered_map<Id, size_t> slots_ = {};
	FieldIndex fields_                    = {};

public:
	SearchIndex() = default;

	SearchIndex(std::vector<Record> records, const Transliterator& translit)
	        : records_(std::move(records))
	{
		fields_.reserve(records_.size());
		slots_.reserve(records_.size());
		for (size_t i = 0; i < records_.size(); ++i) {
			slots_.emplace(Fields::id(records_[i]), i);
			fields_.add(Fields::fields(records_[i]), translit);
		}
	}

	[[nodiscard]] std::vector<Id> query(const std::string_view raw_query) const
	{
		const auto slots = fields_.query(raw_query);

		std::vector<Id> ids = {};
		ids.reserve(slots.size());
		for (const auto slot : slots) {
			ids.emplace_back(Fields::id(records_[slot]));
		}
		return ids;
	}

	[[nodiscard]] const Record* find(const Id& id) const
	{
		const auto it = slots_.find(id);
		return (it != slots_.end()) ? &records_[it->second] : nullptr;
	}

	[[nodiscard]] size_t size() const
	{
		return records_.size();
	}

	[[nodiscard]] bool empty() const
	{
		return records_.empty();
	}
};

#endif
