#ifndef QUERY_SESSION_H
#define QUERY_SESSION_H

#include "utilities.h"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Query State
// ============================================================================

// cursor is set iff matches is non-empty, and then indexes into matches
template <typename Id>
struct QueryState {
	std::string raw_query        = {};
	std::vector<Id> matches      = {};
	std::optional<size_t> cursor = {};
};

template <typename Index>
[[nodiscard]] QueryState<typename Index::Id> with_query(const Index& index,
                                                        std::string query)
{
	QueryState<typename Index::Id> next = {.raw_query = std::move(query)};
	next.matches = index.query(next.raw_query);
	if (!next.matches.empty()) {
		next.cursor = 0;
	}
	return next;
}

template <typename Id>
[[nodiscard]] QueryState<Id> with_cursor(QueryState<Id> state, const int delta)
{
	if (state.matches.empty()) {
		state.cursor.reset();
		return state;
	}

	const auto last    = static_cast<long>(state.matches.size()) - 1;
	const auto current = static_cast<long>(state.cursor.value_or(0));
	state.cursor = static_cast<size_t>(std::clamp(current + delta, 0L, last));
	return state;
}

// ============================================================================
// Query Session
// ============================================================================

template <typename Index>
class QuerySession {
public:
	using Id     = typename Index::Id;
	using Record = typename Index::Record;
	using State  = QueryState<Id>;

private:
	const Index& index_;
	State state_ = {};

public:
	explicit QuerySession(const Index& index)
	        : index_(index),
	          state_(with_query(index, {}))
	{}

	void set_query(std::string query)
	{
		state_ = with_query(index_, std::move(query));
	}

	void move_cursor(const int delta)
	{
		state_ = with_cursor(std::move(state_), delta);
	}

	void clear()
	{
		set_query({});
	}

	// Appends typed text (one or more UTF-8 characters)
	void type(const std::string_view text)
	{
		set_query(state_.raw_query + std::string(text));
	}

	// Deletes the last character; false if the query was already empty
	bool erase()
	{
		auto query = state_.raw_query;
		if (!Util::pop_utf8(query)) {
			return false;
		}
		set_query(std::move(query));
		return true;
	}

	[[nodiscard]] const std::string& query() const
	{
		return state_.raw_query;
	}

	[[nodiscard]] const std::vector<Id>& matches() const
	{
		return state_.matches;
	}

	[[nodiscard]] std::optional<size_t> cursor() const
	{
		return state_.cursor;
	}

	[[nodiscard]] const Record* at(const size_t position) const
	{
		return (position < state_.matches.size())
		               ? index_.find(state_.matches[position])
		               : nullptr;
	}

	[[nodiscard]] const Record* selected() const
	{
		return state_.cursor ? at(*state_.cursor) : nullptr;
	}

	[[nodiscard]] const Index& index() const
	{
		return index_;
	}
};

#endif
