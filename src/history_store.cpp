#include "history_store.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <iostream>
#include <ranges>

// ============================================================================
// History Store
// ============================================================================

namespace fs = std::filesystem;
using json   = nlohmann::json;

namespace {

[[nodiscard]] const json* field(const json& item, const char* key, const char* legacy_key)
{
	if (const auto it = item.find(key); it != item.end()) {
		return &*it;
	}
	if (const auto it = item.find(legacy_key); it != item.end()) {
		return &*it;
	}
	return nullptr;
}

[[nodiscard]] std::optional<TimePoint> parse_timestamp(const json& value)
{
	if (value.is_string()) {
		return Util::parse_iso8601(value.get<std::string>());
	}
	// Seconds since the epoch, up to the end of year 9999. Anything larger
	// is likely milliseconds and would overflow the clock's duration.
	constexpr int64_t max_epoch_seconds = 253402300799;
	int64_t secs = 0;
	if (value.is_number_unsigned()) {
		const auto raw = value.get<uint64_t>();
		if (raw > static_cast<uint64_t>(max_epoch_seconds)) {
			return std::nullopt;
		}
		secs = static_cast<int64_t>(raw);
	}
	else if (value.is_number_integer()) {
		secs = value.get<int64_t>();
	}
	else if (value.is_number_float()) {
		const auto raw = value.get<double>();
		if (!std::isfinite(raw) || raw < 0.0 || raw > static_cast<double>(max_epoch_seconds)) {
			return std::nullopt;
		}
		secs = static_cast<int64_t>(raw);
	}
	else {
		return std::nullopt;
	}
	if (secs < 0 || secs > max_epoch_seconds) {
		return std::nullopt;
	}
	return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(secs)));
}

[[nodiscard]] std::optional<LibraryRecord> record_from_json(const json& item)
{
	if (!item.is_object()) {
		return std::nullopt;
	}

	const auto path = item.find("path");
	if (path == item.end() || !path->is_string() ||
	    path->get_ref<const std::string&>().empty()) {
		return std::nullopt;
	}

	LibraryRecord record = {.path = path->get<std::string>()};

	if (const auto* name = field(item, "display_name", "name");
	    name && name->is_string()) {
		record.display_name = name->get<std::string>();
	}

	if (const auto* opened = field(item, "last_opened", "last_used")) {
		record.last_opened = parse_timestamp(*opened);
	}

	if (const auto* count = field(item, "open_count", "use_count");
	    count && count->is_number_integer()) {
		const auto value  = count->get<int64_t>();
		record.open_count = static_cast<uint32_t>(std::clamp<int64_t>(
		        value, 0, std::numeric_limits<uint32_t>::max()));
	}

	if (const auto* books = field(item, "book_count", "book_count_hint");
	    books && books->is_number_integer()) {
		record.book_count_hint = books->get<int64_t>();
	}

	return record;
}

[[nodiscard]] json record_to_json(const LibraryRecord& record)
{
	json item            = json::object();
	item["path"]         = record.path;
	item["display_name"] = record.display_name;
	item["last_opened"]  = record.last_opened
	                               ? json(Util::format_iso8601(*record.last_opened))
	                               : json(nullptr);
	item["open_count"]   = record.open_count;
	item["book_count"]   = record.book_count_hint ? json(*record.book_count_hint)
	                                              : json(nullptr);
	return item;
}

} // namespace

[[nodiscard]] LibraryRecord* HistoryStore::find_mutable(const std::string& path)
{
	const auto it = std::ranges::find(records_, path, &LibraryRecord::path);
	return (it != records_.end()) ? &*it : nullptr;
}

void HistoryStore::absorb(LibraryRecord record)
{
	record.path = Util::canonical_path(record.path);
	if (record.display_name.empty()) {
		record.display_name = name_for(record.path);
	}

	auto* existing = find_mutable(record.path);
	if (!existing) {
		records_.emplace_back(std::move(record));
		return;
	}

	const bool newer = record.last_opened &&
	                   (!existing->last_opened ||
	                    *record.last_opened > *existing->last_opened);

	existing->open_count = std::max(existing->open_count, record.open_count);
	if (newer) {
		existing->last_opened = record.last_opened;
	}
	if (record.book_count_hint && (newer || !existing->book_count_hint)) {
		existing->book_count_hint = record.book_count_hint;
	}
}

HistoryStore::HistoryStore(fs::path file) : file_(std::move(file)) {}

[[nodiscard]] std::optional<fs::path> HistoryStore::default_path()
{
	if (const auto dir = Util::config_directory()) {
		return *dir / "shelfsearch" / "libraries.json";
	}
	return std::nullopt;
}

[[nodiscard]] bool HistoryStore::ranks_before(const LibraryRecord& a, const LibraryRecord& b)
{
	if (a.last_opened != b.last_opened) {
		if (!a.last_opened) {
			return false;
		}
		if (!b.last_opened) {
			return true;
		}
		return *a.last_opened > *b.last_opened;
	}
	if (a.open_count != b.open_count) {
		return a.open_count > b.open_count;
	}
	if (a.display_name != b.display_name) {
		return a.display_name < b.display_name;
	}
	return a.path < b.path;
}

[[nodiscard]] std::string HistoryStore::name_for(const std::string_view path)
{
	const fs::path p(path);
	auto name = p.filename().string();
	return name.empty() ? std::string(path) : name;
}

bool HistoryStore::load()
{
	using namespace std::string_view_literals;

	if (!file_) {
		return true;
	}

	std::error_code ec = {};
	if (!fs::exists(*file_, ec)) {
		return !ec;
	}

	try {
		std::ifstream in(*file_);
		if (!in) {
			throw std::runtime_error("cannot open file");
		}

		const auto doc = json::parse(in);
		const json* list = nullptr;
		if (doc.is_array()) {
			list = &doc;
		} else if (const auto it = doc.find("libraries");
		           doc.is_object() && it != doc.end() && it->is_array()) {
			list = &*it;
		} else {
			throw std::runtime_error("expected an array of libraries");
		}

		std::vector<LibraryRecord> loaded = {};
		records_.swap(loaded);
		for (const auto& item : *list) {
			if (auto record = record_from_json(item)) {
				absorb(std::move(*record));
			}
		}
		dirty_ = false;
		return true;
	} catch (const std::exception& e) {
		std::cerr << "Warning: Cannot read library history "sv << file_->string()
		          << ": "sv << e.what() << " (history kept in memory only)\n"sv;
		file_.reset();
		return false;
	}
}

bool HistoryStore::save()
{
	using namespace std::string_view_literals;

	if (!file_) {
		return true;
	}

	try {
		std::error_code ec = {};
		if (file_->has_parent_path()) {
			fs::create_directories(file_->parent_path(), ec);
			if (ec) {
				throw fs::filesystem_error("cannot create directory",
				                           file_->parent_path(),
				                           ec);
			}
		}

		json doc = json::array();
		for (const auto& record : ranked()) {
			doc.push_back(record_to_json(record));
		}

		auto staging = *file_;
		staging += ".tmp";
		{
			std::ofstream out(staging, std::ios::trunc);
			out << doc.dump(2) << '\n';
			out.close();
			if (!out) {
				throw std::runtime_error("cannot write " + staging.string());
			}
		}

		fs::rename(staging, *file_, ec);
		if (ec) {
			fs::remove(staging, ec);
			throw std::runtime_error("cannot replace " + file_->string());
		}

		dirty_ = false;
		return true;
	} catch (const std::exception& e) {
		std::cerr << "Warning: Failed to save library history: "sv << e.what()
		          << '\n';
		return false;
	}
}

std::vector<LibraryRecord> HistoryStore::merge(
        const std::vector<std::string>& candidates)
{
	for (const auto& candidate : candidates) {
		const auto path = Util::canonical_path(candidate);
		if (!find_mutable(path)) {
			records_.push_back({.path = path, .display_name = name_for(path)});
			dirty_ = true;
		}
	}
	return ranked();
}

void HistoryStore::record_open(const std::string_view path,
                               const TimePoint now,
                               const std::optional<int64_t> book_count)
{
	const auto canonical = Util::canonical_path(path);

	auto* record = find_mutable(canonical);
	if (!record) {
		record = &records_.emplace_back(
		        LibraryRecord{.path = canonical, .display_name = name_for(canonical)});
	}

	++record->open_count;
	record->last_opened = now;
	if (book_count) {
		record->book_count_hint = book_count;
	}
	dirty_ = true;
}

void HistoryStore::set_book_count(const std::string_view path, const int64_t book_count)
{
	auto* record = find_mutable(Util::canonical_path(path));
	if (!record || record->book_count_hint == book_count) {
		return;
	}
	record->book_count_hint = book_count;
	dirty_                  = true;
}

[[nodiscard]] std::vector<LibraryRecord> HistoryStore::ranked() const
{
	auto result = records_;
	std::ranges::sort(result, &HistoryStore::ranks_before);
	return result;
}

[[nodiscard]] const LibraryRecord* HistoryStore::find(const std::string_view path) const
{
	const auto canonical = Util::canonical_path(path);
	const auto it = std::ranges::find(records_, canonical, &LibraryRecord::path);
	return (it != records_.end()) ? &*it : nullptr;
}

[[nodiscard]] size_t HistoryStore::size() const
{
	return records_.size();
}

[[nodiscard]] bool HistoryStore::dirty() const
{
	return dirty_;
}

[[nodiscard]] bool HistoryStore::persistent() const
{
	return file_.has_value();
}
