#include "utilities.h"

#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <iterator>
#include <ranges>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <pwd.h>
#include <sys/ioctl.h>
#include <unistd.h>
#endif

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

[[nodiscard]] std::string to_lower(const std::string_view s)
{
	std::string result = {};
	result.reserve(s.size());
	std::ranges::transform(s, std::back_inserter(result), [](const unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return result;
}

[[nodiscard]] std::string fold_case(const std::string_view s)
{
	UErrorCode status = U_ZERO_ERROR;
	const auto* nfkc = icu::Normalizer2::getNFKCCasefoldInstance(status);
	if (U_FAILURE(status) || !nfkc) {
		return to_lower(s);
	}

	const auto source = icu::UnicodeString::fromUTF8(
	        icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));
	const auto folded = nfkc->normalize(source, status);
	if (U_FAILURE(status)) {
		return to_lower(s);
	}

	std::string result = {};
	folded.toUTF8String(result);
	return result;
}

[[nodiscard]] std::vector<std::string> tokenize(const std::string_view text)
{
	std::vector<std::string> words = {};
	std::istringstream ss{std::string(text)};

	for (std::string word = {}; ss >> word;) {
		words.emplace_back(std::move(word));
	}
	return words;
}

bool pop_utf8(std::string& s)
{
	if (s.empty()) {
		return false;
	}
	// Drop continuation bytes, then the lead byte
	while (s.size() > 1 &&
	       (static_cast<unsigned char>(s.back()) & 0xC0) == 0x80) {
		s.pop_back();
	}
	s.pop_back();
	return true;
}

namespace {

[[nodiscard]] size_t column_width(const UChar32 c)
{
	if (c < 0x20 || (c >= 0x7F && c < 0xA0)) {
		return 0;
	}
	if (u_getCombiningClass(c) != 0 || u_charType(c) == U_NON_SPACING_MARK) {
		return 0;
	}
	const auto ea = u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH);
	return (ea == U_EA_WIDE || ea == U_EA_FULLWIDTH) ? 2 : 1;
}

} // namespace

[[nodiscard]] size_t display_width(const std::string_view text)
{
	size_t width       = 0;
	const auto* bytes  = reinterpret_cast<const uint8_t*>(text.data());
	const auto length  = static_cast<int32_t>(text.size());
	int32_t i          = 0;

	while (i < length) {
		UChar32 c = 0;
		U8_NEXT(bytes, i, length, c);
		width += (c < 0) ? 1 : column_width(c);
	}
	return width;
}

[[nodiscard]] std::string truncate(const std::string_view text, const size_t max_columns)
{
	if (display_width(text) <= max_columns) {
		return std::string(text);
	}
	if (max_columns <= 3) {
		return std::string(max_columns, '.');
	}

	const size_t budget = max_columns - 3;
	const auto* bytes   = reinterpret_cast<const uint8_t*>(text.data());
	const auto length   = static_cast<int32_t>(text.size());
	int32_t i           = 0;
	size_t used         = 0;

	while (i < length) {
		const int32_t start = i;
		UChar32 c           = 0;
		U8_NEXT(bytes, i, length, c);
		const size_t w = (c < 0) ? 1 : column_width(c);
		if (used + w > budget) {
			i = start;
			break;
		}
		used += w;
	}

	std::string result(text.substr(0, static_cast<size_t>(i)));
	result += "...";
	return result;
}

[[nodiscard]] std::string join(const std::vector<std::string>& parts,
                               const std::string_view separator)
{
	std::string result = {};
	for (const auto& part : parts) {
		if (!result.empty()) {
			result += separator;
		}
		result += part;
	}
	return result;
}

[[nodiscard]] std::string format_iso8601(const TimePoint tp)
{
	using namespace std::chrono;

	const auto secs  = time_point_cast<seconds>(tp);
	const auto day   = floor<days>(secs);
	const year_month_day ymd{day};
	const hh_mm_ss hms{secs - day};

	char buf[32] = {};
	std::snprintf(buf,
	              sizeof(buf),
	              "%04d-%02u-%02uT%02d:%02d:%02dZ",
	              static_cast<int>(ymd.year()),
	              static_cast<unsigned>(ymd.month()),
	              static_cast<unsigned>(ymd.day()),
	              static_cast<int>(hms.hours().count()),
	              static_cast<int>(hms.minutes().count()),
	              static_cast<int>(hms.seconds().count()));
	return buf;
}

[[nodiscard]] std::optional<TimePoint> parse_iso8601(const std::string_view text)
{
	using namespace std::chrono;

	const std::string s{text};
	int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
	int consumed = 0;

	if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &consumed) != 3) {
		return std::nullopt;
	}

	size_t pos = static_cast<size_t>(consumed);
	if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
		int tconsumed = 0;
		if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d:%2d%n", &h, &mi, &sec, &tconsumed) != 3) {
			return std::nullopt;
		}
		pos += 1 + static_cast<size_t>(tconsumed);
	}

	const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
	                         day{static_cast<unsigned>(d)}};
	if (!ymd.ok() || h > 23 || mi > 59 || sec > 60) {
		return std::nullopt;
	}

	// Fractional seconds are dropped
	if (pos < s.size() && s[pos] == '.') {
		++pos;
		while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
			++pos;
		}
	}

	auto tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{sec};

	if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
		const int sign = (s[pos] == '+') ? 1 : -1;
		int oh = 0, om = 0;
		if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2 &&
		    std::sscanf(s.c_str() + pos + 1, "%2d%2d", &oh, &om) < 1) {
			return std::nullopt;
		}
		tp -= sign * (hours{oh} + minutes{om});
	}

	return time_point_cast<system_clock::duration>(tp);
}

[[nodiscard]] std::string format_local(const TimePoint tp)
{
	const std::time_t t = std::chrono::system_clock::to_time_t(tp);
	std::tm local       = {};
#ifdef _WIN32
	localtime_s(&local, &t);
#else
	localtime_r(&t, &local);
#endif
	char buf[32] = {};
	std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &local);
	return buf;
}

[[nodiscard]] std::optional<std::filesystem::path> home_directory()
{
#ifdef _WIN32
	if (const char* profile = std::getenv("USERPROFILE"); profile && *profile) {
		return std::filesystem::path(profile);
	}
#else
	if (const char* home = std::getenv("HOME"); home && *home) {
		return std::filesystem::path(home);
	}
	if (const auto* pw = getpwuid(getuid()); pw && pw->pw_dir) {
		return std::filesystem::path(pw->pw_dir);
	}
#endif
	return std::nullopt;
}

[[nodiscard]] std::optional<std::filesystem::path> config_directory()
{
#ifdef _WIN32
	if (const char* appdata = std::getenv("APPDATA"); appdata && *appdata) {
		return std::filesystem::path(appdata);
	}
#else
	if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
		const std::filesystem::path dir(xdg);
		if (dir.is_absolute()) {
			return dir;
		}
	}
#endif
	if (const auto home = home_directory()) {
		return *home / ".config";
	}
	return std::nullopt;
}

[[nodiscard]] std::string canonical_path(const std::filesystem::path& p)
{
	std::error_code ec = {};
	auto absolute      = std::filesystem::absolute(p, ec);
	if (ec) {
		absolute = p;
	}

	auto canonical = std::filesystem::weakly_canonical(absolute, ec);
	if (ec) {
		canonical = absolute.lexically_normal();
	}

	// "/a/b/" and "/a/b" are the same library
	if (!canonical.has_filename() && canonical.has_relative_path()) {
		canonical = canonical.parent_path();
	}
	return canonical.string();
}

[[nodiscard]] size_t terminal_height()
{
#ifdef _WIN32
	CONSOLE_SCREEN_BUFFER_INFO csbi = {};
	GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi);
	return csbi.srWindow.Bottom - csbi.srWindow.Top + 1;
#else
	winsize w = {};
	ioctl(STDOUT_FILENO, TIOCGWINSZ, &w);
	return w.ws_row;
#endif
}

[[nodiscard]] size_t terminal_width()
{
#ifdef _WIN32
	CONSOLE_SCREEN_BUFFER_INFO csbi = {};
	GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi);
	return csbi.srWindow.Right - csbi.srWindow.Left + 1;
#else
	winsize w = {};
	ioctl(STDOUT_FILENO, TIOCGWINSZ, &w);
	return w.ws_col;
#endif
}

void clear_screen()
{
#ifdef _WIN32
	std::system("cls");
#else
	std::cout << "\033[H\033[J" << std::flush;
#endif
}

} // namespace Util
