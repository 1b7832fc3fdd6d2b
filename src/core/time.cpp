#include <stencil/core/time.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <limits>
#include <string>

namespace stencil {

namespace {

constexpr std::int64_t kNanosPerSecond = 1'000'000'000;
constexpr std::int64_t kSecondsPerDay = 86'400;
constexpr std::int64_t kMaxSeconds = std::numeric_limits<std::int64_t>::max() / kNanosPerSecond;
// Lowest whole day, so floor<days> of any accepted instant stays representable.
constexpr std::int64_t kMinSeconds = -(kMaxSeconds / kSecondsPerDay) * kSecondsPerDay;

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto parse_digits(std::string_view text, std::size_t min_len, std::size_t max_len)
    -> std::optional<unsigned> {
    if (text.size() < min_len || text.size() > max_len) {
        return std::nullopt;
    }
    unsigned value = 0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto parse_calendar_part(std::string_view text) -> std::optional<Date> {
    auto sep_pos = text.find_first_not_of("0123456789");
    if (sep_pos == std::string_view::npos) {
        return std::nullopt;
    }
    const char sep = text[sep_pos];
    if (sep != '-' && sep != '/' && sep != '_' && sep != '.') {
        return std::nullopt;
    }
    auto second_sep = text.find(sep, sep_pos + 1);
    if (second_sep == std::string_view::npos) {
        return std::nullopt;
    }
    auto first = text.substr(0, sep_pos);
    auto middle = text.substr(sep_pos + 1, second_sep - sep_pos - 1);
    auto last = text.substr(second_sep + 1);

    std::optional<unsigned> year;
    std::optional<unsigned> month = parse_digits(middle, 1, 2);
    std::optional<unsigned> day;
    if (first.size() == 4) {
        year = parse_digits(first, 4, 4);
        day = parse_digits(last, 1, 2);
    } else {
        day = parse_digits(first, 1, 2);
        year = parse_digits(last, 4, 4);
    }
    if (!year || !month || !day) {
        return std::nullopt;
    }
    return make_date(static_cast<int>(*year), *month, *day);
}

struct TimeOfDay {
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
};

auto parse_time_part(std::string_view text) -> std::optional<TimeOfDay> {
    auto first_colon = text.find(':');
    if (first_colon == std::string_view::npos) {
        return std::nullopt;
    }
    auto hour = parse_digits(text.substr(0, first_colon), 1, 2);
    auto rest = text.substr(first_colon + 1);
    std::optional<unsigned> minute;
    std::optional<unsigned> second = 0U;
    if (auto second_colon = rest.find(':'); second_colon != std::string_view::npos) {
        minute = parse_digits(rest.substr(0, second_colon), 2, 2);
        auto seconds_text = rest.substr(second_colon + 1);
        // Fractional seconds are accepted and dropped.
        if (auto dot = seconds_text.find('.'); dot != std::string_view::npos) {
            if (!parse_digits(seconds_text.substr(dot + 1), 1, 9)) {
                return std::nullopt;
            }
            seconds_text = seconds_text.substr(0, dot);
        }
        second = parse_digits(seconds_text, 2, 2);
    } else {
        minute = parse_digits(rest, 2, 2);
    }
    if (!hour || !minute || !second || *hour > 23 || *minute > 59 || *second > 59) {
        return std::nullopt;
    }
    return TimeOfDay{.hour = *hour, .minute = *minute, .second = *second};
}

}  // namespace

auto make_date(int year, unsigned month, unsigned day) -> std::optional<Date> {
    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                       std::chrono::day{day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return Date{static_cast<std::int32_t>(sys_days{ymd}.time_since_epoch().count())};
}

auto make_timestamp(Date date, unsigned hour, unsigned minute, unsigned second)
    -> std::optional<Timestamp> {
    const auto seconds = static_cast<std::int64_t>(date.days) * kSecondsPerDay +
                         static_cast<std::int64_t>(hour) * 3600 +
                         static_cast<std::int64_t>(minute) * 60 + static_cast<std::int64_t>(second);
    if (seconds < kMinSeconds || seconds > kMaxSeconds) {
        return std::nullopt;
    }
    return Timestamp{seconds * kNanosPerSecond};
}

namespace {

auto civil_from_day(std::chrono::sys_days day_point) -> CivilTime {
    using namespace std::chrono;
    year_month_day ymd{day_point};
    auto jan1 = sys_days{ymd.year() / January / 1};
    return CivilTime{
        .year = static_cast<int>(ymd.year()),
        .month = static_cast<unsigned>(ymd.month()),
        .day = static_cast<unsigned>(ymd.day()),
        .weekday = weekday{day_point}.c_encoding(),
        .yearday = static_cast<unsigned>((day_point - jan1).count()),
    };
}

}  // namespace

auto to_civil(Date date) -> CivilTime {
    return civil_from_day(std::chrono::sys_days{std::chrono::days{date.days}});
}

auto to_civil(Timestamp ts) -> CivilTime {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day_point = floor<days>(tp);
    hh_mm_ss<nanoseconds> hms{tp - day_point};
    auto civil = civil_from_day(day_point);
    civil.hour = static_cast<unsigned>(hms.hours().count());
    civil.minute = static_cast<unsigned>(hms.minutes().count());
    civil.second = static_cast<unsigned>(hms.seconds().count());
    return civil;
}

auto to_tm(const CivilTime& civil) -> std::tm {
    std::tm tm{};
    tm.tm_year = civil.year - 1900;
    tm.tm_mon = static_cast<int>(civil.month) - 1;
    tm.tm_mday = static_cast<int>(civil.day);
    tm.tm_hour = static_cast<int>(civil.hour);
    tm.tm_min = static_cast<int>(civil.minute);
    tm.tm_sec = static_cast<int>(civil.second);
    tm.tm_wday = static_cast<int>(civil.weekday);
    tm.tm_yday = static_cast<int>(civil.yearday);
    tm.tm_isdst = 0;
    return tm;
}

auto format_date(Date date) -> std::string {
    auto civil = to_civil(date);
    return fmt::format("{:04}-{:02}-{:02}", civil.year, civil.month, civil.day);
}

auto format_timestamp(Timestamp ts) -> std::string {
    auto civil = to_civil(ts);
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}", civil.year, civil.month, civil.day,
                       civil.hour, civil.minute, civil.second);
}

auto parse_date_text(std::string_view text) -> std::optional<std::variant<Date, Timestamp>> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    auto split = text.find_first_of(" T");
    auto date = parse_calendar_part(text.substr(0, split));
    if (!date) {
        return std::nullopt;
    }
    if (split == std::string_view::npos) {
        return std::variant<Date, Timestamp>{*date};
    }
    auto time = parse_time_part(trim(text.substr(split + 1)));
    if (!time) {
        return std::nullopt;
    }
    auto ts = make_timestamp(*date, time->hour, time->minute, time->second);
    if (!ts) {
        return std::nullopt;
    }
    return std::variant<Date, Timestamp>{*ts};
}

}  // namespace stencil
