#include "util/timestamp.hpp"
#include "util/errors.hpp"

#include <cctype>
#include <cstdint>
#include <fmt/core.h>

using namespace std::chrono;

namespace {

struct Cursor {
    std::string_view s;
    size_t pos = 0;

    [[nodiscard]] bool done() const { return pos >= s.size(); }
    [[nodiscard]] char peek() const { return done() ? '\0' : s[pos]; }

    int digits(const size_t count, const std::string_view what) {
        if (pos + count > s.size()) throw mds::TimestampError(fmt::format("Truncated timestamp '{}' (expected {})", s, what));
        int v = 0;
        for (size_t i = 0; i < count; ++i) {
            const auto c = static_cast<unsigned char>(s[pos + i]);
            if (!std::isdigit(c)) throw mds::TimestampError(fmt::format("Invalid {} in timestamp '{}'", what, s));
            v = v * 10 + (c - '0');
        }
        pos += count;
        return v;
    }

    void expect(const char c) {
        if (peek() != c) throw mds::TimestampError(fmt::format("Malformed timestamp '{}': expected '{}' at offset {}", s, c, pos));
        ++pos;
    }
};

}

namespace mds::util {

Timestamp now() { return floor<microseconds>(system_clock::now()); }

Timestamp fromTimespec(const timespec& ts) {
    return Timestamp{seconds{ts.tv_sec}} + duration_cast<microseconds>(nanoseconds{ts.tv_nsec});
}

std::string timestampToString(const Timestamp& ts) {
    const auto day = floor<days>(ts);
    const year_month_day ymd{day};
    const hh_mm_ss hms{ts - day};

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count(),
                       hms.subseconds().count());
}

Timestamp parseTimestamp(const std::string_view iso) {
    Cursor c{iso};

    const int y = c.digits(4, "year");
    c.expect('-');
    const int mo = c.digits(2, "month");
    c.expect('-');
    const int d = c.digits(2, "day");

    if (c.peek() != 'T' && c.peek() != 't' && c.peek() != ' ')
        throw TimestampError(fmt::format("Malformed timestamp '{}': missing time part", iso));
    ++c.pos;

    const int h = c.digits(2, "hour");
    c.expect(':');
    const int mi = c.digits(2, "minute");
    c.expect(':');
    const int s = c.digits(2, "second");

    microseconds frac{0};
    if (c.peek() == '.' || c.peek() == ',') {
        ++c.pos;
        int64_t value = 0;
        int n = 0;
        while (!c.done() && std::isdigit(static_cast<unsigned char>(c.peek()))) {
            if (n < 6) value = value * 10 + (c.peek() - '0');
            ++n;
            ++c.pos;
        }
        if (n == 0 || n > 9) throw TimestampError(fmt::format("Invalid fractional seconds in timestamp '{}'", iso));
        for (int i = n; i < 6; ++i) value *= 10;
        frac = microseconds{value};
    }

    if (c.done())
        throw TimestampError(fmt::format("Timestamp '{}' has no zone designator; refusing to compare a naive time", iso));

    minutes offset{0};
    if (c.peek() == 'Z' || c.peek() == 'z') {
        ++c.pos;
    } else if (c.peek() == '+' || c.peek() == '-') {
        const bool negative = c.peek() == '-';
        ++c.pos;
        const int oh = c.digits(2, "offset hours");
        if (c.peek() == ':') ++c.pos;
        const int om = c.digits(2, "offset minutes");
        if (oh > 23 || om > 59) throw TimestampError(fmt::format("Invalid zone offset in timestamp '{}'", iso));
        offset = hours{oh} + minutes{om};
        if (negative) offset = -offset;
    } else {
        throw TimestampError(fmt::format("Unrecognized zone designator in timestamp '{}'", iso));
    }

    if (!c.done()) throw TimestampError(fmt::format("Trailing characters in timestamp '{}'", iso));

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 59)
        throw TimestampError(fmt::format("Out of range field in timestamp '{}'", iso));

    const auto local = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s};
    return Timestamp{local - offset} + frac;
}

std::string toString(const std::optional<Timestamp>& ts, const std::string_view ifEmpty) {
    return ts ? timestampToString(*ts) : std::string(ifEmpty);
}

} // namespace mds::util
