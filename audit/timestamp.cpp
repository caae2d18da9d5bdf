#include "timestamp.hpp"
#include "errors.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace auditstore {

namespace {

constexpr std::int64_t kMicrosPerSecond = 1000000;
constexpr std::int64_t kMicrosPerDay = 86400 * kMicrosPerSecond;

// 0001-01-01T00:00:00Z and 9999-12-31T23:59:59.999999Z.
constexpr std::int64_t kEarliestMicros = -62135596800LL * kMicrosPerSecond;
constexpr std::int64_t kLatestMicros = 253402300800LL * kMicrosPerSecond - 1;

// Floor division so that instants before the epoch keep a positive fraction.
void split_micros(std::int64_t micros, std::int64_t &secs, std::int64_t &frac) {
    secs = micros / kMicrosPerSecond;
    frac = micros % kMicrosPerSecond;
    if (frac < 0) {
        frac += kMicrosPerSecond;
        --secs;
    }
}

std::tm to_utc_tm(std::int64_t secs) {
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    if (::gmtime_r(&t, &tm) == nullptr) {
        throw ValidationError("timestamp out of range");
    }
    return tm;
}

class Cursor {
public:
    explicit Cursor(const std::string &text) : text_(text) {}

    bool done() const { return pos_ >= text_.size(); }
    char peek() const { return done() ? '\0' : text_[pos_]; }

    bool accept(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    void expect(char c) {
        if (!accept(c)) fail();
    }

    int digits(std::size_t n) {
        int value = 0;
        for (std::size_t i = 0; i < n; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(peek()))) fail();
            value = value * 10 + (text_[pos_++] - '0');
        }
        return value;
    }

    [[noreturn]] void fail() const {
        throw ValidationError("invalid ISO-8601 timestamp: " + text_);
    }

private:
    const std::string &text_;
    std::size_t pos_ = 0;
};

} // namespace

Timestamp now_utc() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
}

std::int64_t to_epoch_micros(Timestamp ts) {
    return ts.time_since_epoch().count();
}

Timestamp from_epoch_micros(std::int64_t micros) {
    return Timestamp(std::chrono::microseconds(micros));
}

double to_epoch_seconds(Timestamp ts) {
    return static_cast<double>(to_epoch_micros(ts)) / 1000000.0;
}

std::optional<Timestamp> days_before(Timestamp ts, std::int64_t days) {
    const std::int64_t micros = to_epoch_micros(ts);
    if (micros < kEarliestMicros || micros > kLatestMicros) {
        return std::nullopt;
    }
    // Both quotients round toward zero, which keeps the bounds inclusive.
    const std::int64_t max_days = (micros - kEarliestMicros) / kMicrosPerDay;
    const std::int64_t min_days = (micros - kLatestMicros) / kMicrosPerDay;
    if (days > max_days || days < min_days) {
        return std::nullopt;
    }
    return from_epoch_micros(micros - days * kMicrosPerDay);
}

std::string to_iso8601(Timestamp ts) {
    std::int64_t secs = 0;
    std::int64_t frac = 0;
    split_micros(to_epoch_micros(ts), secs, frac);
    const std::tm tm = to_utc_tm(secs);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(frac));
    return buf;
}

std::string to_compact_stamp(Timestamp ts) {
    std::int64_t secs = 0;
    std::int64_t frac = 0;
    split_micros(to_epoch_micros(ts), secs, frac);
    const std::tm tm = to_utc_tm(secs);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

Timestamp parse_iso8601(const std::string &text) {
    Cursor in(text);

    std::tm tm{};
    tm.tm_year = in.digits(4) - 1900;
    in.expect('-');
    tm.tm_mon = in.digits(2) - 1;
    in.expect('-');
    tm.tm_mday = in.digits(2);
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31) {
        in.fail();
    }

    std::int64_t micros = 0;
    std::int64_t offset_secs = 0;

    if (in.accept('T') || in.accept(' ')) {
        tm.tm_hour = in.digits(2);
        in.expect(':');
        tm.tm_min = in.digits(2);
        if (in.accept(':')) {
            tm.tm_sec = in.digits(2);
            if (in.accept('.')) {
                std::int64_t scale = 100000;
                std::size_t count = 0;
                while (std::isdigit(static_cast<unsigned char>(in.peek()))) {
                    const int d = in.digits(1);
                    if (count < 6) {
                        micros += d * scale;
                        scale /= 10;
                    }
                    ++count;
                }
                if (count == 0) in.fail();
            }
        }
        if (tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
            in.fail();
        }

        if (in.accept('Z') || in.accept('z')) {
            // UTC
        } else if (in.peek() == '+' || in.peek() == '-') {
            int sign = 1;
            if (in.accept('-')) {
                sign = -1;
            } else {
                in.expect('+');
            }
            const int hh = in.digits(2);
            in.accept(':');
            const int mm = in.digits(2);
            if (hh > 23 || mm > 59) in.fail();
            offset_secs = sign * (hh * 3600 + mm * 60);
        }
    }

    if (!in.done()) in.fail();

    const std::int64_t secs = static_cast<std::int64_t>(::timegm(&tm)) - offset_secs;
    return from_epoch_micros(secs * kMicrosPerSecond + micros);
}

} // namespace auditstore
