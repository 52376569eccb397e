// src/reconcile/timestamp_normalizer.cpp

#include "portfolio_recon/reconcile/timestamp_normalizer.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include "portfolio_recon/core/time_utils.hpp"
#include "portfolio_recon/reconcile/field_extractor.hpp"

namespace portfolio_recon {

namespace {

// Largest magnitude that still fits in int64 after conversion to milliseconds
constexpr double kMaxMillis = 9.0e18;

/**
 * @brief Cursor over ISO-8601 text
 */
class IsoCursor {
public:
    explicit IsoCursor(const std::string& text) : text_(text), pos_(0) {}

    bool at_end() const {
        return pos_ >= text_.size();
    }

    char peek() const {
        return at_end() ? '\0' : text_[pos_];
    }

    bool consume(char expected) {
        if (peek() != expected) {
            return false;
        }
        ++pos_;
        return true;
    }

    // Reads exactly `width` digits
    bool digits(size_t width, int& out) {
        if (pos_ + width > text_.size()) {
            return false;
        }
        int value = 0;
        for (size_t i = 0; i < width; ++i) {
            char c = text_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
            value = value * 10 + (c - '0');
        }
        pos_ += width;
        out = value;
        return true;
    }

    // Reads one or more digits of a fraction, keeping millisecond precision
    bool fraction_millis(int& out) {
        size_t start = pos_;
        int millis = 0;
        int kept = 0;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            if (kept < 3) {
                millis = millis * 10 + (text_[pos_] - '0');
                ++kept;
            }
            ++pos_;
        }
        if (pos_ == start) {
            return false;
        }
        while (kept < 3) {
            millis *= 10;
            ++kept;
        }
        out = millis;
        return true;
    }

private:
    const std::string& text_;
    size_t pos_;
};

bool parse_offset_minutes(IsoCursor& cursor, int& offset_minutes) {
    offset_minutes = 0;
    if (cursor.at_end()) {
        return true;
    }
    if (cursor.consume('Z') || cursor.consume('z')) {
        return cursor.at_end();
    }

    int sign = 0;
    if (cursor.consume('+')) {
        sign = 1;
    } else if (cursor.consume('-')) {
        sign = -1;
    } else {
        return false;
    }

    int hours = 0;
    int minutes = 0;
    if (!cursor.digits(2, hours) || hours > 23) {
        return false;
    }
    if (!cursor.at_end()) {
        cursor.consume(':');
        if (!cursor.digits(2, minutes) || minutes > 59) {
            return false;
        }
    }
    offset_minutes = sign * (hours * 60 + minutes);
    return cursor.at_end();
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

}  // namespace

std::optional<TimestampMs> TimestampNormalizer::normalize(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        uint64_t raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return from_integer(static_cast<int64_t>(raw));
    }
    if (value.is_number_integer()) {
        return from_integer(value.get<int64_t>());
    }
    if (value.is_number_float()) {
        return from_number(value.get<double>());
    }
    if (value.is_string()) {
        return parse_iso8601(value.get<std::string>());
    }
    return std::nullopt;
}

std::optional<TimestampMs> TimestampNormalizer::from_integer(int64_t value) {
    if (value > kMillisecondThreshold || value < -kMillisecondThreshold) {
        return value;
    }
    return value * 1000;
}

std::optional<TimestampMs> TimestampNormalizer::from_number(double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }

    double millis = std::fabs(value) > static_cast<double>(kMillisecondThreshold)
                        ? value
                        : value * 1000.0;
    if (std::fabs(millis) >= kMaxMillis) {
        return std::nullopt;
    }
    return static_cast<TimestampMs>(std::llround(millis));
}

std::optional<TimestampMs> TimestampNormalizer::parse_iso8601(const std::string& raw) {
    const std::string text = trim(raw);
    IsoCursor cursor(text);

    int year = 0;
    int month = 0;
    int day = 0;
    if (!cursor.digits(4, year) || !cursor.consume('-') || !cursor.digits(2, month) ||
        !cursor.consume('-') || !cursor.digits(2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > core::days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    int offset_minutes = 0;

    if (!cursor.at_end()) {
        if (!(cursor.consume('T') || cursor.consume('t') || cursor.consume(' '))) {
            return std::nullopt;
        }
        if (!cursor.digits(2, hour) || !cursor.consume(':') || !cursor.digits(2, minute)) {
            return std::nullopt;
        }
        if (cursor.consume(':')) {
            if (!cursor.digits(2, second)) {
                return std::nullopt;
            }
            if (cursor.consume('.') || cursor.consume(',')) {
                if (!cursor.fraction_millis(millis)) {
                    return std::nullopt;
                }
            }
        }
        if (hour > 23 || minute > 59 || second > 59) {
            return std::nullopt;
        }
        if (!parse_offset_minutes(cursor, offset_minutes)) {
            return std::nullopt;
        }
    }

    int64_t days = core::days_from_civil(year, static_cast<unsigned>(month),
                                         static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second -
                      static_cast<int64_t>(offset_minutes) * 60;
    return seconds * 1000 + millis;
}

std::optional<TimestampMs> TimestampNormalizer::resolve(
    const Record& record, const std::vector<std::string>& candidates) {
    return FieldExtractor::first_match<TimestampMs>(record, candidates,
                                                    &TimestampNormalizer::normalize);
}

}  // namespace portfolio_recon
