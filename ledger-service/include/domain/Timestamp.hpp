#pragma once

#include <string>
#include <chrono>
#include <cstdio>
#include <cstdint>
#include <ctime>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Временная метка UTC с точностью до миллисекунд
 *
 * Сериализуется в ISO 8601: "2025-12-16T10:30:00.123Z".
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromEpochMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    int64_t toEpochMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    /**
     * @brief Создать Timestamp из ISO 8601 строки
     * @param isoString "2025-12-16T10:30:00Z", "2025-12-16T10:30:00.250Z"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        int millis = 0;
        int consumed = 0;

        int matched = std::sscanf(isoString.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                                  &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                                  &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed);
        if (matched != 6) {
            throw std::invalid_argument("Invalid timestamp: " + isoString);
        }

        // Дробная часть секунд: берём первые три цифры
        size_t pos = static_cast<size_t>(consumed);
        if (pos < isoString.size() && isoString[pos] == '.') {
            int digits = 0;
            ++pos;
            while (pos < isoString.size() && isoString[pos] >= '0' && isoString[pos] <= '9') {
                if (digits < 3) {
                    millis = millis * 10 + (isoString[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            while (digits++ < 3) millis *= 10;
        }

        tm.tm_year -= 1900;
        tm.tm_mon -= 1;
        std::time_t seconds = timegm(&tm);

        return Timestamp(std::chrono::system_clock::from_time_t(seconds) +
                         std::chrono::milliseconds(millis));
    }

    /**
     * @brief Начало календарного дня UTC
     * @param date Строка "YYYY-MM-DD"
     * @throws std::invalid_argument если дата некорректна
     */
    static Timestamp fromDate(const std::string& date) {
        std::tm tm = {};
        int consumed = 0;
        if (date.size() != 10 ||
            std::sscanf(date.c_str(), "%4d-%2d-%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday, &consumed) != 3 ||
            consumed != 10) {
            throw std::invalid_argument("Invalid date, expected YYYY-MM-DD: " + date);
        }
        if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31) {
            throw std::invalid_argument("Invalid date: " + date);
        }

        int year = tm.tm_year;
        int month = tm.tm_mon;
        int day = tm.tm_mday;

        tm.tm_year -= 1900;
        tm.tm_mon -= 1;
        std::time_t seconds = timegm(&tm);

        // timegm нормализует 2025-02-30 в март, такие даты отвергаем
        std::tm check = {};
        gmtime_r(&seconds, &check);
        if (check.tm_year + 1900 != year || check.tm_mon + 1 != month || check.tm_mday != day) {
            throw std::invalid_argument("Invalid date: " + date);
        }

        return Timestamp(std::chrono::system_clock::from_time_t(seconds));
    }

    /**
     * @brief Последняя миллисекунда того же дня (23:59:59.999)
     */
    Timestamp endOfDay() const {
        auto seconds = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&seconds, &tm);
        tm.tm_hour = 23;
        tm.tm_min = 59;
        tm.tm_sec = 59;
        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)) +
                         std::chrono::milliseconds(999));
    }

    std::string toString() const {
        auto seconds = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&seconds, &tm);

        int64_t millis = toEpochMillis() % 1000;
        if (millis < 0) millis += 1000;

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
        return buffer;
    }

    /// "YYYY-MM-DD"
    std::string toDateString() const {
        return toString().substr(0, 10);
    }

    Timestamp addMillis(int64_t millis) const {
        return Timestamp(value + std::chrono::milliseconds(millis));
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace ledger::domain
