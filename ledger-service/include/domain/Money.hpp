#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Денежная сумма с фиксированной точкой
 *
 * Хранит значение в минорных единицах (центах), две цифры после запятой,
 * как DECIMAL(15, 2) в банковской схеме. Все операции целочисленные.
 *
 * Модуль суммы не больше MAX_CENTS: сумма двух допустимых значений
 * всегда помещается в int64_t.
 */
class Money {
public:
    /// 9 999 999 999 999.99
    static constexpr int64_t MAX_CENTS = 999'999'999'999'999;

    int64_t cents = 0;

    Money() = default;

    explicit Money(int64_t minorUnits) : cents(minorUnits) {}

    /**
     * @throws std::invalid_argument если значение вне DECIMAL(15, 2)
     */
    static Money fromCents(int64_t minorUnits) {
        Money money(minorUnits);
        if (!money.inRange()) {
            throw std::invalid_argument("Amount out of range: " + std::to_string(minorUnits) + " cents");
        }
        return money;
    }

    /**
     * @brief Распарсить десятичную строку ("100", "70.5", "-12.34")
     * @throws std::invalid_argument если строка не число, больше двух знаков после точки
     *         или значение вне DECIMAL(15, 2)
     */
    static Money fromString(const std::string& str) {
        if (str.empty()) {
            throw std::invalid_argument("Empty amount");
        }

        size_t pos = 0;
        bool negative = false;
        if (str[0] == '-' || str[0] == '+') {
            negative = (str[0] == '-');
            pos = 1;
        }

        int64_t units = 0;
        int64_t fraction = 0;
        int fractionDigits = 0;
        bool seenDot = false;
        bool seenDigit = false;

        for (; pos < str.size(); ++pos) {
            char c = str[pos];
            if (c == '.') {
                if (seenDot) throw std::invalid_argument("Invalid amount: " + str);
                seenDot = true;
                continue;
            }
            if (c < '0' || c > '9') {
                throw std::invalid_argument("Invalid amount: " + str);
            }
            seenDigit = true;
            if (seenDot) {
                if (++fractionDigits > 2) {
                    throw std::invalid_argument("Amount has more than 2 decimals: " + str);
                }
                fraction = fraction * 10 + (c - '0');
            } else {
                units = units * 10 + (c - '0');
                if (units > MAX_CENTS / 100) {
                    throw std::invalid_argument("Amount out of range: " + str);
                }
            }
        }

        if (!seenDigit) {
            throw std::invalid_argument("Invalid amount: " + str);
        }
        if (fractionDigits == 1) {
            fraction *= 10;
        }

        int64_t total = units * 100 + fraction;
        return Money(negative ? -total : total);
    }

    /// "1234.50", "-0.05"
    std::string toString() const {
        uint64_t absolute = cents < 0 ? 0 - static_cast<uint64_t>(cents) : static_cast<uint64_t>(cents);
        std::string fraction = std::to_string(absolute % 100);
        if (fraction.size() < 2) fraction = "0" + fraction;
        return (cents < 0 ? "-" : "") + std::to_string(absolute / 100) + "." + fraction;
    }

    bool isPositive() const { return cents > 0; }
    bool isZero() const { return cents == 0; }
    bool isNegative() const { return cents < 0; }
    bool inRange() const { return cents >= -MAX_CENTS && cents <= MAX_CENTS; }

    Money operator+(const Money& other) const { return Money(cents + other.cents); }
    Money operator-(const Money& other) const { return Money(cents - other.cents); }
    Money operator-() const { return Money(-cents); }

    Money& operator+=(const Money& other) {
        cents += other.cents;
        return *this;
    }

    Money& operator-=(const Money& other) {
        cents -= other.cents;
        return *this;
    }

    bool operator==(const Money& other) const { return cents == other.cents; }
    bool operator!=(const Money& other) const { return cents != other.cents; }
    bool operator<(const Money& other) const { return cents < other.cents; }
    bool operator>(const Money& other) const { return cents > other.cents; }
    bool operator<=(const Money& other) const { return cents <= other.cents; }
    bool operator>=(const Money& other) const { return cents >= other.cents; }
};

} // namespace ledger::domain
