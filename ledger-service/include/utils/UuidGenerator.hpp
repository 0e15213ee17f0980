#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace ledger::utils {

/**
 * @brief Случайные идентификаторы: UUID v4 для проводок и событий, короткие ID отчётов
 *
 * Источник случайности свой у каждого потока.
 */
class UuidGenerator {
public:
    /// xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y из [8, 9, a, b]
    static std::string generate() {
        std::array<uint8_t, 16> bytes{};
        fill(bytes.data(), bytes.size());
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

        std::string uuid;
        uuid.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) uuid += '-';
            appendHex(uuid, bytes[i]);
        }
        return uuid;
    }

    /// "stmt-1f0c9a7e"
    static std::string generateWithPrefix(const std::string& prefix) {
        std::array<uint8_t, 4> bytes{};
        fill(bytes.data(), bytes.size());

        std::string id = prefix + "-";
        for (auto b : bytes) appendHex(id, b);
        return id;
    }

private:
    static void fill(uint8_t* out, size_t n) {
        thread_local std::mt19937_64 engine{std::random_device{}()};
        for (size_t i = 0; i < n; i += 8) {
            uint64_t word = engine();
            for (size_t j = 0; j < 8 && i + j < n; ++j) {
                out[i + j] = static_cast<uint8_t>(word >> (8 * j));
            }
        }
    }

    static void appendHex(std::string& out, uint8_t byte) {
        static constexpr char DIGITS[] = "0123456789abcdef";
        out += DIGITS[byte >> 4];
        out += DIGITS[byte & 0x0F];
    }
};

} // namespace ledger::utils
