#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Вид движения по счёту
 */
enum class MovementType {
    CREDIT,     ///< Зачисление
    DEBIT,      ///< Списание
    REVERSAL    ///< Сторно ранее проведённого движения
};

inline std::string toString(MovementType type) {
    switch (type) {
        case MovementType::CREDIT:   return "CREDIT";
        case MovementType::DEBIT:    return "DEBIT";
        case MovementType::REVERSAL: return "REVERSAL";
        default: return "UNKNOWN";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline MovementType parseMovementType(const std::string& str) {
    if (str == "CREDIT" || str == "credit")     return MovementType::CREDIT;
    if (str == "DEBIT" || str == "debit")       return MovementType::DEBIT;
    if (str == "REVERSAL" || str == "reversal") return MovementType::REVERSAL;
    throw std::invalid_argument("Unknown movement type: " + str);
}

} // namespace ledger::domain
