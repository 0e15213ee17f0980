#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Категория банковского счёта
 */
enum class AccountType {
    SAVINGS,    ///< Сберегательный
    CHECKING    ///< Расчётный
};

/**
 * @brief Преобразовать AccountType в строку
 */
inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::SAVINGS:  return "SAVINGS";
        case AccountType::CHECKING: return "CHECKING";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Преобразовать строку в AccountType
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountType parseAccountType(const std::string& str) {
    if (str == "SAVINGS" || str == "savings")   return AccountType::SAVINGS;
    if (str == "CHECKING" || str == "checking") return AccountType::CHECKING;
    throw std::invalid_argument("Unknown account type: " + str);
}

} // namespace ledger::domain
