#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/AccountType.hpp"
#include <string>
#include <cstdint>
#include <cstddef>

namespace ledger::domain {

/**
 * @brief Снимок данных владельца счёта
 *
 * Денормализованная копия клиента из Customer service на момент открытия.
 * При переименовании клиента существующие счета не обновляются.
 */
struct AccountOwner {
    static constexpr size_t MAX_CUSTOMER_ID_LENGTH = 64;
    static constexpr size_t MAX_NAME_LENGTH = 100;      ///< В байтах UTF-8

    std::string customerId;
    std::string name;
};

/**
 * @brief Банковский счёт
 *
 * Номер выдаёт хранилище. balance всегда равен сумме проведённых
 * движений; version растёт на каждой записи (оптимистичная блокировка).
 */
struct Account {
    int64_t accountNumber = 0;
    AccountOwner owner;
    AccountType type = AccountType::SAVINGS;
    Money balance;
    bool active = true;
    int64_t version = 0;
    Timestamp createdAt;
    Timestamp updatedAt;

    Account() = default;

    Account(const AccountOwner& owner, AccountType type)
        : owner(owner)
        , type(type)
        , createdAt(Timestamp::now())
        , updatedAt(createdAt)
    {}
};

} // namespace ledger::domain
