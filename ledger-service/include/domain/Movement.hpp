#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/MovementType.hpp"
#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace ledger::domain {

/**
 * @brief Проводка по счёту
 *
 * Неизменяема после записи. Единственное исключение: при сторно у исходной
 * проводки выставляются reversed и reversedMovementId.
 *
 * Для CREDIT balanceAfter = balanceBefore + amount, для DEBIT наоборот.
 * REVERSAL двигает баланс в сторону, противоположную исходной проводке.
 */
struct Movement {
    /// Предел длины transactionId, idempotencyKey, reference, correlationId, requestId
    static constexpr size_t MAX_ID_LENGTH = 100;
    static constexpr size_t MAX_DESCRIPTION_LENGTH = 200;

    std::string movementId;                         ///< UUID
    int64_t accountNumber = 0;
    MovementType type = MovementType::CREDIT;
    Money amount;                                   ///< Всегда > 0
    Money balanceBefore;
    Money balanceAfter;
    std::string description;
    std::string reference;
    std::string transactionId;                      ///< Уникален в хранилище
    std::optional<std::string> idempotencyKey;      ///< Уникален, если задан
    std::optional<std::string> reversedMovementId;  ///< У сторно: исходная проводка; у исходной: её сторно
    bool reversed = false;
    std::optional<std::string> correlationId;
    std::optional<std::string> requestId;
    Timestamp createdAt;

    /**
     * @brief Знаковое изменение баланса
     */
    Money netEffect() const {
        return balanceAfter - balanceBefore;
    }
};

} // namespace ledger::domain
