#pragma once

#include "domain/Movement.hpp"
#include "domain/LedgerErrors.hpp"
#include "ports/output/ILedgerStore.hpp"
#include <memory>
#include <optional>
#include <string>
#include <iostream>

namespace ledger::application {

/**
 * @brief Защита от повторного применения проводки
 *
 * Окончательная гарантия - уникальные ограничения хранилища на
 * transaction_id и idempotency_key. Предварительная проверка лишь
 * экономит неудачную запись при обычных повторах клиента.
 *
 * Найденная проводка возвращается как результат, только если её счёт,
 * сумма и вид совпадают с запросом. Иначе это IdempotencyConflictError.
 */
class IdempotencyGuard {
public:
    /**
     * @brief Определяющие поля запроса для сравнения с существующей проводкой
     */
    struct Request {
        int64_t accountNumber = 0;
        domain::MovementType type = domain::MovementType::CREDIT;
        domain::Money amount;
        std::string transactionId;
        std::optional<std::string> idempotencyKey;
    };

    explicit IdempotencyGuard(std::shared_ptr<ports::output::ILedgerStore> store)
        : store_(std::move(store))
    {
        std::cout << "[IdempotencyGuard] Created" << std::endl;
    }

    /**
     * @brief Найти уже проведённую проводку для этого запроса
     *
     * @return Существующая проводка, если запрос - повтор; nullopt, если новый
     * @throws domain::IdempotencyConflictError если ключи указывают на разные
     *         проводки или определяющие поля не совпадают
     */
    std::optional<domain::Movement> findExisting(const Request& request) {
        auto byTransaction = store_->findMovementByTransactionId(request.transactionId);

        std::optional<domain::Movement> byKey;
        if (request.idempotencyKey) {
            byKey = store_->findMovementByIdempotencyKey(*request.idempotencyKey);
        }

        if (byTransaction && byKey && byTransaction->movementId != byKey->movementId) {
            throw domain::IdempotencyConflictError(
                "transactionId " + request.transactionId + " and idempotencyKey " +
                *request.idempotencyKey + " refer to different movements");
        }

        auto existing = byTransaction ? byTransaction : byKey;
        if (existing) {
            verifyMatches(request, *existing);
        }
        return existing;
    }

    /**
     * @brief Разрешить нарушение уникальности, полученное при записи
     *
     * Запись проиграла гонку параллельному запросу с тем же ключом:
     * возвращаем проводку победителя, если она совпадает с запросом.
     *
     * @throws domain::IdempotencyConflictError при несовпадении полей
     * @throws domain::ConcurrentModificationError если проводка уже не находится
     */
    domain::Movement resolveDuplicate(const Request& request, ports::output::CommitStatus status) {
        std::optional<domain::Movement> existing;
        if (status == ports::output::CommitStatus::DUPLICATE_IDEMPOTENCY_KEY && request.idempotencyKey) {
            existing = store_->findMovementByIdempotencyKey(*request.idempotencyKey);
        } else {
            existing = store_->findMovementByTransactionId(request.transactionId);
        }

        if (!existing) {
            throw domain::ConcurrentModificationError(
                "Duplicate " + ports::output::toString(status) + " for transaction " +
                request.transactionId + " but existing movement is gone");
        }

        verifyMatches(request, *existing);
        std::cout << "[IdempotencyGuard] Resolved duplicate " << request.transactionId
                  << " -> " << existing->movementId << std::endl;
        return *existing;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;

    static void verifyMatches(const Request& request, const domain::Movement& existing) {
        if (existing.accountNumber != request.accountNumber ||
            existing.amount != request.amount ||
            existing.type != request.type) {
            throw domain::IdempotencyConflictError(
                "Movement " + existing.movementId + " for transaction " + existing.transactionId +
                " was " + domain::toString(existing.type) + " " + existing.amount.toString() +
                " on account " + std::to_string(existing.accountNumber) +
                ", request is " + domain::toString(request.type) + " " + request.amount.toString() +
                " on account " + std::to_string(request.accountNumber));
        }
    }
};

} // namespace ledger::application
