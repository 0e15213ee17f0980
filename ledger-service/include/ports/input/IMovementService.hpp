#pragma once

#include "domain/Movement.hpp"
#include "domain/enums/MovementType.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Запрос на проведение движения (CREDIT/DEBIT)
 */
struct MovementCommand {
    int64_t accountNumber = 0;
    domain::MovementType type = domain::MovementType::CREDIT;
    domain::Money amount;
    std::string transactionId;
    std::optional<std::string> idempotencyKey;
    std::optional<std::string> description;
    std::optional<std::string> reference;
    std::optional<std::string> correlationId;
    std::optional<std::string> requestId;
};

/**
 * @brief Запрос на сторно проводки
 */
struct ReversalCommand {
    std::string movementId;
    std::string transactionId;
    std::optional<std::string> idempotencyKey;
    std::optional<std::string> description;
    std::optional<std::string> correlationId;
    std::optional<std::string> requestId;
};

/**
 * @brief Интерфейс проведения движений
 */
class IMovementService {
public:
    virtual ~IMovementService() = default;

    /**
     * @brief Провести движение ровно один раз
     *
     * Повтор с тем же transactionId (или idempotencyKey) возвращает
     * исходную проводку без повторного применения.
     */
    virtual domain::Movement createMovement(const MovementCommand& command) = 0;

    virtual domain::Movement reverseMovement(const ReversalCommand& command) = 0;

    /**
     * @throws domain::NotFoundError
     */
    virtual domain::Movement getMovement(const std::string& movementId) = 0;

    /// Новые сверху
    virtual std::vector<domain::Movement> getMovementsByAccount(int64_t accountNumber) = 0;
};

} // namespace ledger::ports::input
