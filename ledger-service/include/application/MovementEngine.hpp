#pragma once

#include "ports/input/IMovementService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/IdempotencyGuard.hpp"
#include "application/CustomerConsistencyCache.hpp"
#include "application/LedgerEventPublisher.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/events/MovementCreatedEvent.hpp"
#include "settings/LedgerSettings.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <memory>
#include <optional>
#include <vector>
#include <string>
#include <iostream>

namespace ledger::application {

/**
 * @brief Проведение движений по счетам
 *
 * Каждое движение: проверка повтора -> чтение счёта с версией ->
 * расчёт нового баланса -> атомарная запись баланса и проводки под версией.
 * При конфликте версий шаги повторяются с чтения счёта, не более
 * LEDGER_MAX_RETRIES раз, затем ConcurrentModificationError.
 * Событие movement.created публикуется после фиксации и на её исход не влияет.
 */
class MovementEngine : public ports::input::IMovementService {
public:
    MovementEngine(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<IdempotencyGuard> guard,
        std::shared_ptr<CustomerConsistencyCache> customers,
        std::shared_ptr<LedgerEventPublisher> publisher,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , guard_(std::move(guard))
      , customers_(std::move(customers))
      , publisher_(std::move(publisher))
      , metrics_(std::move(metrics))
      , settings_(std::move(settings))
    {
        std::cout << "[MovementEngine] Created (maxRetries=" << settings_->getMaxRetries() << ")" << std::endl;
    }

    domain::Movement createMovement(const ports::input::MovementCommand& command) override {
        try {
            if (command.type == domain::MovementType::REVERSAL) {
                throw domain::ValidationError("REVERSAL movements are created through reverseMovement");
            }

            Plan plan;
            plan.request.accountNumber = command.accountNumber;
            plan.request.type = command.type;
            plan.request.amount = command.amount;
            plan.request.transactionId = command.transactionId;
            plan.request.idempotencyKey = command.idempotencyKey;
            plan.sign = (command.type == domain::MovementType::CREDIT) ? 1 : -1;
            plan.description = command.description.value_or("");
            plan.reference = command.reference.value_or("");
            plan.correlationId = command.correlationId;
            plan.requestId = command.requestId;
            validate(plan);

            if (auto existing = guard_->findExisting(plan.request)) {
                return replay(*existing);
            }
            return apply(plan);

        } catch (const domain::LedgerException& e) {
            reject(e, command.transactionId);
            throw;
        }
    }

    domain::Movement reverseMovement(const ports::input::ReversalCommand& command) override {
        try {
            if (command.transactionId.empty()) {
                throw domain::ValidationError("transactionId is required");
            }

            auto original = store_->findMovement(command.movementId);
            if (!original) {
                throw domain::NotFoundError("Movement not found: " + command.movementId);
            }
            if (original->type == domain::MovementType::REVERSAL) {
                throw domain::ValidationError("A reversal cannot be reversed: " + command.movementId);
            }

            Plan plan;
            plan.request.accountNumber = original->accountNumber;
            plan.request.type = domain::MovementType::REVERSAL;
            plan.request.amount = original->amount;
            plan.request.transactionId = command.transactionId;
            plan.request.idempotencyKey = command.idempotencyKey;
            plan.sign = (original->type == domain::MovementType::CREDIT) ? -1 : 1;
            plan.description = command.description.value_or("Reversal of " + original->movementId);
            plan.reference = original->transactionId;
            plan.correlationId = command.correlationId;
            plan.requestId = command.requestId;
            plan.reverses = original->movementId;
            validate(plan);

            // Повтор сторно возвращает его, даже если исходная уже помечена
            if (auto existing = guard_->findExisting(plan.request)) {
                return replay(*existing);
            }
            if (original->reversed) {
                throw domain::ValidationError("Movement already reversed: " + original->movementId);
            }
            return apply(plan);

        } catch (const domain::LedgerException& e) {
            reject(e, command.transactionId);
            throw;
        }
    }

    domain::Movement getMovement(const std::string& movementId) override {
        auto movement = store_->findMovement(movementId);
        if (!movement) {
            throw domain::NotFoundError("Movement not found: " + movementId);
        }
        return *movement;
    }

    std::vector<domain::Movement> getMovementsByAccount(int64_t accountNumber) override {
        if (!store_->findAccount(accountNumber)) {
            throw domain::NotFoundError("Account not found: " + std::to_string(accountNumber));
        }
        return store_->findMovementsByAccount(accountNumber);
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<IdempotencyGuard> guard_;
    std::shared_ptr<CustomerConsistencyCache> customers_;
    std::shared_ptr<LedgerEventPublisher> publisher_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    struct Plan {
        IdempotencyGuard::Request request;
        int sign = 1;                               ///< +1 зачисление, -1 списание
        std::string description;
        std::string reference;
        std::optional<std::string> correlationId;
        std::optional<std::string> requestId;
        std::optional<std::string> reverses;        ///< ID сторнируемой проводки
    };

    /**
     * @brief Проверка запроса до обращения к хранилищу
     *
     * Пределы длины совпадают с колонками таблицы movements.
     */
    static void validate(const Plan& plan) {
        const auto& request = plan.request;
        if (!request.amount.isPositive()) {
            throw domain::ValidationError("Amount must be positive, got " + request.amount.toString());
        }
        if (!request.amount.inRange()) {
            throw domain::ValidationError("Amount exceeds " +
                                          domain::Money(domain::Money::MAX_CENTS).toString());
        }
        if (request.transactionId.empty()) {
            throw domain::ValidationError("transactionId is required");
        }

        checkLength("transactionId", request.transactionId, domain::Movement::MAX_ID_LENGTH);
        if (request.idempotencyKey) {
            checkLength("idempotencyKey", *request.idempotencyKey, domain::Movement::MAX_ID_LENGTH);
        }
        checkLength("description", plan.description, domain::Movement::MAX_DESCRIPTION_LENGTH);
        checkLength("reference", plan.reference, domain::Movement::MAX_ID_LENGTH);
        if (plan.correlationId) {
            checkLength("correlationId", *plan.correlationId, domain::Movement::MAX_ID_LENGTH);
        }
        if (plan.requestId) {
            checkLength("requestId", *plan.requestId, domain::Movement::MAX_ID_LENGTH);
        }
    }

    static void checkLength(const char* field, const std::string& value, size_t maxLength) {
        if (value.size() > maxLength) {
            throw domain::ValidationError(std::string(field) + " is longer than " +
                                          std::to_string(maxLength) + " characters");
        }
    }

    domain::Movement apply(const Plan& plan) {
        const auto& request = plan.request;
        std::string movementId = utils::UuidGenerator::generate();
        int attempts = 1 + std::max(0, settings_->getMaxRetries());

        for (int attempt = 0; attempt < attempts; ++attempt) {
            auto account = store_->findAccount(request.accountNumber);
            if (!account) {
                throw domain::NotFoundError("Account not found: " + std::to_string(request.accountNumber));
            }
            if (!account->active) {
                throw domain::ValidationError("Account is not active: " + std::to_string(request.accountNumber));
            }
            if (attempt == 0) {
                checkCustomer(account->owner.customerId);
            }

            // Оба слагаемых в пределах MAX_CENTS, переполнения int64_t нет
            domain::Money before = account->balance;
            domain::Money after = plan.sign > 0 ? before + request.amount : before - request.amount;
            if (!after.inRange()) {
                throw domain::ValidationError(
                    "Balance of account " + std::to_string(request.accountNumber) + " would exceed " +
                    domain::Money(domain::Money::MAX_CENTS).toString());
            }
            if (after.isNegative()) {
                throw domain::InsufficientFundsError(
                    "Insufficient funds on account " + std::to_string(request.accountNumber) +
                    ": balance " + before.toString() + ", requested " + request.amount.toString());
            }

            ports::output::MovementCommit commit;
            commit.accountNumber = account->accountNumber;
            commit.expectedVersion = account->version;
            commit.newBalance = after;
            commit.reversesMovementId = plan.reverses;

            auto& m = commit.movement;
            m.movementId = movementId;
            m.accountNumber = account->accountNumber;
            m.type = request.type;
            m.amount = request.amount;
            m.balanceBefore = before;
            m.balanceAfter = after;
            m.description = plan.description;
            m.reference = plan.reference;
            m.transactionId = request.transactionId;
            m.idempotencyKey = request.idempotencyKey;
            m.reversedMovementId = plan.reverses;
            m.correlationId = plan.correlationId;
            m.requestId = plan.requestId;
            m.createdAt = domain::Timestamp::now();

            auto result = store_->commitMovement(commit);

            switch (result.status) {
                case ports::output::CommitStatus::COMMITTED:
                    return committed(*result.movement, account->owner.customerId);

                case ports::output::CommitStatus::VERSION_CONFLICT:
                    metrics_->increment("ledger_version_conflicts_total");
                    std::cout << "[MovementEngine] Version conflict on account " << request.accountNumber
                              << " (attempt " << attempt + 1 << "/" << attempts << ")" << std::endl;
                    continue;

                case ports::output::CommitStatus::DUPLICATE_TRANSACTION:
                case ports::output::CommitStatus::DUPLICATE_IDEMPOTENCY_KEY:
                    return replay(guard_->resolveDuplicate(request, result.status));

                case ports::output::CommitStatus::ALREADY_REVERSED:
                    throw domain::ValidationError("Movement already reversed: " + plan.reverses.value_or(""));
            }
        }

        throw domain::ConcurrentModificationError(
            "Account " + std::to_string(request.accountNumber) + " modified concurrently, gave up after " +
            std::to_string(attempts) + " attempts");
    }

    void checkCustomer(const std::string& customerId) {
        switch (customers_->resolve(customerId)) {
            case domain::CustomerStatus::ACTIVE:
                return;
            case domain::CustomerStatus::INACTIVE:
                throw domain::ValidationError("Customer is not active: " + customerId);
            default:
                throw domain::NotFoundError("Customer not found: " + customerId);
        }
    }

    domain::Movement committed(const domain::Movement& movement, const std::string& customerId) {
        metrics_->increment("ledger_movements_total", {{"kind", domain::toString(movement.type)}});
        std::cout << "[MovementEngine] " << domain::toString(movement.type) << " " << movement.amount.toString()
                  << " on " << movement.accountNumber << ": " << movement.balanceBefore.toString()
                  << " -> " << movement.balanceAfter.toString()
                  << " (tx=" << movement.transactionId << ")" << std::endl;

        domain::MovementCreatedEvent event(movement, customerId);
        event.eventId = utils::UuidGenerator::generate();
        publisher_->publish("movement.created", std::to_string(movement.accountNumber), event);

        return movement;
    }

    domain::Movement replay(const domain::Movement& existing) {
        metrics_->increment("ledger_movement_replays_total");
        std::cout << "[MovementEngine] Replay of " << existing.transactionId
                  << " -> " << existing.movementId << std::endl;
        return existing;
    }

    void reject(const domain::LedgerException& e, const std::string& transactionId) {
        metrics_->increment("ledger_movement_rejections_total", {{"code", e.codeString()}});
        std::cerr << "[MovementEngine] Rejected tx=" << transactionId
                  << " " << e.codeString() << ": " << e.what() << std::endl;
    }
};

} // namespace ledger::application
