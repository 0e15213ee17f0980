#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "settings/LedgerDbSettings.hpp"
#include "domain/LedgerErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища леджера
 *
 * Таблица: accounts
 * - account_number BIGINT PRIMARY KEY (sequence с 1000000001)
 * - account_type VARCHAR(20), balance BIGINT (в центах, >= 0), active BOOLEAN
 * - customer_id, customer_name - денормализованный снимок владельца
 * - version BIGINT - оптимистичная блокировка
 *
 * Таблица: movements
 * - movement_id VARCHAR(36) PRIMARY KEY
 * - account_number BIGINT REFERENCES accounts ON DELETE RESTRICT
 * - transaction_id UNIQUE, idempotency_key UNIQUE (NULL допускается)
 * - amount, balance_before, balance_after BIGINT (в центах)
 *
 * Каждая операция открывает своё соединение и транзакцию. Ошибки libpqxx
 * наружу уходят как domain::StorageError. Изменения счетов одного клиента
 * сериализуются advisory-блокировкой по customer_id.
 */
class PostgresLedgerStore : public ports::output::ILedgerStore {
public:
    explicit PostgresLedgerStore(std::shared_ptr<settings::LedgerDbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
        std::cout << "[PostgresLedgerStore] Connected to " << settings_->getName() << std::endl;
    }

    ports::output::AccountWriteResult insertAccount(const domain::Account& account,
                                                    int maxActiveAccounts) override {
        return guarded("insertAccount", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            ports::output::AccountWriteResult outcome;

            if (account.active) {
                lockCustomer(txn, account.owner.customerId);
                outcome.status = checkOpeningRules(txn, account, maxActiveAccounts);
                if (outcome.status != ports::output::AccountWriteStatus::WRITTEN) {
                    return outcome;
                }
            }

            auto result = txn.exec_params(
                "INSERT INTO accounts (account_type, balance, active, customer_id, customer_name, "
                "version, created_at, updated_at) "
                "VALUES ($1, $2, $3, $4, $5, 0, to_timestamp($6 / 1000.0), to_timestamp($6 / 1000.0)) "
                "RETURNING " + std::string(ACCOUNT_COLUMNS),
                domain::toString(account.type),
                account.balance.cents,
                account.active,
                account.owner.customerId,
                account.owner.name,
                account.createdAt.toEpochMillis()
            );

            txn.commit();

            outcome.status = ports::output::AccountWriteStatus::WRITTEN;
            outcome.account = rowToAccount(result[0]);
            std::cout << "[PostgresLedgerStore] Inserted account " << outcome.account->accountNumber << std::endl;
            return outcome;
        });
    }

    std::optional<domain::Account> findAccount(int64_t accountNumber) override {
        return guarded("findAccount", [&]() -> std::optional<domain::Account> {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + std::string(ACCOUNT_COLUMNS) + " FROM accounts WHERE account_number = $1",
                accountNumber
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToAccount(result[0]);
        });
    }

    std::vector<domain::Account> findAccountsByCustomer(const std::string& customerId) override {
        return guarded("findAccountsByCustomer", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + std::string(ACCOUNT_COLUMNS) + " FROM accounts "
                "WHERE customer_id = $1 ORDER BY account_number",
                customerId
            );

            std::vector<domain::Account> accounts;
            accounts.reserve(result.size());
            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
            return accounts;
        });
    }

    ports::output::AccountWriteResult updateAccount(const domain::Account& account,
                                                    int64_t expectedVersion,
                                                    int maxActiveAccounts) override {
        using ports::output::AccountWriteStatus;
        return guarded("updateAccount", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            ports::output::AccountWriteResult outcome;

            // Сначала клиент, потом строка счёта: тот же порядок, что и в insertAccount
            lockCustomer(txn, account.owner.customerId);
            auto current = txn.exec_params(
                "SELECT account_type, active, version FROM accounts "
                "WHERE account_number = $1 FOR UPDATE",
                account.accountNumber
            );
            if (current.empty() || current[0]["version"].as<int64_t>() != expectedVersion) {
                outcome.status = AccountWriteStatus::VERSION_CONFLICT;
                return outcome;
            }

            bool wasActive = current[0]["active"].as<bool>();
            auto wasType = domain::parseAccountType(current[0]["account_type"].as<std::string>());
            bool activating = account.active && !wasActive;
            bool changingType = account.active && account.type != wasType;
            if (activating || changingType) {
                outcome.status = checkOpeningRules(txn, account, maxActiveAccounts);
                if (outcome.status != AccountWriteStatus::WRITTEN) {
                    return outcome;
                }
            }

            auto result = txn.exec_params(
                "UPDATE accounts SET account_type = $1, active = $2, "
                "version = version + 1, updated_at = NOW() "
                "WHERE account_number = $3 "
                "RETURNING " + std::string(ACCOUNT_COLUMNS),
                domain::toString(account.type),
                account.active,
                account.accountNumber
            );

            txn.commit();

            outcome.status = AccountWriteStatus::WRITTEN;
            outcome.account = rowToAccount(result[0]);
            return outcome;
        });
    }

    ports::output::CommitResult commitMovement(const ports::output::MovementCommit& commit) override {
        using ports::output::CommitStatus;
        return guarded("commitMovement", [&] {
            ports::output::CommitResult outcome;
            const auto& m = commit.movement;

            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            // CAS: строка обновится, только если версию никто не успел сдвинуть
            auto updated = txn.exec_params(
                "UPDATE accounts SET balance = $1, version = version + 1, updated_at = NOW() "
                "WHERE account_number = $2 AND version = $3 AND active "
                "RETURNING " + std::string(ACCOUNT_COLUMNS),
                commit.newBalance.cents,
                commit.accountNumber,
                commit.expectedVersion
            );

            if (updated.empty()) {
                outcome.status = CommitStatus::VERSION_CONFLICT;
                return outcome;
            }

            try {
                txn.exec_params(
                    "INSERT INTO movements (movement_id, account_number, movement_type, amount, "
                    "balance_before, balance_after, description, reference, transaction_id, "
                    "idempotency_key, reversed_movement_id, reversed, correlation_id, request_id, created_at) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, FALSE, $12, $13, "
                    "to_timestamp($14 / 1000.0))",
                    m.movementId,
                    m.accountNumber,
                    domain::toString(m.type),
                    m.amount.cents,
                    m.balanceBefore.cents,
                    m.balanceAfter.cents,
                    m.description,
                    m.reference,
                    m.transactionId,
                    m.idempotencyKey,
                    m.reversedMovementId,
                    m.correlationId,
                    m.requestId,
                    m.createdAt.toEpochMillis()
                );
            } catch (const pqxx::unique_violation&) {
                std::cout << "[PostgresLedgerStore] Unique violation for transaction "
                          << m.transactionId << std::endl;
                outcome.status = classifyDuplicate(m);
                return outcome;
            }

            if (commit.reversesMovementId) {
                auto marked = txn.exec_params(
                    "UPDATE movements SET reversed = TRUE, reversed_movement_id = $1 "
                    "WHERE movement_id = $2 AND NOT reversed RETURNING movement_id",
                    m.movementId,
                    *commit.reversesMovementId
                );
                if (marked.empty()) {
                    outcome.status = CommitStatus::ALREADY_REVERSED;
                    return outcome;
                }
            }

            txn.commit();

            outcome.status = CommitStatus::COMMITTED;
            outcome.account = rowToAccount(updated[0]);
            outcome.movement = m;
            return outcome;
        });
    }

    std::optional<domain::Movement> findMovement(const std::string& movementId) override {
        return findMovementBy("movement_id", movementId);
    }

    std::optional<domain::Movement> findMovementByTransactionId(const std::string& transactionId) override {
        return findMovementBy("transaction_id", transactionId);
    }

    std::optional<domain::Movement> findMovementByIdempotencyKey(const std::string& key) override {
        return findMovementBy("idempotency_key", key);
    }

    std::vector<domain::Movement> findMovementsByAccount(
        int64_t accountNumber,
        const std::optional<domain::Timestamp>& from = std::nullopt,
        const std::optional<domain::Timestamp>& to = std::nullopt) override
    {
        return guarded("findMovementsByAccount", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            std::optional<int64_t> fromMs;
            std::optional<int64_t> toMs;
            if (from) fromMs = from->toEpochMillis();
            if (to) toMs = to->toEpochMillis();

            auto result = txn.exec_params(
                "SELECT " + std::string(MOVEMENT_COLUMNS) + " FROM movements "
                "WHERE account_number = $1 "
                "AND ($2::BIGINT IS NULL OR created_at >= to_timestamp($2 / 1000.0)) "
                "AND ($3::BIGINT IS NULL OR created_at <= to_timestamp($3 / 1000.0)) "
                "ORDER BY created_at DESC, seq DESC",
                accountNumber,
                fromMs,
                toMs
            );

            std::vector<domain::Movement> movements;
            movements.reserve(result.size());
            for (const auto& row : result) {
                movements.push_back(rowToMovement(row));
            }
            return movements;
        });
    }

    ports::output::DeleteStatus deleteAccountCascade(int64_t accountNumber,
                                                     std::optional<int64_t> expectedVersion) override {
        using ports::output::DeleteStatus;
        return guarded("deleteAccountCascade", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            // Блокируем счёт, чтобы параллельная проводка не вставилась между DELETE
            auto locked = txn.exec_params(
                "SELECT version FROM accounts WHERE account_number = $1 FOR UPDATE",
                accountNumber
            );
            if (locked.empty()) {
                return DeleteStatus::NOT_FOUND;
            }
            if (expectedVersion && locked[0]["version"].as<int64_t>() != *expectedVersion) {
                return DeleteStatus::VERSION_CONFLICT;
            }

            auto movements = txn.exec_params(
                "DELETE FROM movements WHERE account_number = $1", accountNumber);
            txn.exec_params("DELETE FROM accounts WHERE account_number = $1", accountNumber);

            txn.commit();
            std::cout << "[PostgresLedgerStore] Deleted account " << accountNumber
                      << " with " << movements.affected_rows() << " movements" << std::endl;
            return DeleteStatus::DELETED;
        });
    }

private:
    std::shared_ptr<settings::LedgerDbSettings> settings_;

    static constexpr const char* ACCOUNT_COLUMNS =
        "account_number, account_type, balance, active, customer_id, customer_name, version, "
        "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms, "
        "(EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_ms";

    static constexpr const char* MOVEMENT_COLUMNS =
        "movement_id, account_number, movement_type, amount, balance_before, balance_after, "
        "description, reference, transaction_id, idempotency_key, reversed_movement_id, reversed, "
        "correlation_id, request_id, "
        "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms";

    /**
     * @brief Выполнить операцию, переведя ошибки libpqxx в domain::StorageError
     */
    template <typename Operation>
    static auto guarded(const char* name, Operation&& operation) -> decltype(operation()) {
        try {
            return operation();
        } catch (const pqxx::failure& e) {
            std::cerr << "[PostgresLedgerStore] " << name << " error: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Storage failure in ") + name + ": " + e.what());
        }
    }

    /// Сериализует изменения счетов одного клиента до конца транзакции
    static void lockCustomer(pqxx::work& txn, const std::string& customerId) {
        txn.exec_params("SELECT pg_advisory_xact_lock(hashtext($1))", customerId);
    }

    /**
     * @brief Правила открытия для счёта, который станет активным
     *
     * Вызывается под lockCustomer. Сам счёт не учитывается.
     */
    static ports::output::AccountWriteStatus checkOpeningRules(pqxx::work& txn,
                                                               const domain::Account& account,
                                                               int maxActiveAccounts) {
        auto result = txn.exec_params(
            "SELECT COUNT(*) AS active_count, "
            "COALESCE(BOOL_OR(account_type = $2), FALSE) AS same_type "
            "FROM accounts WHERE customer_id = $1 AND active AND account_number <> $3",
            account.owner.customerId,
            domain::toString(account.type),
            account.accountNumber
        );

        if (result[0]["active_count"].as<int64_t>() >= maxActiveAccounts) {
            return ports::output::AccountWriteStatus::ACTIVE_LIMIT_REACHED;
        }
        if (result[0]["same_type"].as<bool>()) {
            return ports::output::AccountWriteStatus::ACTIVE_TYPE_EXISTS;
        }
        return ports::output::AccountWriteStatus::WRITTEN;
    }

    std::optional<domain::Movement> findMovementBy(const std::string& column, const std::string& value) {
        return guarded("findMovement", [&]() -> std::optional<domain::Movement> {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + std::string(MOVEMENT_COLUMNS) + " FROM movements WHERE " + column + " = $1",
                value
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToMovement(result[0]);
        });
    }

    /**
     * @brief Какое ограничение уникальности сработало
     *
     * Транзакция после unique_violation уже прервана, поэтому проверяем отдельным запросом.
     */
    ports::output::CommitStatus classifyDuplicate(const domain::Movement& movement) {
        if (findMovementByTransactionId(movement.transactionId)) {
            return ports::output::CommitStatus::DUPLICATE_TRANSACTION;
        }
        return ports::output::CommitStatus::DUPLICATE_IDEMPOTENCY_KEY;
    }

    static std::optional<std::string> optionalString(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return field.as<std::string>();
    }

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.accountNumber = row["account_number"].as<int64_t>();
        account.type = domain::parseAccountType(row["account_type"].as<std::string>());
        account.balance = domain::Money::fromCents(row["balance"].as<int64_t>());
        account.active = row["active"].as<bool>();
        account.owner.customerId = row["customer_id"].as<std::string>();
        account.owner.name = row["customer_name"].as<std::string>();
        account.version = row["version"].as<int64_t>();
        account.createdAt = domain::Timestamp::fromEpochMillis(row["created_ms"].as<int64_t>());
        account.updatedAt = domain::Timestamp::fromEpochMillis(row["updated_ms"].as<int64_t>());
        return account;
    }

    static domain::Movement rowToMovement(const pqxx::row& row) {
        domain::Movement m;
        m.movementId = row["movement_id"].as<std::string>();
        m.accountNumber = row["account_number"].as<int64_t>();
        m.type = domain::parseMovementType(row["movement_type"].as<std::string>());
        m.amount = domain::Money::fromCents(row["amount"].as<int64_t>());
        m.balanceBefore = domain::Money::fromCents(row["balance_before"].as<int64_t>());
        m.balanceAfter = domain::Money::fromCents(row["balance_after"].as<int64_t>());
        m.description = row["description"].is_null() ? "" : row["description"].as<std::string>();
        m.reference = row["reference"].is_null() ? "" : row["reference"].as<std::string>();
        m.transactionId = row["transaction_id"].as<std::string>();
        m.idempotencyKey = optionalString(row["idempotency_key"]);
        m.reversedMovementId = optionalString(row["reversed_movement_id"]);
        m.reversed = row["reversed"].as<bool>();
        m.correlationId = optionalString(row["correlation_id"]);
        m.requestId = optionalString(row["request_id"]);
        m.createdAt = domain::Timestamp::fromEpochMillis(row["created_ms"].as<int64_t>());
        return m;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE SEQUENCE IF NOT EXISTS account_number_seq START WITH 1000000001 INCREMENT BY 1
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS accounts (
                    account_number BIGINT PRIMARY KEY DEFAULT nextval('account_number_seq'),
                    account_type VARCHAR(20) NOT NULL CHECK (account_type IN ('SAVINGS', 'CHECKING')),
                    balance BIGINT NOT NULL DEFAULT 0 CHECK (balance >= 0),
                    active BOOLEAN NOT NULL DEFAULT TRUE,
                    customer_id VARCHAR(64) NOT NULL,
                    customer_name VARCHAR(100) NOT NULL,
                    version BIGINT NOT NULL DEFAULT 0,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS movements (
                    seq BIGSERIAL,
                    movement_id VARCHAR(36) PRIMARY KEY,
                    account_number BIGINT NOT NULL REFERENCES accounts(account_number) ON DELETE RESTRICT,
                    movement_type VARCHAR(20) NOT NULL CHECK (movement_type IN ('CREDIT', 'DEBIT', 'REVERSAL')),
                    amount BIGINT NOT NULL CHECK (amount > 0),
                    balance_before BIGINT NOT NULL,
                    balance_after BIGINT NOT NULL,
                    description VARCHAR(200),
                    reference VARCHAR(100),
                    transaction_id VARCHAR(100) NOT NULL UNIQUE,
                    idempotency_key VARCHAR(100) UNIQUE,
                    reversed_movement_id VARCHAR(36),
                    reversed BOOLEAN NOT NULL DEFAULT FALSE,
                    correlation_id VARCHAR(100),
                    request_id VARCHAR(100),
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_accounts_customer_id ON accounts(customer_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_movements_account_created "
                     "ON movements(account_number, created_at DESC)");

            txn.commit();
            std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace ledger::adapters::secondary
