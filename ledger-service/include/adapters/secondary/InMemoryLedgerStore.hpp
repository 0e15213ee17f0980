#pragma once

#include "ports/output/ILedgerStore.hpp"
#include <unordered_map>
#include <map>
#include <vector>
#include <mutex>
#include <algorithm>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief In-Memory реализация хранилища леджера
 *
 * Тот же контракт, что и у PostgresLedgerStore: CAS по версии счёта,
 * уникальность transaction_id и idempotency_key, правила открытия счетов,
 * каскадное удаление. Все операции сериализуются одним mutex.
 * Используется в тестах и при LEDGER_STORAGE=memory.
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
public:
    static constexpr int64_t FIRST_ACCOUNT_NUMBER = 1000000001;

    InMemoryLedgerStore() {
        std::cout << "[InMemoryLedgerStore] Created" << std::endl;
    }

    ports::output::AccountWriteResult insertAccount(const domain::Account& account,
                                                    int maxActiveAccounts) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ports::output::AccountWriteResult result;
        if (account.active) {
            result.status = checkOpeningRules(account, maxActiveAccounts);
            if (result.status != ports::output::AccountWriteStatus::WRITTEN) return result;
        }

        domain::Account stored = account;
        stored.accountNumber = nextAccountNumber_++;
        stored.version = 0;
        accounts_[stored.accountNumber] = stored;

        result.status = ports::output::AccountWriteStatus::WRITTEN;
        result.account = stored;
        return result;
    }

    std::optional<domain::Account> findAccount(int64_t accountNumber) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(accountNumber);
        if (it == accounts_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Account> findAccountsByCustomer(const std::string& customerId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Account> result;
        for (const auto& [number, account] : accounts_) {
            if (account.owner.customerId == customerId) {
                result.push_back(account);
            }
        }
        return result;
    }

    ports::output::AccountWriteResult updateAccount(const domain::Account& account,
                                                    int64_t expectedVersion,
                                                    int maxActiveAccounts) override {
        using ports::output::AccountWriteStatus;
        std::lock_guard<std::mutex> lock(mutex_);
        ports::output::AccountWriteResult result;

        auto it = accounts_.find(account.accountNumber);
        if (it == accounts_.end() || it->second.version != expectedVersion) {
            result.status = AccountWriteStatus::VERSION_CONFLICT;
            return result;
        }

        domain::Account& stored = it->second;
        bool activating = account.active && !stored.active;
        bool changingType = account.active && account.type != stored.type;
        if (activating || changingType) {
            result.status = checkOpeningRules(account, maxActiveAccounts);
            if (result.status != AccountWriteStatus::WRITTEN) return result;
        }

        stored.type = account.type;
        stored.active = account.active;
        stored.version = expectedVersion + 1;
        stored.updatedAt = domain::Timestamp::now();

        result.status = AccountWriteStatus::WRITTEN;
        result.account = stored;
        return result;
    }

    ports::output::CommitResult commitMovement(const ports::output::MovementCommit& commit) override {
        using ports::output::CommitStatus;
        std::lock_guard<std::mutex> lock(mutex_);

        ports::output::CommitResult result;

        auto accIt = accounts_.find(commit.accountNumber);
        if (accIt == accounts_.end() ||
            accIt->second.version != commit.expectedVersion ||
            !accIt->second.active) {
            result.status = CommitStatus::VERSION_CONFLICT;
            return result;
        }

        const auto& movement = commit.movement;
        if (byTransaction_.count(movement.transactionId)) {
            result.status = CommitStatus::DUPLICATE_TRANSACTION;
            return result;
        }
        if (movement.idempotencyKey && byIdempotencyKey_.count(*movement.idempotencyKey)) {
            result.status = CommitStatus::DUPLICATE_IDEMPOTENCY_KEY;
            return result;
        }

        domain::Movement* original = nullptr;
        if (commit.reversesMovementId) {
            auto origIt = movements_.find(*commit.reversesMovementId);
            if (origIt == movements_.end()) {
                result.status = CommitStatus::VERSION_CONFLICT;
                return result;
            }
            if (origIt->second.reversed) {
                result.status = CommitStatus::ALREADY_REVERSED;
                return result;
            }
            original = &origIt->second;
        }

        // Все проверки пройдены, дальше только запись
        domain::Account& account = accIt->second;
        account.balance = commit.newBalance;
        account.version = commit.expectedVersion + 1;
        account.updatedAt = domain::Timestamp::now();

        movements_[movement.movementId] = movement;
        byTransaction_[movement.transactionId] = movement.movementId;
        if (movement.idempotencyKey) {
            byIdempotencyKey_[*movement.idempotencyKey] = movement.movementId;
        }
        byAccount_[commit.accountNumber].push_back(movement.movementId);

        if (original) {
            original->reversed = true;
            original->reversedMovementId = movement.movementId;
        }

        result.status = CommitStatus::COMMITTED;
        result.account = account;
        result.movement = movement;
        return result;
    }

    std::optional<domain::Movement> findMovement(const std::string& movementId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = movements_.find(movementId);
        if (it == movements_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::Movement> findMovementByTransactionId(const std::string& transactionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return findByIndex(byTransaction_, transactionId);
    }

    std::optional<domain::Movement> findMovementByIdempotencyKey(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return findByIndex(byIdempotencyKey_, key);
    }

    std::vector<domain::Movement> findMovementsByAccount(
        int64_t accountNumber,
        const std::optional<domain::Timestamp>& from = std::nullopt,
        const std::optional<domain::Timestamp>& to = std::nullopt) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Movement> result;

        auto it = byAccount_.find(accountNumber);
        if (it == byAccount_.end()) return result;

        // Обходим с конца: при равных createdAt новее та, что записана позже
        for (auto idIt = it->second.rbegin(); idIt != it->second.rend(); ++idIt) {
            const auto& movement = movements_.at(*idIt);
            if (from && movement.createdAt < *from) continue;
            if (to && movement.createdAt > *to) continue;
            result.push_back(movement);
        }

        std::stable_sort(result.begin(), result.end(),
            [](const domain::Movement& a, const domain::Movement& b) {
                return a.createdAt > b.createdAt;
            });
        return result;
    }

    ports::output::DeleteStatus deleteAccountCascade(int64_t accountNumber,
                                                     std::optional<int64_t> expectedVersion) override {
        using ports::output::DeleteStatus;
        std::lock_guard<std::mutex> lock(mutex_);
        auto accIt = accounts_.find(accountNumber);
        if (accIt == accounts_.end()) {
            return DeleteStatus::NOT_FOUND;
        }
        if (expectedVersion && accIt->second.version != *expectedVersion) {
            return DeleteStatus::VERSION_CONFLICT;
        }

        auto movIt = byAccount_.find(accountNumber);
        if (movIt != byAccount_.end()) {
            for (const auto& movementId : movIt->second) {
                auto it = movements_.find(movementId);
                if (it == movements_.end()) continue;
                byTransaction_.erase(it->second.transactionId);
                if (it->second.idempotencyKey) {
                    byIdempotencyKey_.erase(*it->second.idempotencyKey);
                }
                movements_.erase(it);
            }
            byAccount_.erase(movIt);
        }

        accounts_.erase(accIt);
        std::cout << "[InMemoryLedgerStore] Deleted account " << accountNumber
                  << " with movements" << std::endl;
        return DeleteStatus::DELETED;
    }

    // Test helpers
    size_t accountCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accounts_.size();
    }

    size_t movementCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return movements_.size();
    }

private:
    mutable std::mutex mutex_;
    int64_t nextAccountNumber_ = FIRST_ACCOUNT_NUMBER;

    std::map<int64_t, domain::Account> accounts_;
    std::unordered_map<std::string, domain::Movement> movements_;
    std::unordered_map<std::string, std::string> byTransaction_;
    std::unordered_map<std::string, std::string> byIdempotencyKey_;
    std::unordered_map<int64_t, std::vector<std::string>> byAccount_;

    /**
     * @brief Правила открытия для счёта, который станет активным
     *
     * Вызывается под mutex_. Сам счёт не учитывается.
     */
    ports::output::AccountWriteStatus checkOpeningRules(const domain::Account& account,
                                                        int maxActiveAccounts) const {
        int active = 0;
        bool sameType = false;
        for (const auto& [number, other] : accounts_) {
            if (number == account.accountNumber || !other.active ||
                other.owner.customerId != account.owner.customerId) {
                continue;
            }
            ++active;
            sameType = sameType || other.type == account.type;
        }
        if (active >= maxActiveAccounts) {
            return ports::output::AccountWriteStatus::ACTIVE_LIMIT_REACHED;
        }
        if (sameType) {
            return ports::output::AccountWriteStatus::ACTIVE_TYPE_EXISTS;
        }
        return ports::output::AccountWriteStatus::WRITTEN;
    }

    std::optional<domain::Movement> findByIndex(
        const std::unordered_map<std::string, std::string>& index,
        const std::string& key) const
    {
        auto it = index.find(key);
        if (it == index.end()) return std::nullopt;
        auto movIt = movements_.find(it->second);
        if (movIt == movements_.end()) return std::nullopt;
        return movIt->second;
    }
};

} // namespace ledger::adapters::secondary
