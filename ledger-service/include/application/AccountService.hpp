#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/CustomerConsistencyCache.hpp"
#include "application/LedgerEventPublisher.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/events/AccountCreatedEvent.hpp"
#include "domain/events/AccountDeletedEvent.hpp"
#include "settings/LedgerSettings.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Сервис управления счетами
 *
 * Правила открытия: не более LEDGER_MAX_ACTIVE_ACCOUNTS активных счетов
 * на клиента и не более одного активного счёта каждой категории.
 * Проверяет их хранилище атомарно с записью счёта.
 */
class AccountService : public ports::input::IAccountService {
public:
    AccountService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<CustomerConsistencyCache> customers,
        std::shared_ptr<LedgerEventPublisher> publisher,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , customers_(std::move(customers))
      , publisher_(std::move(publisher))
      , metrics_(std::move(metrics))
      , settings_(std::move(settings))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    domain::Account createAccount(const ports::input::CreateAccountCommand& command) override {
        if (command.customerId.empty()) {
            throw domain::ValidationError("customerId is required");
        }
        if (command.customerId.size() > domain::AccountOwner::MAX_CUSTOMER_ID_LENGTH) {
            throw domain::ValidationError("customerId is longer than " +
                                          std::to_string(domain::AccountOwner::MAX_CUSTOMER_ID_LENGTH) +
                                          " characters");
        }

        // Только живой запрос: кэшу при открытии счёта не доверяем
        auto customer = customers_->verifyLive(command.customerId);
        if (customer.status == ports::output::CustomerLookupStatus::NOT_FOUND) {
            throw domain::NotFoundError("Customer not found: " + command.customerId);
        }
        if (customer.status == ports::output::CustomerLookupStatus::INACTIVE) {
            throw domain::ValidationError("Customer is not active: " + command.customerId);
        }

        domain::Account account(owner(command.customerId, customer.name), command.type);
        auto written = store_->insertAccount(account, settings_->getMaxActiveAccounts());
        requireWritten(written, account);
        const auto& stored = *written.account;

        std::cout << "[AccountService] Opened " << domain::toString(stored.type)
                  << " account " << stored.accountNumber << " for " << command.customerId << std::endl;

        publishCreated(stored, command.correlationId);
        return stored;
    }

    std::optional<domain::Account> openDefaultAccount(
        const std::string& customerId,
        const std::string& customerName,
        const std::optional<std::string>& correlationId) override
    {
        if (customerId.empty() || customerId.size() > domain::AccountOwner::MAX_CUSTOMER_ID_LENGTH) {
            std::cerr << "[AccountService] Default account skipped: bad customerId '"
                      << customerId << "'" << std::endl;
            return std::nullopt;
        }

        domain::Account account(owner(customerId, customerName), domain::AccountType::SAVINGS);
        auto written = store_->insertAccount(account, settings_->getMaxActiveAccounts());
        if (written.status != ports::output::AccountWriteStatus::WRITTEN) {
            std::cout << "[AccountService] Default account skipped for " << customerId
                      << ": " << ports::output::toString(written.status) << std::endl;
            return std::nullopt;
        }
        const auto& stored = *written.account;

        std::cout << "[AccountService] Opened default SAVINGS account " << stored.accountNumber
                  << " for " << customerId << std::endl;

        publishCreated(stored, correlationId);
        return stored;
    }

    domain::Account updateAccount(int64_t accountNumber,
                                  const ports::input::UpdateAccountCommand& command) override {
        int attempts = 1 + std::max(0, settings_->getMaxRetries());

        for (int attempt = 0; attempt < attempts; ++attempt) {
            auto current = requireAccount(accountNumber);

            domain::Account updated = current;
            if (command.type) updated.type = *command.type;
            if (command.active) updated.active = *command.active;

            auto written = store_->updateAccount(updated, current.version, settings_->getMaxActiveAccounts());
            if (written.status != ports::output::AccountWriteStatus::VERSION_CONFLICT) {
                requireWritten(written, updated);
                std::cout << "[AccountService] Updated account " << accountNumber
                          << " type=" << domain::toString(written.account->type)
                          << " active=" << written.account->active << std::endl;
                return *written.account;
            }

            metrics_->increment("ledger_version_conflicts_total");
            std::cout << "[AccountService] Version conflict updating " << accountNumber
                      << " (attempt " << attempt + 1 << "/" << attempts << ")" << std::endl;
        }

        throw domain::ConcurrentModificationError(
            "Account " + std::to_string(accountNumber) + " modified concurrently");
    }

    domain::Account getAccount(int64_t accountNumber) override {
        return requireAccount(accountNumber);
    }

    std::vector<domain::Account> getAccountsByCustomer(const std::string& customerId) override {
        return store_->findAccountsByCustomer(customerId);
    }

    ports::input::BalanceView getBalance(int64_t accountNumber) override {
        auto account = requireAccount(accountNumber);
        return ports::input::BalanceView{
            account.accountNumber,
            account.balance,
            account.active,
            account.version
        };
    }

    void deleteAccount(int64_t accountNumber, bool hard) override {
        if (hard) {
            hardDelete(accountNumber);
            return;
        }

        auto account = requireAccount(accountNumber);
        if (!account.active) {
            std::cout << "[AccountService] Account " << accountNumber << " already inactive" << std::endl;
            return;
        }

        ports::input::UpdateAccountCommand deactivate;
        deactivate.active = false;
        auto updated = updateAccount(accountNumber, deactivate);

        metrics_->increment("ledger_accounts_deleted_total");
        std::cout << "[AccountService] Soft-deleted account " << accountNumber << std::endl;
        publishDeleted(updated, domain::AccountDeletedEvent::Mode::SOFT, "command");
    }

    int deleteAccountsByCustomer(const std::string& customerId) override {
        auto accounts = store_->findAccountsByCustomer(customerId);
        int deleted = 0;

        for (const auto& account : accounts) {
            try {
                auto status = store_->deleteAccountCascade(account.accountNumber, std::nullopt);
                if (status != ports::output::DeleteStatus::DELETED) {
                    std::cout << "[AccountService] Account " << account.accountNumber
                              << " already gone" << std::endl;
                    continue;
                }
                ++deleted;
                metrics_->increment("ledger_accounts_deleted_total");
                publishDeleted(account, domain::AccountDeletedEvent::Mode::HARD, "customer.deleted");
            } catch (const std::exception& e) {
                std::cerr << "[AccountService] Failed to delete account " << account.accountNumber
                          << " of " << customerId << ": " << e.what() << std::endl;
            }
        }

        std::cout << "[AccountService] Deleted " << deleted << "/" << accounts.size()
                  << " accounts of " << customerId << std::endl;
        return deleted;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<CustomerConsistencyCache> customers_;
    std::shared_ptr<LedgerEventPublisher> publisher_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    domain::Account requireAccount(int64_t accountNumber) {
        auto account = store_->findAccount(accountNumber);
        if (!account) {
            throw domain::NotFoundError("Account not found: " + std::to_string(accountNumber));
        }
        return *account;
    }

    /**
     * @brief Удаление с проводками, только при нулевом балансе
     *
     * Баланс проверяется по прочитанной версии, а удаление выполняется
     * под той же версией: проводка между чтением и удалением даёт повтор.
     */
    void hardDelete(int64_t accountNumber) {
        int attempts = 1 + std::max(0, settings_->getMaxRetries());

        for (int attempt = 0; attempt < attempts; ++attempt) {
            auto account = requireAccount(accountNumber);
            if (!account.balance.isZero()) {
                throw domain::ValidationError(
                    "Account " + std::to_string(accountNumber) + " has non-zero balance " +
                    account.balance.toString());
            }

            auto status = store_->deleteAccountCascade(accountNumber, account.version);
            if (status == ports::output::DeleteStatus::NOT_FOUND) {
                throw domain::NotFoundError("Account not found: " + std::to_string(accountNumber));
            }
            if (status == ports::output::DeleteStatus::DELETED) {
                metrics_->increment("ledger_accounts_deleted_total");
                std::cout << "[AccountService] Hard-deleted account " << accountNumber << std::endl;
                publishDeleted(account, domain::AccountDeletedEvent::Mode::HARD, "command");
                return;
            }

            metrics_->increment("ledger_version_conflicts_total");
            std::cout << "[AccountService] Version conflict deleting " << accountNumber
                      << " (attempt " << attempt + 1 << "/" << attempts << ")" << std::endl;
        }

        throw domain::ConcurrentModificationError(
            "Account " + std::to_string(accountNumber) + " modified concurrently");
    }

    /**
     * @brief Отказ хранилища по правилам открытия в ValidationError
     *
     * Правила проверяет хранилище в одной транзакции с записью.
     */
    void requireWritten(const ports::output::AccountWriteResult& written,
                        const domain::Account& account) const {
        using ports::output::AccountWriteStatus;
        switch (written.status) {
            case AccountWriteStatus::WRITTEN:
                return;
            case AccountWriteStatus::ACTIVE_LIMIT_REACHED:
                throw domain::ValidationError(
                    "Customer " + account.owner.customerId + " already has " +
                    std::to_string(settings_->getMaxActiveAccounts()) + " active accounts");
            case AccountWriteStatus::ACTIVE_TYPE_EXISTS:
                throw domain::ValidationError(
                    "Customer " + account.owner.customerId + " already has an active " +
                    domain::toString(account.type) + " account");
            case AccountWriteStatus::VERSION_CONFLICT:
                break;
        }
        throw domain::ConcurrentModificationError(
            "Account " + std::to_string(account.accountNumber) + " modified concurrently");
    }

    /// Снимок владельца; имя обрезается до колонки customer_name по границе символа UTF-8
    static domain::AccountOwner owner(const std::string& customerId, const std::string& name) {
        domain::AccountOwner result{customerId, name};
        if (result.name.size() > domain::AccountOwner::MAX_NAME_LENGTH) {
            size_t cut = domain::AccountOwner::MAX_NAME_LENGTH;
            while (cut > 0 && (static_cast<unsigned char>(result.name[cut]) & 0xC0) == 0x80) {
                --cut;
            }
            result.name.resize(cut);
        }
        return result;
    }

    void publishCreated(const domain::Account& account, const std::optional<std::string>& correlationId) {
        domain::AccountCreatedEvent event(account);
        event.eventId = utils::UuidGenerator::generate();
        event.correlationId = correlationId;
        publisher_->publish("account.created", std::to_string(account.accountNumber), event);
    }

    void publishDeleted(const domain::Account& account,
                        domain::AccountDeletedEvent::Mode mode,
                        const std::string& reason) {
        domain::AccountDeletedEvent event(account, mode, reason);
        event.eventId = utils::UuidGenerator::generate();
        publisher_->publish("account.deleted", std::to_string(account.accountNumber), event);
    }
};

} // namespace ledger::application
