#pragma once

#include "domain/Account.hpp"
#include "domain/enums/AccountType.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Запрос на открытие счёта
 */
struct CreateAccountCommand {
    std::string customerId;
    domain::AccountType type = domain::AccountType::SAVINGS;
    std::optional<std::string> correlationId;
};

/**
 * @brief Изменение атрибутов счёта, пустые поля не меняются
 */
struct UpdateAccountCommand {
    std::optional<domain::AccountType> type;
    std::optional<bool> active;
};

/**
 * @brief Баланс счёта
 */
struct BalanceView {
    int64_t accountNumber = 0;
    domain::Money balance;
    bool active = false;
    int64_t version = 0;
};

/**
 * @brief Интерфейс сервиса управления счетами
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Открыть счёт для активного клиента
     *
     * Клиент проверяется живым запросом в Customer service, кэш не используется.
     * @throws domain::CustomerUnavailableError если Customer service недоступен
     * @throws domain::ValidationError при нарушении правил открытия
     */
    virtual domain::Account createAccount(const CreateAccountCommand& command) = 0;

    /**
     * @brief Открыть SAVINGS счёт новому клиенту по событию customer.created
     *
     * Живой запрос не делается: событие само подтверждает существование клиента.
     * @return nullopt если у клиента уже есть активный SAVINGS или достигнут лимит
     */
    virtual std::optional<domain::Account> openDefaultAccount(
        const std::string& customerId,
        const std::string& customerName,
        const std::optional<std::string>& correlationId) = 0;

    virtual domain::Account updateAccount(int64_t accountNumber, const UpdateAccountCommand& command) = 0;

    /**
     * @throws domain::NotFoundError
     */
    virtual domain::Account getAccount(int64_t accountNumber) = 0;

    virtual std::vector<domain::Account> getAccountsByCustomer(const std::string& customerId) = 0;

    virtual BalanceView getBalance(int64_t accountNumber) = 0;

    /**
     * @brief Закрыть счёт
     * @param hard true: удалить счёт и проводки (только при нулевом балансе),
     *             false: снять флаг active
     */
    virtual void deleteAccount(int64_t accountNumber, bool hard) = 0;

    /**
     * @brief Удалить все счета клиента
     *
     * Ошибка по одному счёту не прерывает остальные.
     * @return Количество удалённых счетов
     */
    virtual int deleteAccountsByCustomer(const std::string& customerId) = 0;
};

} // namespace ledger::ports::input
