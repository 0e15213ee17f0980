#pragma once

#include "domain/Account.hpp"
#include "domain/Movement.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Результат атомарной записи проводки
 */
enum class CommitStatus {
    COMMITTED,
    VERSION_CONFLICT,           ///< Версия счёта изменилась или счёт закрыт/удалён
    DUPLICATE_TRANSACTION,      ///< Нарушена уникальность transaction_id
    DUPLICATE_IDEMPOTENCY_KEY,  ///< Нарушена уникальность idempotency_key
    ALREADY_REVERSED            ///< Исходная проводка уже сторнирована
};

inline std::string toString(CommitStatus status) {
    switch (status) {
        case CommitStatus::COMMITTED:                 return "COMMITTED";
        case CommitStatus::VERSION_CONFLICT:          return "VERSION_CONFLICT";
        case CommitStatus::DUPLICATE_TRANSACTION:     return "DUPLICATE_TRANSACTION";
        case CommitStatus::DUPLICATE_IDEMPOTENCY_KEY: return "DUPLICATE_IDEMPOTENCY_KEY";
        case CommitStatus::ALREADY_REVERSED:          return "ALREADY_REVERSED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Результат записи атрибутов счёта
 */
enum class AccountWriteStatus {
    WRITTEN,
    VERSION_CONFLICT,       ///< Версия счёта изменилась или счёт удалён
    ACTIVE_TYPE_EXISTS,     ///< У клиента уже есть активный счёт этой категории
    ACTIVE_LIMIT_REACHED    ///< У клиента уже maxActiveAccounts активных счетов
};

inline std::string toString(AccountWriteStatus status) {
    switch (status) {
        case AccountWriteStatus::WRITTEN:              return "WRITTEN";
        case AccountWriteStatus::VERSION_CONFLICT:     return "VERSION_CONFLICT";
        case AccountWriteStatus::ACTIVE_TYPE_EXISTS:   return "ACTIVE_TYPE_EXISTS";
        case AccountWriteStatus::ACTIVE_LIMIT_REACHED: return "ACTIVE_LIMIT_REACHED";
        default: return "UNKNOWN";
    }
}

struct AccountWriteResult {
    AccountWriteStatus status = AccountWriteStatus::VERSION_CONFLICT;
    std::optional<domain::Account> account;         ///< Записанный счёт при WRITTEN
};

enum class DeleteStatus {
    DELETED,
    NOT_FOUND,
    VERSION_CONFLICT        ///< Счёт изменился после чтения
};

/**
 * @brief Одна единица записи: новый баланс + новая проводка (+ отметка сторно)
 */
struct MovementCommit {
    int64_t accountNumber = 0;
    int64_t expectedVersion = 0;                    ///< CAS по версии счёта
    domain::Money newBalance;
    domain::Movement movement;
    std::optional<std::string> reversesMovementId;  ///< Пометить исходную проводку reversed
};

struct CommitResult {
    CommitStatus status = CommitStatus::VERSION_CONFLICT;
    std::optional<domain::Account> account;         ///< Счёт после записи (version + 1)
    std::optional<domain::Movement> movement;       ///< Записанная проводка
};

/**
 * @brief Хранилище счетов и проводок
 *
 * Все изменения одного счёта сериализуются через version (compare-and-swap),
 * глобальных блокировок нет. commitMovement атомарен: либо меняются и баланс,
 * и проводка (и отметка у сторнируемой), либо ничего.
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /**
     * @brief Сохранить новый счёт, номер выдаёт хранилище
     *
     * Правила открытия проверяются в той же транзакции, что и запись:
     * два параллельных запроса одного клиента не обойдут их оба.
     * @param maxActiveAccounts Лимит активных счетов клиента
     * @return WRITTEN и счёт с присвоенным accountNumber, либо нарушенное правило
     */
    virtual AccountWriteResult insertAccount(const domain::Account& account, int maxActiveAccounts) = 0;

    virtual std::optional<domain::Account> findAccount(int64_t accountNumber) = 0;

    virtual std::vector<domain::Account> findAccountsByCustomer(const std::string& customerId) = 0;

    /**
     * @brief Обновить атрибуты счёта (тип, active) под версией
     *
     * Баланс через этот метод не меняется. Правила открытия проверяются
     * атомарно с записью, если счёт становится активным или меняет категорию.
     */
    virtual AccountWriteResult updateAccount(const domain::Account& account,
                                             int64_t expectedVersion,
                                             int maxActiveAccounts) = 0;

    virtual CommitResult commitMovement(const MovementCommit& commit) = 0;

    virtual std::optional<domain::Movement> findMovement(const std::string& movementId) = 0;
    virtual std::optional<domain::Movement> findMovementByTransactionId(const std::string& transactionId) = 0;
    virtual std::optional<domain::Movement> findMovementByIdempotencyKey(const std::string& key) = 0;

    /**
     * @brief Проводки счёта, новые сверху
     * @param from,to Необязательные границы createdAt, включительно
     */
    virtual std::vector<domain::Movement> findMovementsByAccount(
        int64_t accountNumber,
        const std::optional<domain::Timestamp>& from = std::nullopt,
        const std::optional<domain::Timestamp>& to = std::nullopt) = 0;

    /**
     * @brief Удалить счёт и все его проводки одной транзакцией
     * @param expectedVersion Удалить, только если версия счёта не изменилась;
     *        nullopt удаляет безусловно
     */
    virtual DeleteStatus deleteAccountCascade(int64_t accountNumber,
                                              std::optional<int64_t> expectedVersion) = 0;
};

} // namespace ledger::ports::output
