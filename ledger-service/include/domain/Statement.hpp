#pragma once

#include "Account.hpp"
#include "Movement.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Период выписки: календарные дни UTC, границы включительно
 */
struct StatementPeriod {
    std::string startDate;  ///< "YYYY-MM-DD"
    std::string endDate;    ///< "YYYY-MM-DD"
    Timestamp from;         ///< startDate 00:00:00.000
    Timestamp to;           ///< endDate 23:59:59.999
};

/**
 * @brief Выписка по одному счёту
 */
struct AccountStatement {
    Account account;
    Money openingBalance;
    Money closingBalance;
    std::vector<Movement> movements;    ///< Новые сверху
    Money totalCredits;
    Money totalDebits;
    int64_t reversalCount = 0;
};

struct StatementSummary {
    int64_t accountCount = 0;
    int64_t movementCount = 0;
    Money totalCredits;
    Money totalDebits;
    Money netChange;
};

/**
 * @brief Отчёт по всем счетам клиента за период
 */
struct StatementReport {
    std::string reportId;
    Timestamp generatedAt;
    std::string customerId;
    std::string customerName;
    StatementPeriod period;
    std::vector<AccountStatement> perAccount;
    StatementSummary summary;

    /// Сумма изменений (closing - opening) по всем счетам
    Money netChange() const { return summary.netChange; }
};

} // namespace ledger::domain
