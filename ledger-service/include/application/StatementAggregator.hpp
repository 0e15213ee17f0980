#pragma once

#include "ports/input/IStatementService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "domain/LedgerErrors.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <stdexcept>
#include <iostream>

namespace ledger::application {

/**
 * @brief Формирование выписок по счетам клиента
 *
 * Только чтение. Для каждого счёта берутся проводки с createdAt в
 * [startDate 00:00, endDate 23:59:59.999] UTC, новые сверху.
 *
 * closing: текущий баланс, если период захватывает "сейчас"; иначе баланс
 * после последней проводки периода; если в периоде проводок нет, текущий
 * баланс за вычетом всех проводок после конца периода.
 * opening = closing - сумма знаковых изменений проводок периода.
 *
 * totalCredits/totalDebits считают только CREDIT/DEBIT, сторно входит
 * лишь в изменение баланса.
 */
class StatementAggregator : public ports::input::IStatementService {
public:
    explicit StatementAggregator(std::shared_ptr<ports::output::ILedgerStore> store)
        : store_(std::move(store))
    {
        std::cout << "[StatementAggregator] Created" << std::endl;
    }

    domain::StatementReport generateStatement(const std::string& customerId,
                                              const std::string& startDate,
                                              const std::string& endDate) override {
        if (customerId.empty()) {
            throw domain::ValidationError("customerId is required");
        }

        domain::StatementReport report;
        report.reportId = utils::UuidGenerator::generateWithPrefix("stmt");
        report.generatedAt = domain::Timestamp::now();
        report.customerId = customerId;
        report.period = parsePeriod(startDate, endDate);

        auto accounts = store_->findAccountsByCustomer(customerId);
        for (const auto& account : accounts) {
            if (report.customerName.empty()) {
                report.customerName = account.owner.name;
            }
            auto statement = buildAccountStatement(account, report.period, report.generatedAt);

            report.summary.accountCount += 1;
            report.summary.movementCount += static_cast<int64_t>(statement.movements.size());
            report.summary.totalCredits += statement.totalCredits;
            report.summary.totalDebits += statement.totalDebits;
            report.summary.netChange += statement.closingBalance - statement.openingBalance;

            report.perAccount.push_back(std::move(statement));
        }

        std::cout << "[StatementAggregator] Statement " << report.reportId << " for " << customerId
                  << " " << startDate << ".." << endDate << ": " << report.summary.accountCount
                  << " accounts, " << report.summary.movementCount << " movements" << std::endl;
        return report;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;

    static domain::StatementPeriod parsePeriod(const std::string& startDate, const std::string& endDate) {
        domain::StatementPeriod period;
        period.startDate = startDate;
        period.endDate = endDate;
        try {
            period.from = domain::Timestamp::fromDate(startDate);
            period.to = domain::Timestamp::fromDate(endDate).endOfDay();
        } catch (const std::invalid_argument& e) {
            throw domain::ValidationError(e.what());
        }
        if (period.from > period.to) {
            throw domain::ValidationError("startDate " + startDate + " is after endDate " + endDate);
        }
        return period;
    }

    domain::AccountStatement buildAccountStatement(const domain::Account& account,
                                                   const domain::StatementPeriod& period,
                                                   const domain::Timestamp& now) {
        domain::AccountStatement statement;
        statement.account = account;
        statement.movements = store_->findMovementsByAccount(account.accountNumber, period.from, period.to);

        domain::Money inRangeNet;
        for (const auto& m : statement.movements) {
            inRangeNet += m.netEffect();
            switch (m.type) {
                case domain::MovementType::CREDIT:   statement.totalCredits += m.amount; break;
                case domain::MovementType::DEBIT:    statement.totalDebits += m.amount; break;
                case domain::MovementType::REVERSAL: statement.reversalCount += 1; break;
            }
        }

        if (period.to >= now) {
            statement.closingBalance = account.balance;
        } else if (!statement.movements.empty()) {
            statement.closingBalance = statement.movements.front().balanceAfter;
        } else {
            // Откатываем текущий баланс на проводки после конца периода
            domain::Money afterRange;
            for (const auto& m : store_->findMovementsByAccount(account.accountNumber, period.to.addMillis(1))) {
                afterRange += m.netEffect();
            }
            statement.closingBalance = account.balance - afterRange;
        }

        statement.openingBalance = statement.closingBalance - inRangeNet;
        return statement;
    }
};

} // namespace ledger::application
