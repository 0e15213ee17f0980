#pragma once

#include "domain/Statement.hpp"
#include <string>

namespace ledger::ports::input {

/**
 * @brief Интерфейс формирования выписок
 */
class IStatementService {
public:
    virtual ~IStatementService() = default;

    /**
     * @brief Выписка по всем счетам клиента
     * @param startDate,endDate "YYYY-MM-DD", включительно
     * @throws domain::ValidationError при некорректных датах или startDate > endDate
     */
    virtual domain::StatementReport generateStatement(const std::string& customerId,
                                                      const std::string& startDate,
                                                      const std::string& endDate) = 0;
};

} // namespace ledger::ports::input
