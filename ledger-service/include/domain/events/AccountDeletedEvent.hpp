#pragma once

#include "DomainEvent.hpp"
#include "domain/Account.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Событие: счёт закрыт (SOFT) или удалён вместе с проводками (HARD)
 */
struct AccountDeletedEvent : public DomainEvent {
    enum class Mode { SOFT, HARD };

    int64_t accountNumber = 0;
    std::string customerId;
    Mode mode = Mode::SOFT;
    std::string reason;     ///< "command" или "customer.deleted"

    AccountDeletedEvent() : DomainEvent("account.deleted") {}

    AccountDeletedEvent(const Account& account, Mode mode, const std::string& reason)
        : DomainEvent("account.deleted")
        , accountNumber(account.accountNumber)
        , customerId(account.owner.customerId)
        , mode(mode)
        , reason(reason) {}

    std::string toJson() const override;
};

} // namespace ledger::domain
