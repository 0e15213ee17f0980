#pragma once

#include "DomainEvent.hpp"
#include "domain/Account.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Событие: открыт счёт
 */
struct AccountCreatedEvent : public DomainEvent {
    Account account;

    AccountCreatedEvent() : DomainEvent("account.created") {}

    explicit AccountCreatedEvent(const Account& acc)
        : DomainEvent("account.created")
        , account(acc) {}

    std::string toJson() const override;
};

} // namespace ledger::domain
