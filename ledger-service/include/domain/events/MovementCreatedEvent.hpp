#pragma once

#include "DomainEvent.hpp"
#include "domain/Movement.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Событие: проведено движение по счёту
 */
struct MovementCreatedEvent : public DomainEvent {
    Movement movement;
    std::string customerId;

    MovementCreatedEvent() : DomainEvent("movement.created") {}

    MovementCreatedEvent(const Movement& m, const std::string& customerId)
        : DomainEvent("movement.created")
        , movement(m)
        , customerId(customerId)
    {
        correlationId = m.correlationId;
    }

    std::string toJson() const override;
};

} // namespace ledger::domain
