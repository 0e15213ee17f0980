#include "domain/events/MovementCreatedEvent.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

std::string MovementCreatedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    if (correlationId) {
        j["correlationId"] = *correlationId;
    }
    j["movementId"] = movement.movementId;
    j["accountNumber"] = movement.accountNumber;
    j["customerId"] = customerId;
    j["movementType"] = toString(movement.type);
    // Суммы строкой, чтобы не терять копейки на double
    j["amount"] = movement.amount.toString();
    j["balanceBefore"] = movement.balanceBefore.toString();
    j["balanceAfter"] = movement.balanceAfter.toString();
    j["transactionId"] = movement.transactionId;
    if (movement.idempotencyKey) {
        j["idempotencyKey"] = *movement.idempotencyKey;
    }
    if (movement.reversedMovementId) {
        j["reversedMovementId"] = *movement.reversedMovementId;
    }
    j["description"] = movement.description;
    j["reference"] = movement.reference;
    j["createdAt"] = movement.createdAt.toString();
    return j.dump();
}

} // namespace ledger::domain
