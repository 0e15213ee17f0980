#include "domain/events/AccountCreatedEvent.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

std::string AccountCreatedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    if (correlationId) {
        j["correlationId"] = *correlationId;
    }
    j["accountNumber"] = account.accountNumber;
    j["customerId"] = account.owner.customerId;
    j["customerName"] = account.owner.name;
    j["accountType"] = toString(account.type);
    j["balance"] = account.balance.toString();
    j["active"] = account.active;
    j["createdAt"] = account.createdAt.toString();
    return j.dump();
}

} // namespace ledger::domain
