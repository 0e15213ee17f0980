#include "domain/events/AccountDeletedEvent.hpp"
#include <nlohmann/json.hpp>

namespace ledger::domain {

std::string AccountDeletedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    if (correlationId) {
        j["correlationId"] = *correlationId;
    }
    j["accountNumber"] = accountNumber;
    j["customerId"] = customerId;
    j["mode"] = (mode == Mode::HARD) ? "HARD" : "SOFT";
    j["reason"] = reason;
    return j.dump();
}

} // namespace ledger::domain
