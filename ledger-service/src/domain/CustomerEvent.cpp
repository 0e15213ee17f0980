#include "domain/CustomerEvent.hpp"
#include "domain/CustomerJson.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace ledger::domain {

namespace {

CustomerEventType parseType(const std::string& type) {
    if (type == "customer.created" || type == "CUSTOMER_CREATED") return CustomerEventType::CREATED;
    if (type == "customer.updated" || type == "CUSTOMER_UPDATED") return CustomerEventType::UPDATED;
    if (type == "customer.deleted" || type == "CUSTOMER_DELETED") return CustomerEventType::DELETED;
    throw std::invalid_argument("Unknown customer event type: " + type);
}

std::string readId(const nlohmann::json& j, const char* field) {
    if (!j.contains(field) || j[field].is_null()) return "";
    if (j[field].is_string()) return j[field].get<std::string>();
    return j[field].dump();
}

} // namespace

CustomerEvent CustomerEvent::fromJson(const std::string& json, const std::string& routingKey) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("Malformed customer event: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::invalid_argument("Customer event is not a JSON object");
    }

    CustomerEvent event;
    event.eventId = readId(j, "eventId");
    event.customerId = readId(j, "customerId");

    if (event.eventId.empty()) {
        throw std::invalid_argument("Customer event without eventId");
    }
    if (event.customerId.empty()) {
        throw std::invalid_argument("Customer event without customerId");
    }

    std::string type = customer_json::stringField(j, "eventType");
    event.type = parseType(type.empty() ? routingKey : type);

    if (j.contains("timestamp") && j["timestamp"].is_number_integer()) {
        event.timestamp = Timestamp::fromEpochMillis(j["timestamp"].get<int64_t>());
    } else if (j.contains("timestamp") && j["timestamp"].is_string()) {
        event.timestamp = Timestamp::fromString(j["timestamp"].get<std::string>());
    } else {
        throw std::invalid_argument("Customer event without timestamp");
    }

    event.name = customer_json::stringField(j, "name");

    if (auto active = customer_json::activeFlag(j)) {
        event.active = *active;
    }
    if (event.type == CustomerEventType::DELETED) {
        event.active = false;
    }

    if (j.contains("correlationId") && j["correlationId"].is_string()) {
        event.correlationId = j["correlationId"].get<std::string>();
    }

    return event;
}

} // namespace ledger::domain
