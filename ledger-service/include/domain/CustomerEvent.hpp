#pragma once

#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace ledger::domain {

enum class CustomerEventType {
    CREATED,
    UPDATED,
    DELETED
};

inline std::string toString(CustomerEventType type) {
    switch (type) {
        case CustomerEventType::CREATED: return "customer.created";
        case CustomerEventType::UPDATED: return "customer.updated";
        case CustomerEventType::DELETED: return "customer.deleted";
        default: return "customer.unknown";
    }
}

/**
 * @brief Событие жизненного цикла клиента из Customer service
 *
 * Приходит из banking.customer.events с routing key customer.*.
 */
struct CustomerEvent {
    std::string eventId;
    CustomerEventType type = CustomerEventType::UPDATED;
    Timestamp timestamp;
    std::string customerId;
    std::string name;
    bool active = true;
    std::optional<std::string> correlationId;

    /**
     * @brief Разобрать JSON события
     *
     * Тип берётся из поля eventType, а если его нет, из routingKey.
     * Флаг активности по правилам customer_json::activeFlag, без него клиент активен.
     * timestamp: ISO 8601 строка или epoch millis.
     *
     * @throws std::invalid_argument при отсутствии eventId/customerId
     *         или неизвестном типе события
     */
    static CustomerEvent fromJson(const std::string& json, const std::string& routingKey = "");
};

} // namespace ledger::domain
