#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Публикуется в шину после фиксации изменения в хранилище.
 */
struct DomainEvent {
    std::string eventId;                        ///< UUID события
    std::string eventType;                      ///< Тип события (account.created, movement.created)
    Timestamp timestamp;                        ///< Время создания события
    std::optional<std::string> correlationId;   ///< Для трассировки

    DomainEvent() : timestamp(Timestamp::now()) {}

    explicit DomainEvent(const std::string& type)
        : eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;
};

} // namespace ledger::domain
