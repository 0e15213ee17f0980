#pragma once

#include <string>
#include <optional>

namespace ledger::ports::output {

/**
 * @brief Готовое к отправке сообщение
 *
 * topic становится routing key, partitionKey (номер счёта или ID клиента)
 * уходит заголовком и задаёт порядок событий одной сущности.
 */
struct OutboundMessage {
    std::string topic;
    std::string partitionKey;
    std::string eventType;
    std::string body;
    std::string timestamp;
    std::optional<std::string> correlationId;
};

/**
 * @brief Интерфейс транспорта публикации событий
 *
 * Реализуется RabbitMQAdapter.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Отправить сообщение в брокер
     * @throws std::runtime_error если отправить не удалось
     */
    virtual void publish(const OutboundMessage& message) = 0;
};

} // namespace ledger::ports::output
