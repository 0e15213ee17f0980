#pragma once

#include <string>
#include <vector>
#include <functional>

namespace ledger::ports::output {

/**
 * @brief Тип обработчика событий
 *
 * @param routingKey Ключ маршрутизации события
 * @param message JSON-сообщение с данными события
 */
using EventHandler = std::function<void(const std::string& routingKey, const std::string& message)>;

/**
 * @brief Интерфейс потребителя событий
 *
 * @example
 * ```cpp
 * eventConsumer->subscribe({"customer.created", "customer.deleted"},
 *     [this](const std::string& routingKey, const std::string& message) {
 *         handle(routingKey, message);
 *     });
 * eventConsumer->start();
 * ```
 */
class IEventConsumer {
public:
    virtual ~IEventConsumer() = default;

    /**
     * @brief Подписаться на события
     * @param routingKeys Список ключей маршрутизации для подписки
     * @param handler Обработчик событий
     */
    virtual void subscribe(const std::vector<std::string>& routingKeys, EventHandler handler) = 0;

    virtual void start() = 0;

    virtual void stop() = 0;
};

} // namespace ledger::ports::output
