#pragma once

#include "domain/events/DomainEvent.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/input/IMetricsService.hpp"
#include "settings/LedgerSettings.hpp"
#include <ICommand.hpp>
#include <CommandException.hpp>
#include <ThreadSafeQueue.hpp>
#include <memory>
#include <string>
#include <thread>
#include <mutex>
#include <iostream>

namespace ledger::application {

/**
 * @brief Отправка одного сообщения в транспорт
 */
class PublishCommand : public ICommand {
public:
    PublishCommand(std::shared_ptr<ports::output::IEventPublisher> transport,
                   ports::output::OutboundMessage message)
        : transport_(std::move(transport))
        , message_(std::move(message)) {}

    void execute() override {
        try {
            transport_->publish(message_);
        } catch (const std::exception& e) {
            throw CommandException(name(), e.what());
        }
    }

    std::string name() const override {
        return "publish " + message_.topic + " key=" + message_.partitionKey;
    }

private:
    std::shared_ptr<ports::output::IEventPublisher> transport_;
    ports::output::OutboundMessage message_;
};

/**
 * @brief Fire-and-forget публикация доменных событий
 *
 * publish() только сериализует событие и ставит команду в очередь,
 * вызывающий поток не ждёт брокер и никогда не получает исключение.
 * Один фоновый поток отправляет сообщения по порядку, поэтому события
 * одной сущности уходят в порядке публикации.
 *
 * Очередь ограничена LEDGER_PUBLISH_QUEUE_CAPACITY: пока брокер тормозит,
 * лишние события отбрасываются, а не копятся в памяти.
 *
 * Потерянное событие (ошибка сериализации, ошибка брокера, переполнение
 * очереди, публикация после остановки) пишется в лог и в
 * ledger_events_publish_failed_total. Доставка at-most-once.
 */
class LedgerEventPublisher {
public:
    LedgerEventPublisher(
        std::shared_ptr<ports::output::IEventPublisher> transport,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : transport_(std::move(transport))
      , metrics_(std::move(metrics))
      , queue_(settings->getPublishQueueCapacity())
    {
        worker_ = std::thread([this]() { run(); });
        std::cout << "[LedgerEventPublisher] Created" << std::endl;
    }

    ~LedgerEventPublisher() {
        stop();
    }

    LedgerEventPublisher(const LedgerEventPublisher&) = delete;
    LedgerEventPublisher& operator=(const LedgerEventPublisher&) = delete;

    /**
     * @brief Поставить событие в очередь на отправку
     * @param topic Routing key (account.created, movement.created)
     * @param partitionKey ID сущности: номер счёта или ID клиента
     */
    void publish(const std::string& topic,
                 const std::string& partitionKey,
                 const domain::DomainEvent& event) {
        ports::output::OutboundMessage message;
        try {
            message.topic = topic;
            message.partitionKey = partitionKey;
            message.eventType = event.eventType;
            message.timestamp = event.timestamp.toString();
            message.correlationId = event.correlationId;
            message.body = event.toJson();
        } catch (const std::exception& e) {
            metrics_->increment("ledger_events_publish_failed_total");
            std::cerr << "[LedgerEventPublisher] Serialization failed for " << topic
                      << " key=" << partitionKey << ": " << e.what() << std::endl;
            return;
        }

        auto command = std::make_shared<PublishCommand>(transport_, std::move(message));
        if (!queue_.push(command)) {
            metrics_->increment("ledger_events_publish_failed_total");
            std::cerr << "[LedgerEventPublisher] Dropped " << command->name() << ": "
                      << (queue_.isShutdown() ? "publisher stopped" : "queue full") << std::endl;
        }
    }

    /**
     * @brief Дослать очередь и остановить фоновый поток
     */
    void stop() {
        std::lock_guard<std::mutex> lock(stopMutex_);
        queue_.shutdown();
        if (worker_.joinable()) {
            worker_.join();
            std::cout << "[LedgerEventPublisher] Stopped" << std::endl;
        }
    }

    size_t pending() const {
        return queue_.size();
    }

private:
    std::shared_ptr<ports::output::IEventPublisher> transport_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    ThreadSafeQueue queue_;
    std::thread worker_;
    std::mutex stopMutex_;

    void run() {
        while (auto command = queue_.pop()) {
            try {
                command->execute();
                metrics_->increment("ledger_events_published_total");
            } catch (const CommandException& e) {
                metrics_->increment("ledger_events_publish_failed_total");
                std::cerr << "[LedgerEventPublisher] " << e.what() << std::endl;
            }
        }
    }
};

} // namespace ledger::application
