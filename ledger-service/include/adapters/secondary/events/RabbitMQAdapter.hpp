#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <future>
#include <chrono>
#include <stdexcept>
#include <unordered_map>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief RabbitMQ адаптер: публикация доменных событий и приём событий клиентов
 *
 * Реализует IEventPublisher и IEventConsumer на одном соединении.
 *
 * Архитектура:
 * - Публикация: topic exchange banking.events, routing key = topic сообщения,
 *   заголовки timestamp, event-type, partition-key, x-correlation-id
 * - Приём: topic exchange banking.customer.events, durable очередь
 *   ledger.customer-events, ack после обработчиков
 *
 * Все вызовы AMQP-CPP выполняются в потоке io_context. publish() ставит
 * отправку в этот поток и ждёт её не дольше RABBITMQ_PUBLISH_TIMEOUT_MS.
 * Без соединения или при остановившемся потоке publish() отказывает сразу.
 *
 * @example
 * ```cpp
 * auto adapter = std::make_shared<RabbitMQAdapter>(settings);
 * adapter->subscribe({"customer.created"}, [](const std::string& key, const std::string& msg) {
 *     std::cout << key << ": " << msg << std::endl;
 * });
 * adapter->start();
 * ```
 */
class RabbitMQAdapter : public ports::output::IEventPublisher,
                        public ports::output::IEventConsumer {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ready_(false)
        , loopAlive_(false)
        , ioContext_()
        , work_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        customerExchange_ = settings_->getCustomerExchange();
        queueName_ = settings_->getQueue();
        std::cout << "[RabbitMQAdapter] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " publish=" << exchangeName_
                  << " consume=" << customerExchange_ << "/" << queueName_ << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    // =========================================================================
    // IEventPublisher
    // =========================================================================

    /**
     * @brief Отправить сообщение в banking.events
     * @throws std::runtime_error если нет соединения, брокер отказал или истёк таймаут
     */
    void publish(const ports::output::OutboundMessage& message) override {
        if (!running_) {
            throw std::runtime_error("RabbitMQ adapter is not running");
        }
        if (!loopAlive_) {
            throw std::runtime_error("RabbitMQ event loop has stopped");
        }
        if (!ready_) {
            throw std::runtime_error("Cannot publish " + message.topic + ": not connected");
        }

        auto done = std::make_shared<std::promise<void>>();
        auto future = done->get_future();

        boost::asio::post(ioContext_, [this, message, done]() {
            try {
                sendOnLoop(message);
                done->set_value();
            } catch (const std::exception&) {
                done->set_exception(std::current_exception());
            }
        });

        auto timeout = std::chrono::milliseconds(settings_->getPublishTimeoutMs());
        if (future.wait_for(timeout) != std::future_status::ready) {
            throw std::runtime_error("Publish of " + message.topic + " timed out after " +
                                     std::to_string(timeout.count()) + "ms");
        }
        future.get();
    }

    // =========================================================================
    // IEventConsumer
    // =========================================================================

    /**
     * @brief Подписаться на события
     *
     * Привязки очереди создаются при подключении, поэтому подписываться
     * нужно до start().
     */
    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);

        for (const auto& key : routingKeys) {
            handlers_[key].push_back(handler);
            pendingBindings_.push_back(key);
        }
    }

    void start() override {
        if (running_) return;

        running_ = true;
        loopAlive_ = true;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
            ready_ = false;
            loopAlive_ = false;
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    void stop() override {
        if (!running_) return;

        running_ = false;
        ready_ = false;
        work_.reset();
        ioContext_.stop();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

private:
    void connect() {
        std::string connStr = "amqp://" + settings_->getUser() + ":" +
                              settings_->getPassword() + "@" +
                              settings_->getHost() + ":" +
                              std::to_string(settings_->getPort()) + "/";

        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(connStr));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* msg) {
            ready_ = false;
            std::cerr << "[RabbitMQAdapter] Channel error: " << msg << std::endl;
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                ready_ = true;
                std::cout << "[RabbitMQAdapter] Exchange declared: " << exchangeName_ << std::endl;
            })
            .onError([this](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange " << exchangeName_ << " error: " << msg << std::endl;
            });

        channel_->declareExchange(customerExchange_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                std::cout << "[RabbitMQAdapter] Exchange declared: " << customerExchange_ << std::endl;
                setupBindings();
            })
            .onError([this](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Exchange " << customerExchange_ << " error: " << msg << std::endl;
            });
    }

    void setupBindings() {
        // Durable очередь с фиксированным именем: события не теряются между рестартами
        channel_->declareQueue(queueName_, AMQP::durable)
            .onSuccess([this](const std::string& name, uint32_t messages, uint32_t) {
                std::cout << "[RabbitMQAdapter] Queue declared: " << name
                          << " (" << messages << " waiting)" << std::endl;

                std::lock_guard<std::mutex> lock(handlersMutex_);
                for (const auto& key : pendingBindings_) {
                    channel_->bindQueue(customerExchange_, queueName_, key);
                    std::cout << "[RabbitMQAdapter] Bound: " << key << std::endl;
                }
                pendingBindings_.clear();

                startConsuming();
            })
            .onError([this](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Queue " << queueName_ << " error: " << msg << std::endl;
            });
    }

    void startConsuming() {
        channel_->consume(queueName_)
            .onReceived([this](const AMQP::Message& msg, uint64_t tag, bool redelivered) {
                std::string routingKey = msg.routingkey();
                std::string body(msg.body(), msg.bodySize());

                std::cout << "[RabbitMQAdapter] Received " << routingKey
                          << (redelivered ? " (redelivered)" : "") << std::endl;

                std::vector<ports::output::EventHandler> handlers;
                {
                    std::lock_guard<std::mutex> lock(handlersMutex_);
                    auto it = handlers_.find(routingKey);
                    if (it != handlers_.end()) {
                        handlers = it->second;
                    }
                }

                for (const auto& handler : handlers) {
                    try {
                        handler(routingKey, body);
                    } catch (const std::exception& e) {
                        std::cerr << "[RabbitMQAdapter] Handler error on " << routingKey
                                  << ": " << e.what() << std::endl;
                    }
                }

                channel_->ack(tag);
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQAdapter] Consume error: " << msg << std::endl;
            });
    }

    void sendOnLoop(const ports::output::OutboundMessage& message) {
        if (!channel_ || !ready_) {
            throw std::runtime_error("Cannot publish " + message.topic + ": not connected");
        }

        AMQP::Table headers;
        headers.set("timestamp", message.timestamp);
        headers.set("event-type", message.eventType);
        headers.set("partition-key", message.partitionKey);
        if (message.correlationId) {
            headers.set("x-correlation-id", *message.correlationId);
        }

        AMQP::Envelope envelope(message.body.data(), message.body.size());
        envelope.setContentType("application/json");
        envelope.setDeliveryMode(2);
        envelope.setHeaders(headers);
        if (message.correlationId) {
            envelope.setCorrelationID(*message.correlationId);
        }

        if (!channel_->publish(exchangeName_, message.topic, envelope)) {
            throw std::runtime_error("Channel rejected " + message.topic);
        }

        std::cout << "[RabbitMQAdapter] Published " << message.topic
                  << " key=" << message.partitionKey << std::endl;
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;
    std::string customerExchange_;
    std::string queueName_;

    std::atomic<bool> running_;
    std::atomic<bool> ready_;
    std::atomic<bool> loopAlive_;                   ///< Поток io_context ещё крутится
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;

    std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    std::vector<std::string> pendingBindings_;
};

} // namespace ledger::adapters::secondary
