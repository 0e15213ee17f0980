#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/input/IMovementService.hpp"
#include "ports/input/IStatementService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "application/LedgerEventPublisher.hpp"
#include "application/CustomerEventHandler.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"
#include <atomic>
#include <memory>

namespace ledger {

/**
 * @brief Ledger Service Application (Event-Driven)
 *
 * Публикует: account.created, account.deleted, movement.created (в banking.events)
 * Слушает: customer.created, customer.updated, customer.deleted (из banking.customer.events)
 *
 * Template Method:
 * 1. loadEnvironment() - настройки из ENV
 * 2. configureInjection() - сборка графа через Boost.DI
 * 3. start() - запуск RabbitMQ после регистрации обработчиков
 * 4. ожидание stop(), затем shutdown()
 */
class LedgerApp {
public:
    LedgerApp();
    ~LedgerApp();

    /**
     * @brief Запустить сервис и блокироваться до stop()
     */
    void run(int argc, char* argv[]);

    /**
     * @brief Запросить остановку (безопасно вызывать из обработчика сигнала)
     */
    void stop();

    std::shared_ptr<ports::input::IAccountService> accountService() const { return accountService_; }
    std::shared_ptr<ports::input::IMovementService> movementService() const { return movementService_; }
    std::shared_ptr<ports::input::IStatementService> statementService() const { return statementService_; }

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    void start();
    void shutdown();

private:
    std::atomic<bool> stopRequested_{false};

    std::shared_ptr<settings::LedgerSettings> ledgerSettings_;
    std::shared_ptr<settings::RabbitMQSettings> rabbitSettings_;

    std::shared_ptr<adapters::secondary::RabbitMQAdapter> rabbitMQAdapter_;
    std::shared_ptr<application::LedgerEventPublisher> eventPublisher_;
    std::shared_ptr<application::CustomerEventHandler> customerEventHandler_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::shared_ptr<ports::input::IMovementService> movementService_;
    std::shared_ptr<ports::input::IStatementService> statementService_;
};

} // namespace ledger
