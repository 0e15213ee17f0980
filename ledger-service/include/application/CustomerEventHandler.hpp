#pragma once

#include "ports/output/IEventConsumer.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "application/CustomerConsistencyCache.hpp"
#include "domain/CustomerEvent.hpp"
#include "settings/LedgerSettings.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Обработчик событий от customer-service
 *
 * Слушает banking.customer.events:
 * - customer.created: обновить кэш, открыть SAVINGS (если включено)
 * - customer.updated: обновить кэш
 * - customer.deleted: обновить кэш, удалить все счета клиента
 *
 * Побочные действия выполняются, только если событие действительно
 * применено к кэшу: дубли и устаревшие события ничего не меняют.
 */
class CustomerEventHandler {
public:
    CustomerEventHandler(
        std::shared_ptr<ports::output::IEventConsumer> eventConsumer,
        std::shared_ptr<CustomerConsistencyCache> customers,
        std::shared_ptr<ports::input::IAccountService> accountService,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : eventConsumer_(std::move(eventConsumer))
      , customers_(std::move(customers))
      , accountService_(std::move(accountService))
      , metrics_(std::move(metrics))
      , settings_(std::move(settings))
    {
        std::cout << "[CustomerEventHandler] Created" << std::endl;
        subscribe();
    }

    /**
     * @brief Обработать одно сообщение из шины
     *
     * Исключения не выбрасывает: сломанное сообщение логируется и
     * подтверждается, чтобы не блокировать очередь.
     */
    void handleEvent(const std::string& routingKey, const std::string& message) {
        domain::CustomerEvent event;
        try {
            event = domain::CustomerEvent::fromJson(message, routingKey);
        } catch (const std::exception& e) {
            metrics_->increment("ledger_customer_events_discarded_total");
            std::cerr << "[CustomerEventHandler] Malformed " << routingKey << ": " << e.what() << std::endl;
            return;
        }

        auto outcome = customers_->onCustomerEvent(event);
        if (outcome != CustomerConsistencyCache::ApplyOutcome::APPLIED) {
            metrics_->increment("ledger_customer_events_discarded_total");
            return;
        }
        metrics_->increment("ledger_customer_events_total", {{"event", domain::toString(event.type)}});

        try {
            switch (event.type) {
                case domain::CustomerEventType::CREATED:
                    onCreated(event);
                    break;
                case domain::CustomerEventType::DELETED:
                    onDeleted(event);
                    break;
                case domain::CustomerEventType::UPDATED:
                    break;
            }
        } catch (const std::exception& e) {
            std::cerr << "[CustomerEventHandler] Error handling " << domain::toString(event.type)
                      << " for " << event.customerId << ": " << e.what() << std::endl;
        }
    }

private:
    std::shared_ptr<ports::output::IEventConsumer> eventConsumer_;
    std::shared_ptr<CustomerConsistencyCache> customers_;
    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    void subscribe() {
        eventConsumer_->subscribe(
            {"customer.created", "customer.updated", "customer.deleted"},
            [this](const std::string& key, const std::string& msg) { handleEvent(key, msg); }
        );
        std::cout << "[CustomerEventHandler] Subscribed to 3 event types" << std::endl;
    }

    void onCreated(const domain::CustomerEvent& event) {
        if (!settings_->isAutoOpenSavings() || !event.active) {
            return;
        }
        accountService_->openDefaultAccount(event.customerId, event.name, event.correlationId);
    }

    void onDeleted(const domain::CustomerEvent& event) {
        int deleted = accountService_->deleteAccountsByCustomer(event.customerId);
        std::cout << "[CustomerEventHandler] Customer " << event.customerId
                  << " deleted, removed " << deleted << " accounts" << std::endl;
    }
};

} // namespace ledger::application
