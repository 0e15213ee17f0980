#pragma once

#include "domain/CustomerProjection.hpp"
#include "domain/CustomerEvent.hpp"
#include "domain/LedgerErrors.hpp"
#include "ports/output/ICustomerClient.hpp"
#include "ports/input/IMetricsService.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <string>
#include <iostream>

namespace ledger::application {

/**
 * @brief Локальная проекция состояния клиентов из Customer service
 *
 * Наполняется событиями customer.* и синхронными запросами при промахе.
 * Запись по одному клиенту идёт через ThreadSafeMap::compute, поэтому
 * сравнение "новее ли событие" и замена записи атомарны.
 *
 * Правила применения события:
 * - тот же eventId, что и последний применённый: дубль, игнорируется
 * - после удаления клиента запись больше не меняется
 * - customer.deleted применяется всегда (удаление терминально в Customer service)
 * - остальные применяются только если timestamp строго новее; при равном
 *   timestamp побеждает больший eventId, но не поверх результата запроса
 *
 * Результат синхронного запроса записывается с меткой "сейчас", поэтому
 * события, созданные до запроса, считаются устаревшими.
 */
class CustomerConsistencyCache {
public:
    enum class ApplyOutcome {
        APPLIED,
        DUPLICATE,
        STALE
    };

    CustomerConsistencyCache(
        std::shared_ptr<ports::output::ICustomerClient> customerClient,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : customerClient_(std::move(customerClient))
      , metrics_(std::move(metrics))
    {
        std::cout << "[CustomerConsistencyCache] Created" << std::endl;
    }

    /**
     * @brief Состояние клиента только по кэшу, без сетевых вызовов
     */
    domain::CustomerStatus isCustomerActive(const std::string& customerId) const {
        auto projection = projections_.find(customerId);
        if (!projection) {
            return domain::CustomerStatus::UNKNOWN;
        }
        return projection->status();
    }

    /**
     * @brief Применить событие жизненного цикла клиента
     */
    ApplyOutcome onCustomerEvent(const domain::CustomerEvent& event) {
        ApplyOutcome outcome = ApplyOutcome::APPLIED;

        projections_.compute(event.customerId,
            [&](const std::shared_ptr<domain::CustomerProjection>& current)
                -> std::shared_ptr<domain::CustomerProjection>
            {
                if (current) {
                    if (current->lastEventId == event.eventId) {
                        outcome = ApplyOutcome::DUPLICATE;
                        return current;
                    }
                    if (current->deleted || !isNewer(event, *current)) {
                        outcome = ApplyOutcome::STALE;
                        return current;
                    }
                }

                auto next = std::make_shared<domain::CustomerProjection>();
                next->customerId = event.customerId;
                next->name = event.name.empty() && current ? current->name : event.name;
                next->deleted = (event.type == domain::CustomerEventType::DELETED);
                next->active = !next->deleted && event.active;
                next->lastEventAt = event.timestamp;
                next->lastEventId = event.eventId;
                next->source = domain::ProjectionSource::EVENT;
                return next;
            });

        if (outcome == ApplyOutcome::APPLIED) {
            std::cout << "[CustomerConsistencyCache] Applied " << domain::toString(event.type)
                      << " for " << event.customerId << std::endl;
        } else {
            std::cout << "[CustomerConsistencyCache] Discarded "
                      << (outcome == ApplyOutcome::DUPLICATE ? "duplicate " : "stale ")
                      << event.eventId << " for " << event.customerId << std::endl;
        }
        return outcome;
    }

    /**
     * @brief Живой запрос в Customer service, кэш не читается
     *
     * Результат ACTIVE/INACTIVE засевается в кэш. NOT_FOUND не кэшируется.
     * @throws domain::CustomerUnavailableError при таймауте/ошибке
     */
    ports::output::CustomerLookupResult verifyLive(const std::string& customerId) {
        ports::output::CustomerLookupResult result;
        try {
            result = customerClient_->lookup(customerId);
        } catch (const domain::CustomerUnavailableError& e) {
            metrics_->increment("ledger_customer_lookups_total", {{"result", "unavailable"}});
            std::cerr << "[CustomerConsistencyCache] Lookup failed for " << customerId
                      << ": " << e.what() << std::endl;
            throw;
        }

        metrics_->increment("ledger_customer_lookups_total", {{"result", ports::output::toString(result.status)}});

        if (result.status != ports::output::CustomerLookupStatus::NOT_FOUND) {
            seedFromLookup(customerId, result);
        }
        return result;
    }

    /**
     * @brief Состояние клиента: из кэша, а при промахе через verifyLive
     *
     * @return UNKNOWN если клиента нет и в Customer service
     * @throws domain::CustomerUnavailableError если при промахе запрос не удался
     */
    domain::CustomerStatus resolve(const std::string& customerId) {
        auto cached = isCustomerActive(customerId);
        if (cached != domain::CustomerStatus::UNKNOWN) {
            return cached;
        }

        std::cout << "[CustomerConsistencyCache] Cache miss for " << customerId
                  << ", querying customer service" << std::endl;

        auto result = verifyLive(customerId);
        switch (result.status) {
            case ports::output::CustomerLookupStatus::ACTIVE:   return domain::CustomerStatus::ACTIVE;
            case ports::output::CustomerLookupStatus::INACTIVE: return domain::CustomerStatus::INACTIVE;
            default: return domain::CustomerStatus::UNKNOWN;
        }
    }

    std::shared_ptr<domain::CustomerProjection> find(const std::string& customerId) const {
        return projections_.find(customerId);
    }

    size_t size() const {
        return projections_.size();
    }

private:
    std::shared_ptr<ports::output::ICustomerClient> customerClient_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    ThreadSafeMap<std::string, domain::CustomerProjection> projections_;

    static bool isNewer(const domain::CustomerEvent& event, const domain::CustomerProjection& current) {
        if (event.type == domain::CustomerEventType::DELETED) {
            return true;
        }
        if (event.timestamp > current.lastEventAt) {
            return true;
        }
        return event.timestamp == current.lastEventAt &&
               current.source == domain::ProjectionSource::EVENT &&
               event.eventId > current.lastEventId;
    }

    void seedFromLookup(const std::string& customerId, const ports::output::CustomerLookupResult& result) {
        projections_.compute(customerId,
            [&](const std::shared_ptr<domain::CustomerProjection>& current)
                -> std::shared_ptr<domain::CustomerProjection>
            {
                if (current && current->deleted) {
                    return current;
                }

                auto next = std::make_shared<domain::CustomerProjection>();
                next->customerId = customerId;
                next->name = result.name;
                next->active = (result.status == ports::output::CustomerLookupStatus::ACTIVE);
                next->deleted = false;
                next->lastEventAt = domain::Timestamp::now();
                next->lastEventId = current ? current->lastEventId : "";
                next->source = domain::ProjectionSource::LOOKUP;
                return next;
            });
    }
};

} // namespace ledger::application
