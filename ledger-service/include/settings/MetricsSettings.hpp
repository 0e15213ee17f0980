#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки метрик для Ledger Service
 *
 * - Проводки (по видам, повторы, отказы, конфликты версий)
 * - Публикация событий (успешные и потерянные)
 * - События клиентов и синхронные запросы в Customer service
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"ledger_movements_total", "Movements committed", "counter"},
            {"ledger_movement_replays_total", "Idempotent replays answered with the original movement", "counter"},
            {"ledger_movement_rejections_total", "Movements rejected by error code", "counter"},
            {"ledger_version_conflicts_total", "Optimistic version conflicts on account writes", "counter"},
            {"ledger_events_published_total", "Domain events handed to the broker", "counter"},
            {"ledger_events_publish_failed_total", "Domain events dropped on serialization or send failure", "counter"},
            {"ledger_customer_events_total", "Customer lifecycle events applied to the cache", "counter"},
            {"ledger_customer_events_discarded_total", "Customer events discarded as duplicate, stale or malformed", "counter"},
            {"ledger_customer_lookups_total", "Synchronous customer lookups by result", "counter"},
            {"ledger_accounts_deleted_total", "Accounts deleted or deactivated", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            // ============================================
            // Проводки
            // ============================================
            "ledger_movements_total{kind=\"CREDIT\"}",
            "ledger_movements_total{kind=\"DEBIT\"}",
            "ledger_movements_total{kind=\"REVERSAL\"}",
            "ledger_movement_replays_total",
            "ledger_movement_rejections_total{code=\"VALIDATION_ERROR\"}",
            "ledger_movement_rejections_total{code=\"INSUFFICIENT_FUNDS\"}",
            "ledger_movement_rejections_total{code=\"IDEMPOTENCY_CONFLICT\"}",
            "ledger_movement_rejections_total{code=\"CONCURRENT_MODIFICATION\"}",
            "ledger_movement_rejections_total{code=\"CUSTOMER_UNAVAILABLE\"}",
            "ledger_movement_rejections_total{code=\"NOT_FOUND\"}",
            "ledger_movement_rejections_total{code=\"STORAGE_UNAVAILABLE\"}",
            "ledger_version_conflicts_total",

            // ============================================
            // Публикация событий
            // ============================================
            "ledger_events_published_total",
            "ledger_events_publish_failed_total",

            // ============================================
            // Клиенты
            // ============================================
            "ledger_customer_events_total{event=\"customer.created\"}",
            "ledger_customer_events_total{event=\"customer.updated\"}",
            "ledger_customer_events_total{event=\"customer.deleted\"}",
            "ledger_customer_events_discarded_total",
            "ledger_customer_lookups_total{result=\"active\"}",
            "ledger_customer_lookups_total{result=\"inactive\"}",
            "ledger_customer_lookups_total{result=\"not_found\"}",
            "ledger_customer_lookups_total{result=\"unavailable\"}",

            // ============================================
            // Счета
            // ============================================
            "ledger_accounts_deleted_total"
        };
    }
};

} // namespace ledger::settings
