#pragma once

#include <string>
#include <map>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Только counter метрики с опциональными labels, вывод в формате Prometheus.
 *
 * @example
 * ```cpp
 * metricsService->increment("ledger_movement_replays_total");
 * metricsService->increment("ledger_movements_total", {{"kind", "CREDIT"}});
 * std::string output = metricsService->toPrometheusFormat();
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Инкрементировать счётчик метрики
     *
     * Если метрики с таким ключом нет, она создаётся со значением 1.
     * Ключ формируется как "name{label1=\"value1\",label2=\"value2\"}".
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Текущее значение счётчика, 0 если его нет
     */
    virtual int64_t value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const = 0;

    /**
     * @brief Сериализовать метрики в Prometheus text format (version 0.0.4)
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace ledger::ports::input
