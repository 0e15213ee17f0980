#pragma once

#include <string>
#include <vector>

namespace ledger::settings {

/**
 * @brief Определение метрики для Prometheus
 *
 * Используется для генерации HELP и TYPE комментариев.
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "ledger_movements_total")
    std::string help;   ///< Описание метрики для HELP
    std::string type;   ///< Тип метрики: "counter", "gauge", "histogram"
};

/**
 * @brief Интерфейс настроек метрик
 *
 * Ключи из getAllKeys() инициализируются нулями при старте и всегда
 * присутствуют в выводе, даже если событий ещё не было.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /**
     * @return Вектор ключей в формате "metric_name{label1=\"value1\"}"
     */
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace ledger::settings
