#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <map>
#include <set>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <atomic>
#include <iostream>

namespace ledger::application {

/**
 * @brief Счётчики для /metrics
 *
 * Ключ счётчика: имя плюс метки в фигурных скобках, как в выводе Prometheus.
 * Объявленные в настройках ключи существуют с нуля, остальные заводятся
 * при первом increment(). Счётчики не удаляются, поэтому ссылка на
 * atomic остаётся валидной без блокировки.
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_.emplace(key, std::make_unique<std::atomic<int64_t>>(0));
        }
        std::cout << "[MetricsService] " << counters_.size() << " counters declared" << std::endl;
    }

    void increment(const std::string& name,
                   const std::map<std::string, std::string>& labels = {}) override {
        counterFor(keyOf(name, labels)).fetch_add(1, std::memory_order_relaxed);
    }

    int64_t value(const std::string& name,
                  const std::map<std::string, std::string>& labels = {}) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(keyOf(name, labels));
        return it == counters_.end() ? 0 : it->second->load(std::memory_order_relaxed);
    }

    std::string toPrometheusFormat() const override {
        std::string out;
        for (const auto& def : settings_->getDefinitions()) {
            out += "# HELP " + def.name + " " + def.help + "\n";
            out += "# TYPE " + def.name + " " + def.type + "\n";
        }

        // Объявленные ключи в порядке настроек, потом заведённые на лету по алфавиту
        std::vector<std::pair<std::string, int64_t>> declared;
        std::map<std::string, int64_t> adHoc;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            std::set<std::string> seen;
            for (const auto& key : settings_->getAllKeys()) {
                auto it = counters_.find(key);
                if (it == counters_.end() || !seen.insert(key).second) continue;
                declared.emplace_back(key, it->second->load(std::memory_order_relaxed));
            }
            for (const auto& [key, counter] : counters_) {
                if (!seen.count(key)) adHoc[key] = counter->load(std::memory_order_relaxed);
            }
        }

        for (const auto& [key, v] : declared) out += key + " " + std::to_string(v) + "\n";
        for (const auto& [key, v] : adHoc) out += key + " " + std::to_string(v) + "\n";
        return out;
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;

    std::atomic<int64_t>& counterFor(const std::string& key) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) return *it->second;
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& slot = counters_[key];
        if (!slot) slot = std::make_unique<std::atomic<int64_t>>(0);
        return *slot;
    }

    /// ledger_movements_total{kind="CREDIT"}; метки по алфавиту, как их хранит std::map
    static std::string keyOf(const std::string& name, const std::map<std::string, std::string>& labels) {
        if (labels.empty()) return name;

        std::string key = name + "{";
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            if (it != labels.begin()) key += ",";
            key += it->first + "=\"" + it->second + "\"";
        }
        return key + "}";
    }
};

} // namespace ledger::application
