#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ledger::domain::customer_json {

/**
 * @brief Флаг активности клиента в JSON Customer service
 *
 * Одинаково для ответа GET /customers/{id} и для событий customer.*:
 * "active" (bool), иначе "state" (bool, либо строка: ACTIVE/active активен,
 * любое другое значение нет).
 * @return nullopt, если ни одного из полей нет или тип не подходит
 */
inline std::optional<bool> activeFlag(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    if (j.contains("active") && j["active"].is_boolean()) {
        return j["active"].get<bool>();
    }
    if (j.contains("state")) {
        const auto& state = j["state"];
        if (state.is_boolean()) return state.get<bool>();
        if (state.is_string()) {
            auto value = state.get<std::string>();
            return value == "ACTIVE" || value == "active";
        }
    }
    return std::nullopt;
}

/// Строковое поле; отсутствие, null и другой тип дают пустую строку
inline std::string stringField(const nlohmann::json& j, const char* field) {
    if (!j.is_object() || !j.contains(field) || !j[field].is_string()) return "";
    return j[field].get<std::string>();
}

} // namespace ledger::domain::customer_json
