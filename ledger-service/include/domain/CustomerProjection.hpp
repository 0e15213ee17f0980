#pragma once

#include "Timestamp.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Состояние клиента с точки зрения леджера
 */
enum class CustomerStatus {
    ACTIVE,
    INACTIVE,   ///< Деактивирован или удалён
    UNKNOWN     ///< Нет в кэше
};

inline std::string toString(CustomerStatus status) {
    switch (status) {
        case CustomerStatus::ACTIVE:   return "ACTIVE";
        case CustomerStatus::INACTIVE: return "INACTIVE";
        case CustomerStatus::UNKNOWN:  return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Откуда пришла последняя запись в проекцию
 */
enum class ProjectionSource {
    EVENT,      ///< Событие из шины
    LOOKUP      ///< Синхронный запрос в Customer service
};

/**
 * @brief Запись кэша согласованности: локальная проекция клиента
 *
 * lastEventAt и lastEventId отсекают дубли и события, пришедшие
 * не по порядку. deleted терминален.
 */
struct CustomerProjection {
    std::string customerId;
    std::string name;
    bool active = false;
    bool deleted = false;
    Timestamp lastEventAt;
    std::string lastEventId;
    ProjectionSource source = ProjectionSource::EVENT;

    CustomerStatus status() const {
        if (deleted || !active) return CustomerStatus::INACTIVE;
        return CustomerStatus::ACTIVE;
    }
};

} // namespace ledger::domain
