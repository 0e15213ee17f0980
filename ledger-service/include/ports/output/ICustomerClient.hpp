#pragma once

#include <string>

namespace ledger::ports::output {

enum class CustomerLookupStatus {
    ACTIVE,
    INACTIVE,
    NOT_FOUND
};

inline std::string toString(CustomerLookupStatus status) {
    switch (status) {
        case CustomerLookupStatus::ACTIVE:    return "active";
        case CustomerLookupStatus::INACTIVE:  return "inactive";
        case CustomerLookupStatus::NOT_FOUND: return "not_found";
        default: return "unknown";
    }
}

struct CustomerLookupResult {
    CustomerLookupStatus status = CustomerLookupStatus::NOT_FOUND;
    std::string customerId;
    std::string name;
};

/**
 * @brief Синхронный запрос состояния клиента в Customer service
 *
 * Реализуется HttpCustomerClient.
 */
class ICustomerClient {
public:
    virtual ~ICustomerClient() = default;

    /**
     * @brief Запросить клиента по ID
     * @throws domain::CustomerUnavailableError при таймауте или ошибке сервиса
     */
    virtual CustomerLookupResult lookup(const std::string& customerId) = 0;
};

} // namespace ledger::ports::output
