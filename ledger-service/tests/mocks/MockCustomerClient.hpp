#pragma once

#include "ports/output/ICustomerClient.hpp"
#include "domain/LedgerErrors.hpp"
#include <map>
#include <set>
#include <string>
#include <atomic>

namespace ledger::tests {

/**
 * @brief Mock реализация ICustomerClient для тестов
 *
 * Неизвестный клиент отвечает NOT_FOUND.
 */
class MockCustomerClient : public ports::output::ICustomerClient {
public:
    // Настройка ответов
    void addCustomer(const std::string& customerId, const std::string& name, bool active = true) {
        customers_[customerId] = {
            active ? ports::output::CustomerLookupStatus::ACTIVE
                   : ports::output::CustomerLookupStatus::INACTIVE,
            customerId,
            name
        };
    }

    void removeCustomer(const std::string& customerId) {
        customers_.erase(customerId);
    }

    void setUnavailable(bool unavailable) { unavailable_ = unavailable; }

    // Счётчики вызовов
    int lookupCallCount() const { return lookupCallCount_; }
    void resetCallCount() { lookupCallCount_ = 0; }

    // ICustomerClient implementation
    ports::output::CustomerLookupResult lookup(const std::string& customerId) override {
        ++lookupCallCount_;

        if (unavailable_) {
            throw domain::CustomerUnavailableError("Customer service timed out");
        }

        auto it = customers_.find(customerId);
        if (it == customers_.end()) {
            ports::output::CustomerLookupResult result;
            result.status = ports::output::CustomerLookupStatus::NOT_FOUND;
            result.customerId = customerId;
            return result;
        }
        return it->second;
    }

private:
    std::map<std::string, ports::output::CustomerLookupResult> customers_;
    bool unavailable_ = false;
    std::atomic<int> lookupCallCount_{0};
};

} // namespace ledger::tests
