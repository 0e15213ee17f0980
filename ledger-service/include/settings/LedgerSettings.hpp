#pragma once

#include <string>
#include <cstdlib>
#include <cstddef>

namespace ledger::settings {

/**
 * @brief Бизнес-настройки леджера
 *
 * Читает из ENV:
 * - LEDGER_MAX_RETRIES (default: 3) - повторы при конфликте версий
 * - LEDGER_MAX_ACTIVE_ACCOUNTS (default: 5) - активных счетов на клиента
 * - LEDGER_AUTO_OPEN_SAVINGS (default: true) - SAVINGS на customer.created
 * - LEDGER_STORAGE (default: "postgres") - "postgres" | "memory"
 * - LEDGER_PUBLISH_QUEUE_CAPACITY (default: 10000) - событий в очереди на отправку
 */
class LedgerSettings {
public:
    LedgerSettings() {
        if (const char* val = std::getenv("LEDGER_MAX_RETRIES")) {
            maxRetries_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_MAX_ACTIVE_ACCOUNTS")) {
            maxActiveAccounts_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_AUTO_OPEN_SAVINGS")) {
            std::string s(val);
            autoOpenSavings_ = !(s == "false" || s == "0" || s == "no");
        }
        if (const char* val = std::getenv("LEDGER_STORAGE")) {
            storage_ = val;
        }
        if (const char* val = std::getenv("LEDGER_PUBLISH_QUEUE_CAPACITY")) {
            publishQueueCapacity_ = std::stoul(val);
        }
    }

    int getMaxRetries() const { return maxRetries_; }
    int getMaxActiveAccounts() const { return maxActiveAccounts_; }
    bool isAutoOpenSavings() const { return autoOpenSavings_; }
    std::string getStorage() const { return storage_; }
    size_t getPublishQueueCapacity() const { return publishQueueCapacity_; }

    void setMaxRetries(int value) { maxRetries_ = value; }
    void setMaxActiveAccounts(int value) { maxActiveAccounts_ = value; }
    void setAutoOpenSavings(bool value) { autoOpenSavings_ = value; }
    void setPublishQueueCapacity(size_t value) { publishQueueCapacity_ = value; }

private:
    int maxRetries_ = 3;
    int maxActiveAccounts_ = 5;
    bool autoOpenSavings_ = true;
    std::string storage_ = "postgres";
    size_t publishQueueCapacity_ = 10000;
};

} // namespace ledger::settings
