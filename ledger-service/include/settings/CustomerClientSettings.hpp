#pragma once

#include <string>
#include <cstdlib>

namespace ledger::settings {

/**
 * @brief Настройки подключения к Customer Service
 *
 * Читает из ENV:
 * - CUSTOMER_SERVICE_HOST (default: "customer-service")
 * - CUSTOMER_SERVICE_PORT (default: 8080)
 * - CUSTOMER_SERVICE_TIMEOUT_MS (default: 3000)
 */
class CustomerClientSettings {
public:
    CustomerClientSettings() {
        if (const char* host = std::getenv("CUSTOMER_SERVICE_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("CUSTOMER_SERVICE_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* timeout = std::getenv("CUSTOMER_SERVICE_TIMEOUT_MS")) {
            timeoutMs_ = std::stoi(timeout);
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    int getTimeoutMs() const { return timeoutMs_; }

    void setHost(const std::string& host) { host_ = host; }
    void setPort(int port) { port_ = port; }
    void setTimeoutMs(int timeoutMs) { timeoutMs_ = timeoutMs; }

private:
    std::string host_ = "customer-service";
    int port_ = 8080;
    int timeoutMs_ = 3000;
};

} // namespace ledger::settings
