#pragma once

#include "ports/output/ICustomerClient.hpp"
#include "settings/CustomerClientSettings.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/CustomerJson.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

/**
 * @brief HTTP клиент к Customer Service
 *
 * Вызывает GET /api/v1/customers/{id}. Каждый запрос идёт через своё
 * соединение и свой io_context, весь обмен ограничен CUSTOMER_SERVICE_TIMEOUT_MS.
 *
 * - 200: ACTIVE / INACTIVE по полю "active" (или "state"), см. customer_json::activeFlag
 * - 404: NOT_FOUND
 * - остальное, таймаут, сетевая ошибка: CustomerUnavailableError
 */
class HttpCustomerClient : public ports::output::ICustomerClient {
public:
    explicit HttpCustomerClient(std::shared_ptr<settings::CustomerClientSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[HttpCustomerClient] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " timeout=" << settings_->getTimeoutMs() << "ms" << std::endl;
    }

    ports::output::CustomerLookupResult lookup(const std::string& customerId) override {
        if (customerId.empty()) {
            throw domain::ValidationError("customerId is required");
        }

        http::response<http::string_body> response = get("/api/v1/customers/" + customerId);
        return parseResponse(response.result_int(), response.body(), customerId);
    }

    /**
     * @brief Разобрать ответ Customer Service
     * @throws domain::CustomerUnavailableError для неожиданного статуса или тела
     */
    static ports::output::CustomerLookupResult parseResponse(unsigned status,
                                                             const std::string& body,
                                                             const std::string& customerId) {
        ports::output::CustomerLookupResult result;
        result.customerId = customerId;

        if (status == 404) {
            result.status = ports::output::CustomerLookupStatus::NOT_FOUND;
            return result;
        }
        if (status != 200) {
            throw domain::CustomerUnavailableError(
                "Customer service returned " + std::to_string(status) + " for " + customerId);
        }

        nlohmann::json json;
        try {
            json = nlohmann::json::parse(body);
        } catch (const nlohmann::json::exception& e) {
            throw domain::CustomerUnavailableError(
                std::string("Customer service returned malformed body: ") + e.what());
        }

        auto active = domain::customer_json::activeFlag(json);
        if (!active) {
            throw domain::CustomerUnavailableError(
                "Customer service response for " + customerId + " has no active/state field");
        }

        result.status = *active ? ports::output::CustomerLookupStatus::ACTIVE
                                : ports::output::CustomerLookupStatus::INACTIVE;
        result.name = domain::customer_json::stringField(json, "name");
        auto echoedId = domain::customer_json::stringField(json, "customerId");
        if (!echoedId.empty()) {
            result.customerId = echoedId;
        }
        return result;
    }

private:
    std::shared_ptr<settings::CustomerClientSettings> settings_;

    http::response<http::string_body> get(const std::string& target) {
        auto timeout = std::chrono::milliseconds(settings_->getTimeoutMs());

        net::io_context ioc;
        net::ip::tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);

        http::request<http::empty_body> request{http::verb::get, target, 11};
        request.set(http::field::host, settings_->getHost());
        request.set(http::field::accept, "application/json");
        request.set(http::field::user_agent, "ledger-service");

        beast::flat_buffer buffer;
        http::response<http::string_body> response;
        beast::error_code failure;
        bool done = false;

        auto finish = [&](beast::error_code ec) {
            failure = ec;
            done = true;
        };

        // Дедлайн tcp_stream покрывает connect/write/read, run_for - ещё и resolve
        stream.expires_after(timeout);
        resolver.async_resolve(settings_->getHost(), std::to_string(settings_->getPort()),
            [&](beast::error_code ec, net::ip::tcp::resolver::results_type results) {
                if (ec) return finish(ec);
                stream.async_connect(results,
                    [&](beast::error_code ec, const net::ip::tcp::endpoint&) {
                        if (ec) return finish(ec);
                        http::async_write(stream, request,
                            [&](beast::error_code ec, std::size_t) {
                                if (ec) return finish(ec);
                                http::async_read(stream, buffer, response,
                                    [&](beast::error_code ec, std::size_t) { finish(ec); });
                            });
                    });
            });

        ioc.run_for(timeout);

        if (!done) {
            resolver.cancel();
            stream.cancel();
            std::cerr << "[HttpCustomerClient] Timeout GET " << target << std::endl;
            throw domain::CustomerUnavailableError(
                "Customer service timed out after " + std::to_string(timeout.count()) + "ms");
        }
        if (failure) {
            std::cerr << "[HttpCustomerClient] GET " << target << " failed: " << failure.message() << std::endl;
            throw domain::CustomerUnavailableError("Customer service error: " + failure.message());
        }

        beast::error_code ignored;
        stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ignored);
        return response;
    }
};

} // namespace ledger::adapters::secondary
