/**
 * @file HttpCustomerClientTest.cpp
 * @brief Tests for HttpCustomerClient: response parsing and transport failures
 */

#include <gtest/gtest.h>
#include "adapters/secondary/HttpCustomerClient.hpp"
#include <thread>

using namespace ledger;
using ledger::adapters::secondary::HttpCustomerClient;
using ports::output::CustomerLookupStatus;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief Одноразовый HTTP сервер на 127.0.0.1 со случайным портом
 *
 * Принимает одно соединение и отвечает заданным статусом и телом.
 * При silent=true соединение принимается, но ответа нет.
 */
class OneShotServer {
public:
    OneShotServer(http::status status, std::string body, bool silent = false)
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
    {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this, status, body = std::move(body), silent]() {
            beast::error_code ec;
            tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (ec) return;

            beast::flat_buffer buffer;
            http::request<http::string_body> request;
            http::read(socket, buffer, request, ec);
            if (ec) return;
            target_ = std::string(request.target());

            if (silent) {
                // Держим соединение, пока клиент не сдастся
                char byte;
                socket.read_some(net::buffer(&byte, 1), ec);
                return;
            }

            http::response<http::string_body> response{status, request.version()};
            response.set(http::field::content_type, "application/json");
            response.body() = body;
            response.prepare_payload();
            http::write(socket, response, ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
        });
    }

    ~OneShotServer() {
        join();
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    int port() const { return port_; }
    const std::string& target() const { return target_; }

private:
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    int port_ = 0;
    std::string target_;
    std::thread thread_;
};

class HttpCustomerClientTest : public ::testing::Test {
protected:
    std::shared_ptr<HttpCustomerClient> clientFor(int port, int timeoutMs = 2000) {
        auto settings = std::make_shared<settings::CustomerClientSettings>();
        settings->setHost("127.0.0.1");
        settings->setPort(port);
        settings->setTimeoutMs(timeoutMs);
        return std::make_shared<HttpCustomerClient>(settings);
    }
};

// ============================================================================
// parseResponse
// ============================================================================

TEST(HttpCustomerClientParseTest, Ok_ActiveFlag) {
    auto r = HttpCustomerClient::parseResponse(200, R"({"customerId":"C-1","name":"Alice","active":true})", "C-1");
    EXPECT_EQ(r.status, CustomerLookupStatus::ACTIVE);
    EXPECT_EQ(r.name, "Alice");
    EXPECT_EQ(r.customerId, "C-1");
}

TEST(HttpCustomerClientParseTest, Ok_StateString) {
    auto active = HttpCustomerClient::parseResponse(200, R"({"name":"Alice","state":"ACTIVE"})", "C-1");
    EXPECT_EQ(active.status, CustomerLookupStatus::ACTIVE);

    auto inactive = HttpCustomerClient::parseResponse(200, R"({"name":"Alice","state":"BLOCKED"})", "C-1");
    EXPECT_EQ(inactive.status, CustomerLookupStatus::INACTIVE);
}

TEST(HttpCustomerClientParseTest, Ok_StateBoolean) {
    auto r = HttpCustomerClient::parseResponse(200, R"({"name":"Alice","state":false})", "C-1");
    EXPECT_EQ(r.status, CustomerLookupStatus::INACTIVE);
}

TEST(HttpCustomerClientParseTest, NullOrNonStringFields_Tolerated) {
    ports::output::CustomerLookupResult r;
    ASSERT_NO_THROW(r = HttpCustomerClient::parseResponse(
        200, R"({"customerId":null,"name":null,"active":true})", "C-1"));
    EXPECT_EQ(r.status, CustomerLookupStatus::ACTIVE);
    EXPECT_EQ(r.name, "");
    EXPECT_EQ(r.customerId, "C-1");

    ASSERT_NO_THROW(r = HttpCustomerClient::parseResponse(200, R"({"name":17,"state":"ACTIVE"})", "C-1"));
    EXPECT_EQ(r.name, "");
}

TEST(HttpCustomerClientParseTest, NonObjectBody_Unavailable) {
    EXPECT_THROW(HttpCustomerClient::parseResponse(200, "[1,2]", "C-1"), domain::CustomerUnavailableError);
    EXPECT_THROW(HttpCustomerClient::parseResponse(200, "null", "C-1"), domain::CustomerUnavailableError);
}

TEST(HttpCustomerClientParseTest, NotFound) {
    auto r = HttpCustomerClient::parseResponse(404, "", "C-404");
    EXPECT_EQ(r.status, CustomerLookupStatus::NOT_FOUND);
    EXPECT_EQ(r.customerId, "C-404");
}

TEST(HttpCustomerClientParseTest, ServerError_Unavailable) {
    EXPECT_THROW(HttpCustomerClient::parseResponse(500, "{}", "C-1"), domain::CustomerUnavailableError);
    EXPECT_THROW(HttpCustomerClient::parseResponse(503, "", "C-1"), domain::CustomerUnavailableError);
}

TEST(HttpCustomerClientParseTest, MalformedBody_Unavailable) {
    EXPECT_THROW(HttpCustomerClient::parseResponse(200, "<html>", "C-1"), domain::CustomerUnavailableError);
    EXPECT_THROW(HttpCustomerClient::parseResponse(200, R"({"name":"Alice"})", "C-1"),
                 domain::CustomerUnavailableError);
}

// ============================================================================
// lookup over the wire
// ============================================================================

TEST_F(HttpCustomerClientTest, Lookup_Active) {
    OneShotServer server(http::status::ok, R"({"customerId":"C-1","name":"Alice","active":true})");
    auto client = clientFor(server.port());

    auto result = client->lookup("C-1");

    EXPECT_EQ(result.status, CustomerLookupStatus::ACTIVE);
    EXPECT_EQ(result.name, "Alice");
}

TEST_F(HttpCustomerClientTest, Lookup_RequestsCustomerPath) {
    OneShotServer server(http::status::not_found, "");
    auto client = clientFor(server.port());

    auto result = client->lookup("C-42");

    EXPECT_EQ(result.status, CustomerLookupStatus::NOT_FOUND);
    server.join();
    EXPECT_EQ(server.target(), "/api/v1/customers/C-42");
}

TEST_F(HttpCustomerClientTest, Lookup_SilentServer_TimesOut) {
    OneShotServer server(http::status::ok, "", true);
    auto client = clientFor(server.port(), 200);

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(client->lookup("C-1"), domain::CustomerUnavailableError);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(HttpCustomerClientTest, Lookup_ConnectionRefused_Unavailable) {
    int port = 0;
    {
        net::io_context ioc;
        tcp::acceptor reserved(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = reserved.local_endpoint().port();
    }
    auto client = clientFor(port, 500);

    EXPECT_THROW(client->lookup("C-1"), domain::CustomerUnavailableError);
}

TEST_F(HttpCustomerClientTest, Lookup_EmptyId_ValidationError) {
    auto client = clientFor(1);
    EXPECT_THROW(client->lookup(""), domain::ValidationError);
}
