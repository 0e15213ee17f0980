#pragma once

#include "ports/output/IEventConsumer.hpp"
#include <map>
#include <vector>
#include <string>

namespace ledger::tests {

/**
 * @brief Mock реализация IEventConsumer: доставка событий вызовом emit()
 */
class MockEventConsumer : public ports::output::IEventConsumer {
public:
    void subscribe(const std::vector<std::string>& routingKeys,
                   ports::output::EventHandler handler) override {
        for (const auto& key : routingKeys) {
            handlers_[key].push_back(handler);
        }
    }

    void start() override { started_ = true; }
    void stop() override { started_ = false; }

    // Имитация входящего сообщения из шины
    void emit(const std::string& routingKey, const std::string& message) {
        auto it = handlers_.find(routingKey);
        if (it == handlers_.end()) return;
        for (const auto& handler : it->second) {
            handler(routingKey, message);
        }
    }

    bool isSubscribed(const std::string& routingKey) const {
        return handlers_.count(routingKey) > 0;
    }

    bool isStarted() const { return started_; }

private:
    std::map<std::string, std::vector<ports::output::EventHandler>> handlers_;
    bool started_ = false;
};

} // namespace ledger::tests
