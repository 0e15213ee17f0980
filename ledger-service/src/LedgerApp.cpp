#include "LedgerApp.hpp"

// Settings
#include "settings/LedgerDbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/CustomerClientSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Application
#include "application/MetricsService.hpp"
#include "application/CustomerConsistencyCache.hpp"
#include "application/IdempotencyGuard.hpp"
#include "application/MovementEngine.hpp"
#include "application/AccountService.hpp"
#include "application/StatementAggregator.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresLedgerStore.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "adapters/secondary/HttpCustomerClient.hpp"

#include <boost/di.hpp>
#include <chrono>
#include <thread>
#include <iostream>

namespace di = boost::di;

namespace ledger {

LedgerApp::LedgerApp()
{
    std::cout << "[LedgerApp] Initializing..." << std::endl;
}

LedgerApp::~LedgerApp()
{
    shutdown();
    std::cout << "[LedgerApp] Shutting down..." << std::endl;
}

void LedgerApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();

    while (!stopRequested_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    shutdown();
}

void LedgerApp::stop()
{
    stopRequested_ = true;
}

void LedgerApp::loadEnvironment(int, char*[])
{
    ledgerSettings_ = std::make_shared<settings::LedgerSettings>();
    rabbitSettings_ = std::make_shared<settings::RabbitMQSettings>();

    std::cout << "[LedgerApp] Environment loaded: storage=" << ledgerSettings_->getStorage()
              << " maxRetries=" << ledgerSettings_->getMaxRetries()
              << " maxActiveAccounts=" << ledgerSettings_->getMaxActiveAccounts()
              << " autoOpenSavings=" << ledgerSettings_->isAutoOpenSavings() << std::endl;
}

void LedgerApp::configureInjection()
{
    std::cout << "[LedgerApp] Configuring DI..." << std::endl;

    // Шаг 1: RabbitMQAdapter, один экземпляр для Publisher и Consumer
    rabbitMQAdapter_ = std::make_shared<adapters::secondary::RabbitMQAdapter>(rabbitSettings_);

    // Шаг 2: хранилище выбирается по LEDGER_STORAGE
    std::shared_ptr<ports::output::ILedgerStore> store;
    if (ledgerSettings_->getStorage() == "memory") {
        store = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
    } else {
        store = std::make_shared<adapters::secondary::PostgresLedgerStore>(
            std::make_shared<settings::LedgerDbSettings>());
    }

    // Шаг 3: основной injector с instance binding для внешних ресурсов
    auto injector = di::make_injector(
        di::bind<settings::LedgerSettings>().to(ledgerSettings_),
        di::bind<settings::RabbitMQSettings>().to(rabbitSettings_),
        di::bind<settings::CustomerClientSettings>().in(di::singleton),
        di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),

        di::bind<ports::output::ILedgerStore>().to(store),
        di::bind<ports::output::ICustomerClient>().to<adapters::secondary::HttpCustomerClient>().in(di::singleton),

        // RabbitMQ - один экземпляр для обоих интерфейсов
        di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter_),
        di::bind<ports::output::IEventConsumer>().to(rabbitMQAdapter_),

        di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton),
        di::bind<application::CustomerConsistencyCache>().in(di::singleton),
        di::bind<application::IdempotencyGuard>().in(di::singleton),
        di::bind<application::LedgerEventPublisher>().in(di::singleton),

        di::bind<ports::input::IAccountService>().to<application::AccountService>().in(di::singleton),
        di::bind<ports::input::IMovementService>().to<application::MovementEngine>().in(di::singleton),
        di::bind<ports::input::IStatementService>().to<application::StatementAggregator>().in(di::singleton));

    metrics_ = injector.create<std::shared_ptr<ports::input::IMetricsService>>();
    eventPublisher_ = injector.create<std::shared_ptr<application::LedgerEventPublisher>>();

    accountService_ = injector.create<std::shared_ptr<ports::input::IAccountService>>();
    movementService_ = injector.create<std::shared_ptr<ports::input::IMovementService>>();
    statementService_ = injector.create<std::shared_ptr<ports::input::IStatementService>>();

    // Шаг 4: Event Handler (слушает banking.customer.events)
    // CustomerEventHandler вызывает subscribe() в конструкторе
    customerEventHandler_ = injector.create<std::shared_ptr<application::CustomerEventHandler>>();

    std::cout << "[LedgerApp] DI configuration completed" << std::endl;
}

void LedgerApp::start()
{
    // RabbitMQ запускается ПОСЛЕ регистрации всех handlers
    std::cout << "[LedgerApp] Starting RabbitMQ..." << std::endl;
    rabbitMQAdapter_->start();

    std::cout << "[LedgerApp] Ready (events via RabbitMQ)" << std::endl;
}

void LedgerApp::shutdown()
{
    if (!rabbitMQAdapter_) {
        return;
    }

    // Сначала досылаем очередь событий, пока соединение ещё живо
    if (eventPublisher_) {
        eventPublisher_->stop();
    }
    rabbitMQAdapter_->stop();

    if (metrics_) {
        std::cout << "[LedgerApp] Metrics snapshot:\n" << metrics_->toPrometheusFormat() << std::flush;
    }

    customerEventHandler_.reset();
    rabbitMQAdapter_.reset();
}

} // namespace ledger
