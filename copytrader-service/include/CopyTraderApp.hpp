// include/CopyTraderApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/EngineSettings.hpp"
#include "settings/AccountsSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/DbSettings.hpp"

// Ports
#include "ports/input/IEngineControl.hpp"
#include "ports/input/IActionQueueService.hpp"
#include "ports/input/IReconciliationService.hpp"
#include "ports/input/IShortSaleService.hpp"
#include "ports/input/IMultiplierService.hpp"
#include "ports/input/IBlacklistService.hpp"
#include "ports/input/IAuditLogService.hpp"
#include "ports/output/IBrokerConnector.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/INotificationSink.hpp"
#include "ports/output/IOrderMappingRepository.hpp"
#include "ports/output/IMultiplierRepository.hpp"
#include "ports/output/IBlacklistRepository.hpp"
#include "ports/output/IAuditRepository.hpp"

// Application
#include "application/ReplicationEngine.hpp"
#include "application/ReconciliationService.hpp"
#include "application/AuditTrail.hpp"

// Secondary Adapters
#include "adapters/secondary/broker/SimulatedBrokerConnector.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"
#include "adapters/secondary/events/EventPublisherNotificationSink.hpp"
#include "adapters/secondary/persistence/InMemoryOrderMappingRepository.hpp"
#include "adapters/secondary/persistence/InMemoryMultiplierRepository.hpp"
#include "adapters/secondary/persistence/InMemoryBlacklistRepository.hpp"
#include "adapters/secondary/persistence/InMemoryAuditRepository.hpp"
#include "adapters/secondary/persistence/PostgresOrderMappingRepository.hpp"
#include "adapters/secondary/persistence/PostgresMultiplierRepository.hpp"
#include "adapters/secondary/persistence/PostgresBlacklistRepository.hpp"
#include "adapters/secondary/persistence/PostgresAuditRepository.hpp"
#include "adapters/secondary/scheduling/ReconnectMonitor.hpp"
#include "adapters/secondary/scheduling/DailyRestartScheduler.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/SystemHandler.hpp"
#include "adapters/primary/ReconcileHandler.hpp"
#include "adapters/primary/ShortSaleHandler.hpp"
#include "adapters/primary/MultiplierHandler.hpp"
#include "adapters/primary/BlacklistHandler.hpp"
#include "adapters/primary/QueueHandler.hpp"
#include "adapters/primary/SimulatorHandler.hpp"
#include "adapters/primary/AuditHandler.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

namespace di = boost::di;

namespace copytrader
{

    /**
     * @brief CopyTrader Service Application
     *
     * Реплицирует ордера мастер-счёта на follower-счета.
     * Публикует: status.*, short_sale.*, action.*, engine.* (в copytrader.events)
     * HTTP: управление движком, сверка, множители, чёрный список, очередь действий, аудит
     */
    class CopyTraderApp : public BoostBeastApplication
    {
    public:
        CopyTraderApp() { std::cout << "[CopyTraderApp] Initializing..." << std::endl; }

        ~CopyTraderApp() override
        {
            std::cout << "[CopyTraderApp] Shutting down..." << std::endl;
            if (dailyRestart_) dailyRestart_->stop();
            if (reconnectMonitor_) reconnectMonitor_->stop();
            if (engine_) {
                try {
                    engine_->stop();
                } catch (const std::exception& e) {
                    std::cerr << "[CopyTraderApp] Engine stop failed: " << e.what() << std::endl;
                }
            }
            if (rabbitMQAdapter_) rabbitMQAdapter_->stop();
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[CopyTraderApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[CopyTraderApp] Configuring DI..." << std::endl;

            auto engineSettings = std::make_shared<settings::EngineSettings>();
            auto accountsSettings = std::make_shared<settings::AccountsSettings>();

            if (engineSettings->getBrokerMode() != "simulated") {
                throw std::invalid_argument("Unsupported BROKER_MODE: " + engineSettings->getBrokerMode());
            }
            auto connector = std::make_shared<adapters::secondary::SimulatedBrokerConnector>();

            // Шаг 1: RabbitMQAdapter отдельно, чтобы запустить его после регистрации handlers
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton));
            rabbitMQAdapter_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

            // Шаг 2: хранилища выбираются по STORAGE_BACKEND
            std::shared_ptr<ports::output::IOrderMappingRepository> mappingRepository;
            std::shared_ptr<ports::output::IMultiplierRepository> multiplierRepository;
            std::shared_ptr<ports::output::IBlacklistRepository> blacklistRepository;
            std::shared_ptr<ports::output::IAuditRepository> auditRepository;
            if (engineSettings->getStorageBackend() == "memory") {
                mappingRepository = std::make_shared<adapters::secondary::InMemoryOrderMappingRepository>();
                multiplierRepository = std::make_shared<adapters::secondary::InMemoryMultiplierRepository>();
                blacklistRepository = std::make_shared<adapters::secondary::InMemoryBlacklistRepository>();
                auditRepository = std::make_shared<adapters::secondary::InMemoryAuditRepository>();
            } else {
                auto dbSettings = std::make_shared<settings::DbSettings>();
                mappingRepository = std::make_shared<adapters::secondary::PostgresOrderMappingRepository>(dbSettings);
                multiplierRepository = std::make_shared<adapters::secondary::PostgresMultiplierRepository>(dbSettings);
                blacklistRepository = std::make_shared<adapters::secondary::PostgresBlacklistRepository>(dbSettings);
                auditRepository = std::make_shared<adapters::secondary::PostgresAuditRepository>(dbSettings);
            }

            // Шаг 3: ядро движка. Сервисы создаются один раз как конкретные типы
            auto core = di::make_injector(
                di::bind<settings::EngineSettings>().to(engineSettings),
                di::bind<settings::AccountsSettings>().to(accountsSettings),

                di::bind<ports::output::IBrokerConnector>().to(connector),
                di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter_),
                di::bind<ports::output::INotificationSink>()
                    .to<adapters::secondary::EventPublisherNotificationSink>()
                    .in(di::singleton),
                di::bind<ports::output::IOrderMappingRepository>().to(mappingRepository),
                di::bind<ports::output::IMultiplierRepository>().to(multiplierRepository),
                di::bind<ports::output::IBlacklistRepository>().to(blacklistRepository),
                di::bind<ports::output::IAuditRepository>().to(auditRepository),

                di::bind<application::AuditTrail>().in(di::singleton),
                di::bind<application::ReplicationState>().in(di::singleton),
                di::bind<application::SessionManager>().in(di::singleton),
                di::bind<application::OrderMappingStore>().in(di::singleton),
                di::bind<application::MultiplierResolver>().in(di::singleton),
                di::bind<application::BlacklistRegistry>().in(di::singleton),
                di::bind<application::ActionQueue>().in(di::singleton),
                di::bind<application::OrderReplicator>().in(di::singleton),
                di::bind<application::ShortSaleManager>().in(di::singleton),
                di::bind<application::ReplicationEngine>().in(di::singleton));

            engine_ = core.create<std::shared_ptr<application::ReplicationEngine>>();
            auto sessions = core.create<std::shared_ptr<application::SessionManager>>();
            auto state = core.create<std::shared_ptr<application::ReplicationState>>();
            auto multipliers = core.create<std::shared_ptr<application::MultiplierResolver>>();
            auto blacklist = core.create<std::shared_ptr<application::BlacklistRegistry>>();
            auto shortSales = core.create<std::shared_ptr<application::ShortSaleManager>>();
            auto audit = core.create<std::shared_ptr<application::AuditTrail>>();

            // Шаг 4: Input Ports через instance binding на те же экземпляры
            auto injector = di::make_injector(
                di::bind<settings::EngineSettings>().to(engineSettings),
                di::bind<settings::AccountsSettings>().to(accountsSettings),
                di::bind<adapters::secondary::SimulatedBrokerConnector>().to(connector),

                di::bind<application::SessionManager>().to(sessions),
                di::bind<application::ReplicationState>().to(state),
                di::bind<application::MultiplierResolver>().to(multipliers),
                di::bind<application::BlacklistRegistry>().to(blacklist),

                di::bind<ports::input::IEngineControl>().to(engine_),
                di::bind<ports::input::IActionQueueService>().to(engine_),
                di::bind<ports::input::IShortSaleService>().to(shortSales),
                di::bind<ports::input::IMultiplierService>().to(multipliers),
                di::bind<ports::input::IBlacklistService>().to(blacklist),
                di::bind<ports::input::IAuditLogService>().to(audit),
                di::bind<ports::input::IReconciliationService>()
                    .to<application::ReconciliationService>()
                    .in(di::singleton));

            // Шаг 5: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            auto systemHandler = injector.create<std::shared_ptr<adapters::primary::SystemHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/status")] = systemHandler;
            handlers_[getHandlerKey("POST", "/api/v1/connect")] = systemHandler;
            handlers_[getHandlerKey("POST", "/api/v1/replication/start")] = systemHandler;
            handlers_[getHandlerKey("POST", "/api/v1/stop")] = systemHandler;
            handlers_[getHandlerKey("POST", "/api/v1/restart")] = systemHandler;

            auto reconcileHandler = injector.create<std::shared_ptr<adapters::primary::ReconcileHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/reconcile")] = reconcileHandler;
            handlers_[getHandlerKey("POST", "/api/v1/reconcile/apply")] = reconcileHandler;
            handlers_[getHandlerKey("POST", "/api/v1/reconcile/skip")] = reconcileHandler;

            auto shortSaleHandler = injector.create<std::shared_ptr<adapters::primary::ShortSaleHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/short-sales")] = shortSaleHandler;
            handlers_[getHandlerKey("DELETE", "/api/v1/short-sales/*")] = shortSaleHandler;

            auto multiplierHandler = injector.create<std::shared_ptr<adapters::primary::MultiplierHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/multipliers")] = multiplierHandler;
            handlers_[getHandlerKey("PUT", "/api/v1/multipliers")] = multiplierHandler;
            handlers_[getHandlerKey("DELETE", "/api/v1/multipliers")] = multiplierHandler;

            auto blacklistHandler = injector.create<std::shared_ptr<adapters::primary::BlacklistHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/blacklist")] = blacklistHandler;
            handlers_[getHandlerKey("POST", "/api/v1/blacklist")] = blacklistHandler;
            handlers_[getHandlerKey("DELETE", "/api/v1/blacklist")] = blacklistHandler;

            auto queueHandler = injector.create<std::shared_ptr<adapters::primary::QueueHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/queue/*")] = queueHandler;
            handlers_[getHandlerKey("POST", "/api/v1/queue/*/replay")] = queueHandler;
            handlers_[getHandlerKey("POST", "/api/v1/queue/*/discard")] = queueHandler;

            auto simulatorHandler = injector.create<std::shared_ptr<adapters::primary::SimulatorHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/simulator/master/orders")] = simulatorHandler;
            handlers_[getHandlerKey("POST", "/api/v1/simulator/master/orders/*/cancel")] = simulatorHandler;
            handlers_[getHandlerKey("POST", "/api/v1/simulator/master/orders/*/replace")] = simulatorHandler;
            handlers_[getHandlerKey("PUT", "/api/v1/simulator/accounts/*")] = simulatorHandler;

            handlers_[getHandlerKey("GET", "/api/v1/audit")] =
                injector.create<std::shared_ptr<adapters::primary::AuditHandler>>();

            // Шаг 6: фоновые задачи движка
            reconnectMonitor_ = std::make_unique<adapters::secondary::ReconnectMonitor>(engine_, engineSettings);
            reconnectMonitor_->start();

            dailyRestart_ = std::make_unique<adapters::secondary::DailyRestartScheduler>(engine_, engineSettings);
            dailyRestart_->start();

            // Шаг 7: RabbitMQ после регистрации всех handlers
            std::cout << "[CopyTraderApp] Starting RabbitMQ..." << std::endl;
            rabbitMQAdapter_->start();

            std::cout << "[CopyTraderApp] Ready, engine " << domain::toString(engine_->state()) << std::endl;
        }

    private:
        std::shared_ptr<adapters::secondary::RabbitMQAdapter> rabbitMQAdapter_;
        std::shared_ptr<application::ReplicationEngine> engine_;
        std::unique_ptr<adapters::secondary::ReconnectMonitor> reconnectMonitor_;
        std::unique_ptr<adapters::secondary::DailyRestartScheduler> dailyRestart_;
    };

} // namespace copytrader
