#include "AgentApp.hpp"

#include <IEnvironment.hpp>

// Handlers (Primary Adapters)
#include "adapters/primary/sessions/CreateSessionHandler.hpp"
#include "adapters/primary/sessions/EndSessionHandler.hpp"
#include "adapters/primary/sessions/ListSessionsHandler.hpp"
#include "adapters/primary/auth/ValidateTokenHandler.hpp"
#include "adapters/primary/auth/RevokeTokenHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"

// Application Services
#include "application/TokenAuthority.hpp"
#include "application/SessionBroker.hpp"

// Secondary Adapters
#include "adapters/secondary/clock/SystemClock.hpp"
#include "adapters/secondary/entropy/OpenSslEntropySource.hpp"
#include "adapters/secondary/logging/ConsoleEventLogger.hpp"
#include "adapters/secondary/settings/SessionSettings.hpp"
#include "adapters/secondary/settings/SecuritySettings.hpp"

#include <iostream>

namespace di = boost::di;

// ============================================================================
// AgentApp Implementation
// ============================================================================

AgentApp::AgentApp()
{
    std::cout << "[AgentApp] Application created" << std::endl;
}

AgentApp::~AgentApp()
{
    shutdownServices();
    std::cout << "[AgentApp] Application destroyed" << std::endl;
}

void AgentApp::shutdownServices()
{
    if (broker_) {
        broker_->shutdown();
    }
    if (authority_) {
        authority_->shutdown();
    }
}

void AgentApp::loadEnvironment(int argc, char *argv[])
{
    std::cout << "[AgentApp] Loading environment..." << std::endl;

    // Базовый метод загружает config.json в env_
    BoostBeastApplication::loadEnvironment(argc, argv);

    std::cout << "[AgentApp] Environment loaded successfully" << std::endl;
}

void AgentApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[AgentApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<IEnvironment>().to(env_),

        di::bind<ctrlhost::ports::output::ISessionSettings>()
            .to<ctrlhost::adapters::secondary::SessionSettings>()
            .in(di::singleton),

        di::bind<ctrlhost::ports::output::ISecuritySettings>()
            .to<ctrlhost::adapters::secondary::SecuritySettings>()
            .in(di::singleton),

        di::bind<ctrlhost::ports::output::IClock>()
            .to<ctrlhost::adapters::secondary::SystemClock>()
            .in(di::singleton),

        di::bind<ctrlhost::ports::output::IEntropySource>()
            .to<ctrlhost::adapters::secondary::OpenSslEntropySource>()
            .in(di::singleton),

        // stdout/stderr; второй конструктор (с потоками) - для тестов
        di::bind<ctrlhost::ports::output::IEventLogger>()
            .to(std::make_shared<ctrlhost::adapters::secondary::ConsoleEventLogger>()),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ctrlhost::ports::input::ITokenAuthority>()
            .to<ctrlhost::application::TokenAuthority>()
            .in(di::singleton),

        di::bind<ctrlhost::ports::input::ISessionBroker>()
            .to<ctrlhost::application::SessionBroker>()
            .in(di::singleton));

    authority_ = injector.create<std::shared_ptr<ctrlhost::ports::input::ITokenAuthority>>();
    broker_ = injector.create<std::shared_ptr<ctrlhost::ports::input::ISessionBroker>>();

    std::cout << "\n📦 Boost.DI Injector configured:" << std::endl;
    std::cout << "  ✓ Secondary Adapters (6 bindings)" << std::endl;
    std::cout << "  ✓ Application Services (2 bindings)" << std::endl;

    // ========================================================================
    // Layer 3: Primary Adapters (HTTP Handlers)
    // ========================================================================

    std::cout << "\n🎮 Registering HTTP Handlers via DI..." << std::endl;

    // ========================================================================
    // SESSION HANDLERS
    // ========================================================================
    {
        auto handler = injector.create<
            std::shared_ptr<ctrlhost::adapters::primary::CreateSessionHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/sessions/desktop")] = handler;
        std::cout << "  ✓ CreateSessionHandler: POST /api/v1/sessions/desktop" << std::endl;
    }

    {
        auto handler = injector.create<
            std::shared_ptr<ctrlhost::adapters::primary::ListSessionsHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/sessions/desktop")] = handler;
        std::cout << "  ✓ ListSessionsHandler: GET /api/v1/sessions/desktop" << std::endl;
    }

    // Путь /api/v1/sessions/desktop/{id}/end разбирает сам handler
    {
        auto handler = injector.create<
            std::shared_ptr<ctrlhost::adapters::primary::EndSessionHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/sessions/desktop/*")] = handler;
        std::cout << "  ✓ EndSessionHandler: POST /api/v1/sessions/desktop/{id}/end" << std::endl;
    }

    // ========================================================================
    // AUTH HANDLERS
    // ========================================================================
    {
        auto handler = injector.create<
            std::shared_ptr<ctrlhost::adapters::primary::ValidateTokenHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/auth/validate")] = handler;
        std::cout << "  ✓ ValidateTokenHandler: POST /api/v1/auth/validate" << std::endl;
    }

    {
        auto handler = injector.create<
            std::shared_ptr<ctrlhost::adapters::primary::RevokeTokenHandler>>();
        handlers_[getHandlerKey("POST", "/api/v1/auth/revoke")] = handler;
        std::cout << "  ✓ RevokeTokenHandler: POST /api/v1/auth/revoke" << std::endl;
    }

    // ========================================================================
    // INFRASTRUCTURE HANDLERS
    // ========================================================================
    {
        auto handler = injector.create<std::shared_ptr<ctrlhost::adapters::primary::HealthHandler>>();
        handlers_[getHandlerKey("GET", "/api/v1/health")] = handler;
        std::cout << "  ✓ HealthHandler: GET /api/v1/health" << std::endl;
    }

    std::cout << "\n[AgentApp] DI configuration completed - "
              << handlers_.size() << " routes registered" << std::endl;
}

void AgentApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║        ctrlhost - Desktop Control Agent              ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  HTTP Server:  Boost.Beast                           ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
