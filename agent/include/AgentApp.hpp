#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <boost/di.hpp>
#include <memory>

// Forward declarations - Ports
namespace ctrlhost::ports::input {
    class ITokenAuthority;
    class ISessionBroker;
}

/**
 * @class AgentApp
 * @brief Агент удалённого управления рабочим столом
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка config.json в Environment
 * 2. configureInjection() - настройка Boost.DI и регистрация handlers
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * TokenAuthority и SessionBroker держат фоновые потоки очистки,
 * поэтому приложение сохраняет на них ссылки и останавливает их
 * в shutdownServices() после выхода из run().
 */
class AgentApp : public BoostBeastApplication
{
public:
    AgentApp();
    ~AgentApp() override;

    /**
     * @brief Остановить фоновые задачи сервисов (идемпотентно)
     */
    void shutdownServices();

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    /**
     * @brief Настроить Boost.DI контейнер и зарегистрировать handlers
     */
    void configureInjection() override;

private:
    std::shared_ptr<ctrlhost::ports::input::ITokenAuthority> authority_;
    std::shared_ptr<ctrlhost::ports::input::ISessionBroker> broker_;

    void printStartupBanner();
};
