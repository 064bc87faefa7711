#include "AgentApp.hpp"
#include <iostream>
#include <csignal>

// Глобальный указатель для обработки сигналов
AgentApp* g_app = nullptr;

void signalHandler(int signal)
{
    std::cout << "\n[main] Received signal " << signal << std::endl;
    if (g_app)
    {
        g_app->stop();
    }
}

int main(int argc, char* argv[])
{
    try
    {
        AgentApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  ctrlhost agent starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        // loadEnvironment() → configureInjection() → start()
        app.run(argc, argv);

        // Сервер остановлен: гасим фоновые очистки до разрушения сервисов
        app.shutdownServices();
        g_app = nullptr;

        std::cout << "[main] ctrlhost agent stopped" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
