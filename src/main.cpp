#include "AccountServerApp.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        accounts::AccountServerApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Account Server Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        // SIGINT/SIGTERM перехватывает само приложение (asio::signal_set)
        app.run(argc, argv);

        std::cout << "[main] Account Server stopped" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
