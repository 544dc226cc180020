#include <coinchase/Server.hpp>
#include <coinchase/core/ConfigLoader.hpp>
#include <coinchase/core/Logger.hpp>
#include <coinchase/core/LoggingConfig.hpp>
#include <coinchase/core/ThreadContext.hpp>
#include <coingame/GameWorld.hpp>

#include <exception>
#include <iostream>

int main(int argc, char **argv)
{
    coinchase::core::ThreadContext::setThreadName("main");
    try
    {
        const auto cfg = coinchase::core::ConfigLoader::load(argc, argv);
        coinchase::core::applyLoggingConfig(cfg);

        coingame::GameWorld world(cfg.game);
        coinchase::Server server(cfg, world.services());
        server.run();

        coinchase::core::shutdownLogger();
        return 0;
    }
    catch (const std::exception &e)
    {
        SLOG_FATAL("Main", "StartupFailed", "what='{}'", e.what());
        coinchase::core::shutdownLogger();
        std::cerr << "coinchase_server: " << e.what() << '\n';
        return 1;
    }
}
