#include <coinchase/core/LoggingConfig.hpp>
#include <coinchase/core/Logger.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace coinchase::core
{
namespace
{

// ostream 수명을 함께 쥐고 있는 비동기 Logger 래퍼
class OwningOstreamLogger final : public ILogger
{
  public:
    OwningOstreamLogger(std::shared_ptr<std::ostream> os, LogLevel lvl)
        : os_(std::move(os)), logger_(*os_)
    {
        logger_.setMinLevel(lvl);
    }

    void log(LogLevel level, std::string_view message) override { logger_.log(level, message); }
    [[nodiscard]] LogLevel minLevel() const noexcept override { return logger_.minLevel(); }
    void shutdown() noexcept override { logger_.stopAndJoin(); }

  private:
    std::shared_ptr<std::ostream> os_;
    Logger logger_;
};

} // namespace

void applyLoggingConfig(const coinchase::ServerConfig &cfg)
{
    std::shared_ptr<std::ostream> os;
    if (cfg.logFilePath.empty())
    {
        os = std::shared_ptr<std::ostream>(&std::clog, [](std::ostream *) {});
    }
    else
    {
        auto file = std::make_shared<std::ofstream>(cfg.logFilePath, std::ios::app);
        if (!file->is_open())
        {
            throw std::runtime_error("[LoggingConfig] failed to open log file: " + cfg.logFilePath);
        }
        os = std::move(file);
    }

    // 교체 전 기존 로거의 잔여 로그를 먼저 비운다.
    shutdownLogger();
    setLogger(std::make_shared<OwningOstreamLogger>(std::move(os), cfg.logLevel));
}

} // namespace coinchase::core
