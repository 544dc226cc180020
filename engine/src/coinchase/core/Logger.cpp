#include <coinchase/core/Logger.hpp>
#include <coinchase/core/ThreadContext.hpp> // ttag(), tid()

#include <fmt/format.h>

#include <chrono>
#include <condition_variable>
#include <ctime>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <unistd.h> // isatty, fileno
#include <vector>

namespace coinchase::core
{

namespace detail
{
std::atomic<int> &fastMinLevel()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}
} // namespace detail

static const char *levelToStr(LogLevel lvl) noexcept
{
    switch (lvl)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    }
    return "INFO";
}

static const char *levelColor(LogLevel lvl) noexcept
{
    switch (lvl)
    {
    case LogLevel::Trace:
        return "\x1b[90m"; // gray
    case LogLevel::Debug:
        return "\x1b[36m"; // cyan
    case LogLevel::Info:
        return "\x1b[32m"; // green
    case LogLevel::Warn:
        return "\x1b[33m"; // yellow
    case LogLevel::Error:
    case LogLevel::Fatal:
        return "\x1b[31m"; // red
    }
    return "";
}

struct LogEvent
{
    LogLevel level{};
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::string threadTag; // e.g. "main", "r0", "monitor"
    long threadId{};
};

class Logger::Impl
{
  public:
    explicit Impl(std::ostream &os) : os_(os)
    {
        if (&os == &std::cout || &os == &std::clog || &os == &std::cerr)
        {
            useColor_ = (::isatty(::fileno(stderr)) != 0);
        }
        worker_ = std::thread([this]() { processQueue(); });
    }

    ~Impl() { stop(); }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void log(LogLevel level, std::string_view msg)
    {
        // 시간/스레드 정보는 호출 시점에 캡처
        auto now = std::chrono::system_clock::now();
        std::string tag(coinchase::core::ttag());
        long threadId = coinchase::core::tid();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push(LogEvent{level, std::string(msg), now, std::move(tag), threadId});
        }
        cv_.notify_one();
    }

    void setMinLevel(LogLevel level) noexcept
    {
        minLevel_.store(level, std::memory_order_relaxed);
        detail::fastMinLevel().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel minLevel() const noexcept { return minLevel_.load(std::memory_order_relaxed); }

  private:
    void processQueue()
    {
        while (true)
        {
            std::vector<LogEvent> batch;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stop_ || !queue_.empty(); });

                if (stop_ && queue_.empty())
                    return;

                while (!queue_.empty())
                {
                    batch.push_back(std::move(queue_.front()));
                    queue_.pop();
                }
            }

            for (const auto &ev : batch)
            {
                if (ev.level < minLevel())
                    continue;
                writeLog(ev);
            }
            os_.flush();
        }
    }

    void writeLog(const LogEvent &ev)
    {
        using namespace std::chrono;

        const auto t = system_clock::to_time_t(ev.timestamp);
        std::tm tm{};
        localtime_r(&t, &tm);

        const auto us = duration_cast<microseconds>(ev.timestamp.time_since_epoch()) % seconds(1);

        const std::string thrCol = fmt::format("{} tid={}", ev.threadTag, ev.threadId);
        const std::string lvlCol = fmt::format("{:<5}", levelToStr(ev.level));

        const char *c1 = useColor_ ? levelColor(ev.level) : "";
        const char *c2 = useColor_ ? "\x1b[0m" : "";

        // time | thread | level | message
        os_ << fmt::format("{:02d}:{:02d}:{:02d}.{:06d} | {} | {}{}{} | {}\n", tm.tm_hour,
                           tm.tm_min, tm.tm_sec, static_cast<int>(us.count()), thrCol, c1,
                           lvlCol, c2, ev.message);
    }

    std::ostream &os_;
    std::thread worker_;
    std::queue<LogEvent> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_{false};
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    bool useColor_{false};
};

Logger::Logger(std::ostream &os) : impl_(std::make_unique<Impl>(os)) {}
Logger::~Logger() = default;

void Logger::log(LogLevel level, std::string_view message)
{
    impl_->log(level, message);
}
void Logger::setMinLevel(LogLevel level) noexcept
{
    impl_->setMinLevel(level);
}
LogLevel Logger::minLevel() const noexcept
{
    return impl_->minLevel();
}

void Logger::stopAndJoin()
{
    impl_->stop();
}

// ===== Global Instance Management =====

static std::shared_ptr<ILogger> &globalLoggerStorage()
{
    static std::shared_ptr<ILogger> logger = std::make_shared<Logger>();
    return logger;
}

ILogger &getLogger()
{
    auto &instance = globalLoggerStorage();
    if (!instance)
    {
        instance = std::make_shared<Logger>();
    }
    return *instance;
}

void setLogger(std::shared_ptr<ILogger> logger) noexcept
{
    if (logger)
    {
        detail::fastMinLevel().store(static_cast<int>(logger->minLevel()),
                                     std::memory_order_relaxed);
    }
    else
    {
        detail::fastMinLevel().store(static_cast<int>(LogLevel::Info), std::memory_order_relaxed);
    }
    globalLoggerStorage() = std::move(logger);
}

void shutdownLogger() noexcept
{
    auto &instance = globalLoggerStorage();
    if (!instance)
        return;

    instance->shutdown();
    instance.reset();
}

} // namespace coinchase::core
