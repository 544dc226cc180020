#pragma once

#include <coinchase/util/NonCopyable.hpp>

#include <fmt/format.h>

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace coinchase::core
{

enum class LogLevel : int
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

namespace detail
{
// 로그 필터링용 전역 atomic (Logger.cpp 에서 정의)
std::atomic<int> &fastMinLevel();
} // namespace detail

// Hot path 용 빠른 레벨 체크
inline bool fastEnabled(LogLevel level) noexcept
{
    return static_cast<int>(level) >= detail::fastMinLevel().load(std::memory_order_relaxed);
}

// 로깅 인터페이스
class ILogger : private coinchase::util::NonCopyable
{
  public:
    virtual ~ILogger() = default;

    [[nodiscard]] virtual LogLevel minLevel() const noexcept { return LogLevel::Trace; }
    virtual void shutdown() noexcept {}

    // 메시지는 이미 "comp | evt | key=value..." 형태로 만들어서 넣는다.
    virtual void log(LogLevel level, std::string_view message) = 0;
};

// 기본 Logger 구현체 (ostream 기반, 비동기)
class Logger final : public ILogger
{
  public:
    explicit Logger(std::ostream &os = std::clog);
    ~Logger() override;

    void log(LogLevel level, std::string_view message) override;

    void setMinLevel(LogLevel level) noexcept;
    [[nodiscard]] LogLevel minLevel() const noexcept override;

    // 스레드 조인 + 잔여 로그 플러시
    void stopAndJoin();
    void shutdown() noexcept override { stopAndJoin(); }

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Global instance
ILogger &getLogger();
void setLogger(std::shared_ptr<ILogger> logger) noexcept;
void shutdownLogger() noexcept;

// =============================================================================
// Structured Logging Frontend
//   최종 라인: "HH:MM:SS.uuuuuu | r0 tid=123 | INFO  | comp | evt | k=v ..."
//   - prefix(time/thread/level)는 Logger 가 찍는다
//   - message(payload)는 "comp | evt | key=value"만 남긴다
// =============================================================================
namespace slog
{
inline std::string build(std::string_view comp, std::string_view evt, std::string_view details)
{
    if (details.empty())
        return fmt::format("{} | {}", comp, evt);
    return fmt::format("{} | {} | {}", comp, evt, details);
}

inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt)
{
    if (!fastEnabled(lvl))
        return;
    getLogger().log(lvl, build(comp, evt, {}));
}

template <typename... Args>
inline void emit(LogLevel lvl, std::string_view comp, std::string_view evt,
                 fmt::format_string<Args...> fmtStr, Args &&...args)
{
    if (!fastEnabled(lvl))
        return;
    std::string details = fmt::format(fmtStr, std::forward<Args>(args)...);
    getLogger().log(lvl, build(comp, evt, details));
}
} // namespace slog

#define SLOG_TRACE(comp, evt, ...)                                                                 \
    ::coinchase::core::slog::emit(::coinchase::core::LogLevel::Trace, (comp),                      \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_DEBUG(comp, evt, ...)                                                                 \
    ::coinchase::core::slog::emit(::coinchase::core::LogLevel::Debug, (comp),                      \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_INFO(comp, evt, ...)                                                                  \
    ::coinchase::core::slog::emit(::coinchase::core::LogLevel::Info, (comp),                       \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_WARN(comp, evt, ...)                                                                  \
    ::coinchase::core::slog::emit(::coinchase::core::LogLevel::Warn, (comp),                       \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_ERROR(comp, evt, ...)                                                                 \
    ::coinchase::core::slog::emit(::coinchase::core::LogLevel::Error, (comp),                      \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)
#define SLOG_FATAL(comp, evt, ...)                                                                 \
    ::coinchase::core::slog::emit(::coinchase::core::LogLevel::Fatal, (comp),                      \
                                  (evt)__VA_OPT__(, ) __VA_ARGS__)

} // namespace coinchase::core
