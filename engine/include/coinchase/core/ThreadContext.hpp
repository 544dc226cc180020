#pragma once

#include <array>
#include <cstdio>
#include <string_view>

#if defined(__linux__)
#include <sys/syscall.h> // SYS_gettid
#include <unistd.h>      // syscall
#endif

namespace coinchase::core
{

/// 로그 prefix 에 찍히는 스레드 태그/tid 를 thread_local 로 캐시합니다.
///
/// - 세션 태스크: "r3"(receiver), "s3"(sender), "p3"(processor) 처럼 역할 + slot id
/// - 그 외: "main", "monitor", "lobby", "clock" 등 이름 그대로
class ThreadContext
{
  public:
    static constexpr int kNoSlot = -1;

    // 세션 태스크 스레드 시작점에서 1회 호출
    static void setSessionTask(char role, int slotId) noexcept
    {
        currentSlotId_() = slotId;
        std::snprintf(tagBuf_().data(), tagBuf_().size(), "%c%d", role, slotId);
        (void)currentTid();
    }

    // 세션에 속하지 않는 보조 스레드(monitor/lobby/clock)용
    static void setThreadName(const char *name) noexcept
    {
        currentSlotId_() = kNoSlot;
        std::snprintf(tagBuf_().data(), tagBuf_().size(), "%s", name);
        (void)currentTid();
    }

    [[nodiscard]] static int currentSlotId() noexcept { return currentSlotId_(); }

    [[nodiscard]] static long currentTid() noexcept { return cachedTid_(); }

    [[nodiscard]] static std::string_view currentThreadTag() noexcept
    {
        auto &buf = tagBuf_();
        if (buf[0] == '\0')
        {
            std::snprintf(buf.data(), buf.size(), "main");
        }
        return std::string_view{buf.data()};
    }

  private:
    static int &currentSlotId_() noexcept
    {
        thread_local int id = kNoSlot;
        return id;
    }

    static long computeTid_() noexcept
    {
#if defined(__linux__)
        return static_cast<long>(::syscall(SYS_gettid));
#else
        return 0;
#endif
    }

    static long &cachedTid_() noexcept
    {
        thread_local long tid = computeTid_(); // 스레드당 1회만 syscall
        return tid;
    }

    static std::array<char, 16> &tagBuf_() noexcept
    {
        thread_local std::array<char, 16> buf{};
        return buf;
    }
};

[[nodiscard]] inline long tid() noexcept
{
    return ThreadContext::currentTid();
}
[[nodiscard]] inline std::string_view ttag() noexcept
{
    return ThreadContext::currentThreadTag();
}

} // namespace coinchase::core
