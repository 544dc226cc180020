#pragma once

#include <cstdint>
#include <string_view>

namespace coinchase::session
{

/// 세션 슬롯 상태 머신
///
/// AVAILABLE -pull-> PULLED_OUT -setClientInformation-> INFO_RECEIVED -startSend-> WORKING
/// in-use 어느 상태에서든 태스크 실패/취소 시 TERMINATED, put 으로 다시 AVAILABLE.
enum class WorkerStatus : std::uint8_t
{
    Available = 0,
    PulledOut,
    InfoReceived,
    Working,
    Terminated,
};

[[nodiscard]] constexpr std::string_view toString(WorkerStatus s) noexcept
{
    switch (s)
    {
    case WorkerStatus::Available:
        return "AVAILABLE";
    case WorkerStatus::PulledOut:
        return "PULLED_OUT";
    case WorkerStatus::InfoReceived:
        return "INFO_RECEIVED";
    case WorkerStatus::Working:
        return "WORKING";
    case WorkerStatus::Terminated:
        return "TERMINATED";
    }
    return "UNKNOWN";
}

/// pool 의 in-use 인덱스에 있어야 하는 상태인지
[[nodiscard]] constexpr bool isInUse(WorkerStatus s) noexcept
{
    return s == WorkerStatus::PulledOut || s == WorkerStatus::InfoReceived ||
           s == WorkerStatus::Working;
}

} // namespace coinchase::session
