#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace coinchase::core
{

/// 세션 런타임 경로에서 반환하는 에러 코드입니다.
///
/// - 세션 스레드는 예외 대신 std::error_code 를 반환하고,
///   상위(task supervisor)가 그 값을 보고 coordinator 를 발동합니다.
/// - Capacity 는 로그인 거절(복구 가능), 나머지는 대부분 세션 치명 에러입니다.
enum class Errc : int
{
    Capacity = 1,      // 사용 가능한 슬롯 없음
    NotFound,          // userId 에 해당하는 슬롯 없음
    InvalidState,      // 슬롯 상태가 요구 상태와 다름 (force exit 동반)
    DuplicateOwner,    // 이미 다른 슬롯을 소유한 userId
    ProtocolViolation, // 프레이밍/태그/페이로드 디코드 실패
    TransientIo,       // fault budget 에서 차감되는 송신 실패
    FatalIo,           // accept/dial/read 실패, fault budget 소진
    Cancelled,         // coordinator 발동으로 중단
};

[[nodiscard]] const std::error_category &coinchaseCategory() noexcept;

[[nodiscard]] inline std::error_code make_error_code(Errc e) noexcept
{
    return {static_cast<int>(e), coinchaseCategory()};
}

/// 로그 필드용 짧은 이름 ("Capacity", "FatalIo" ...)
[[nodiscard]] const char *errcName(Errc e) noexcept;

} // namespace coinchase::core

namespace std
{
template <> struct is_error_code_enum<coinchase::core::Errc> : true_type
{
};
} // namespace std
