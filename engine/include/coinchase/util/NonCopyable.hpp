#pragma once

namespace coinchase::util {

/// 복사/대입 금지용 베이스 클래스입니다.
///
/// - 상속받은 타입은 복사 생성자 / 복사 대입 연산자가 삭제됩니다.
/// - move 는 허용하며, 소켓/스레드를 가진 타입은 파생 클래스에서 move 도 막습니다.
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &) = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&) = default;
    NonCopyable &operator=(NonCopyable &&) = default;
};

} // namespace coinchase::util
