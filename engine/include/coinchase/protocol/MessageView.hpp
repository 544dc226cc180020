#pragma once

#include <cstddef>
#include <span>

namespace coinchase::protocol {

/// 소유권이 없는 프레임 뷰입니다. (type 바이트 + payload, 구분자 제외)
///
/// 수명 규약:
/// - 다음 tryFrame() 호출 전까지만 유효합니다. framer 의 scratch 버퍼를 가리키기 때문입니다.
/// - 보관이 필요하면 명시적으로 복사합니다.
class MessageView {
  public:
    MessageView() noexcept = default;
    MessageView(const std::byte *data, std::size_t size) noexcept : data_(data), size_(size) {}

    [[nodiscard]] const std::byte *data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] std::span<const std::byte> bytes() const noexcept { return {data_, size_}; }

  private:
    const std::byte *data_{nullptr};
    std::size_t size_{0};
};

} // namespace coinchase::protocol
