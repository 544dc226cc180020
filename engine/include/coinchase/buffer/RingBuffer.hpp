#pragma once

#include <cstddef> // std::size_t, std::byte
#include <span>
#include <vector>
#include <sys/uio.h> // struct iovec

namespace coinchase::buffer
{

/// 세션 수신용 고정 크기 바이트 링 버퍼입니다.
///
/// - head/tail 인덱스로 FIFO 저장. 남은 공간보다 큰 write 는 들어가는 만큼만 씁니다.
/// - receiver 스레드 한 곳에서만 접근하므로 내부 락은 없습니다.
/// - 구분자 기반 프레이밍을 위해 find()/discard() 를 제공합니다.
class RingBuffer
{
  public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    /// @param capacity 바이트 단위 용량 (0이면 std::invalid_argument)
    explicit RingBuffer(std::size_t capacity);

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t freeSpace() const noexcept { return capacity_ - size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] bool full() const noexcept { return size_ == capacity_; }

    /// 최대 len 바이트를 기록합니다. @return 실제로 기록된 바이트 수
    std::size_t write(const std::byte *data, std::size_t len) noexcept;

    std::size_t write(std::span<const std::byte> data) noexcept
    {
        return write(data.data(), data.size());
    }

    /// 최대 len 바이트를 dest 로 읽고 소비합니다. @return 실제로 읽은 바이트 수
    std::size_t read(std::byte *dest, std::size_t len) noexcept;

    /// read() 와 같지만 head 를 움직이지 않습니다.
    std::size_t peek(std::byte *dest, std::size_t len) const noexcept;

    /// head 기준으로 value 가 처음 나타나는 오프셋. 없으면 npos.
    [[nodiscard]] std::size_t find(std::byte value) const noexcept;

    /// 앞에서 n 바이트를 버립니다. (size 보다 크면 size 만큼)
    void discard(std::size_t n) noexcept;

    /// tail 기준 빈 공간을 1~2 개 iovec 로 노출합니다. readv 로 직접 수신할 때 사용.
    /// - 호출 후 반드시 commitWrite(n) 으로 실제 수신량을 반영해야 합니다.
    /// - 반환값: iov 개수(0/1/2)
    [[nodiscard]] int writeIov(::iovec out[2], std::size_t maxLen) const noexcept;

    void commitWrite(std::size_t n) noexcept;

    void clear() noexcept;

  private:
    std::vector<std::byte> buffer_;
    std::size_t capacity_;
    std::size_t head_{0};
    std::size_t tail_{0};
    std::size_t size_{0};
};

} // namespace coinchase::buffer
