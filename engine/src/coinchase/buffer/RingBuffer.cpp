#include <coinchase/buffer/RingBuffer.hpp>

#include <algorithm> // std::min, std::find
#include <cstring>   // std::memcpy
#include <stdexcept> // std::invalid_argument

namespace coinchase::buffer
{

RingBuffer::RingBuffer(std::size_t capacity) : buffer_(capacity), capacity_(capacity)
{
    if (capacity_ == 0)
    {
        throw std::invalid_argument("RingBuffer capacity must be greater than 0");
    }
}

std::size_t RingBuffer::write(const std::byte *data, std::size_t len) noexcept
{
    if (!data || len == 0)
    {
        return 0;
    }

    const std::size_t toWrite = std::min(len, freeSpace());
    if (toWrite == 0)
    {
        return 0;
    }

    const std::size_t firstPart = std::min(toWrite, capacity_ - tail_);
    std::memcpy(buffer_.data() + tail_, data, firstPart);

    const std::size_t remaining = toWrite - firstPart;
    if (remaining > 0)
    {
        // 0번 인덱스로 랩어라운드
        std::memcpy(buffer_.data(), data + firstPart, remaining);
    }

    tail_ = (tail_ + toWrite) % capacity_;
    size_ += toWrite;
    return toWrite;
}

std::size_t RingBuffer::read(std::byte *dest, std::size_t len) noexcept
{
    const std::size_t copied = peek(dest, len);
    discard(copied);
    return copied;
}

std::size_t RingBuffer::peek(std::byte *dest, std::size_t len) const noexcept
{
    if (!dest || len == 0)
    {
        return 0;
    }

    const std::size_t toCopy = std::min(len, size_);
    if (toCopy == 0)
    {
        return 0;
    }

    const std::size_t firstPart = std::min(toCopy, capacity_ - head_);
    std::memcpy(dest, buffer_.data() + head_, firstPart);

    const std::size_t remaining = toCopy - firstPart;
    if (remaining > 0)
    {
        std::memcpy(dest + firstPart, buffer_.data(), remaining);
    }

    return toCopy;
}

std::size_t RingBuffer::find(std::byte value) const noexcept
{
    if (size_ == 0)
    {
        return npos;
    }

    // [head, min(head+size, cap)) 다음 [0, 나머지)
    const std::size_t firstPart = std::min(size_, capacity_ - head_);
    const auto *begin = buffer_.data() + head_;
    const auto *hit = std::find(begin, begin + firstPart, value);
    if (hit != begin + firstPart)
    {
        return static_cast<std::size_t>(hit - begin);
    }

    const std::size_t remaining = size_ - firstPart;
    if (remaining > 0)
    {
        const auto *wrapBegin = buffer_.data();
        const auto *wrapHit = std::find(wrapBegin, wrapBegin + remaining, value);
        if (wrapHit != wrapBegin + remaining)
        {
            return firstPart + static_cast<std::size_t>(wrapHit - wrapBegin);
        }
    }

    return npos;
}

void RingBuffer::discard(std::size_t n) noexcept
{
    const std::size_t toDrop = std::min(n, size_);
    if (toDrop == 0)
    {
        return;
    }

    head_ = (head_ + toDrop) % capacity_;
    size_ -= toDrop;
    if (size_ == 0)
    {
        // 비면 인덱스를 0으로 돌려 다음 readv 가 한 조각으로 끝나게 한다.
        head_ = 0;
        tail_ = 0;
    }
}

int RingBuffer::writeIov(::iovec out[2], std::size_t maxLen) const noexcept
{
    if (!out || maxLen == 0)
        return 0;

    const std::size_t toWrite = std::min(maxLen, freeSpace());
    if (toWrite == 0)
        return 0;

    const std::size_t firstPart = std::min(toWrite, capacity_ - tail_);
    const std::size_t remaining = toWrite - firstPart;

    out[0].iov_base = const_cast<std::byte *>(buffer_.data() + tail_);
    out[0].iov_len = firstPart;

    if (remaining > 0)
    {
        out[1].iov_base = const_cast<std::byte *>(buffer_.data());
        out[1].iov_len = remaining;
        return 2;
    }

    out[1].iov_base = nullptr;
    out[1].iov_len = 0;
    return 1;
}

void RingBuffer::commitWrite(std::size_t n) noexcept
{
    // freeSpace 초과 commit 은 호출자 버그. 넘치는 만큼은 잘라낸다.
    n = std::min(n, freeSpace());
    if (n == 0)
    {
        return;
    }

    tail_ = (tail_ + n) % capacity_;
    size_ += n;
}

void RingBuffer::clear() noexcept
{
    head_ = 0;
    tail_ = 0;
    size_ = 0;
}

} // namespace coinchase::buffer
