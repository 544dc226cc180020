#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace coinchase::protocol::wire {

// Frame = escape([type: 1 byte][payload: N bytes]) + [delimiter: '$']
inline constexpr std::byte kDelimiter{0x24};

// 본문 안의 '$' 와 escape 바이트는 [kEscape][byte ^ kEscapeMask] 두 바이트로 바꿔 씁니다.
// 따라서 escape 된 본문에는 '$' 가 나타나지 않습니다.
inline constexpr std::byte kEscape{0x7D};
inline constexpr std::byte kEscapeMask{0x20};

inline constexpr std::uint8_t kTypeStatus = 0;
inline constexpr std::uint8_t kTypeAttack = 1;

/// 한 번에 읽는 크기이자 구분자 없이 허용되는 최대 누적 길이
inline constexpr std::size_t kDefaultChunkSize = 4096;

inline void appendEscaped(std::span<const std::byte> body, std::vector<std::byte> &out)
{
    for (const std::byte b : body)
    {
        if (b == kDelimiter || b == kEscape)
        {
            out.push_back(kEscape);
            out.push_back(b ^ kEscapeMask);
        }
        else
        {
            out.push_back(b);
        }
    }
}

/// escape 를 제자리에서 풉니다. 끝이 escape 바이트로 끝나거나
/// escape 뒤에 '$'/escape 가 아닌 값이 오면 false.
[[nodiscard]] inline bool unescapeInPlace(std::vector<std::byte> &body)
{
    std::size_t w = 0;
    for (std::size_t r = 0; r < body.size(); ++r)
    {
        std::byte b = body[r];
        if (b == kEscape)
        {
            if (++r == body.size())
            {
                return false;
            }
            b = body[r] ^ kEscapeMask;
            if (b != kDelimiter && b != kEscape)
            {
                return false;
            }
        }
        body[w++] = b;
    }
    body.resize(w);
    return true;
}

} // namespace coinchase::protocol::wire
