#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace coinchase::protocol
{

/// zlib(deflate) 블록 압축. 프레임 하나를 통째로 압축/해제합니다.
///
/// - 실패 시 false 를 반환하고 out 은 비웁니다.
/// - decompressBlock 은 결과가 maxOutput 을 넘으면 실패로 봅니다.
[[nodiscard]] bool compressBlock(std::span<const std::byte> input, std::vector<std::byte> &out);

[[nodiscard]] bool decompressBlock(std::span<const std::byte> input, std::vector<std::byte> &out,
                                   std::size_t maxOutput = 16U * 1024U * 1024U);

} // namespace coinchase::protocol
