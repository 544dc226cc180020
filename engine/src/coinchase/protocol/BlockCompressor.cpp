#include <coinchase/protocol/BlockCompressor.hpp>

#include <coinchase/core/Logger.hpp>

#include <zlib.h>

#include <algorithm>

namespace coinchase::protocol
{

bool compressBlock(std::span<const std::byte> input, std::vector<std::byte> &out)
{
    uLongf destLen = ::compressBound(static_cast<uLong>(input.size()));
    out.resize(destLen);

    const int rc = ::compress2(reinterpret_cast<Bytef *>(out.data()), &destLen,
                               reinterpret_cast<const Bytef *>(input.data()),
                               static_cast<uLong>(input.size()), Z_BEST_SPEED);
    if (rc != Z_OK)
    {
        SLOG_ERROR("BlockCompressor", "CompressFailed", "rc={} input_len={}", rc, input.size());
        out.clear();
        return false;
    }

    out.resize(destLen);
    return true;
}

bool decompressBlock(std::span<const std::byte> input, std::vector<std::byte> &out,
                     std::size_t maxOutput)
{
    out.clear();

    z_stream zs{};
    if (::inflateInit(&zs) != Z_OK)
    {
        return false;
    }

    zs.next_in = const_cast<Bytef *>(reinterpret_cast<const Bytef *>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::size_t chunk = std::max<std::size_t>(input.size() * 4, 256);
    int rc = Z_OK;
    while (rc != Z_STREAM_END)
    {
        const std::size_t used = out.size();
        if (used >= maxOutput)
        {
            rc = Z_BUF_ERROR;
            break;
        }

        const std::size_t grow = std::min(chunk, maxOutput - used);
        out.resize(used + grow);
        zs.next_out = reinterpret_cast<Bytef *>(out.data() + used);
        zs.avail_out = static_cast<uInt>(grow);

        rc = ::inflate(&zs, Z_NO_FLUSH);
        out.resize(used + (grow - zs.avail_out));

        if (rc == Z_STREAM_END)
        {
            break;
        }
        if (rc != Z_OK)
        {
            break; // Z_DATA_ERROR, Z_BUF_ERROR(입력이 잘림) 등
        }
        chunk *= 2;
    }

    ::inflateEnd(&zs);

    if (rc != Z_STREAM_END)
    {
        out.clear();
        return false;
    }
    return true;
}

} // namespace coinchase::protocol
