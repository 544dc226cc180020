#pragma once

#include <coinchase/game/GameTypes.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <span>
#include <system_error>

namespace coinchase::session
{

/// sender 가 스냅샷을 밀어 넣는 클라이언트 방향 연결입니다.
class IOutboundLink
{
  public:
    virtual ~IOutboundLink() = default;

    /// 프레임 전체를 보냅니다. 일부만 보냈거나 실패하면 false.
    [[nodiscard]] virtual bool write(std::span<const std::byte> frame) = 0;

    /// 스트림이 더 이상 쓸 수 없는 상태인지 (프레임 중간에서 끊겼거나 연결이 닫힘).
    /// true 면 이후 write 는 전부 실패하므로 재시도할 의미가 없습니다.
    [[nodiscard]] virtual bool broken() const noexcept { return false; }
};

struct DialRequest
{
    game::ClientAddress address;
    std::chrono::milliseconds timeout{0};

    /// readable 이 되면 dial/write 를 즉시 포기해야 하는 fd (coordinator wake fd)
    int cancelFd{-1};
};

/// 클라이언트로 역방향 연결을 만드는 함수. 실패 시 nullptr + ec.
/// - 취소로 포기한 경우 ec 는 Errc::Cancelled, 그 외 실패는 Errc::FatalIo.
using OutboundDialer =
    std::function<std::unique_ptr<IOutboundLink>(const DialRequest &, std::error_code &)>;

} // namespace coinchase::session
