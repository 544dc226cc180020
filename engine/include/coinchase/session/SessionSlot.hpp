#pragma once

#include <coinchase/game/GameTypes.hpp>
#include <coinchase/net/Acceptor.hpp>
#include <coinchase/session/SessionContext.hpp>
#include <coinchase/session/SessionEnvironment.hpp>
#include <coinchase/session/WorkerStatus.hpp>
#include <coinchase/util/NonCopyable.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

namespace coinchase::session
{

/// userId -> slot 인덱스. WorkerPool 이 구현하며 슬롯은 client 정보 등록 시 여기서 소유권을 얻는다.
class IOwnerIndex
{
  public:
    virtual ~IOwnerIndex() = default;

    /// userId 가 다른 슬롯에 묶여 있으면 false
    [[nodiscard]] virtual bool claimOwner(const std::string &userId, int slotId) = 0;
    virtual void releaseOwner(const std::string &userId, int slotId) noexcept = 0;
};

/// monitor 가 ping 을 보낸 뒤 echo 를 기다릴 때 쓰는 표
struct ProbeTicket
{
    std::shared_ptr<SessionContext> context;
    std::uint64_t receiverSeq{0};
    std::uint64_t processorSeq{0};
};

/// 재사용되는 세션 1개분의 서버 측 상태입니다.
///
/// - port 는 생성 시 bind 한 리스너에서 정해지고 프로세스가 끝날 때까지 바뀌지 않습니다.
/// - status/owner/clientAddress 는 슬롯 mutex 로 보호됩니다.
/// - 세션 태스크는 SessionContext 단위로 묶이며, arm 할 때마다 generation 이 올라갑니다.
///   이전 generation 의 태스크가 뒤늦게 상태를 바꾸려 해도 무시됩니다.
///
/// 락 순서: WorkerPool::mu_ -> SessionSlot::mu_ -> WorkerPool::ownersMu_
class SessionSlot : private coinchase::util::NonCopyable
{
  public:
    SessionSlot(int id, std::unique_ptr<net::Acceptor> listener, const SessionEnvironment &env,
                IOwnerIndex &owners);
    ~SessionSlot();

    [[nodiscard]] int id() const noexcept { return id_; }
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    [[nodiscard]] WorkerStatus status() const;
    [[nodiscard]] std::string ownerUserId() const;
    [[nodiscard]] game::ClientAddress clientAddress() const;

    /// PULLED_OUT -> INFO_RECEIVED. 다른 상태면 force exit + InvalidState.
    /// 다른 슬롯이 이미 userId 를 소유하고 있으면 DuplicateOwner (상태 변화 없음).
    [[nodiscard]] std::error_code setClientInformation(const std::string &userId,
                                                       const std::string &ip, std::uint16_t port);

    /// INFO_RECEIVED -> WORKING 후 sender 태스크 시작.
    /// 다른 상태이거나 dialer 가 없으면 force exit + InvalidState.
    [[nodiscard]] std::error_code startSendUserRelatedDataToClient();

    /// paired processor 에 force exit 신호를 보냅니다.
    void forceExit() noexcept;

    /// 현재 세션이 살아 있는지 (context 존재 + coordinator 미발동)
    [[nodiscard]] bool sessionAlive() const;

    /// receiver/processor 양쪽에 ping. 세션이 없으면 nullopt.
    [[nodiscard]] std::optional<ProbeTicket> beginProbe();

    /// ticket 의 두 echo 를 deadline 까지 기다립니다. 둘 다 오면 true.
    [[nodiscard]] static bool awaitProbe(const ProbeTicket &ticket,
                                         std::chrono::steady_clock::time_point deadline);

    /// ping/echo 한 번에 끝내는 편의 함수
    [[nodiscard]] bool probeLiveness(std::chrono::milliseconds timeout);

    // ===== 세션 태스크가 호출 =====

    /// in-use 상태 + 현재 context 의 generation 일 때만 TERMINATED 로 바꿉니다.
    void markTerminated(std::uint64_t generation) noexcept;

    [[nodiscard]] net::Acceptor &listener() noexcept { return *listener_; }

    // ===== WorkerPool 전용 =====

    /// mutex() 를 잡은 상태에서 호출
    [[nodiscard]] const std::string &ownerUserIdLocked() const noexcept { return ownerUserId_; }

    /// AVAILABLE -> PULLED_OUT (pool 락 안에서 호출)
    void markPulledOutLocked();

    /// 현재 context 를 떼어내고 취소합니다. join 은 호출자가 락 밖에서 합니다.
    [[nodiscard]] std::shared_ptr<SessionContext> detachSessionLocked(TerminationReason reason);

    /// owner/address 를 지우고 AVAILABLE 로. @return 지워진 owner
    std::string resetToAvailableLocked();

    /// 새 generation 의 receiver/processor 를 시작합니다. 실패 시 false (세션 없음 상태).
    bool armLocked();

    [[nodiscard]] std::mutex &mutex() const noexcept { return mu_; }

    /// context 취소 + join (프로세스 종료용, 재무장 없음)
    void shutdown();

  private:
    void forceExitLocked() noexcept;
    void drainStaleConnections_() noexcept;

    const int id_;
    std::unique_ptr<net::Acceptor> listener_;
    const std::uint16_t port_;
    const SessionEnvironment &env_;
    IOwnerIndex &owners_;

    mutable std::mutex mu_;
    WorkerStatus status_{WorkerStatus::Available};
    std::string ownerUserId_;
    game::ClientAddress clientAddress_;

    std::uint64_t generation_{0};
    std::shared_ptr<SessionContext> context_;
};

} // namespace coinchase::session
