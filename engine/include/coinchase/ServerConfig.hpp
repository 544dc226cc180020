#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <coinchase/core/Logger.hpp>

namespace coinchase
{

/// 세션 태스크(receiver/sender/processor) 튜닝 값입니다.
struct SessionTuning
{
    /// 수신 idle 타임아웃(ms). 1바이트 이상 읽을 때마다 다시 연장됩니다.
    std::uint32_t readIdleTimeoutMs = 300'000;

    /// 클라이언트로 역방향 dial 할 때의 타임아웃(ms)
    std::uint32_t dialTimeoutMs = 300'000;

    /// 한 번에 읽는 바이트 수이자, 구분자 없이 허용되는 최대 프레임 길이
    std::size_t chunkSize = 4096;

    /// 연속 송신 실패 허용 횟수
    std::uint32_t faultTolerance = 100;

    /// poll 한 번에 기다리는 최대 시간(ms). probe 응답 지연의 상한이기도 합니다.
    std::uint32_t pollSliceMs = 50;

    /// 브로드캐스트 clock 주기(ms)
    std::uint32_t broadcastIntervalMs = 100;
};

/// liveness monitor 주기/응답 대기 시간
struct LivenessOptions
{
    std::uint32_t intervalMs = 10'000;
    std::uint32_t probeTimeoutMs = 2'000;
};

/// in-memory 게임 월드 초기화 값
struct GameOptions
{
    std::int32_t mapSize = 64;
    std::uint32_t coinCount = 40;
    std::uint32_t itemCount = 8;

    /// 기본 시야 반경(칸). 아이템 효과가 여기에 더해집니다.
    std::int32_t baseVisibility = 5;

    /// 0 이면 std::random_device 로 시드를 뽑습니다.
    std::uint64_t seed = 0;
};

/// coinchase 서버 전체 설정입니다.
struct ServerConfig
{
    /// 로비 HTTP 서버 바인딩 주소/포트
    std::string httpAddress = "0.0.0.0";
    std::uint16_t httpPort = 8080;

    /// 세션 슬롯 리스너 바인딩 주소
    std::string slotAddress = "0.0.0.0";

    /// 슬롯 i 는 slotBasePort + i 에서 listen 합니다.
    /// - 0 이면 슬롯마다 커널이 고른 임시 포트를 사용합니다.
    std::uint16_t slotBasePort = 9000;

    /// 워커 풀 크기 (슬롯 수 = processor 수)
    std::uint32_t capacity = 8;

    /// - 빈 문자열("")이면 std::clog 로 출력합니다.
    std::string logFilePath;
    core::LogLevel logLevel = core::LogLevel::Info;

    SessionTuning session{};
    LivenessOptions liveness{};
    GameOptions game{};
};

/// 설정 값 조합을 검증합니다. 실패 시 std::invalid_argument 를 던집니다.
void validateServerConfig(const ServerConfig &config);

} // namespace coinchase
