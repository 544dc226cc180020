#pragma once

#include <coinchase/ServerConfig.hpp>

#include <string>

namespace coinchase::core
{

class ConfigLoader
{
  public:
    /// `--config <path.toml>` 를 읽어 검증까지 마친 ServerConfig 를 돌려줍니다.
    /// - `--help` 는 사용법 출력 후 종료합니다.
    /// - 누락/범위 초과/검증 실패는 예외로 보고합니다.
    static ServerConfig load(int argc, char **argv);

    /// TOML 파일 하나를 파싱/검증합니다. (CLI 없이 쓰는 경로)
    static ServerConfig loadFile(const std::string &path);
};

} // namespace coinchase::core
