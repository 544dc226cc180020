#include <coinchase/core/Error.hpp>

namespace coinchase::core
{

namespace
{
class CoinchaseCategory final : public std::error_category
{
  public:
    const char *name() const noexcept override { return "coinchase"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Errc>(ev))
        {
        case Errc::Capacity:
            return "worker currently not available";
        case Errc::NotFound:
            return "worker not found";
        case Errc::InvalidState:
            return "session slot is not in the required state";
        case Errc::DuplicateOwner:
            return "user already owns a session slot";
        case Errc::ProtocolViolation:
            return "wire protocol violation";
        case Errc::TransientIo:
            return "transient i/o failure";
        case Errc::FatalIo:
            return "fatal i/o failure";
        case Errc::Cancelled:
            return "session cancelled";
        }
        return "unknown coinchase error";
    }
};
} // namespace

const std::error_category &coinchaseCategory() noexcept
{
    static const CoinchaseCategory category;
    return category;
}

const char *errcName(Errc e) noexcept
{
    switch (e)
    {
    case Errc::Capacity:
        return "Capacity";
    case Errc::NotFound:
        return "NotFound";
    case Errc::InvalidState:
        return "InvalidState";
    case Errc::DuplicateOwner:
        return "DuplicateOwner";
    case Errc::ProtocolViolation:
        return "ProtocolViolation";
    case Errc::TransientIo:
        return "TransientIo";
    case Errc::FatalIo:
        return "FatalIo";
    case Errc::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

} // namespace coinchase::core
