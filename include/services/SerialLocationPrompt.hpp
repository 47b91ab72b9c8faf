#ifndef SLOTWATCH_SERVICES_SERIALLOCATIONPROMPT_HPP
#define SLOTWATCH_SERVICES_SERIALLOCATIONPROMPT_HPP

#include "services/LocationService.hpp"

#include <cstdint>

namespace slotwatch
{
/**
 * @brief Location pick over the USB serial console
 *
 * Lists the locations numbered from 1 and reads one line of comma-separated
 * numbers, e.g. "1,3".
 */
class SerialLocationPrompt : public ILocationPrompt
{
public:
    static constexpr std::uint32_t kDefaultTimeoutMs{300'000}; // 5 minutes

    explicit SerialLocationPrompt(std::uint32_t timeoutMs = kDefaultTimeoutMs)
        : m_timeoutMs(timeoutMs)
    {
    }

    [[nodiscard]] std::vector<std::size_t> choose(const std::vector<Location> &locations) override;

private:
    std::uint32_t m_timeoutMs{kDefaultTimeoutMs};
};
} // namespace slotwatch

#endif // SLOTWATCH_SERVICES_SERIALLOCATIONPROMPT_HPP
