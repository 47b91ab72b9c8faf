#ifndef SLOTWATCH_BOOKING_IPOLLCONTROL_HPP
#define SLOTWATCH_BOOKING_IPOLLCONTROL_HPP

namespace slotwatch
{
/**
 * @brief Pause switch of the poll scheduler, driven by the booking state machine
 */
class IPollControl
{
public:
    virtual ~IPollControl() = default;

    /// Stop dispatching location checks; the current round is kept
    virtual void pause() = 0;

    /// Continue the current round where it stopped
    virtual void resume() = 0;

    [[nodiscard]] virtual bool isPaused() const = 0;
};
} // namespace slotwatch

#endif // SLOTWATCH_BOOKING_IPOLLCONTROL_HPP
