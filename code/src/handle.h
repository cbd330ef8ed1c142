/*
 * handle.h
 *
 * Project: Wristwatch Firmware
 * Purpose: Exclusive peripheral ownership
 *
 * Notes:
 *  - Handles are move-only; copying would duplicate hardware ownership
 *  - A moved-from handle is hollow and owns nothing
 *  - Every operation on a hollow handle is a system fault
 *  - No standard library on the target, consume() stands in for std::move
 *
 * Updated: 2026-10-12
 */

#pragma once

namespace watch {

/*
 * Capability shared by every peripheral handle and raw token:
 * knows whether it still owns its hardware.
 */
class PeripheralHandle {
public:
    PeripheralHandle(const PeripheralHandle &) = delete;
    PeripheralHandle &operator=(const PeripheralHandle &) = delete;

    bool live() const { return live_; }

protected:
    PeripheralHandle() : live_(false) {}
    explicit PeripheralHandle(bool live) : live_(live) {}

    PeripheralHandle(PeripheralHandle &&other) : live_(other.live_)
    {
        other.live_ = false;
    }

    PeripheralHandle &operator=(PeripheralHandle &&other)
    {
        if (this != &other) {
            live_ = other.live_;
            other.live_ = false;
        }
        return *this;
    }

    ~PeripheralHandle() {}

    /* Faults unless this handle owns its hardware */
    void require_live(const char *what) const;

    /* Give up ownership; used by transitions after the new handle exists */
    void hollow() { live_ = false; }

private:
    bool live_;
};

/* Hand a handle over to a transition or a new owner */
template <typename T>
inline T &&consume(T &handle)
{
    return static_cast<T &&>(handle);
}

} // namespace watch
