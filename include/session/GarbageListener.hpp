#pragma once

namespace panelrise::session {

/// Attack traffic between grids, for HUDs and tests.
class GarbageListener {
public:
    virtual ~GarbageListener() = default;

    virtual void onGarbageSent(int /*sender*/, int /*target*/, int /*score*/) {}
    virtual void onGarbageCountered(int /*player*/, int /*countered*/, int /*remaining*/) {}
    virtual void onGarbageReceived(int /*player*/, int /*score*/) {}
};

} // namespace panelrise::session
