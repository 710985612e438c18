/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_BASE_HPP
#define CONTROLLER_BASE_HPP

/**
 * @file ControllerBase.hpp
 * @brief Base class for the simulation controllers owned by a SimulationContext
 *
 * Controllers own the per-entity state of one simulation concern (patrol,
 * awareness, combat) and are driven by the ControllerRegistry.
 *
 * Key characteristics:
 * - Owned by SimulationContext through its ControllerRegistry (not singletons)
 * - Suspendable: a suspended controller is skipped by updateAll() and
 *   therefore accumulates no simulation time
 * - Non-copyable (callbacks may capture 'this')
 */

#include <string_view>

class ControllerBase
{
public:
    virtual ~ControllerBase() = default;

    // Non-copyable
    ControllerBase(const ControllerBase&) = delete;
    ControllerBase& operator=(const ControllerBase&) = delete;

    // Movable
    ControllerBase(ControllerBase&&) noexcept = default;
    ControllerBase& operator=(ControllerBase&&) noexcept = default;

    /**
     * @brief Stop receiving updates (host paused)
     * @note Safe to call multiple times
     */
    void suspend()
    {
        if (m_suspended) {
            return;
        }
        m_suspended = true;
        onSuspend();
    }

    /**
     * @brief Resume receiving updates
     * @note Safe to call multiple times
     */
    void resume()
    {
        if (!m_suspended) {
            return;
        }
        m_suspended = false;
        onResume();
    }

    [[nodiscard]] bool isSuspended() const { return m_suspended; }

    /**
     * @brief Controller name for logging and debugging
     */
    [[nodiscard]] virtual std::string_view getName() const = 0;

protected:
    ControllerBase() = default;

    // Optional hooks for derived controllers
    virtual void onSuspend() {}
    virtual void onResume() {}

private:
    bool m_suspended{false};
};

#endif // CONTROLLER_BASE_HPP
