/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IUPDATABLE_HPP
#define IUPDATABLE_HPP

/**
 * @file IUpdatable.hpp
 * @brief Interface for controllers that advance with simulation time
 *
 * Usage:
 * - Ticked:  class MyController : public ControllerBase, public IUpdatable
 * - Passive: class MyController : public ControllerBase
 *
 * The ControllerRegistry detects IUpdatable at compile time via
 * std::is_base_of_v and only calls update() on controllers that implement it.
 */
class IUpdatable
{
public:
    virtual ~IUpdatable() = default;

    /**
     * @brief Advance the controller by one simulation tick
     * @param deltaTime Clamped tick length in seconds
     *
     * Not called while the controller is suspended.
     */
    virtual void update(float deltaTime) = 0;
};

#endif // IUPDATABLE_HPP
