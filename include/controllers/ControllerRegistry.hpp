/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_REGISTRY_HPP
#define CONTROLLER_REGISTRY_HPP

/**
 * @file ControllerRegistry.hpp
 * @brief Owns the simulation controllers and ticks them in registration order
 *
 * One slot per controller type. A slot remembers the IUpdatable side of its
 * controller when it has one, detected at compile time in add<T>(), so
 * updateAll() never casts. Lookups are a linear scan over a handful of slots.
 *
 * Ownership: SimulationContext owns the ControllerRegistry, which owns the controllers.
 *
 * Usage:
 * @code
 * m_controllers.add<PatrolController>(map, alertConfig, patrolConfig, seed);
 * m_controllers.add<CombatController>(map, combatConfig, seed + 2);
 * m_controllers.updateAll(dt);   // Patrol first, then Combat
 * m_controllers.suspendAll();    // Host paused
 * @endcode
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include <algorithm>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <vector>

class ControllerRegistry
{
public:
    ControllerRegistry() = default;
    ~ControllerRegistry() = default;

    ControllerRegistry(const ControllerRegistry&) = delete;
    ControllerRegistry& operator=(const ControllerRegistry&) = delete;

    ControllerRegistry(ControllerRegistry&&) noexcept = default;
    ControllerRegistry& operator=(ControllerRegistry&&) noexcept = default;

    /**
     * @brief Construct a controller of type T from the forwarded arguments
     * @return The new controller, or the existing one if T is already registered
     */
    template<typename T, typename... Args>
    T& add(Args&&... args)
    {
        static_assert(std::is_base_of_v<ControllerBase, T>, "T must derive from ControllerBase");

        if (T* existing = get<T>()) {
            return *existing;
        }

        auto controller = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *controller;

        Slot slot{std::type_index(typeid(T)), std::move(controller), nullptr};
        if constexpr (std::is_base_of_v<IUpdatable, T>) {
            slot.updatable = &ref;
        }
        m_slots.push_back(std::move(slot));
        return ref;
    }

    template<typename T>
    T* get()
    {
        const Slot* slot = find(std::type_index(typeid(T)));
        return slot ? static_cast<T*>(slot->controller.get()) : nullptr;
    }

    template<typename T>
    const T* get() const
    {
        const Slot* slot = find(std::type_index(typeid(T)));
        return slot ? static_cast<const T*>(slot->controller.get()) : nullptr;
    }

    template<typename T>
    [[nodiscard]] bool has() const { return find(std::type_index(typeid(T))) != nullptr; }

    void suspendAll()
    {
        for (auto& slot : m_slots) {
            slot.controller->suspend();
        }
    }

    void resumeAll()
    {
        for (auto& slot : m_slots) {
            slot.controller->resume();
        }
    }

    /**
     * @brief Tick every updatable controller that is not suspended
     * @param deltaTime Tick length in seconds
     */
    void updateAll(float deltaTime)
    {
        for (auto& slot : m_slots) {
            if (slot.updatable && !slot.controller->isSuspended()) {
                slot.updatable->update(deltaTime);
            }
        }
    }

    [[nodiscard]] size_t size() const { return m_slots.size(); }
    [[nodiscard]] bool empty() const { return m_slots.empty(); }

    void clear() { m_slots.clear(); }

private:
    struct Slot {
        std::type_index type;
        std::unique_ptr<ControllerBase> controller;
        IUpdatable* updatable; // Null for passive controllers
    };

    const Slot* find(std::type_index type) const
    {
        auto it = std::find_if(m_slots.begin(), m_slots.end(),
                               [type](const Slot& slot) { return slot.type == type; });
        return it != m_slots.end() ? &*it : nullptr;
    }

    std::vector<Slot> m_slots;
};

#endif // CONTROLLER_REGISTRY_HPP
