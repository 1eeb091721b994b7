/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for FleetWatch interfaces.
 *
 * Device families are a closed set dispatched through std::variant, so each
 * family driver is checked against DeviceDriverLike at compile time instead
 * of deriving from a virtual base.
 */

#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <concepts>
#include <string>
#include <vector>

namespace fleetwatch {

// Forward declarations
struct ConfigSnapshot;
struct ConfigPatch;
struct DriverContext;

// ─────────────────────────────────────────────
// DeviceDriverLike
// ─────────────────────────────────────────────

/**
 * @concept DeviceDriverLike
 * @brief Constrains the per-family drivers held by DeviceDriver.
 *
 * status() is on the poll path and must not fail; config() may. Patch
 * validation and rendering are pure so that invalid input is rejected
 * before any device I/O.
 */
template <typename T>
concept DeviceDriverLike = requires(
    T driver,
    const T& const_driver,
    const ConfigPatch& patch,
    const ConfigSnapshot& snapshot,
    Timestamp now
) {
    { T::family() } -> std::same_as<DeviceFamily>;
    { const_driver.device() } -> std::same_as<const DeviceConfig&>;
    { const_driver.context() } -> std::same_as<const DriverContext&>;
    { driver.status(now) } -> std::same_as<StatusSample>;
    { driver.config() } -> std::same_as<Result<ConfigSnapshot>>;
    { const_driver.validate_patch(patch) } -> std::same_as<Result<void>>;
    { const_driver.render_commands(patch) } -> std::same_as<std::vector<std::string>>;
    { T::patch_from_snapshot(snapshot) } -> std::same_as<Result<ConfigPatch>>;
};

}  // namespace fleetwatch
