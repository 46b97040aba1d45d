#pragma once

/**
 * @file Constants.h
 * @brief Engine-wide defaults
 */

#include <cstddef>

namespace PFSM::Constants {

/**
 * @brief Default bound on nested transitions
 *
 * A transition requested from inside onEnter/onExit runs before the outer
 * one returns. Depth counts those nested calls; the outermost is depth 1.
 */
constexpr std::size_t DEFAULT_MAX_TRANSITION_DEPTH = 32;

/**
 * @brief Name used in log messages for a null state reference
 */
constexpr const char *NULL_STATE_NAME = "<null>";

}  // namespace PFSM::Constants
