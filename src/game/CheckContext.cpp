/**
 * AGL Core - Check Context Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "CheckContext.hpp"

namespace agl {

std::string toString(StatusStage stage) {
    switch (stage) {
        case StatusStage::Game: return "game";
        case StatusStage::Voice: return "voice";
        case StatusStage::Patch: return "patch";
        case StatusStage::Telemetry: return "telemetry";
    }
    return "unknown";
}

} // namespace agl
