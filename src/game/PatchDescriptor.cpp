/**
 * AGL Core - Patch Descriptor Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "PatchDescriptor.hpp"

namespace agl {

std::string toString(PatchKind kind) {
    switch (kind) {
        case PatchKind::Player: return "player";
        case PatchKind::Xlua: return "xlua";
        case PatchKind::Mfplat: return "mfplat";
        case PatchKind::Wrapper: return "wrapper";
    }
    return "unknown";
}

std::string toString(PatchStatus status) {
    switch (status) {
        case PatchStatus::Verified: return "verified";
        case PatchStatus::Unverified: return "unverified";
        case PatchStatus::Broken: return "broken";
        case PatchStatus::Unsafe: return "unsafe";
        case PatchStatus::Concerning: return "concerning";
    }
    return "unknown";
}

} // namespace agl
