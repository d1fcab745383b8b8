/**
 * AGL Core - Runner Features Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Features.hpp"

namespace agl {

Features Features::fromJson(const nlohmann::json& value) {
    Features features;

    if (!value.is_object()) {
        return features;
    }

    if (auto it = value.find("bundle"); it != value.end() && it->is_string()) {
        if (it->get<std::string>() == "Proton") {
            features.bundle = BundleKind::Proton;
        }
    }

    if (auto it = value.find("need_dxvk"); it != value.end() && it->is_boolean()) {
        features.needDxvk = it->get<bool>();
    }

    if (auto it = value.find("compact_launch"); it != value.end() && it->is_boolean()) {
        features.compactLaunch = it->get<bool>();
    }

    if (auto it = value.find("prefix_subdir"); it != value.end() && it->is_string()) {
        features.prefixSubdir = it->get<std::string>();
    }

    if (auto it = value.find("command"); it != value.end() && it->is_string()) {
        features.command = it->get<std::string>();
    }

    if (auto it = value.find("env"); it != value.end() && it->is_object()) {
        for (const auto& [key, entry] : it->items()) {
            // Non-string values are kept as their JSON text
            features.env[key] = entry.is_string() ? entry.get<std::string>() : entry.dump();
        }
    }

    return features;
}

nlohmann::json Features::toJson() const {
    nlohmann::json j;

    if (bundle == BundleKind::Proton) {
        j["bundle"] = "Proton";
    }
    j["need_dxvk"] = needDxvk;
    j["compact_launch"] = compactLaunch;
    if (prefixSubdir) {
        j["prefix_subdir"] = *prefixSubdir;
    }
    if (command) {
        j["command"] = *command;
    }
    j["env"] = env;

    return j;
}

bool Features::operator==(const Features& other) const {
    return bundle == other.bundle &&
           needDxvk == other.needDxvk &&
           compactLaunch == other.compactLaunch &&
           prefixSubdir == other.prefixSubdir &&
           command == other.command &&
           env == other.env;
}

Features resolveFeatures(const std::optional<Features>& versionFeatures,
                         const std::optional<Features>& groupFeatures) {
    if (versionFeatures) {
        return *versionFeatures;
    }
    if (groupFeatures) {
        return *groupFeatures;
    }
    return Features{};
}

} // namespace agl
