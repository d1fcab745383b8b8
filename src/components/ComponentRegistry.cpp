/**
 * AGL Core - Component Registry Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ComponentRegistry.hpp"

#include "core/Errors.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace agl {

namespace {

constexpr const char* INDEX_FILE = "components.json";

nlohmann::json readDocument(const std::filesystem::path& path, const std::string& label) {
    std::ifstream file(path);
    if (!file) {
        throw StructuralConfigError(label, "document can't be read from " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw StructuralConfigError(label, std::string("invalid JSON: ") + e.what());
    }
}

std::string requireString(const nlohmann::json& object, const char* key, const std::string& fieldPath) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw StructuralConfigError(fieldPath + "." + key, "not found");
    }
    if (!it->is_string()) {
        throw StructuralConfigError(fieldPath + "." + key, "must be a string");
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it != object.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

// Only an object counts as a features entry, anything else is ignored
std::optional<Features> optionalFeatures(const nlohmann::json& object) {
    auto it = object.find("features");
    if (it != object.end() && it->is_object()) {
        return Features::fromJson(*it);
    }
    return std::nullopt;
}

WineFiles parseWineFiles(const nlohmann::json& version, const std::string& fieldPath) {
    auto it = version.find("files");
    if (it == version.end()) {
        throw StructuralConfigError(fieldPath + ".files", "not found");
    }
    if (!it->is_object()) {
        throw StructuralConfigError(fieldPath + ".files", "must be an object");
    }

    WineFiles files;
    files.wine = requireString(*it, "wine", fieldPath + ".files");
    files.wine64 = optionalString(*it, "wine64");
    files.wineserver = optionalString(*it, "wineserver");
    files.wineboot = optionalString(*it, "wineboot");
    files.winecfg = optionalString(*it, "winecfg");
    return files;
}

ComponentVersion parseVersion(const nlohmann::json& entry, ComponentKind kind, const std::string& fieldPath) {
    if (!entry.is_object()) {
        throw StructuralConfigError(fieldPath, "version entry must be an object");
    }

    ComponentVersion version;
    version.name = requireString(entry, "name", fieldPath);
    version.uri = requireString(entry, "uri", fieldPath);
    version.features = optionalFeatures(entry);

    if (kind == ComponentKind::Wine) {
        version.title = requireString(entry, "title", fieldPath);
        version.files = parseWineFiles(entry, fieldPath);
    } else {
        // DXVK catalogs name their entries by release version
        auto title = optionalString(entry, "title");
        auto release = optionalString(entry, "version");
        if (!title && !release) {
            throw StructuralConfigError(fieldPath + ".title", "not found");
        }
        version.title = title ? *title : *release;
        version.version = release ? *release : *title;
    }

    return version;
}

ComponentGroup parseGroup(const nlohmann::json& entry,
                          const std::filesystem::path& catalogPath,
                          ComponentKind kind,
                          const std::string& fieldPath) {
    if (!entry.is_object()) {
        throw StructuralConfigError(fieldPath, "group entry must be an object");
    }

    ComponentGroup group;
    group.name = requireString(entry, "name", fieldPath);
    group.title = requireString(entry, "title", fieldPath);
    group.features = optionalFeatures(entry);

    auto relative = std::filesystem::path(toString(kind)) / (group.name + ".json");
    auto versionsLabel = relative.generic_string();
    auto versions = readDocument(catalogPath / relative, versionsLabel);

    if (!versions.is_array()) {
        throw StructuralConfigError(versionsLabel, toString(kind) + " versions must be a list");
    }

    group.versions.reserve(versions.size());
    for (size_t i = 0; i < versions.size(); ++i) {
        group.versions.push_back(parseVersion(versions[i], kind,
            versionsLabel + "[" + std::to_string(i) + "]"));
    }

    return group;
}

} // anonymous namespace

std::vector<ComponentGroup> parseCatalog(const std::filesystem::path& catalogPath, ComponentKind kind) {
    auto index = readDocument(catalogPath / INDEX_FILE, INDEX_FILE);
    auto key = toString(kind);
    auto fieldPath = std::string(INDEX_FILE) + ":" + key;

    if (!index.is_object()) {
        throw StructuralConfigError(INDEX_FILE, "index must be an object");
    }

    auto it = index.find(key);
    if (it == index.end()) {
        throw StructuralConfigError(fieldPath, key + " entry not found");
    }
    if (!it->is_array()) {
        throw StructuralConfigError(fieldPath, key + " entry must be a list");
    }

    std::vector<ComponentGroup> groups;
    groups.reserve(it->size());

    for (size_t i = 0; i < it->size(); ++i) {
        groups.push_back(parseGroup((*it)[i], catalogPath, kind,
            fieldPath + "[" + std::to_string(i) + "]"));
    }

    return groups;
}

ComponentRegistry::ComponentRegistry(RuntimeEnvironment env)
    : m_discovery(std::move(env))
{
}

std::string ComponentRegistry::cacheKeyPath(const std::filesystem::path& catalogPath) {
    return catalogPath.lexically_normal().string();
}

ComponentRegistry::GroupListPtr ComponentRegistry::loadGroups(const std::filesystem::path& catalogPath,
                                                              ComponentKind kind) {
    CacheKey key{cacheKeyPath(catalogPath), kind};

    // Held across the load so concurrent first loads parse only once
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_cache.find(key);
    if (it != m_cache.end()) {
        spdlog::debug("Using cached {} components from {}", toString(kind), key.first);
        return it->second;
    }

    spdlog::debug("Getting {} versions from {}", toString(kind), key.first);

    auto groups = std::make_shared<const GroupList>(parseCatalog(catalogPath, kind));

    size_t versionCount = 0;
    for (const auto& group : *groups) {
        versionCount += group.versions.size();
    }
    spdlog::info("Loaded {} {} group(s) with {} version(s) from {}",
        groups->size(), toString(kind), versionCount, key.first);

    m_cache.emplace(key, groups);
    return groups;
}

ComponentRegistry::GroupList ComponentRegistry::runnerGroups(const std::filesystem::path& catalogPath) {
    if (m_discovery.environment().prefersSteamRunners()) {
        try {
            return m_discovery.discoverProtonInstalls();
        } catch (const DiscoveryError& e) {
            spdlog::warn("{}. Falling back to the components catalog", e.what());
        }
    }

    return *loadGroups(catalogPath, ComponentKind::Wine);
}

ComponentRegistry::GroupList ComponentRegistry::groupsFor(const std::filesystem::path& catalogPath,
                                                          ComponentKind kind) {
    if (kind == ComponentKind::Wine) {
        return runnerGroups(catalogPath);
    }
    return *loadGroups(catalogPath, kind);
}

std::optional<ComponentGroup> ComponentRegistry::findGroup(const std::filesystem::path& catalogPath,
                                                           const std::string& name,
                                                           ComponentKind kind) {
    for (auto& group : groupsFor(catalogPath, kind)) {
        if (group.matches(name)) {
            return group;
        }
    }
    return std::nullopt;
}

std::optional<ComponentVersion> ComponentRegistry::findVersion(const std::filesystem::path& catalogPath,
                                                               const std::string& name,
                                                               ComponentKind kind) {
    for (const auto& group : groupsFor(catalogPath, kind)) {
        if (const auto* version = group.findVersion(name)) {
            return *version;
        }
    }
    return std::nullopt;
}

ComponentVersion ComponentRegistry::requireVersion(const std::filesystem::path& catalogPath,
                                                   const std::string& name,
                                                   ComponentKind kind) {
    auto version = findVersion(catalogPath, name, kind);
    if (!version) {
        throw NotFoundError("No " + toString(kind) + " version named \"" + name + "\"");
    }
    return *version;
}

std::optional<ComponentGroup> ComponentRegistry::findGroupOf(const std::filesystem::path& catalogPath,
                                                             const ComponentVersion& version,
                                                             ComponentKind kind) {
    for (auto& group : groupsFor(catalogPath, kind)) {
        if (group.findVersion(version.name)) {
            return group;
        }
    }
    return std::nullopt;
}

ComponentVersion ComponentRegistry::latest(const std::filesystem::path& catalogPath, ComponentKind kind) {
    auto groups = groupsFor(catalogPath, kind);
    if (groups.empty() || groups.front().versions.empty()) {
        throw NotFoundError("No " + toString(kind) + " versions available");
    }
    return groups.front().versions.front();
}

Features ComponentRegistry::featuresFor(const std::filesystem::path& catalogPath,
                                        const ComponentVersion& version,
                                        ComponentKind kind) {
    if (version.features) {
        return *version.features;
    }

    auto group = findGroupOf(catalogPath, version, kind);
    return resolveFeatures(std::nullopt, group ? group->features : std::nullopt);
}

ComponentRegistry::GroupList ComponentRegistry::listDownloaded(const std::filesystem::path& catalogPath,
                                                               const std::filesystem::path& localFolder,
                                                               ComponentKind kind) {
    GroupList downloaded;

    for (auto& group : groupsFor(catalogPath, kind)) {
        if (group.managed) {
            // Runners are externally managed
            downloaded.push_back(std::move(group));
            continue;
        }

        std::vector<ComponentVersion> present;
        for (auto& version : group.versions) {
            if (version.isDownloadedIn(localFolder)) {
                present.push_back(std::move(version));
            }
        }

        if (!present.empty()) {
            group.versions = std::move(present);
            downloaded.push_back(std::move(group));
        }
    }

    return downloaded;
}

void ComponentRegistry::invalidate(const std::filesystem::path& catalogPath) {
    auto path = cacheKeyPath(catalogPath);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.erase({path, ComponentKind::Wine});
    m_cache.erase({path, ComponentKind::Dxvk});

    spdlog::debug("Invalidated cached components for {}", path);
}

void ComponentRegistry::reload() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();

    spdlog::debug("Cleared all cached components");
}

} // namespace agl
