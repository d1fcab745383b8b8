/**
 * AGL Core - Component Registry
 *
 * Loads wine and DXVK builds from the components catalog:
 *
 *   <catalog>/components.json          {"wine": [groups], "dxvk": [groups]}
 *   <catalog>/wine/<group>.json        [versions]
 *   <catalog>/dxvk/<group>.json        [versions]
 *
 * and answers lookups over them. When launched from Steam, wine lookups
 * go to Steam-managed Proton builds instead.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "components/Component.hpp"
#include "core/platform/RuntimeEnvironment.hpp"
#include "steam/ProtonDiscovery.hpp"

namespace agl {

/**
 * Components catalog registry
 *
 * Parsed catalogs are cached per (catalog path, kind) until invalidate()
 * or reload() is called. A catalog edited on disk after its first load
 * is not seen before then.
 *
 * Safe to share between threads.
 */
class ComponentRegistry {
public:
    using GroupList = std::vector<ComponentGroup>;
    using GroupListPtr = std::shared_ptr<const GroupList>;

    explicit ComponentRegistry(RuntimeEnvironment env);

    /**
     * Load all groups of a kind from the catalog
     *
     * Repeated calls with the same path and kind return the same cached
     * object.
     *
     * @throws StructuralConfigError if a required key is missing or has
     *         the wrong type, or a document can't be read or parsed
     */
    GroupListPtr loadGroups(const std::filesystem::path& catalogPath, ComponentKind kind);

    /**
     * Get runner (wine) groups
     *
     * Prefers Steam-managed Proton when the environment says we were
     * launched from Steam; falls back to the catalog if Steam discovery
     * fails.
     */
    GroupList runnerGroups(const std::filesystem::path& catalogPath);

    /**
     * Find a group by its own name or by the name of any of its versions
     *
     * Both "wine-ge-proton" and "lutris-GE-Proton7-37-x86_64" work.
     */
    std::optional<ComponentGroup> findGroup(const std::filesystem::path& catalogPath,
                                            const std::string& name,
                                            ComponentKind kind = ComponentKind::Wine);

    /**
     * Find a version by name in any group
     */
    std::optional<ComponentVersion> findVersion(const std::filesystem::path& catalogPath,
                                                const std::string& name,
                                                ComponentKind kind = ComponentKind::Wine);

    /**
     * Like findVersion(), but a missing version is an error
     *
     * @throws NotFoundError
     */
    ComponentVersion requireVersion(const std::filesystem::path& catalogPath,
                                    const std::string& name,
                                    ComponentKind kind = ComponentKind::Wine);

    /**
     * Find the group a version belongs to
     */
    std::optional<ComponentGroup> findGroupOf(const std::filesystem::path& catalogPath,
                                              const ComponentVersion& version,
                                              ComponentKind kind = ComponentKind::Wine);

    /**
     * Get the latest recommended version (first version of first group)
     *
     * @throws NotFoundError if the catalog lists no versions
     */
    ComponentVersion latest(const std::filesystem::path& catalogPath, ComponentKind kind);

    /**
     * Get a version's effective features
     *
     * Version features if set, else its group's, else defaults.
     */
    Features featuresFor(const std::filesystem::path& catalogPath,
                         const ComponentVersion& version,
                         ComponentKind kind = ComponentKind::Wine);

    /**
     * List groups restricted to versions downloaded in a folder
     *
     * A version counts as downloaded when <localFolder>/<name> exists.
     * Groups left without versions are dropped. Managed groups are kept
     * as-is, their presence is asserted by their manager.
     */
    GroupList listDownloaded(const std::filesystem::path& catalogPath,
                             const std::filesystem::path& localFolder,
                             ComponentKind kind = ComponentKind::Wine);

    /**
     * Drop cached groups of both kinds for a catalog path
     */
    void invalidate(const std::filesystem::path& catalogPath);

    /**
     * Drop every cached catalog
     */
    void reload();

    const RuntimeEnvironment& environment() const { return m_discovery.environment(); }

private:
    using CacheKey = std::pair<std::string, ComponentKind>;

    GroupList groupsFor(const std::filesystem::path& catalogPath, ComponentKind kind);

    static std::string cacheKeyPath(const std::filesystem::path& catalogPath);

    ProtonDiscovery m_discovery;

    std::mutex m_mutex;
    std::map<CacheKey, GroupListPtr> m_cache;
};

/**
 * Parse a catalog without caching
 *
 * @throws StructuralConfigError
 */
std::vector<ComponentGroup> parseCatalog(const std::filesystem::path& catalogPath, ComponentKind kind);

} // namespace agl
