/**
 * AGL Core - Error Types
 *
 * Exceptions raised by the component registry and Steam discovery.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <stdexcept>
#include <string>

namespace agl {

/**
 * Base class for all library errors
 */
class AglError : public std::runtime_error {
public:
    explicit AglError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Components catalog does not have the expected shape
 *
 * Always fatal to the load that raised it. The field path points at
 * the offending entry, e.g. "components.json:wine[1].title".
 */
class StructuralConfigError : public AglError {
public:
    StructuralConfigError(const std::string& fieldPath, const std::string& problem)
        : AglError("Wrong components index structure: " + fieldPath + ": " + problem)
        , m_fieldPath(fieldPath) {}

    const std::string& fieldPath() const { return m_fieldPath; }

private:
    std::string m_fieldPath;
};

/**
 * Steam was expected (launched from Steam) but its install can't be found
 */
class DiscoveryError : public AglError {
public:
    explicit DiscoveryError(const std::string& message)
        : AglError(message) {}
};

/**
 * No runner or version matches a requested name
 */
class NotFoundError : public AglError {
public:
    explicit NotFoundError(const std::string& message)
        : AglError(message) {}
};

} // namespace agl
