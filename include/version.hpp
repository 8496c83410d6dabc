#ifndef VERSION_HPP
#define VERSION_HPP

#include <optional>
#include <string>
#include <vector>

namespace Toolpack {

/**
 * @brief Splits a version string (e.g. "1.2.3") into numeric components.
 *        Non-numeric components parse as 0.
 */
std::vector<int> parseVersion(const std::string& version);

/**
 * @brief Compares two dotted version strings numerically.
 * @return -1 if v1 < v2, 0 if equal, 1 if v1 > v2. Missing components count as 0.
 */
int compareVersions(const std::string& v1, const std::string& v2);

/**
 * @return True for "X.Y.Z" and "X.Y.Z.N" with no leading zeros.
 */
bool isValidVersion(const std::string& version);

/**
 * @brief Picks the highest version in `available` that satisfies `constraint`.
 *
 * Accepted constraints:
 *  - "" or "latest": the highest version;
 *  - "X.Y.Z.N": exactly that version;
 *  - "X.Y.Z": that version or the highest "X.Y.Z.N";
 *  - an operator (>, >=, <, <=, ==, =, !=) followed by a dotted version.
 *
 * @return The selected version, or std::nullopt if nothing matches or the
 *         constraint is malformed.
 */
std::optional<std::string> selectVersion(const std::vector<std::string>& available,
                                         const std::string& constraint);

} // namespace Toolpack

#endif // VERSION_HPP
