#ifndef LIST_HPP
#define LIST_HPP

#include <ostream>

#include "environment.hpp"
#include "install_state.hpp"

namespace Toolpack {

/**
 * @class List
 * @brief Prints installed components and the environment they export.
 */
class List
{
public:
    /**
     * @brief Prints every install record: identity, version, install path and
     *        install time.
     */
    static void showInstalledComponents(const InstallState& state, std::ostream& out);

    /**
     * @brief Prints the variables and PATH entries derived from the install state.
     */
    static void showEnvironment(const EnvironmentSet& environment, std::ostream& out);
};

} // namespace Toolpack

#endif // LIST_HPP
