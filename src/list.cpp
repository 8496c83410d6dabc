#include "list.hpp"

#include <algorithm>
#include <iomanip>

namespace Toolpack {

void List::showInstalledComponents(const InstallState& state, std::ostream& out)
{
    out << "Installed Components:\n";
    out << "---------------------\n";

    if (state.empty()) {
        out << "No components are installed." << std::endl;
        return;
    }

    size_t width = 0;
    for (const auto& [key, record] : state.records()) {
        width = std::max(width, key.size());
    }

    for (const auto& [key, record] : state.records()) {
        out << std::left << std::setw(static_cast<int>(width)) << key << "  "
            << std::setw(12) << record.version << " "
            << record.installPath.string();
        if (!record.installedAt.empty()) {
            out << "  (" << record.installedAt << ")";
        }
        out << "\n";
    }
    out.flush();
}

void List::showEnvironment(const EnvironmentSet& environment, std::ostream& out)
{
    if (environment.empty()) {
        out << "No environment changes are active." << std::endl;
        return;
    }

    for (const auto& [name, value] : environment.variables) {
        out << name << "=" << value << "\n";
    }
    if (!environment.pathEntries.empty()) {
        out << "PATH entries:\n";
        for (const auto& entry : environment.pathEntries) {
            out << "  " << entry << "\n";
        }
    }
    out.flush();
}

} // namespace Toolpack
