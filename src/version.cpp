#include "version.hpp"
#include "utils.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

namespace Toolpack {

namespace {

    // Components are capped at nine digits so they always fit an int.
    const std::regex fullVersionRegex(
        R"(^(0|[1-9]\d{0,8})\.(0|[1-9]\d{0,8})\.(0|[1-9]\d{0,8})(\.(0|[1-9]\d{0,8}))?$)");

    const std::regex operandRegex(R"(^\d{1,9}(\.\d{1,9}){0,3}$)");

    const std::regex constraintRegex(R"(^(>=|<=|==|!=|>|<|=)\s*(\S+)$)");

    bool satisfies(const std::string& candidate,
                   const std::string& operatorSymbol,
                   const std::string& operand)
    {
        int res = compareVersions(candidate, operand);

        if      (operatorSymbol == ">")   return (res > 0);
        else if (operatorSymbol == ">=")  return (res >= 0);
        else if (operatorSymbol == "<")   return (res < 0);
        else if (operatorSymbol == "<=")  return (res <= 0);
        else if (operatorSymbol == "==" || operatorSymbol == "=") return (res == 0);
        else if (operatorSymbol == "!=")  return (res != 0);

        log_warning("Unknown version comparison operator: '" + operatorSymbol + "'");
        return false;
    }

    std::optional<std::string> highest(const std::vector<std::string>& candidates)
    {
        if (candidates.empty()) {
            return std::nullopt;
        }
        return *std::max_element(candidates.begin(), candidates.end(),
                                 [](const std::string& a, const std::string& b) {
                                     return compareVersions(a, b) < 0;
                                 });
    }

} // namespace

std::vector<int> parseVersion(const std::string& version)
{
    std::vector<int> parts;
    std::stringstream ss(version);
    std::string token;

    while (std::getline(ss, token, '.')) {
        try {
            parts.push_back(std::stoi(token));
        } catch (const std::exception&) {
            // If parsing fails, default to 0
            parts.push_back(0);
        }
    }
    return parts;
}

int compareVersions(const std::string& v1, const std::string& v2)
{
    auto p1 = parseVersion(v1);
    auto p2 = parseVersion(v2);
    size_t n = std::max(p1.size(), p2.size());

    for (size_t i = 0; i < n; ++i) {
        int c1 = (i < p1.size()) ? p1[i] : 0;
        int c2 = (i < p2.size()) ? p2[i] : 0;

        if (c1 < c2) return -1;
        if (c1 > c2) return 1;
    }
    return 0;
}

bool isValidVersion(const std::string& version)
{
    return std::regex_match(version, fullVersionRegex);
}

std::optional<std::string> selectVersion(const std::vector<std::string>& available,
                                         const std::string& constraint)
{
    std::string wanted = trim(constraint);
    std::vector<std::string> matching;

    if (wanted.empty() || wanted == "latest") {
        return highest(available);
    }

    std::smatch match;
    if (std::regex_match(wanted, match, constraintRegex)) {
        std::string operatorSymbol = match[1].str();
        std::string operand        = match[2].str();
        if (!std::regex_match(operand, operandRegex)) {
            return std::nullopt;
        }
        for (const auto& candidate : available) {
            if (satisfies(candidate, operatorSymbol, operand)) {
                matching.push_back(candidate);
            }
        }
        return highest(matching);
    }

    if (!isValidVersion(wanted)) {
        return std::nullopt;
    }

    // "1.65.0" selects the newest "1.65.0.N" build as well as "1.65.0" itself.
    for (const auto& candidate : available) {
        if (candidate == wanted || candidate.rfind(wanted + ".", 0) == 0) {
            matching.push_back(candidate);
        }
    }
    return highest(matching);
}

} // namespace Toolpack
