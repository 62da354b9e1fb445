#pragma once

#include "GridConfig.hpp"

#include <string>
#include <vector>

namespace gridflow
{
    struct ConfigParseResult
    {
        bool ok = false;
        GridConfig config{};
        std::vector<std::string> errors;
    };

    std::string gridConfigToJson(const GridConfig &config);

    // Missing sections and fields keep their defaults; present fields must have
    // the right type. Semantic checks live in SafetyChecker.
    ConfigParseResult gridConfigFromJson(const std::string &json_text);

    std::string validationErrorsToJson(const std::vector<std::string> &errors);
} // namespace gridflow
