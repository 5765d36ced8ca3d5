#pragma once

#include "Report.h"

#include <string>

namespace ReportJson {

/**
 * @brief Serializes a report with a fixed key order.
 * @details Numbers use 15 significant digits; non-finite numbers and absent
 *          statistics are written as null. Identical reports give identical text.
 */
std::string toJson(const Report& report, bool pretty = true);

std::string escapeJsonString(const std::string& value);
std::string formatDouble(double value);

} // namespace ReportJson
