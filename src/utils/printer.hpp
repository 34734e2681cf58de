#pragma once
#include "inspectresult.hpp"
#include <ostream>
#include <string>

// Throws std::runtime_error if the report cannot be written.
void dumpJson(const InspectReport& report, const std::string& filename);
std::string reportToJson(const InspectReport& report);
void printReport(const InspectReport& report, std::ostream& out);
