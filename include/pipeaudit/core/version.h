#pragma once

namespace pipeaudit::core {

// kBuildVersion is the current software version string, recorded in every report.
constexpr const char* kBuildVersion = "0.3";

// kReportFormat identifies the JSON report layout.
constexpr const char* kReportFormat = "pipeaudit.report/1";

}  // namespace pipeaudit::core
