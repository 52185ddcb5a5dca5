#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sealer::manifest {

// Closed set of export kinds that may be sealed. Adding one is a schema change.
enum class ExportType : std::uint8_t {
  kInspectionReport = 1,
  kPdfReport        = 2,
  kDefectExport     = 3,
  kClaimsPack       = 4,
};

constexpr std::string_view ToString(ExportType type) {
  switch (type) {
    case ExportType::kInspectionReport:
      return "inspection_report";
    case ExportType::kPdfReport:
      return "pdf_report";
    case ExportType::kDefectExport:
      return "defect_export";
    case ExportType::kClaimsPack:
      return "claims_pack";
  }
  return "unknown";
}

constexpr std::optional<ExportType> ParseExportType(std::string_view value) {
  if (value == "inspection_report") return ExportType::kInspectionReport;
  if (value == "pdf_report") return ExportType::kPdfReport;
  if (value == "defect_export") return ExportType::kDefectExport;
  if (value == "claims_pack") return ExportType::kClaimsPack;
  return std::nullopt;
}

} // namespace sealer::manifest
