// Ticket: 0014_html_report

#ifndef CLASH_REPORT_HTML_REPORT_WRITER_HPP
#define CLASH_REPORT_HTML_REPORT_WRITER_HPP

#include <filesystem>
#include <string>

#include "clash-core/src/Detection/ReportDocument.hpp"

namespace clash_report
{

/**
 * @brief Tabular HTML rendering of a report, one row per clash record
 *
 * Columns: Clash ID, Tolerance, Overlapping Tris, Clash Start, Clash End,
 * Clashing Frames, Object A, Object B. Times and tolerances are printed
 * with three decimals. The tolerance column shows the tolerance the record
 * was classified against (clash or clearance). Output is write-only; use
 * the JSON exporter for anything that needs to be read back.
 *
 * @ticket 0014_html_report
 */
class HtmlReportWriter
{
public:
  /**
   * @param title Page title and heading
   * @param sourceName Name of the scene the report was produced from
   */
  HtmlReportWriter(std::string title, std::string sourceName);

  std::string render(const clash_core::ReportDocument& document) const;

  /**
   * @throws clash_core::ReportIOError if path cannot be written
   */
  void write(const clash_core::ReportDocument& document,
             const std::filesystem::path& path) const;

private:
  std::string title_;
  std::string sourceName_;
};

/**
 * @brief Escape the five HTML special characters
 */
std::string escapeHtml(const std::string& text);

}  // namespace clash_report

#endif  // CLASH_REPORT_HTML_REPORT_WRITER_HPP
