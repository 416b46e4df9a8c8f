// Ticket: 0014_html_report

#include "clash-report/src/HtmlReportWriter.hpp"

#include <array>
#include <fstream>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "clash-core/src/Detection/DetectionErrors.hpp"

namespace clash_report
{

namespace
{

struct Column
{
  const char* header;
  bool numeric;  // Right-aligned
};

constexpr std::array<Column, 8> kColumns{{{"Clash ID", false},
                                           {"Tolerance", true},
                                           {"Overlapping Tris", true},
                                           {"Clash Start", true},
                                           {"Clash End", true},
                                           {"Clashing Frames", true},
                                           {"Object A", false},
                                           {"Object B", false}}};

}  // namespace

std::string escapeHtml(const std::string& text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text)
  {
    switch (c)
    {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

HtmlReportWriter::HtmlReportWriter(std::string title, std::string sourceName)
  : title_{std::move(title)}, sourceName_{std::move(sourceName)}
{
}

std::string HtmlReportWriter::render(const clash_core::ReportDocument& document) const
{
  using clash_core::Classification;

  std::string html;
  html += "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n";
  html += fmt::format("<title>{}</title>\n", escapeHtml(title_));
  html += "<style>\n"
          "table { border-collapse: collapse; }\n"
          "th, td { border: 1px solid #999; padding: 2px 6px; }\n"
          "td.num { text-align: right; }\n"
          "</style>\n</head>\n<body>\n";
  html += fmt::format("<h1>{}</h1>\n", escapeHtml(title_));
  html += fmt::format("<p>Source: {}</p>\n", escapeHtml(sourceName_));
  if (!document.config.queryName.empty())
  {
    html += fmt::format("<p>Query: {}</p>\n", escapeHtml(document.config.queryName));
  }
  if (!document.config.comment.empty())
  {
    html += fmt::format("<p>{}</p>\n", escapeHtml(document.config.comment));
  }

  html += "<table>\n<tr>";
  for (const auto& column : kColumns)
  {
    html += fmt::format("<th>{}</th>", column.header);
  }
  html += "</tr>\n";

  for (size_t i = 0; i < document.records.size(); ++i)
  {
    const clash_core::ClashRecord& record = document.records[i];
    const double tolerance = record.classification == Classification::Clash
                               ? document.config.clashTolerance
                               : document.config.clearanceTolerance;

    const std::array<std::string, 8> cells{
      std::to_string(i + 1),
      fmt::format("{:.3f}", tolerance),
      std::to_string(record.overlappingTriangles),
      fmt::format("{:.3f}", record.startTime),
      fmt::format("{:.3f}", record.endTime),
      std::to_string(record.sampleCount()),
      escapeHtml(record.pair.first()),
      escapeHtml(record.pair.second())};

    html += "<tr>";
    for (size_t c = 0; c < cells.size(); ++c)
    {
      html += kColumns[c].numeric ? fmt::format("<td class=\"num\">{}</td>", cells[c])
                                  : fmt::format("<td>{}</td>", cells[c]);
    }
    html += "</tr>\n";
  }

  html += "</table>\n</body>\n</html>\n";
  return html;
}

void HtmlReportWriter::write(const clash_core::ReportDocument& document,
                             const std::filesystem::path& path) const
{
  const std::string html = render(document);

  std::ofstream file{path, std::ios::out | std::ios::trunc};
  if (!file.is_open())
  {
    spdlog::error("Cannot open '{}' for writing", path.string());
    throw clash_core::ReportIOError("Cannot open '" + path.string() + "' for writing");
  }
  file << html;
  file.flush();
  if (!file)
  {
    spdlog::error("Failed writing HTML report to '{}'", path.string());
    throw clash_core::ReportIOError("Failed writing HTML report to '" + path.string() +
                                    "'");
  }
  spdlog::info("Exported {} clash record(s) as HTML to '{}'",
               document.records.size(),
               path.string());
}

}  // namespace clash_report
