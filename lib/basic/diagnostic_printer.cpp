// circ_dsl/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "circ_dsl/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace circ_dsl
{

namespace
{

rang::fg severity_color(Severity s)
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
  }
  return rang::fg::reset;
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r') {
      out += c;
    }
  }
  return out;
}

std::string display_path(const fs::path & path)
{
  std::error_code ec;
  const fs::path rel = fs::relative(path, fs::current_path(ec), ec);
  if (ec || rel.empty()) {
    return path.string();
  }
  return rel.string();
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Auto : rang::control::Off);
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  print_header(diag);
  print_location(diag, sources);

  for (const auto & label : diag.labels) {
    print_label(label, sources);
  }
  for (const auto & fixit : diag.fixits) {
    print_fixit(fixit);
  }
  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }

  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    const SourceRange ra = a->primary_range();
    const SourceRange rb = b->primary_range();
    if (ra.file_id().value != rb.file_id().value) {
      return ra.file_id().value < rb.file_id().value;
    }
    return ra.get_begin() < rb.get_begin();
  });

  for (const Diagnostic * d : ordered) {
    print(*d, sources);
  }
  print_summary(diags);
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string head =
    diag.code.empty() ? std::string(to_string(diag.severity))
                      : fmt::format("{}[{}]", to_string(diag.severity), diag.code);

  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << head << rang::fg::reset << ": "
        << diag.message << rang::style::reset << "\n";
    return;
  }
  fmt::print(os_, "{}: {}\n", head, diag.message);
}

void DiagnosticPrinter::print_location(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange range = diag.primary_range();
  const fs::path path = sources.get_path(range.file_id());
  const std::string filename = path.empty() ? "<unknown>" : display_path(path);

  const FullSourceRange fr = sources.get_full_range(range);
  if (fr.is_valid()) {
    fmt::print(os_, "{} {}:{}:{}\n", gutter("-->"), filename, fr.start_line, fr.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter("-->"), filename);
  }
}

void DiagnosticPrinter::print_label(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * file = sources.get_file(label.range.file_id());
  const FullSourceRange fr = sources.get_full_range(label.range);
  if (file == nullptr || !fr.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const std::string_view raw_line = file->get_line(fr.start_line - 1);
  const std::string line = expand_tabs(raw_line);

  fmt::print(os_, "{}\n", gutter("|"));
  fmt::print(os_, "{:>5} {} {}\n", fr.start_line, use_color_ ? "\033[1;36m|\033[0m" : "|", line);

  // Marker width stops at the end of the first line for multi-line ranges.
  uint32_t first_col = fr.start_column;
  uint32_t last_col = (fr.end_line == fr.start_line)
                        ? fr.end_column
                        : static_cast<uint32_t>(raw_line.size()) + 1;
  if (last_col <= first_col) {
    last_col = first_col + 1;
  }

  std::string prefix;
  for (uint32_t i = 0; i + 1 < first_col && i < raw_line.size(); ++i) {
    prefix += (raw_line[i] == '\t') ? "    " : " ";
  }

  const char marker = label.style == LabelStyle::Primary ? '^' : '-';
  const std::string markers(last_col - first_col, marker);

  fmt::print(os_, "{} {}", gutter("|"), prefix);
  if (use_color_) {
    os_ << (label.style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan)
        << rang::style::bold;
  }
  fmt::print(os_, "{}", markers);
  if (!label.message.empty()) {
    fmt::print(os_, " {}", label.message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit)
{
  if (fixit.range.size() == 0) {
    print_trailer("help", fmt::format("insert `{}`", fixit.replacement_text));
    return;
  }
  print_trailer("help", fmt::format("replace with `{}`", fixit.replacement_text));
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter("|"));
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
    return;
  }
  fmt::print(os_, "      = {}: {}\n", kind, message);
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.errors().size();
  const size_t warnings = diags.warnings().size();
  if (errors == 0 && warnings == 0) {
    return;
  }
  fmt::print(
    os_, "{} error{}, {} warning{} emitted\n", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");
}

std::string DiagnosticPrinter::gutter(std::string_view content) const
{
  if (use_color_) {
    return fmt::format("\033[1;36m{:>7}\033[0m", content);
  }
  return fmt::format("{:>7}", content);
}

}  // namespace circ_dsl
