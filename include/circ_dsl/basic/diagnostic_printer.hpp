// circ_dsl/basic/diagnostic_printer.hpp
//
// Renders diagnostics with source excerpts in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "circ_dsl/basic/diagnostic.hpp"
#include "circ_dsl/basic/source_manager.hpp"

namespace circ_dsl
{

/**
 * Prints diagnostics in Rust-style format:
 *
 *   error[E0105]: record `Token` is missing required variable `owner: address`
 *     --> src/main.leo:3:1
 *      |
 *    3 | record Token {
 *      | ^^^^^^^^^^^^^^
 *      |
 *      = help: add `owner: address` to the record
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Emit terminal colours
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Prints all diagnostics ordered by file and position, then a summary line.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_header(const Diagnostic & diag);
  void print_location(const Diagnostic & diag, const SourceRegistry & sources);
  void print_label(const Label & label, const SourceRegistry & sources);
  void print_fixit(const FixIt & fixit);
  void print_trailer(std::string_view kind, std::string_view message);
  void print_summary(const DiagnosticBag & diags);

  [[nodiscard]] std::string gutter(std::string_view content) const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace circ_dsl
