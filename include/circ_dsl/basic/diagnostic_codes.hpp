// circ_dsl/basic/diagnostic_codes.hpp - Stable diagnostic codes
//
// E00xx: syntax, E01xx: type checking, E02xx: import resolution, W00xx: warnings.
//
#pragma once

#include <string_view>

namespace circ_dsl::diag_code
{

// Syntax
inline constexpr std::string_view k_syntax_error = "E0001";
inline constexpr std::string_view k_io_error = "E0002";

// Type checking
inline constexpr std::string_view k_duplicate_variable = "E0101";
inline constexpr std::string_view k_function_has_no_return = "E0102";
inline constexpr std::string_view k_duplicate_circuit_member = "E0103";
inline constexpr std::string_view k_duplicate_record_variable = "E0104";
inline constexpr std::string_view k_required_record_variable = "E0105";
inline constexpr std::string_view k_record_var_wrong_type = "E0106";
inline constexpr std::string_view k_unknown_type = "E0107";
inline constexpr std::string_view k_shadowed_function = "E0108";
inline constexpr std::string_view k_shadowed_circuit = "E0109";

// Import resolution
inline constexpr std::string_view k_directory_error = "E0201";
inline constexpr std::string_view k_convert_os_string = "E0202";
inline constexpr std::string_view k_expected_file = "E0203";
inline constexpr std::string_view k_unknown_symbol = "E0204";
inline constexpr std::string_view k_unknown_package = "E0205";
inline constexpr std::string_view k_import_parse_error = "E0206";
inline constexpr std::string_view k_cyclic_import = "E0207";

// Warnings
inline constexpr std::string_view k_duplicate_entry_point = "W0001";

}  // namespace circ_dsl::diag_code
