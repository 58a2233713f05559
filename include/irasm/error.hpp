#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <stdexcept>
#include <cstdint>

namespace irasm
{
  /// Diagnostic codes, printed as IA-<code>.
  enum class error_kind : std::uint_fast16_t
  {
    register_format     = 1,
    field_range         = 2,
    alignment           = 3,
    label_redefinition  = 4,
    unknown_mnemonic    = 5,
    unknown_field       = 6,
    operand_count       = 7,
    number_format       = 8,
    undefined_label     = 9,
    syntax              = 10,

    undefined_parameter = 20,
    template_syntax     = 21,
    parameter           = 22,

    unknown_arg         = 30,
    emit_not_present    = 31,
    missing_input       = 32,
    base_out_of_range   = 33,
    cannot_open_input   = 34,
    cannot_open_output  = 35,
    ambiguous_parameters = 36,
    missing_value       = 37,
  };

  NLOHMANN_JSON_SERIALIZE_ENUM( error_kind, {
    { error_kind::register_format, "register-format" },
    { error_kind::field_range, "field-range" },
    { error_kind::alignment, "alignment" },
    { error_kind::label_redefinition, "label-redefinition" },
    { error_kind::unknown_mnemonic, "unknown-mnemonic" },
    { error_kind::unknown_field, "unknown-field" },
    { error_kind::operand_count, "operand-count" },
    { error_kind::number_format, "number-format" },
    { error_kind::undefined_label, "undefined-label" },
    { error_kind::syntax, "syntax" },
    { error_kind::undefined_parameter, "undefined-parameter" },
    { error_kind::template_syntax, "template-syntax" },
    { error_kind::parameter, "parameter" },
    { error_kind::unknown_arg, "unknown-arg" },
    { error_kind::emit_not_present, "emit-not-present" },
    { error_kind::missing_input, "missing-input" },
    { error_kind::base_out_of_range, "base-out-of-range" },
    { error_kind::cannot_open_input, "cannot-open-input" },
    { error_kind::cannot_open_output, "cannot-open-output" },
    { error_kind::ambiguous_parameters, "ambiguous-parameters" },
    { error_kind::missing_value, "missing-value" },
  })

  /// Thrown on the first failure of an assembly or preprocessing run.
  /// Carries the diagnostic record the front end hands to the diagnostics manager.
  class assembly_error : public std::runtime_error
  {
  public:
    explicit assembly_error(const nlohmann::json& record);

    error_kind kind() const;
    const nlohmann::json& diag() const
    { return record; }

    // no-op if a line was attached before
    void attach_line(std::string_view line);
  private:
    nlohmann::json record;
  };
}
