#pragma once

#include <irasm/source_range.hpp>
#include <irasm/diagnostic.hpp>
#include <irasm/error.hpp>

#include <fmt/format.h>

namespace irasm
{
namespace diagnostic_db
{

#define db_entry(lv, name, kind, txt) static const auto name = [](const source_range& range) \
{ return mk_diag::lv(range, static_cast<std::uint_fast16_t>(error_kind::kind), txt); }

#define db_entry_arg(lv, name, kind, txt) static const auto name = [](const source_range& range, auto t) \
{ return mk_diag::lv(range, static_cast<std::uint_fast16_t>(error_kind::kind), fmt::format(FMT_STRING(txt), t)); }

#define db_entry_arg2(lv, name, kind, txt) static const auto name = [](const source_range& range, auto t1, auto t2) \
{ return mk_diag::lv(range, static_cast<std::uint_fast16_t>(error_kind::kind), fmt::format(FMT_STRING(txt), t1, t2)); }

#define db_entry_arg3(lv, name, kind, txt) static const auto name = [](const source_range& range, auto t1, auto t2, auto t3) \
{ return mk_diag::lv(range, static_cast<std::uint_fast16_t>(error_kind::kind), fmt::format(FMT_STRING(txt), t1, t2, t3)); }

namespace args
{

db_entry_arg(error, unknown_arg, unknown_arg, "Unknown command line argument \"{}\".");
db_entry_arg(error, emit_not_present, emit_not_present, "Selected emit class \"{}\" is unknown!");
db_entry(error, missing_input, missing_input, "No input file given.");
db_entry_arg(error, missing_value, missing_value, "Option \"-{}\" expects a value.");
db_entry_arg(error, base_out_of_range, base_out_of_range, "Base address \"{}\" is not a number below 2^32.");

}

namespace assembler
{

db_entry_arg2(error, register_format, register_format, "Field \"{}\" expects a register, instead got \"{}\".");
db_entry_arg2(error, register_range, field_range, "Register \"{}\" does not exist, field \"{}\" takes r0 to r31.");
db_entry_arg3(error, field_range, field_range, "Value {} does not fit the {}-bit field \"{}\".");
db_entry_arg3(error, relative_range, field_range, "Offset of {} instructions to label \"{}\" does not fit field \"{}\".");
db_entry_arg2(error, alignment, alignment, "Distance of {} bytes to label \"{}\" is not a multiple of 4.");
db_entry_arg3(error, label_redefinition, label_redefinition, "Label \"{}\" is bound to 0x{:08x}, redeclared at 0x{:08x}.");
db_entry_arg(error, unknown_mnemonic, unknown_mnemonic, "Unknown mnemonic \"{}\".");
db_entry_arg2(error, unknown_field, unknown_field, "Layout of \"{}\" references unknown field \"{}\".");
db_entry_arg2(error, malformed_slot, unknown_field, "Layout of \"{}\" has token \"{}\", expected field:literal.");
db_entry_arg3(error, operand_count, operand_count, "\"{}\" expects {} operands, instead got {}.");
db_entry_arg2(error, number_format, number_format, "Field \"{}\" expects a number, instead got \"{}\".");
db_entry_arg(error, undefined_label, undefined_label, "Label \"{}\" is never declared.");
db_entry(error, empty_operand, syntax, "Empty operand.");

}

namespace preprocessor
{

db_entry_arg(error, undefined_parameter, undefined_parameter, "Template parameter \"{}\" has no value.");
db_entry_arg(error, template_error, template_syntax, "Template cannot be rendered: {}.");

}

namespace parameters
{

db_entry_arg(error, not_key_value, parameter, "Parameter \"{}\" is not of the form key=value.");
db_entry_arg(error, not_a_value, parameter, "\"{}\" is not a number, range or random value.");
db_entry_arg(error, empty_range, parameter, "Range \"{}\" is empty.");

}

namespace frontend
{

db_entry_arg(error, cannot_open_input, cannot_open_input, "Cannot read input file \"{}\".");
db_entry_arg(error, cannot_open_output, cannot_open_output, "Cannot write output file \"{}\".");
db_entry_arg(error, ambiguous_parameters, ambiguous_parameters, "Parameters expand to {} combinations, but --emit=bin writes a single binary.");

}

#undef db_entry
#undef db_entry_arg
#undef db_entry_arg2
#undef db_entry_arg3

}
}
