#include <irasm/reader.hpp>
#include <irasm/diagnostic_db.hpp>
#include <irasm/error.hpp>

#include <utility>
#include <cctype>

namespace irasm
{

namespace
{

bool is_space(char c)
{ return std::isspace(static_cast<unsigned char>(c)) != 0; }

// [beg, end) of `str` without surrounding whitespace
std::pair<std::size_t, std::size_t> trim(std::string_view str)
{
  std::size_t beg = 0;
  std::size_t end = str.size();

  while(beg < end && is_space(str[beg]))
    ++beg;
  while(end > beg && is_space(str[end - 1]))
    --end;

  return { beg, end };
}

}

std::vector<statement> asm_reader::read_text(std::string_view text, std::string_view module)
{
  asm_reader r(text, module);

  std::vector<statement> statements;
  while(r.next_line())
  {
    if(r.linebuf.empty() || r.linebuf.front() == '#')
      continue;

    statements.push_back(r.parse_statement());
  }
  return statements;
}

bool asm_reader::next_line()
{
  if(exhausted)
    return false;

  auto end = text.find('\n', pos);
  if(end == std::string_view::npos)
  {
    end = text.size();
    exhausted = true;
  }

  const auto raw = text.substr(pos, end - pos);
  pos = end + 1;
  ++row;

  const auto [beg, fin] = trim(raw);
  linebuf = raw.substr(beg, fin - beg);
  col = beg;

  return true;
}

source_range asm_reader::range_of(std::size_t beg, std::size_t len) const
{
  return source_range::on_row(module, row, col + beg + 1, len);
}

statement asm_reader::parse_statement() const
{
  statement stmt;
  stmt.text = std::string(linebuf);
  stmt.loc = range_of(0, linebuf.size());

  std::size_t mnemonic_end = 0;
  while(mnemonic_end < linebuf.size() && !is_space(linebuf[mnemonic_end]))
    ++mnemonic_end;
  stmt.mnemonic = std::string(linebuf.substr(0, mnemonic_end));

  const auto rest = linebuf.substr(mnemonic_end);
  if(trim(rest).first == rest.size())
    return stmt; // no operands

  std::size_t beg = mnemonic_end;
  while(true)
  {
    auto comma = linebuf.find(',', beg);
    const auto end = comma == std::string_view::npos ? linebuf.size() : comma;

    const auto piece = linebuf.substr(beg, end - beg);
    const auto [first, last] = trim(piece);
    const auto loc = range_of(beg + first, last - first);

    if(first == last)
    {
      assembly_error err(diagnostic_db::assembler::empty_operand(loc));
      err.attach_line(stmt.text);
      throw err;
    }
    stmt.operands.push_back(operand::parse(piece.substr(first, last - first), loc));

    if(comma == std::string_view::npos)
      break;
    beg = comma + 1;
  }

  return stmt;
}

}
