#include <irasm/arguments_parser.hpp>
#include <irasm/diagnostic.hpp>
#include <irasm/frontend.hpp>
#include <irasm/config.hpp>

#include <cstdio>

int main(int argc, const char** argv)
{
  using namespace irasm;

  arguments::parse(argc, argv, stdout);

  if(diagnostic.error_code() != 0)
    goto end;
  if(config.print_help)
    goto end;

  frontend::run(config);

end:
  diagnostic.print(stderr);
  return diagnostic.error_code();
}
