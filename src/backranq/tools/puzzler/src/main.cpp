#include <iostream>

#include "backranq/tools/puzzler/commands.hpp"

int main(int argc, char **argv)
{
  return backranq::tools::puzzler::run_main(argc, argv, std::cout, std::cerr);
}
