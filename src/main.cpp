#include "app/Cli.hpp"

int main(int argc, char** argv) {
  const reclaim::app::ToolInfo tool{"reclaim-mem", true, true};
  return reclaim::app::run(argc, argv, tool);
}
