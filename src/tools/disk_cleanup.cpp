#include "app/Cli.hpp"

int main(int argc, char** argv) {
  const reclaim::app::ToolInfo tool{"reclaim-disk", false, false};
  return reclaim::app::run(argc, argv, tool);
}
