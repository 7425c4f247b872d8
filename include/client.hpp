#pragma once

#include <iostream>
#include <ostream>
#include <string>

#include "config.hpp"

namespace waywidgets {

class Client {
 public:
  static Client *inst();
  // Exit status is always 0, the bar must never see a widget fail.
  // Widget lines go to `out`.
  int main(int argc, char *argv[], const std::string &widget, std::ostream &out = std::cout);

  Config config;

 private:
  Client() = default;
  void loadConfig(const std::string &config_opt);
};

}  // namespace waywidgets
