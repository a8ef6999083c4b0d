/**
 * @file main.cpp
 * @brief Entry point for the mongokit command line tool
 */

#include <iostream>

#include "app/application.h"

int main(int argc, char* argv[]) {
  auto app = mongokit::app::Application::Create(argc, argv);
  if (!app) {
    std::cerr << "Error: " << app.error().to_string() << "\n";
    return 1;
  }

  return (*app)->Run();
}
