#include "windloft_core/case_runner.hpp"
#include "windloft_core/version.hpp"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  std::cout << "windloft mesh generator\n";
  std::cout << "version=" << windloft::core::version() << "\n";
  if (argc < 2) {
    std::cout << "usage: windloft_cli <case_file> [out_dir]\n";
    return 0;
  }

  const std::string case_path = argv[1];
  const std::string out_dir = argc > 2 ? argv[2] : "out";
  try {
    const windloft::core::RunSummary summary = windloft::core::run_case(case_path, out_dir);
    std::cout << "status=" << summary.status << "\n";
    std::cout << "case_type=" << summary.case_type << "\n";
    std::cout << "parts=" << summary.part_count << "\n";
    std::cout << "nodes=" << summary.node_count << "\n";
    std::cout << "triangles=" << summary.triangle_count << "\n";
    std::cout << "run_log=" << summary.run_log << "\n";
  } catch (const std::exception& error) {
    std::cerr << "windloft_cli: " << error.what() << "\n";
    return 1;
  }
  return 0;
}
