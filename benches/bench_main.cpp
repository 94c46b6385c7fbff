#include <iostream>

void run_config_benchmark();
void run_performance_benchmarks();

int main() {
  std::cout << "Sato Benchmarks\n";
  run_config_benchmark();
  run_performance_benchmarks();
  return 0;
}
