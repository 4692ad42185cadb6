#include <iostream>

int test_args();
int test_cvars();
int test_log_sinks();
int test_json_writer();
int test_random();
int test_world_directory();
int test_intelligence_map();
int test_trust_ledger();
int test_heartland();
int test_intel_sharing();
int test_betrayal();
int test_espionage();
int test_world_state();
int test_intel_config();

int main() {
  int fails = 0;

  fails += test_args();
  fails += test_cvars();
  fails += test_log_sinks();
  fails += test_json_writer();
  fails += test_random();
  fails += test_world_directory();
  fails += test_intelligence_map();
  fails += test_trust_ledger();
  fails += test_heartland();
  fails += test_intel_sharing();
  fails += test_betrayal();
  fails += test_espionage();
  fails += test_world_state();
  fails += test_intel_config();

  if (fails == 0) {
    std::cout << "[fogline_tests] ALL PASS\n";
    return 0;
  }

  std::cerr << "[fogline_tests] FAILS=" << fails << "\n";
  return 1;
}
