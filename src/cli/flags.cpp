#include <gflags/gflags.h>

DEFINE_string(only, "", "Comma separated steps to run, without their default dependents");
DEFINE_string(except, "", "Comma separated steps to leave out unless another selected step requires them");
DEFINE_bool(setup_only, false, "Only set up the environments of the selected steps");
DEFINE_bool(no_setup, false, "Run the selected steps in their existing environments");
DEFINE_bool(fail_fast, false, "Stop scheduling new steps after the first failure");
DEFINE_bool(list, false, "List the available steps and whether they would run");
DEFINE_bool(list_dependencies, false, "Like --list, also showing the requirements of every step");
DEFINE_bool(verbose, false, "Log debug output and show step descriptions in listings");
DEFINE_bool(clean, false, "Remove the environments of the selected steps before running them");
DEFINE_int32(jobs, 0, "Number of steps running in parallel (0 uses the host parallelism)");
DEFINE_string(config, "dwasfile.json", "Step file to load");
DEFINE_string(cache_path, ".dwas", "Directory holding the step environments");
DEFINE_string(install_command, "", "Shell command installing {packages} into a freshly built environment");
