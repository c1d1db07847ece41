#pragma once

// cmd_put: store TEXT (or stdin when TEXT is "-") in the --db database
// cmd_get: print the paste stored under TOKEN
// cmd_sweep: delete expired pastes from the --db database
int cmd_put(int argc, char* argv[]);    // NOLINT(modernize-avoid-c-arrays)
int cmd_get(int argc, char* argv[]);    // NOLINT(modernize-avoid-c-arrays)
int cmd_sweep(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
