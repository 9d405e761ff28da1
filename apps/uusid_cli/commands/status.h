#pragma once

// cmd_metrics: generate a number of ids and print the generator metrics as JSON.
// Usage: uusid_cli metrics [--count N] [generator flags]
int cmd_metrics(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_health: run the generator health probe and print it as JSON.
// Usage: uusid_cli health [generator flags]
// Exit status 0 when healthy, 2 otherwise.
int cmd_health(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
