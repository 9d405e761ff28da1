#pragma once

// cmd_validate: validate ids and print one JSON result per id.
// Usage: uusid_cli validate <id>... [--strict] [--start ms] [--end ms] [generator flags]
// Exit status 0 when every id is valid, 2 when at least one is not.
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_analyze: summarise a newline-delimited id file as JSON.
// Usage: uusid_cli analyze <file> [--separator C] [--prefix P]
int cmd_analyze(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_hierarchy: describe a hierarchical id as JSON.
// Usage: uusid_cli hierarchy <id> [--root-levels N]
int cmd_hierarchy(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_timestamp: print the embedded generation time of an id.
// Usage: uusid_cli timestamp <id> [--separator C] [--prefix P]
int cmd_timestamp(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
