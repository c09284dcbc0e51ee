#pragma once

// cmd_normalize_release: normalize one Contracts Finder OCDS release package.
// Usage: pnn_cli normalize-release <file> [--uri <uri>] [--csv-file <name>]
//                                  [--row-index <n>] [--db <db-path>]
int cmd_normalize_release(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
