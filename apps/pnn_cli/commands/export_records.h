#pragma once

// cmd_export: print stored records of one source family as JSON lines.
// Usage: pnn_cli export <contracts_finder|find_a_tender> --db <db-path>
int cmd_export(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
