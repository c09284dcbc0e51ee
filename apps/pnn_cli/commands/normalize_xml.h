#pragma once

// cmd_normalize_xml: normalize one Find a Tender XML notice and print it as a JSON line.
// Usage: pnn_cli normalize-xml <file> [--db <db-path>]
int cmd_normalize_xml(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
