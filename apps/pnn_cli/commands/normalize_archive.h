#pragma once

// cmd_normalize_archive: normalize every .xml entry of a daily ZIP archive, one JSON line
// per notice, and report the count on stderr.
// Usage: pnn_cli normalize-archive <zip> [--db <db-path>]
int cmd_normalize_archive(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
