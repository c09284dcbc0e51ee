#include "commands/export_records.h"
#include "commands/normalize_archive.h"
#include "commands/normalize_release.h"
#include "commands/normalize_xml.h"

#include "pnn/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "procurement-notice-normalizer v" << pnn::core::kBuildVersion << "\n"
            << "Usage: pnn_cli <command> [args]\n"
            << "Commands:\n"
            << "  normalize-xml <file> [--db <db-path>]\n"
            << "  normalize-archive <zip> [--db <db-path>]\n"
            << "  normalize-release <file> [--uri <uri>] [--csv-file <name>] [--row-index <n>]"
               " [--db <db-path>]\n"
            << "  export <contracts_finder|find_a_tender> --db <db-path>\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "normalize-xml") {
    return cmd_normalize_xml(argc, argv);
  }
  if (subcommand == "normalize-archive") {
    return cmd_normalize_archive(argc, argv);
  }
  if (subcommand == "normalize-release") {
    return cmd_normalize_release(argc, argv);
  }
  if (subcommand == "export") {
    return cmd_export(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << pnn::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
