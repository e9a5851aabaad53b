/**
 * pagesplit - split a PDF into single-page files by section manifest
 *
 * Usage:
 *   ./pagesplit <manifest.json> <document.pdf> [options]
 *
 * Examples:
 *   ./pagesplit book_sections.json Book.pdf
 *   ./pagesplit book_sections.json Book_compressed.pdf --output=split --verbose
 *   ./pagesplit book_sections.json Book.pdf --offset=0
 */

#include "splitting/pgs_splitter.h"
#include "utils/pgs_env.h"
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

void print_usage(const char* program_name) {
  std::cout << "Section Splitter - pagesplit\n" << std::endl;
  std::cout << "Usage:" << std::endl;
  std::cout << "  " << program_name << " <manifest.json> <document.pdf> [options]\n" << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --output=<dir>       Output root (default: ./output, env PGS_OUTPUT_DIR)" << std::endl;
  std::cout << "  --offset=<n>         Manifest to physical page offset (default: 1, env PGS_PAGE_OFFSET)" << std::endl;
  std::cout << "  --tolerance=<n>      Allowed page count difference (default: 5, env PGS_PAGE_TOLERANCE)" << std::endl;
  std::cout << "  --verbose, -v        Print the page mapping of every section\n" << std::endl;
  std::cout << "Examples:" << std::endl;
  std::cout << "  " << program_name << " book_sections.json Book.pdf" << std::endl;
  std::cout << "  " << program_name << " book_sections.json Book.pdf --output=split --verbose" << std::endl;
}

int main(int argc, char* argv[]) {
  if (argc < 3) {
    print_usage(argv[0]);
    return 1;
  }

  if (fs::exists(".env")) {
    load_env_file(".env");
  }

  pgs_string manifest_path = argv[1];
  pgs_string document_path = argv[2];
  pgs_split_config config = pgs_split_config::from_environment();

  // Parse optional arguments
  for (int i = 3; i < argc; i++) {
    pgs_string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    }
    if (!config.apply_argument(arg)) {
      std::cerr << "❌ Invalid option: " << arg.c_str() << "\n" << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  if (!fs::exists(manifest_path.to_std_const())) {
    std::cerr << "❌ Manifest file not found: " << manifest_path.c_str() << std::endl;
    return 1;
  }
  if (!fs::exists(document_path.to_std_const())) {
    std::cerr << "❌ Document file not found: " << document_path.c_str() << std::endl;
    return 1;
  }

  pgs::progress::console_sink progress;
  pgs_splitter splitter(config, &progress);
  pgs_split_result result = splitter.split(manifest_path, document_path);

  if (!result.success) {
    std::cerr << "❌ PDF splitting failed: " << result.message.c_str() << std::endl;
    return 1;
  }

  std::cout << "\n🎉 PDF splitting completed successfully!" << std::endl;
  std::cout << "📁 Output directory: " << config.output_dir.c_str() << std::endl;
  if (!result.summary_path.empty()) {
    std::cout << "📋 Summary report: " << result.summary_path.c_str() << std::endl;
  }
  return 0;
}
