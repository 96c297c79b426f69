#include <chsexpr/chsexpr.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

static std::string slurp_file(const char* path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return {};
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static chsexpr::parse_options strict_options() {
  chsexpr::parse_options opt;
  opt.require_eof = true;
  return opt;
}

static int parse_one(const char* path) {
  std::string s = slurp_file(path);
  if (s.empty()) {
    // An empty file cannot hold a node; report it as unreadable.
    return 2;
  }

  auto r = chsexpr::parse(std::string_view{s.data(), s.size()}, strict_options());
  return r.err ? 1 : 0;
}

static void report_failure(const char* path) {
  std::string s = slurp_file(path);
  auto r = chsexpr::parse(std::string_view{s.data(), s.size()}, strict_options());
  std::cerr << "parse failed: " << path << "\n";
  std::cerr << "  code=" << static_cast<int>(r.err.code)
            << " offset=" << r.err.offset
            << " line=" << r.err.line
            << " column=" << r.err.column << "\n";
  std::cerr << "  " << chsexpr::error_message(r.err) << "\n";
}

static int format_one(const char* path) {
  std::string s = slurp_file(path);
  if (s.empty()) {
    std::cerr << "failed to read file or file is empty: " << path << "\n";
    return 2;
  }

  auto r = chsexpr::parse(std::string_view{s.data(), s.size()}, strict_options());
  if (r.err) {
    report_failure(path);
    return 1;
  }
  std::cout << chsexpr::dump(r.val) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc == 3 && std::string_view{argv[1]} == "--list") {
    std::ifstream in(argv[2]);
    if (!in) {
      std::cerr << "failed to read list file: " << argv[2] << "\n";
      return 2;
    }

    bool any_fail = false;
    bool any_io_fail = false;
    std::string path;
    while (std::getline(in, path)) {
      if (path.empty()) continue;
      const int rc = parse_one(path.c_str());
      if (rc == 0) {
        std::cout << path << "\tOK\n";
      } else {
        std::cout << path << "\tFAIL\n";
        any_fail = true;
        if (rc == 2) any_io_fail = true;
      }
    }
    return any_io_fail ? 2 : (any_fail ? 1 : 0);
  }

  if (argc == 3 && std::string_view{argv[1]} == "--format") {
    return format_one(argv[2]);
  }

  if (argc != 2) {
    std::cerr << "usage: chsexpr_parse_file <file.kicad_sch>\n";
    std::cerr << "       chsexpr_parse_file --list <paths.txt>\n";
    std::cerr << "       chsexpr_parse_file --format <file.kicad_sch>\n";
    return 2;
  }

  const char* path = argv[1];
  const int rc = parse_one(path);
  if (rc == 0) return 0;

  if (rc == 2) {
    std::cerr << "failed to read file or file is empty: " << path << "\n";
    return 2;
  }

  // Re-run to get a detailed error message.
  report_failure(path);
  return 1;
}
