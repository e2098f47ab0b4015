#include <stlcheck/report.hpp>

using namespace std;

namespace {

void print_usage(ostream& out, const char* program) {
  out << "Usage:\n"
      << program << " [options] <STL object file path>\n\n"
      << "Validates an ASCII or binary STL file and prints a JSON report.\n\n"
      << "Options:\n"
      << "  -v, --verbose   Print every warning.\n"
      << "  -t, --tolerant  Report negative vertices, wrong winding orders,\n"
      << "                  and mismatched solid names as warnings.\n"
      << "  -h, --help      Print this help.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(cout, argv[0]);
    return 0;
  }

  stlcheck::diagnostics::options opts{};
  filesystem::path path{};
  for (int i = 1; i < argc; ++i) {
    const string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(cout, argv[0]);
      return 0;
    } else if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "-t" || arg == "--tolerant") {
      opts.strict = false;
    } else if (arg.starts_with("-") || !path.empty()) {
      print_usage(cerr, argv[0]);
      return 1;
    } else {
      path = arg;
    }
  }
  if (path.empty()) {
    print_usage(cerr, argv[0]);
    return 1;
  }

  try {
    const auto result = stlcheck::validate(path, opts);
    if (!result) {
      cerr << stlcheck::serialize(stlcheck::report(path, result)) << endl;
      return 1;
    }
    cout << stlcheck::serialize(stlcheck::report(path, result)) << endl;
  } catch (const exception& e) {
    cerr << stlcheck::serialize(stlcheck::failure_report(e.what())) << endl;
    return 1;
  }
}
