#include <modelgen/database_model.hpp>
#include <modelgen/dry_run_writer.hpp>
#include <modelgen/errors.hpp>
#include <modelgen/expat_reader.hpp>
#include <modelgen/filesystem_writer.hpp>
#include <modelgen/generator.hpp>
#include <modelgen/naming.hpp>
#include <modelgen/schema_loader.hpp>
#include <modelgen/type_map.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_codegen = 4;

struct cli_options {
  std::string schema_file;
  std::string package_name = "ovsmodel";
  std::string output_dir = ".";
  std::string type_map_file;
  std::string acronym_file;
  bool dry_run = false;
  bool show_help = false;
  bool show_version = false;
  bool list_outputs = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: modelgen [options] <schema.ovsschema>\n"
     << "\n"
     << "Options:\n"
     << "  -p <name>         Go package name (default: ovsmodel)\n"
     << "  -o <dir>          Output directory (default: current directory)\n"
     << "  -t <file>         Type map override file (modelgen-typemap.xml)\n"
     << "  -a <file>         Acronym override file\n"
     << "  -d, --dry-run     Print generated files instead of writing them\n"
     << "  --list-outputs    Print expected output filenames and exit\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "modelgen " << MODELGEN_VERSION << "\n";
}

static std::string
option_argument(int argc, char* argv[], int& i, const std::string& flag) {
  if (i + 1 >= argc) {
    std::cerr << "modelgen: " << flag << " requires an argument\n";
    std::exit(exit_usage);
  }
  return argv[++i];
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "-d" || arg == "--dry-run") {
      opts.dry_run = true;
      continue;
    }

    if (arg == "--list-outputs") {
      opts.list_outputs = true;
      continue;
    }

    if (arg == "-p") {
      opts.package_name = option_argument(argc, argv, i, arg);
      if (!modelgen::is_go_identifier(opts.package_name)) {
        std::cerr << "modelgen: invalid package name: " << opts.package_name
                  << "\n";
        std::exit(exit_usage);
      }
      continue;
    }

    if (arg == "-o") {
      opts.output_dir = option_argument(argc, argv, i, arg);
      continue;
    }

    if (arg == "-t") {
      opts.type_map_file = option_argument(argc, argv, i, arg);
      continue;
    }

    if (arg == "-a") {
      opts.acronym_file = option_argument(argc, argv, i, arg);
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "modelgen: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.schema_file.empty()) {
      std::cerr << "modelgen: only one schema file may be given\n";
      std::exit(exit_usage);
    }
    opts.schema_file = arg;
  }

  return opts;
}

static int
run(const cli_options& opts) {
  modelgen::database_schema schema;
  try {
    schema = modelgen::load_schema_file(opts.schema_file);
  } catch (const modelgen::io_error& e) {
    std::cerr << "modelgen: " << e.what() << "\n";
    return exit_io;
  } catch (const std::exception& e) {
    std::cerr << "modelgen: error parsing schema " << opts.schema_file << ": "
              << e.what() << "\n";
    return exit_parse;
  }

  modelgen::package_options package_opts;
  package_opts.package_name = opts.package_name;

  if (!opts.type_map_file.empty()) {
    try {
      auto reader = modelgen::expat_reader::from_file(opts.type_map_file);
      package_opts.codegen.types.merge(modelgen::type_map::load(reader));
    } catch (const modelgen::io_error& e) {
      std::cerr << "modelgen: " << e.what() << "\n";
      return exit_io;
    } catch (const std::exception& e) {
      std::cerr << "modelgen: error loading type map " << opts.type_map_file
                << ": " << e.what() << "\n";
      return exit_parse;
    }
  }

  if (!opts.acronym_file.empty()) {
    try {
      auto reader = modelgen::expat_reader::from_file(opts.acronym_file);
      package_opts.codegen.acronyms.merge(modelgen::acronym_set::load(reader));
    } catch (const modelgen::io_error& e) {
      std::cerr << "modelgen: " << e.what() << "\n";
      return exit_io;
    } catch (const std::exception& e) {
      std::cerr << "modelgen: error loading acronyms " << opts.acronym_file
                << ": " << e.what() << "\n";
      return exit_parse;
    }
  }

  modelgen::dry_run_writer printer(std::cout);
  modelgen::filesystem_writer files_out(opts.output_dir);
  modelgen::output_writer& writer =
      opts.dry_run ? static_cast<modelgen::output_writer&>(printer) : files_out;
  modelgen::generator gen(writer);

  std::vector<modelgen::rendered_file> files;
  try {
    files = modelgen::render_package(schema, package_opts, gen);
  } catch (const std::exception& e) {
    std::cerr << "modelgen: code generation error: " << e.what() << "\n";
    return exit_codegen;
  }

  // --list-outputs: print filenames and exit
  if (opts.list_outputs) {
    for (const auto& file : files)
      std::cout << file.filename << "\n";
    return exit_success;
  }

  try {
    for (const auto& file : files)
      gen.write(file.filename, file.content);
  } catch (const std::exception& e) {
    std::cerr << "modelgen: " << e.what() << "\n";
    return exit_io;
  }

  if (!opts.dry_run) {
    std::cerr << "modelgen: wrote " << files.size() << " file(s) to "
              << opts.output_dir << "\n";
  }
  return exit_success;
}

int
main(int argc, char* argv[]) {
  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.schema_file.empty()) {
    std::cerr << "modelgen: no input file\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
