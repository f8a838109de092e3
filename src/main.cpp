#include <boost/program_options.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include "cli.hpp"
#include "dataframe.hpp"
#include "formula.hpp"
#include "io.hpp"
#include "log.hpp"

using namespace std;

namespace {

struct Options {
  string table_path;
  string formula;
  string log_path;
  bool preview = false;
};

int run(const Options &options, const FD::Parameters &parameters) {
  FD::DataFrame data = FD::load_table(options.table_path, parameters.separator);
  LOG(info) << "Loaded " << data;

  FD::Evaluator evaluator(parameters);
  FD::ModelFrame frame = evaluator(options.formula, data);
  LOG(info) << frame.design;

  if (options.preview)
    FD::print_matrix_head(cout, frame.design.matrix, frame.design.labels);

  FD::write_model_frame(frame, parameters);
  return EXIT_SUCCESS;
}
}

int main(int argc, char **argv) {
  Options options;
  FD::Parameters parameters;

  string config_path;
  string usage_info
      = "Design matrix construction from R-style formulas\n"
        "\n"
        "Reads a table with a header line and evaluates a formula such as\n"
        "  y ~ 1 + x + c(group) + log(z) + I(x^(1/2)) + poly(x, 3) + x*z\n"
        "against it. The design matrix is written to <output>X.tsv and the\n"
        "response to <output>y.tsv.";

  size_t num_cols = help_width();
  namespace po = boost::program_options;
  po::options_description cli_options;
  po::options_description generic_options
      = gen_generic_options(config_path, num_cols);

  po::options_description required_options("Required options", num_cols);
  po::options_description basic_options("Basic options", num_cols);

  required_options.add_options()
    ("file,f", po::value(&options.table_path)->required(),
     "Path to a table file. "
     "Format: one header line with the column names, then one line per "
     "sample. May be compressed with gzip or bzip2.")
    ("formula,F", po::value(&options.formula)->required(),
     "Formula to evaluate, e.g. 'y ~ 1 + x'.");

  basic_options.add_options()
    ("output,o", po::value(&parameters.output_prefix)->default_value(parameters.output_prefix),
     "Prefix for generated output files.")
    ("sep", po::value(&parameters.separator)->default_value(parameters.separator, "tab"),
     "Field separator of the input and output tables; 'tab' for a tab.")
    ("compression", po::value(&parameters.compression_mode)->default_value(parameters.compression_mode),
     "Compression method to use for output files. "
     "Can be one of 'gzip', 'bzip2', 'none'.")
    ("chunksize", po::value(&parameters.chunksize)->default_value(parameters.chunksize),
     "Number of rows to evaluate at once. "
     "Reserved; currently all rows are evaluated at once.")
    ("log", po::value(&options.log_path),
     "Also write log messages to this file.")
    ("preview", po::bool_switch(&options.preview),
     "Print the first rows of the design matrix.");

  cli_options.add(generic_options)
      .add(required_options)
      .add(basic_options);

  po::positional_options_description positional_options;
  positional_options.add("file", 1);

  int ret_val
      = process_cli_options(argc, const_cast<const char **>(argv), usage_info,
                            cli_options, true, positional_options);
  if (ret_val != PROCESSING_SUCCESSFUL)
    return ret_val;

  if (parameters.separator == "tab")
    parameters.separator = "\t";

  try {
    init_logging(options.log_path, verbosity);
    LOG(verbose) << "Parameters: " << parameters;
    return run(options, parameters);
  } catch (std::exception &e) {
    LOG(fatal) << "An error occurred during program execution.";
    LOG(fatal) << e.what();
    LOG(fatal) << "Please consult the command line help with -h.";
    return EXIT_FAILURE;
  }
}
