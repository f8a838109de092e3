/* =====================================================================================
 * Copyright (c) 2011, Jonas Maaskola
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 * =====================================================================================
 *
 *       Filename:  cli.cpp
 *
 *    Description:  Command line parsing shared by the executables
 *
 * =====================================================================================
 */

#include "cli.hpp"
#include <fstream>
#include <iostream>
#include "log.hpp"
#include "terminal.hpp"
#include "version.hpp"

using namespace std;

namespace po = boost::program_options;

const std::string default_error_msg
    = "Please inspect the command line help with -h or --help.";

po::options_description gen_generic_options(string &config_path, size_t cols) {
  po::options_description generic_options("Generic options", cols);
  generic_options.add_options()
    ("config", po::value(&config_path), "Read options from a configuration file.")
    ("help,h", "Produce help message.")
    ("version", "Print out the version. Also show the build type with -v.")
    ("verbose,v", "Be verbose about the progress.")
    ("noisy,V", "Be very verbose about the progress.")
    ;
  return generic_options;
}

size_t help_width() {
  const size_t MIN_COLS = 60;
  const size_t MAX_COLS = 80;
  size_t cols = get_terminal_width();
  if (cols < MIN_COLS)
    cols = MIN_COLS;
  if (cols > MAX_COLS)
    cols = MAX_COLS;
  return cols;
}

namespace {
int report_error(const std::string &context, const std::string &message) {
  LOG(fatal) << "Error while parsing " << context << ":";
  LOG(fatal) << message;
  LOG(fatal) << default_error_msg;
  return EXIT_FAILURE;
}

template <typename Fnc>
int guarded_store(const std::string &context, Fnc fnc) {
  try {
    fnc();
  } catch (po::unknown_option &e) {
    return report_error(context, "Option " + e.get_option_name()
                                     + " not known.");
  } catch (po::ambiguous_option &e) {
    return report_error(context, "Option " + e.get_option_name()
                                     + " is ambiguous.");
  } catch (po::multiple_values &e) {
    return report_error(context, "Option " + e.get_option_name()
                                     + " was specified multiple times.");
  } catch (po::multiple_occurrences &e) {
    return report_error(context, "Option " + e.get_option_name()
                                     + " was specified multiple times.");
  } catch (po::invalid_option_value &e) {
    return report_error(context, "The value specified for option "
                                     + e.get_option_name()
                                     + " has an invalid format.");
  } catch (po::too_many_positional_options_error &e) {
    return report_error(context,
                        "Too many positional options were specified.");
  } catch (po::invalid_command_line_syntax &e) {
    return report_error(context, "Invalid command line syntax.");
  } catch (po::required_option &e) {
    return report_error(context, "The required option " + e.get_option_name()
                                     + " was not specified.");
  } catch (po::validation_error &e) {
    return report_error(context, "Validation of option " + e.get_option_name()
                                     + " failed.");
  } catch (po::error &e) {
    return report_error(context, e.what());
  } catch (std::exception &e) {
    return report_error(context, e.what());
  }
  return PROCESSING_SUCCESSFUL;
}
}

int process_cli_options(
    int argc, const char **argv, const std::string &usage_string,
    boost::program_options::options_description &cli_options,
    bool use_positional_options,
    boost::program_options::positional_options_description
        &positional_options) {
  po::variables_map vm;
  int ret_val = guarded_store("command line options", [&]() {
    if (not use_positional_options)
      po::store(po::command_line_parser(argc, argv).options(cli_options).run(),
                vm);
    else
      po::store(po::command_line_parser(argc, argv)
                    .options(cli_options)
                    .positional(positional_options)
                    .run(),
                vm);
  });
  if (ret_val != PROCESSING_SUCCESSFUL)
    return ret_val;

  if (vm.count("verbose"))
    verbosity = Verbosity::verbose;
  if (vm.count("noisy"))
    verbosity = Verbosity::debug;

  if (vm.count("version") and not vm.count("help")) {
    std::cout << FD_PROGRAM_NAME << " " << FD_VERSION << std::endl;
    if (verbosity >= Verbosity::verbose)
      std::cout << "Build type: " << FD_BUILD_TYPE << std::endl;
    return EXIT_SUCCESS;
  }

  if (vm.count("help")) {
    std::cout << FD_PROGRAM_NAME << " " << FD_VERSION << std::endl;
    std::cout
        << "Provided under GNU General Public License Version 3 or later.\n"
        << std::endl;
    std::cout << usage_string << std::endl << std::endl;
    std::cout << cli_options << std::endl;
    return EXIT_SUCCESS;
  }

  if (vm.count("config")) {
    std::string config_path = vm["config"].as<std::string>();
    std::ifstream ifs(config_path.c_str());
    if (not ifs)
      return report_error("config file",
                          "Can not open config file: " + config_path);
    ret_val = guarded_store("config file", [&]() {
      po::store(po::parse_config_file(ifs, cli_options), vm);
    });
    if (ret_val != PROCESSING_SUCCESSFUL)
      return ret_val;
  }

  return guarded_store("command line options", [&]() { po::notify(vm); });
}
