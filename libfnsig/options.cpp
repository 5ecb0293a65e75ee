// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <rose.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <typeinfo>
#include <wordexp.h>

#include <boost/format.hpp>

#include <Sawyer/ProgressBar.h>

#include "options.hpp"
#include "util.hpp"
#include "renamer.hpp"

// Demangled exception type names for the terminate handler
#ifdef __GNUC__
#include <cxxabi.h>
#endif

namespace boost {
namespace filesystem {
// Path options accept ~user and $VAR, but command substitution is refused.
void validate(boost::any& v,
              std::vector<std::string> const & values,
              boost::filesystem::path *, int)
{
  using namespace boost::program_options;
  validators::check_first_occurrence(v);
  std::string const & text = validators::get_single_string(values);
  wordexp_t words;
  if (wordexp(text.c_str(), &words, (WRDE_NOCMD | WRDE_UNDEF)) != 0) {
    throw validation_error(validation_error::invalid_option_value);
  }
  auto release = [](wordexp_t *w) { wordfree(w); };
  std::unique_ptr<wordexp_t, decltype(release)> words_guard(&words, release);
  if (words.we_wordc != 1) {
    throw validation_error(validation_error::invalid_option_value);
  }
  v = boost::any(boost::filesystem::path(words.we_wordv[0]));
}

}}

namespace fnsig {

namespace bf = boost::filesystem;
namespace po = boost::program_options;

namespace {
int log_fileno = -1;
LogDestination log_destination;
bool log_interactive = false;
}

bool interactive_logging() {
  return log_interactive;
}

LogDestination get_logging_destination()
{
  if (!log_destination) {
    if (log_fileno < 0) {
      log_fileno = STDOUT_FILENO;
    }
    auto prefix = Sawyer::Message::Prefix::instance()->showProgramName(false);
    log_destination = Sawyer::Message::FdSink::instance(log_fileno, prefix);
  }
  return log_destination;
}

// Option reporting and other messages the user should always see.  INFO and above are always
// enabled, and WHERE reports each option that was found.
Sawyer::Message::Facility olog;

using namespace Sawyer::Message::Common;

#define DEFAULT_VERBOSITY 3
#define MAXIMUM_VERBOSITY 14

ProgOptDesc fnsig_standard_options() {
  ProgOptDesc general("Function signature options");
  general.add_options()
    ("help,h", "display help")
    ("verbose,v",
     po::value<int>()->implicit_value(DEFAULT_VERBOSITY),
     boost::str(boost::format("enable verbose logging (1-%d, default %d)")
                % MAXIMUM_VERBOSITY % DEFAULT_VERBOSITY).c_str())
    ("timing", po::bool_switch(), "show elapsed time in log messages")
    ("batch,b", "no colors or progress bars")
    ("config,C",
     po::value<std::vector<bf::path>>()->composing(),
     "merge a YAML configuration file (repeatable)")
    ("option",
     po::value<std::vector<std::string>>()->composing(),
     "set one configuration value as key1.key2=value (repeatable)")
    ("dump-config", "print the merged configuration and exit")
    ("no-user-file", "skip ~/.fnsig.yaml")
    ("no-site-file", "skip the site configuration and " FNSIG_CONFIG_ENV)
    ("listing",
     po::value<bf::path>(),
     "take functions from a YAML program listing instead of an executable")
    ("file,f",
     po::value<bf::path>(),
     "executable to partition")
    ;

  ProgOptDesc partitioning("ROSE partitioner options");
  partitioning.add_options()
    ("no-semantics", "partition without instruction semantics")
    ("mark-executable", "treat every segment as executable")
    ("allow-64bit", "accept executables that are not 32-bit")
    ("pdebug", "log partitioner progress")
    ("log",
     po::value<std::string>(),
     "Sawyer facility control string, overriding --verbose")
    ;

  general.add(partitioning);
  return general;
}

namespace {

// The site file is etc/fnsig.yaml under the prefix the program was installed into.
std::string site_config_file(char const * argv0)
{
  bf::path bindir = bf::path(argv0).parent_path();
  bf::path prefix;
  if (!bindir.empty()) {
    boost::system::error_code ec;
    bf::path canon = bf::canonical(bindir, ec);
    if (!ec) {
      prefix = canon.parent_path();
    }
  }
  return (prefix / "etc/fnsig.yaml").native();
}

// Built-in defaults, then the site, environment and user files, then --config files in order,
// then each --option.
void load_configuration(ProgOptVarMap & vm, char const * argv0)
{
  bool site = !vm.count("no-site-file");
  std::string site_file = site_config_file(argv0);
  vm.config(Config::load_config(bf::path(argv0).filename().native(),
                                site ? site_file.c_str() : nullptr,
                                site ? FNSIG_CONFIG_ENV : nullptr,
                                vm.count("no-user-file") ? nullptr : ".fnsig.yaml"));
  if (vm.count("config")) {
    for (auto const & file : vm["config"].as<std::vector<bf::path>>()) {
      vm.config().mergeFile(file.native());
    }
  }
  if (vm.count("option")) {
    for (auto const & kv : vm["option"].as<std::vector<std::string>>()) {
      vm.config().mergeKeyValue(kv);
    }
  }
}

// Each verbosity step turns on one more level of one facility.
struct VerbosityStep {
  Sawyer::Message::Facility * facility;
  Sawyer::Message::Importance level;
  int minimum;
};

void apply_verbosity(int verbosity, Sawyer::Message::Facility & rlog)
{
  if (verbosity < 1 || verbosity > MAXIMUM_VERBOSITY) {
    int clamped = std::max(1, std::min(verbosity, MAXIMUM_VERBOSITY));
    OERROR << "Valid verbosity levels are 1-" << MAXIMUM_VERBOSITY << ", using "
           << clamped << "." << LEND;
    verbosity = clamped;
  }

  VerbosityStep const steps[] = {
    {&glog, WARN, 1},
    {&glog, INFO, 2},
    {&olog, WHERE, 3},
    // Rename counts per category
    {&rlog, INFO, 3},
    {&rlog, WARN, 4},
    {&glog, WHERE, 5},
    // Each rename as it is made
    {&rlog, WHERE, 6},
    {&glog, TRACE, 7},
    {&glog, DEBUG, 8},
    // Rejected renames and block pairings
    {&rlog, TRACE, 9},
    {&olog, TRACE, 10},
    {&olog, DEBUG, 11},
    {&rlog, DEBUG, 12},
  };
  for (auto const & step : steps) {
    (*step.facility)[step.level].enable(verbosity >= step.minimum);
  }
  ODEBUG << "Verbose logging level set to " << verbosity << "." << LEND;

  if (verbosity >= MAXIMUM_VERBOSITY) {
    Sawyer::Message::mfacilities.control("all");
  }
}

ProgOptVarMap parse_options(
  int argc, char** argv,
  ProgOptDesc const & desc,
  std::string const & proghelptext,
  boost::optional<ProgPosOptDesc> posopt,
  LogDestination destination)
{
  // Without positional options, bare arguments name the executable to analyze.
  bool needs_input = !posopt;
  if (!posopt) {
    posopt = ProgPosOptDesc().add("file", -1);
  }

  if (destination) {
    log_destination = destination;
    log_fileno = -1;
  }
  LogDestination sink = get_logging_destination();
  sink->prefix()->showElapsedTime(false);
  olog.initialize("OPTI");
  olog.initStreams(sink);
  glog.initStreams(sink);

  ProgOptVarMap vm;
  po::store(po::command_line_parser(argc, argv).options(desc).positional(*posopt).run(), vm);
  load_configuration(vm, argv[0]);

  if (vm.count("dump-config")) {
    // On stdout so that it can be redirected into a file
    std::cout << vm.config() << LEND;
    exit(3);
  }

  log_interactive = log_fileno >= 0 && isatty(log_fileno) && !vm.count("batch");
  if (vm.count("batch") || !color_terminal(log_fileno)) {
    sink->overridePropertiesNS().useColor = false;
  }
  sink->prefix()->showElapsedTime(vm["timing"].as<bool>());

  Rose::Diagnostics::initialize();
  Sawyer::ProgressBarSettings::initialDelay(3.0);
  Sawyer::ProgressBarSettings::minimumUpdateInterval(1.0);
  Sawyer::Message::mfacilities.insert(olog);

  if (vm.count("help")) {
    if (!proghelptext.empty()) {
      std::cout << proghelptext << "\n\n";
    }
    std::cout << desc;
    exit(3);
  }

  // Reports missing required options
  po::notify(vm);

  Sawyer::Message::mfacilities.insert(glog);
  auto & rlog = Renamer::initDiagnostics();

  // Errors everywhere, warnings from the program and the options, and option INFO.
  Sawyer::Message::mfacilities.control("none, >=error");
  glog[WARN].enable();
  olog[WARN].enable();
  olog[INFO].enable();
  if (interactive_logging()) {
    olog[MARCH].enable();
  }

  auto verbosity = vm.get<int>("verbose", "fnsig.verbosity");
  if (verbosity) {
    apply_verbosity(*verbosity, rlog);
  }

  if (vm.count("log")) {
    std::string error = Sawyer::Message::mfacilities.control(vm["log"].as<std::string>());
    if (!error.empty()) {
      OERROR << "Control string error:" << error << LEND;
      Sawyer::Message::mfacilities.control("none, >=error, OPTI(>=info)");
    }
  }

  if (olog[TRACE]) {
    GWARN  << "Main program WARN messages are enabled." << LEND;
    GINFO  << "Main program INFO messages are enabled." << LEND;
    GDEBUG << "Main program DEBUG/WHERE messages are enabled." << LEND;
    GTRACE << "Main program TRACE messages are enabled." << LEND;
    GCRAZY << "Main program CRAZY/DEBUG messages are enabled." << LEND;
  }

  if (needs_input) {
    if (vm.count("listing")) {
      OINFO << "Analyzing listing: " << vm["listing"].as<bf::path>().native() << LEND;
    } else if (vm.count("file")) {
      OINFO << "Analyzing executable: " << vm["file"].as<bf::path>().native() << LEND;
    } else {
      OFATAL << "An executable or a --listing is required." << LEND;
      exit(3);
    }
  }

  return vm;
}

#ifdef __GNUC__
// The demangled type of the exception being handled, if the ABI can tell us.
std::string current_exception_type()
{
  std::type_info * type = abi::__cxa_current_exception_type();
  if (!type) {
    return std::string();
  }
  int status = 0;
  char * name = abi::__cxa_demangle(type->name(), nullptr, nullptr, &status);
  std::string result = name ? name : type->name();
  std::free(name);
  return result;
}
#else
std::string current_exception_type()
{
  return std::string();
}
#endif

void report_nested(std::exception const & e, int depth)
{
  GFATAL << std::string(depth, ' ') << "Reason: " << e.what() << LEND;
  try {
    std::rethrow_if_nested(e);
  } catch (std::exception const & inner) {
    report_nested(inner, depth + 1);
  } catch (...) {
    GFATAL << std::string(depth + 1, ' ') << "Reason: unknown nested exception" << LEND;
  }
}

[[noreturn]] void fnsig_terminate()
{
  // A second terminate must not come back here.
  std::set_terminate(std::abort);

  std::exception_ptr ep = std::current_exception();
  if (!ep) {
    GFATAL << "fnsig main error, terminate called without an active exception" << LEND;
    std::exit(EXIT_FAILURE);
  }
  try {
    std::rethrow_exception(ep);
  } catch (std::exception const & e) {
    std::string type = current_exception_type();
    GFATAL << "fnsig main error: ";
    if (!type.empty()) {
      GFATAL << "(" << type << ") ";
    }
    GFATAL << e.what() << LEND;
    try {
      std::rethrow_if_nested(e);
    } catch (std::exception const & inner) {
      report_nested(inner, 1);
    } catch (...) {
      GFATAL << " Reason: unknown nested exception" << LEND;
    }
  } catch (...) {
    std::string type = current_exception_type();
    GFATAL << "fnsig main error, caught an unexpected exception"
           << (type.empty() ? std::string() : " named " + type) << LEND;
  }
  std::exit(EXIT_FAILURE);
}

} // unnamed namespace

ProgOptVarMap parse_fnsig_options(
  int argc, char** argv,
  ProgOptDesc od,
  const std::string & proghelptext,
  boost::optional<ProgPosOptDesc> posopt,
  LogDestination destination)
{
  try {
    return parse_options(argc, argv, od, proghelptext, posopt, destination);
  } catch (po::error const & e) {
    OFATAL << "Error parsing arguments: " << e.what() << LEND;
    exit(EXIT_FAILURE);
  } catch (ConfigException const & e) {
    OFATAL << "Error in configuration: " << e.what() << LEND;
    exit(EXIT_FAILURE);
  }
}

int fnsig_main(std::string const & glog_name, main_func_ptr fn,
               int argc, char **argv, int logging_fileno)
{
  glog.initialize(glog_name);
  log_fileno = logging_fileno;

  ROSE_INITIALIZE;

  if (!getenv(FNSIG_PASS_EXCEPTIONS_ENV)) {
    std::set_terminate(fnsig_terminate);
  }
  return fn(argc, argv);
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
