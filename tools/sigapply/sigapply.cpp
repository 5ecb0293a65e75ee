// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <libfnsig/driver.hpp>
#include <libfnsig/generator.hpp>
#include <libfnsig/listing.hpp>
#include <libfnsig/matcher.hpp>
#include <libfnsig/misc.hpp>
#include <libfnsig/options.hpp>
#include <libfnsig/renamer.hpp>
#include <libfnsig/sigfile.hpp>
#include <libfnsig/util.hpp>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include <iostream>

using namespace fnsig;

namespace bf = boost::filesystem;

ProgOptDesc sigapply_options() {
  namespace po = boost::program_options;

  ProgOptDesc applyopt("sigapply v1.0 options");
  applyopt.add_options()
    ("signatures,s", po::value<bf::path>(),
     "Signature file of the program whose names should be applied (default: the "
     "fnsig.signature_file setting)")
    ("categories", po::value<std::string>(),
     "Comma separated match categories to apply (formal, strings, immediates, fuzzy)")
    ("show", po::value<StrVector>()->composing(),
     "Report whether the named local function kept its signatures (may be repeated)")
    ("report", po::value<bf::path>(),
     "Write a YAML report of the renames to the given file.  ('-' means stdout)")
    ;
  return applyopt;
}

static int sigapply_main(int argc, char **argv) {
  ProgOptDesc applyod = sigapply_options();
  applyod.add(fnsig_standard_options());

  std::string proghelptext = "sigapply generates the function signatures of a program, matches "
    "them against a signature file written by fn2sig, and renames the matched functions.  "
    "Each rename is reported in the following CSV format:\n\n"
    "\taddress,old_name,new_name,category\n";

  ProgOptVarMap vm = parse_fnsig_options(argc, argv, applyod, proghelptext);

  auto timer = make_timer();

  try {
    MatchCategorySet categories = requested_categories(vm);
    auto backend = open_backend(vm);
    SignatureGenerator generator(*backend, GeneratorSettings(vm.config()));
    SignatureStore local = generator.generate();

    if (vm.count("show")) {
      auto names = vm["show"].as<StrVector>();
      local.show(std::set<std::string>(names.begin(), names.end()), std::cout);
    }

    std::string path = signature_path(vm, "signatures", false);
    SignatureStore external = load_signatures(path);
    OINFO << "Loaded " << external << " from " << path << "." << LEND;

    Matcher matcher(local, external);
    std::vector<CandidateSet> candidates = matcher.match(categories);

    Renamer renamer(*backend, local, external, RenameSettings(vm.config()));
    std::size_t total = renamer.apply(candidates);

    for (RenameRecord const & r : renamer.renames()) {
      std::cout << addr_str(r.address) << ',' << r.old_name << ',' << r.new_name << ','
                << Enum2Str(r.category) << std::endl;
    }
    std::cout << "Renamed " << total << " functions." << std::endl;

    if (vm.count("report")) {
      bf::path report = vm["report"].as<bf::path>();
      if (report == "-") {
        write_rename_report(renamer, *backend, std::cout);
      }
      else {
        bf::ofstream file(report);
        if (!file) {
          GFATAL << "Could not open " << report << " for writing." << LEND;
          return EXIT_FAILURE;
        }
        write_rename_report(renamer, *backend, file);
      }
    }
  } catch (SignatureFileError const & e) {
    GFATAL << e.what() << LEND;
    return EXIT_FAILURE;
  } catch (ListingError const & e) {
    GFATAL << e.what() << LEND;
    return EXIT_FAILURE;
  } catch (ConfigException const & e) {
    GFATAL << e.what() << LEND;
    return EXIT_FAILURE;
  } catch (std::invalid_argument const & e) {
    GFATAL << e.what() << LEND;
    return EXIT_FAILURE;
  }

  OINFO << "sigapply complete in " << timer << " seconds." << LEND;
  return 0;
}

int main(int argc, char **argv) {
  return fnsig_main("SAPP", sigapply_main, argc, argv, STDERR_FILENO);
}

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
