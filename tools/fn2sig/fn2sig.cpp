// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <libfnsig/driver.hpp>
#include <libfnsig/generator.hpp>
#include <libfnsig/listing.hpp>
#include <libfnsig/misc.hpp>
#include <libfnsig/options.hpp>
#include <libfnsig/sigfile.hpp>
#include <libfnsig/util.hpp>

#include <boost/filesystem.hpp>

#include <iostream>

using namespace fnsig;

namespace bf = boost::filesystem;

ProgOptDesc fn2sig_options() {
  namespace po = boost::program_options;

  ProgOptDesc sigopt("fn2sig v1.0 options");
  sigopt.add_options()
    ("output,o", po::value<bf::path>(),
     "Signature file to write (default from fnsig.signature_file)")
    ("show", po::value<StrVector>()->composing(),
     "Report whether the named function kept its signatures (may be repeated)")
    ;
  return sigopt;
}

static int fn2sig_main(int argc, char **argv) {
  ProgOptDesc sigod = fn2sig_options();
  sigod.add(fnsig_standard_options());

  std::string proghelptext = "fn2sig generates the function signatures of a program and saves "
    "them to a signature file that sigapply can use to name the same functions in another "
    "program.\n";

  ProgOptVarMap vm = parse_fnsig_options(argc, argv, sigod, proghelptext);

  auto timer = make_timer();
  std::string path = signature_path(vm, "output");

  try {
    auto backend = open_backend(vm);
    SignatureGenerator generator(*backend, GeneratorSettings(vm.config()));
    SignatureStore store = generator.generate();

    if (vm.count("show")) {
      auto names = vm["show"].as<StrVector>();
      store.show(std::set<std::string>(names.begin(), names.end()), std::cout);
    }

    save_signatures(store, path, compress_signatures(vm));
    OINFO << "Wrote " << store << " to " << path << "." << LEND;
  } catch (SignatureFileError const & e) {
    GFATAL << e.what() << LEND;
    return EXIT_FAILURE;
  } catch (ListingError const & e) {
    GFATAL << e.what() << LEND;
    return EXIT_FAILURE;
  } catch (ConfigException const & e) {
    GFATAL << e.what() << LEND;
    return EXIT_FAILURE;
  }

  OINFO << "fn2sig complete in " << timer << " seconds." << LEND;
  return 0;
}

int main(int argc, char **argv) {
  return fnsig_main("F2SG", fn2sig_main, argc, argv, STDERR_FILENO);
}

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
