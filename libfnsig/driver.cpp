// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include <algorithm>
#include <vector>

#include <boost/algorithm/string.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wshadow"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop

#include "driver.hpp"
#include "listing.hpp"
#include "rosebackend.hpp"
#include "sigfile.hpp"

namespace fnsig {

namespace bf = boost::filesystem;

std::unique_ptr<AnalysisBackend>
open_backend(ProgOptVarMap const & vm)
{
  if (vm.count("listing")) {
    std::string path = vm["listing"].as<bf::path>().native();
    auto timer = make_timer();
    auto listing = make_unique<ListingBackend>(ListingBackend::load(path));
    GINFO << "Loaded " << listing->functions().size() << " functions from " << path
          << " in " << timer << " seconds." << LEND;
    return std::move(listing);
  }
  std::vector<std::string> specimens;
  if (vm.count("file")) {
    specimens.push_back(vm["file"].as<bf::path>().native());
  }
  return make_unique<RoseBackend>(vm, specimens);
}

MatchCategorySet
requested_categories(ProgOptVarMap const & vm)
{
  std::vector<std::string> labels;
  if (vm.count("categories")) {
    auto text = vm["categories"].as<std::string>();
    boost::split(labels, text, boost::is_any_of(", "), boost::token_compress_on);
    labels.erase(std::remove(labels.begin(), labels.end(), std::string()), labels.end());
  }
  else {
    auto node = vm.config().path_get("fnsig.categories");
    if (!node) {
      return all_match_categories();
    }
    labels = node.expect<std::vector<std::string>>("Expected a list of match categories");
  }
  return parse_match_categories(labels);
}

bool
compress_signatures(ProgOptVarMap const & vm)
{
  auto compress = vm.get<bool>("fnsig.compress");
  return compress ? *compress : true;
}

std::string
signature_path(ProgOptVarMap const & vm, std::string const & cli_option,
               bool default_extension)
{
  std::string path = FNSIG_DEFAULT_SIGNATURE_FILE;
  if (vm.count(cli_option)) {
    path = vm[cli_option].as<bf::path>().native();
  }
  else {
    auto configured = vm.get<std::string>("fnsig.signature_file");
    if (configured) {
      path = *configured;
    }
  }
  if (!default_extension) {
    return path;
  }
  auto extension = vm.get<std::string>("fnsig.signature_extension");
  return add_default_extension(path, extension ? *extension : FNSIG_DEFAULT_SIGNATURE_EXTENSION);
}

void
write_rename_report(Renamer const & renamer, AnalysisBackend const & backend,
                    std::ostream & out)
{
  YAML::Emitter yaml;
  yaml << YAML::BeginMap;
  yaml << YAML::Key << "renames" << YAML::Value << YAML::BeginSeq;
  for (RenameRecord const & r : renamer.renames()) {
    yaml << YAML::BeginMap
         << YAML::Key << "address" << YAML::Value << addr_str(r.address)
         << YAML::Key << "old_name" << YAML::Value << r.old_name
         << YAML::Key << "new_name" << YAML::Value << r.new_name
         << YAML::Key << "category" << YAML::Value << Enum2Str(r.category)
         << YAML::Key << "propagated" << YAML::Value << r.propagated
         << YAML::Key << "library" << YAML::Value << backend.is_library(r.address)
         << YAML::EndMap;
  }
  yaml << YAML::EndSeq;
  yaml << YAML::Key << "categories" << YAML::Value << YAML::BeginMap;
  for (auto const & count : renamer.category_counts()) {
    yaml << YAML::Key << Enum2Str(count.first) << YAML::Value << count.second;
  }
  yaml << YAML::EndMap;
  yaml << YAML::Key << "total" << YAML::Value << renamer.renames().size();
  yaml << YAML::EndMap;
  out << yaml.c_str() << std::endl;
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
