// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Options_H
#define Fnsig_Options_H

#include <unistd.h>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include <Sawyer/Message.h>
#include "config.hpp"
#include "util.hpp"

namespace YAML {
template<>
struct convert<boost::filesystem::path> {
  static Node encode(const boost::filesystem::path & path) {
    return Node(path.native());
  }
  static bool decode(const Node & node, boost::filesystem::path & rhs) {
    if (!node.IsScalar()) {
      return false;
    }
    rhs = node.Scalar();
    return true;
  }
};
}

namespace fnsig {

// The option parsing logging facility.
extern Sawyer::Message::Facility olog;
#define OTRACE (fnsig::olog[Sawyer::Message::TRACE]) && fnsig::olog[Sawyer::Message::TRACE]
#define ODEBUG (fnsig::olog[Sawyer::Message::WHERE]) && fnsig::olog[Sawyer::Message::WHERE]
#define OINFO  fnsig::olog[Sawyer::Message::INFO]
#define OWARN  fnsig::olog[Sawyer::Message::WARN]
#define OERROR fnsig::olog[Sawyer::Message::ERROR]
#define OFATAL fnsig::olog[Sawyer::Message::FATAL]

class ProgOptVarMap : public boost::program_options::variables_map{
 public:
  ProgOptVarMap() = default;

  fnsig::Config & config() {
    return _config;
  }

  const fnsig::Config & config() const {
    return _config;
  }

  void config(const fnsig::Config &cfg) {
    _config = cfg;
  }

  template <typename T>
  boost::optional<T> get(const std::string &config_option) const
  {
    auto node = _config.path_get(config_option);
    if (node) {
      return node.as<T>();
    }
    return boost::none;
  }

  // Command line values take precedence over configuration values.
  template <typename T>
  boost::optional<T> get(const std::string &cli_option,
                         const std::string &config_option) const
  {
    if (count(cli_option)) {
      return (*this)[cli_option].as<T>();
    }
    return get<T>(config_option);
  }

 private:
  fnsig::Config _config;
};

} // namespace fnsig

namespace boost {
namespace filesystem {
void validate(boost::any& v,
              std::vector<std::string> const & values,
              boost::filesystem::path *, int);
}}

#include "misc.hpp"

namespace fnsig {

using StrVector = std::vector<std::string>;

using ProgOptDesc = boost::program_options::options_description;
using ProgPosOptDesc = boost::program_options::positional_options_description;

using LogDestination = Sawyer::Message::UnformattedSinkPtr;

// The options shared by every fnsig program, including the analysis backend selection.
ProgOptDesc fnsig_standard_options();

ProgOptVarMap parse_fnsig_options(
  int argc, char** argv,
  ProgOptDesc od,
  const std::string & proghelptext = std::string(),
  boost::optional<ProgPosOptDesc> posopt = boost::none,
  LogDestination logging = LogDestination());

#define FNSIG_PASS_EXCEPTIONS_ENV "FNSIG_PASS_EXCEPTIONS"
#define FNSIG_CONFIG_ENV "FNSIG_CONFIG"

LogDestination get_logging_destination();
bool interactive_logging();

using main_func_ptr = int (*)(int argc, char** argv);
int fnsig_main(std::string const & glog_name, main_func_ptr fn,
               int argc, char **argv, int logging_fileno = STDOUT_FILENO);

} // namespace fnsig

#endif // Fnsig_Options_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
