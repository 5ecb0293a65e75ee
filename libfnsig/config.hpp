// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#ifndef Fnsig_Config_H
#define Fnsig_Config_H

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wshadow"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <boost/optional.hpp>

// Default config path separator
#define CONFIG_PATH_SEPERATOR '.'

namespace fnsig {

// A view of one value in the merged configuration, along with the key path that led to it.
// Looking up a missing key yields an undefined node rather than throwing, so chains such as
// cfg["fnsig"]["compress"] are always safe, and the path is still available for error
// messages.
class ConfigNode {
 public:
  ConfigNode() : node_(YAML::NodeType::Undefined) {}
  ConfigNode(ConfigNode const &) = default;
  // YAML::Node assignment writes through to the referenced node, so rebind instead.
  ConfigNode & operator=(ConfigNode const & rhs);

  ConfigNode operator[](std::string const & key) const;

  /// Look up the given path in the ConfigNode.  If the seperator is '.', cfg.path_get("A.B.C")
  /// is equivalent to cfg["A"]["B"]["C"].
  ConfigNode path_get(std::string const & path, char sep = CONFIG_PATH_SEPERATOR) const;

  bool IsDefined() const { return node_.IsDefined() && !node_.IsNull(); }
  bool IsScalar() const { return IsDefined() && node_.IsScalar(); }
  bool IsSequence() const { return IsDefined() && node_.IsSequence(); }
  bool IsMap() const { return IsDefined() && node_.IsMap(); }
  explicit operator bool() const { return IsDefined(); }
  std::size_t size() const { return node_.size(); }

  /// Return the value of this node as the given type.  If the conversion fails, the value will
  /// be boost::none.
  template <typename T>
  boost::optional<T> as() const {
    if (!IsDefined()) {
      return boost::none;
    }
    try {
      return node_.as<T>();
    } catch (const YAML::BadConversion &) {
      return boost::none;
    }
  }

  /// Return the value of this node as the given type.  Throw a BadNodeError exception if the
  /// conversion fails.
  template <typename T>
  T expect(const char *msg = "Illegal conversion") const;

  /// Return the value of this node as the given type, or 'fallback' if it is missing or
  /// cannot be converted.
  template <typename T>
  T as_fallback(T const & fallback) const {
    auto v = as<T>();
    return v ? *v : fallback;
  }

  std::string const & path() const { return path_; }
  YAML::Node const & node() const { return node_; }

 protected:
  ConfigNode(YAML::Node node, std::string path) : node_(node), path_(std::move(path)) {}

  YAML::Node node_;
  std::string path_;

  friend class Config;
};

std::ostream & operator<<(std::ostream & stream, ConfigNode const & node);

// The layered configuration.  Sources are merged in the order they are added; later sources
// override earlier ones key by key, and a map containing the key "_replace" replaces the map
// it is merged onto instead of merging with it.
class Config {
 public:
  Config() : root_(YAML::NodeType::Map) {}
  explicit Config(std::string appname) : appname_(std::move(appname)),
                                         root_(YAML::NodeType::Map) {}
  Config(Config const &) = default;
  Config & operator=(Config const & rhs);

  /// Create a config holding the built-in defaults.
  static Config default_config(std::string const & appname);

  /// Load a config starting with default_config, merging from the file at default_location
  /// (or the file named in the env_override environment variable instead, when set),
  /// followed by the file named home_config in the $HOME directory.  Any of these arguments
  /// may be null.
  static Config load_config(
    std::string const & appname,
    const char *default_location,
    const char *env_override,
    const char *home_config);

  /// Merge YAML text into this config.  'source' names the text in error messages.
  Config & merge(std::string const & yaml, std::string const & source);
  /// Merge the YAML file 'filename' into this config.  Throws BadFileError.
  Config & mergeFile(std::string const & filename);
  /// Merge a "key1.key2=value" command line specification into this config.  The key is
  /// relative to the application section, so it takes precedence over root level values.
  Config & mergeKeyValue(std::string const & option);

  /// Look up 'key', preferring "application.<appname>.<key>" over the root level "<key>".
  ConfigNode operator[](std::string const & key) const;

  /// Like ConfigNode::path_get(), but the first component honors the application section.
  ConfigNode path_get(std::string const & path, char sep = CONFIG_PATH_SEPERATOR) const;

  std::string const & appname() const { return appname_; }
  std::vector<std::string> const & sources() const { return sources_; }

  friend std::ostream & operator<<(std::ostream & stream, Config const & cfg);

 private:
  void merge_node(YAML::Node const & node, std::string const & source);

  std::string appname_;
  YAML::Node root_;
  std::vector<std::string> sources_;
};

/// Merge node 'b' onto node 'a', returning a new node.  Neither argument is modified.
YAML::Node merge_nodes(YAML::Node const & a, YAML::Node const & b);

/// Exceptions from the config module that report the failing node's path.
class ConfigException : public std::runtime_error {
 public:
  ConfigException(ConfigNode const & node, std::string const & msg)
    : std::runtime_error(build_what(node, msg)) {}
  explicit ConfigException(std::string const & msg) : std::runtime_error(msg) {}
 private:
  static std::string build_what(ConfigNode const & node, std::string const & msg);
};

/// An exception representing an invalid node value
class BadNodeError : public ConfigException {
 public:
  BadNodeError(ConfigNode const & node, std::string const & msg)
    : ConfigException(node, msg) {}
};

/// A configuration file that exists but could not be read or parsed.
class BadFileError : public ConfigException {
 public:
  BadFileError(std::string const & filename, std::string const & why = std::string())
    : ConfigException("Could not load " + filename + (why.empty() ? "" : ": " + why)) {}
};

template <typename T>
T ConfigNode::expect(const char *msg) const {
  if (!IsDefined()) {
    throw BadNodeError(*this, std::string(msg) + " (missing value)");
  }
  try {
    return node_.as<T>();
  } catch (const YAML::BadConversion &) {
    throw BadNodeError(*this, msg);
  }
}

} // namespace fnsig

#endif // Fnsig_Config_H

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
