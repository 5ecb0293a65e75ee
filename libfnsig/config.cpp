// Copyright 2025-2026 Carnegie Mellon University.  See LICENSE file for terms.

#include "config.hpp"

#include <cstdlib>
#include <sstream>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

using YAML::Node;

namespace fnsig {

// Generated at build time from libfnsig/config.yaml
#include "config.yaml.ii"

namespace {

// Indexing a non-const Node inserts the key, so all lookups go through a const reference.
Node const & const_node(Node const & n) {
  return n;
}

Node lookup(Node const & n, std::string const & key) {
  if (!n.IsDefined() || !n.IsMap()) {
    return Node(YAML::NodeType::Undefined);
  }
  Node v = const_node(n)[key];
  if (!v.IsDefined()) {
    return Node(YAML::NodeType::Undefined);
  }
  return v;
}

std::string join_path(std::string const & path, std::string const & key) {
  return path.empty() ? key : path + CONFIG_PATH_SEPERATOR + key;
}

} // unnamed namespace

Node merge_nodes(Node const & a, Node const & b)
{
  if (!b.IsMap()) {
    // A scalar or sequence replaces whatever was there, unless it is null
    return b.IsNull() ? a : b;
  }
  if (const_node(b)["_replace"]) {
    Node c(YAML::NodeType::Map);
    for (auto const & n : b) {
      if (n.first.IsScalar() && n.first.Scalar() == "_replace") {
        continue;
      }
      c[n.first] = n.second;
    }
    return c;
  }
  if (!a.IsMap()) {
    return b;
  }
  if (b.size() == 0) {
    return a;
  }
  Node c(YAML::NodeType::Map);
  for (auto const & n : a) {
    if (n.first.IsScalar()) {
      Node t = lookup(b, n.first.Scalar());
      if (t.IsDefined()) {
        c[n.first] = merge_nodes(n.second, t);
        continue;
      }
    }
    c[n.first] = n.second;
  }
  for (auto const & n : b) {
    if (!n.first.IsScalar() || !lookup(c, n.first.Scalar()).IsDefined()) {
      c[n.first] = n.second;
    }
  }
  return c;
}

ConfigNode &
ConfigNode::operator=(ConfigNode const & rhs)
{
  node_.reset(rhs.node_);
  path_ = rhs.path_;
  return *this;
}

ConfigNode
ConfigNode::operator[](std::string const & key) const
{
  return ConfigNode(lookup(node_, key), join_path(path_, key));
}

ConfigNode
ConfigNode::path_get(std::string const & path, char sep) const
{
  std::stringstream ss(path);
  std::string item;
  ConfigNode n = *this;
  while (std::getline(ss, item, sep)) {
    n = n[item];
  }
  return n;
}

std::ostream &
operator<<(std::ostream & stream, ConfigNode const & node)
{
  if (node.IsDefined()) {
    stream << node.node();
  }
  return stream;
}

Config &
Config::operator=(Config const & rhs)
{
  appname_ = rhs.appname_;
  root_.reset(rhs.root_);
  sources_ = rhs.sources_;
  return *this;
}

void
Config::merge_node(Node const & node, std::string const & source)
{
  root_.reset(merge_nodes(root_, node));
  sources_.push_back(source);
}

Config &
Config::merge(std::string const & yaml, std::string const & source)
{
  Node node;
  try {
    node.reset(YAML::Load(yaml));
  } catch (YAML::Exception const & e) {
    throw BadFileError(source, e.what());
  }
  if (node.IsDefined() && !node.IsNull() && !node.IsMap()) {
    throw BadFileError(source, "top level of a configuration must be a map");
  }
  merge_node(node, source);
  return *this;
}

Config &
Config::mergeFile(std::string const & filename)
{
  boost::filesystem::ifstream file;
  boost::filesystem::path p(filename);
  file.open(p);
  if (!file) {
    throw BadFileError(filename);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return merge(buffer.str(), filename);
}

Config &
Config::mergeKeyValue(std::string const & option)
{
  auto loc = option.find_first_of("=[{\"");
  if (loc == std::string::npos) {
    throw ConfigException("No assignment in option string: " + option);
  }
  if (option[loc] != '=' || loc == 0) {
    throw ConfigException("Illegal option key: " + option);
  }

  // Build application.<appname>.key1.key2 = value as a fresh tree and merge it on top
  std::istringstream is{option.substr(0, loc)};
  std::string item;
  std::vector<std::string> keys;
  while (std::getline(is, item, CONFIG_PATH_SEPERATOR)) {
    if (item.empty()) {
      throw ConfigException("Illegal option key: " + option);
    }
    keys.push_back(item);
  }
  if (keys.empty()) {
    throw ConfigException("Illegal option key: " + option);
  }
  auto map = Node{YAML::NodeType::Map};
  auto current = map["application"] = Node{YAML::NodeType::Map};
  current.reset(current[appname_] = Node{YAML::NodeType::Map});
  for (std::size_t i = 0; i + 1 < keys.size(); ++i) {
    current.reset(current[keys[i]] = Node{YAML::NodeType::Map});
  }
  try {
    current[keys.back()] = YAML::Load(option.substr(loc + 1));
  } catch (YAML::Exception const &) {
    throw ConfigException("Illegal option value: " + option);
  }
  merge_node(map, "<command line>");
  return *this;
}

ConfigNode
Config::operator[](std::string const & key) const
{
  if (!appname_.empty()) {
    Node app = lookup(lookup(lookup(root_, "application"), appname_), key);
    if (app.IsDefined() && !app.IsNull()) {
      return ConfigNode(app, "application." + appname_ + "." + key);
    }
  }
  return ConfigNode(lookup(root_, key), key);
}

ConfigNode
Config::path_get(std::string const & path, char sep) const
{
  std::stringstream ss(path);
  std::string item;
  if (!std::getline(ss, item, sep)) {
    return ConfigNode(Node(YAML::NodeType::Undefined), path);
  }
  // Only the first component can come from the application section
  ConfigNode n = (*this)[item];
  while (std::getline(ss, item, sep)) {
    n = n[item];
  }
  if (n.IsDefined() || appname_.empty()) {
    return n;
  }
  // The application section may override a parent map without naming this leaf, so fall
  // back to the root level path.
  ConfigNode root(root_, std::string());
  return root.path_get(path, sep);
}

std::ostream &
operator<<(std::ostream & stream, Config const & cfg)
{
  YAML::Emitter out;
  out << cfg.root_;
  stream << out.c_str() << '\n';
  return stream;
}

Config
Config::default_config(std::string const & appname) {
  Config cfg(appname);
  std::string config(
    reinterpret_cast<const char *>(&config_yaml),
    config_yaml_len);
  cfg.merge(config, "<default>");
  return cfg;
}

namespace {
bool
file_exists(const char *filename) {
  boost::system::error_code ec;
  return boost::filesystem::exists(boost::filesystem::path(filename), ec);
}
} // anonymous namespace

Config
Config::load_config(
  std::string const & appname,
  const char *default_location,
  const char *env_override,
  const char *home_config)
{
  Config cfg = Config::default_config(appname);
  bool env = false;
  if (env_override) {
    const char *loc = std::getenv(env_override);
    if (loc && file_exists(loc)) {
      cfg.mergeFile(loc);
      env = true;
    }
  }
  if (!env && default_location && file_exists(default_location)) {
    cfg.mergeFile(default_location);
  }
  const char *home = std::getenv("HOME");
  if (home && home_config) {
    std::string home_str(home);
    home_str.push_back('/');
    home_str.append(home_config);
    if (file_exists(home_str.c_str())) {
      cfg.mergeFile(home_str);
    }
  }
  return cfg;
}

std::string
ConfigException::build_what(
  ConfigNode const & node,
  std::string const & msg)
{
  std::stringstream o;
  o << msg << ": '" << node.path() << "'";
  if (node.IsScalar()) {
    o << ": '" << node.node().Scalar() << "'";
  }
  return o.str();
}

} // namespace fnsig

/* Local Variables:   */
/* mode: c++          */
/* fill-column:    95 */
/* comment-column: 0  */
/* End:               */
