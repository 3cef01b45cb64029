#include "PathUtils.hpp"
#include "Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace watchflow {

namespace {

std::string expandHome(const std::string &path) {
  if (path == "~" || path.rfind("~/", 0) == 0) {
    const char *home = std::getenv("HOME");
    if (home && *home)
      return std::string(home) + path.substr(1);
  }
  return path;
}

// Drops a trailing separator so "a/b/" and "a/b" compare equal.
fs::path normalized(const fs::path &p) {
  fs::path n = p.lexically_normal();
  if (!n.has_filename() && n.has_parent_path() && n != n.root_path())
    n = n.parent_path();
  return n;
}

} // namespace

std::string absPath(const std::string &path) {
  if (path.empty())
    throw ResolutionError(path, "empty path");

  std::error_code ec;
  fs::path p = fs::absolute(expandHome(path), ec);
  if (ec)
    throw ResolutionError(path, ec.message());

  fs::path canonical = fs::canonical(p, ec);
  if (ec)
    throw ResolutionError(path, ec.message());

  if (!fs::is_directory(canonical, ec)) {
    throw ResolutionError(path, ec ? ec.message() : "not a directory");
  }
  return canonical.generic_string();
}

bool isHidden(const std::string &path) {
  std::string name = normalized(fs::path(path)).filename().string();
  return name.size() > 1 && name[0] == '.' && name != "..";
}

bool isContained(const std::string &root, const std::string &path) {
  fs::path r(root);
  fs::path p(path);
  if (!r.is_absolute() || !p.is_absolute())
    return false;

  fs::path rel = normalized(p).lexically_relative(normalized(r));
  if (rel.empty())
    return false;
  if (rel == ".")
    return true;
  return *rel.begin() != "..";
}

} // namespace watchflow
