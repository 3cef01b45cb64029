#include "types.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>

namespace watchflow {

std::string opToString(Op op) {
  static const struct {
    Op bit;
    const char *name;
  } names[] = {{Op::Create, "CREATE"},
               {Op::Write, "WRITE"},
               {Op::Remove, "REMOVE"},
               {Op::Rename, "RENAME"},
               {Op::Chmod, "CHMOD"}};

  std::string result;
  for (const auto &n : names) {
    if (any(op & n.bit)) {
      if (!result.empty())
        result += "|";
      result += n.name;
    }
  }
  return result.empty() ? "NONE" : result;
}

Op parseOp(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "create")
    return Op::Create;
  if (lower == "write")
    return Op::Write;
  if (lower == "remove")
    return Op::Remove;
  if (lower == "rename")
    return Op::Rename;
  if (lower == "chmod")
    return Op::Chmod;
  if (lower == "all")
    return Op::All;
  throw ConfigError("unknown operation: " + name);
}

} // namespace watchflow
