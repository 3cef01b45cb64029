#pragma once

#include <string>

namespace watchflow {

// Resolves a watch path to an absolute canonical directory. A leading "~/"
// is expanded from $HOME and relative paths are taken from the current
// directory. Throws ResolutionError if the path does not exist, is not a
// directory or cannot be read.
std::string absPath(const std::string &path);

// True if the final component of path starts with '.' ("." and ".." are
// not hidden).
bool isHidden(const std::string &path);

// True if path lies inside root or is root itself. Both must be absolute;
// when containment cannot be established the answer is false.
bool isContained(const std::string &root, const std::string &path);

} // namespace watchflow
