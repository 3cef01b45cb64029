#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace watchflow {

// Operation bits carried by a RawEvent. Values can be combined.
enum class Op : uint32_t {
  None = 0,
  Create = 1 << 0,
  Write = 1 << 1,
  Remove = 1 << 2,
  Rename = 1 << 3,
  Chmod = 1 << 4,
  All = Create | Write | Remove | Rename | Chmod,
  // Operations that may bring a new directory into a watched tree
  DirOps = Create | Rename,
};

constexpr Op operator|(Op a, Op b) {
  return static_cast<Op>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

constexpr Op operator&(Op a, Op b) {
  return static_cast<Op>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline Op &operator|=(Op &a, Op b) {
  a = a | b;
  return a;
}

constexpr bool any(Op op) { return op != Op::None; }

std::string opToString(Op op);

// Maps "create", "write", "remove", "rename", "chmod" or "all"
// (case-insensitive) to its bit. Throws ConfigError on anything else.
Op parseOp(const std::string &name);

struct RawEvent {
  std::string path; // Absolute path reported by the event source
  Op op = Op::None;
};

inline bool operator==(const RawEvent &a, const RawEvent &b) {
  return a.path == b.path && a.op == b.op;
}

// Events accumulated during one coalescing window, in arrival order.
using EventBatch = std::vector<RawEvent>;

} // namespace watchflow
