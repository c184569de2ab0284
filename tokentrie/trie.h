/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 * All rights reserved.
 *
 * This source code is licensed under the BSD-style license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "tokentrie/options.h"
#include "tokentrie/window.h"

#include <folly/CPortability.h>
#include <folly/Function.h>
#include <folly/Optional.h>
#include <folly/dynamic.h>

#include <cstdint>
#include <deque>
#include <limits>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tokentrie {

/**
 * A compressed trie (radix tree) over strings.
 *
 * Every edge carries a string segment; the full key of a node is the
 * concatenation of the segments from the root down to it. The tree does not
 * own values, it maps keys to 32-bit slots chosen by the caller (see
 * TrieMap for the typed wrapper).
 *
 * Children are kept in insertion order. Keys can't be removed.
 *
 * Not thread safe.
 */
class Tree final {
public:
  using Slot = uint32_t;
  using NodeId = uint32_t;

  static constexpr NodeId NONE = std::numeric_limits<NodeId>::max();

  enum class Order { BreadthFirst, DepthFirst };

  // The window ends exactly where the node's segment ends.
  struct FullMatch {};

  // The node's segment matches the first `index` characters of what remains
  // of the window, and then diverges or one of them runs out.
  struct PartialMatch {
    size_t index;
  };

  // The root's segment diverges from the window at the first character.
  struct NoMatch {};

  using Match = std::variant<FullMatch, PartialMatch, NoMatch>;

  struct Closest {
    NodeId node;
    Match match;
    // Full key of `node`
    std::string fullKey;
    // Window characters consumed down to and including `match`
    size_t consumed;
  };

  struct Found {
    std::string key;
    Slot slot;
  };

  struct Stats {
    size_t nodes = 0;
    size_t values = 0;
    size_t branches = 0;
    size_t key_size = 0;
    size_t depth = 0;
  };

private:
  struct Node;
  struct Impl;

public:
  /// Lazy traversal over the value-bearing nodes of a subtree, driven by an
  /// explicit work list (queue for breadth-first, stack for depth-first).
  struct Iterator final {
    Iterator() = default;
    Iterator(const Impl *impl, NodeId start, std::string key, Order order);

    bool done() const { return node == NONE; }
    const std::string& getKey() const { return key; }
    Slot slot() const;
    void next();

    Iterator& operator++() {
      next();
      return *this;
    }

    bool operator==(const Iterator& other) const {
      return node == other.node;
    }

    bool operator!=(const Iterator& other) const {
      return node != other.node;
    }

  private:
    const Impl * FOLLY_NULLABLE impl = nullptr;
    Order order = Order::BreadthFirst;
    std::deque<std::pair<NodeId, std::string>> work;
    NodeId node = NONE;
    std::string key;
  };

  using iterator = Iterator;
  using const_iterator = Iterator;

  explicit Tree(Options options = {});
  Tree(const Tree& other) = delete;
  Tree(Tree&& other) noexcept {
    impl = other.impl;
    other.impl = nullptr;
  }
  Tree& operator=(const Tree& other) = delete;
  Tree& operator=(Tree&& other) noexcept {
    if (impl != other.impl) {
      std::swap(impl, other.impl);
    }
    return *this;
  }
  ~Tree() noexcept;

  const Options& options() const noexcept;

  void clear() noexcept;

  bool empty() const noexcept;

  // Number of stored keys
  size_t size() const noexcept;

  /// Find the deepest node consistent with the window. `window.pos` is
  /// advanced while walking and restored before returning. Returns none only
  /// when the tree is empty.
  folly::Optional<Closest> closest(KeyWindow& window) const;

  // Exact match.
  folly::Optional<Slot> find(KeyWindow key) const;

  /// Associate `key` with `slot`. If the key is already present its existing
  /// slot is returned along with `false` and nothing changes; the caller
  /// overwrites the value behind that slot.
  std::pair<Slot, bool> insert(folly::StringPiece key, Slot slot);

  /// Longest stored key which is a prefix of the window. With
  /// `wordBoundaryOnly`, a candidate immediately followed (inside the
  /// window) by an ASCII letter is rejected and a shorter one is tried.
  folly::Optional<Found> longestPrefix(
    KeyWindow search,
    bool wordBoundaryOnly = true) const;

  Iterator begin(Order order = Order::BreadthFirst) const;
  Iterator end() const {
    return Iterator();
  }

  // Iterate the subtree under the node where `prefix` ends. Yields nothing
  // if the prefix runs past the tree.
  Iterator iterate(KeyWindow prefix, Order order = Order::BreadthFirst) const;

  std::vector<std::string> keys() const;

  // Logs every violated structural invariant.
  bool validate() const;

  Stats stats() const;

  void dump(std::ostream& s) const;

  // {key, value, children} per node or null if empty.
  folly::dynamic toDynamic(
    folly::FunctionRef<folly::dynamic(Slot)> value) const;

private:
  Impl * FOLLY_NULLABLE impl;
};

inline std::ostream& operator<<(std::ostream& s, const Tree& tree) {
  tree.dump(s);
  return s;
}

inline std::ostream& operator<<(std::ostream& s, const Tree::Stats& stats) {
  return s
    << " nodes: " << stats.nodes
    << " values: " << stats.values
    << " branches: " << stats.branches
    << " keysz: " << stats.key_size
    << " depth: " << stats.depth;
}

}
