/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 * All rights reserved.
 *
 * This source code is licensed under the BSD-style license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "tokentrie/trie.h"

#include <folly/Overload.h>
#include <folly/ScopeGuard.h>
#include <folly/String.h>
#include <glog/logging.h>

#include <algorithm>
#include <cassert>

namespace tokentrie {

namespace {

inline char lowerAscii(char c) {
  return c >= 'A' && c <= 'Z' ? static_cast<char>(c + ('a' - 'A')) : c;
}

inline bool isUpperAscii(char c) {
  return c >= 'A' && c <= 'Z';
}

// A character which continues a word, so that a match ending just before it
// isn't a whole token. Only ASCII letters count.
inline bool isNonBoundary(char c) {
  const auto l = lowerAscii(c);
  return l >= 'a' && l <= 'z';
}

}

struct Tree::Node {
  std::string key;
  folly::Optional<Slot> value;
  NodeId parent = NONE;
  std::vector<NodeId> children;
};

struct Tree::Impl {
  Options options;
  std::vector<Node> nodes;
  NodeId root = NONE;
  size_t count = 0;

  explicit Impl(Options opts) : options(opts) {}

  NodeId alloc(std::string key, folly::Optional<Slot> value, NodeId parent) {
    CHECK_LT(nodes.size(), size_t(NONE)) << "too many trie nodes";
    const auto id = static_cast<NodeId>(nodes.size());
    nodes.push_back(Node{std::move(key), value, parent, {}});
    return id;
  }

  // The stored side has already been lower-cased if the tree is case
  // insensitive. A wildcard in the compared text only counts when `either`
  // is set; keys being inserted never match through their own wildcards.
  bool charsEqual(char stored, char c, bool either) const {
    if (stored == options.wildcard || (either && c == options.wildcard)) {
      return true;
    }
    return stored == (options.caseSensitive ? c : lowerAscii(c));
  }

  Match match(
      folly::StringPiece segment,
      const KeyWindow& window,
      bool either) const {
    size_t index;
    for (index = 0; window.pos + index < window.posMax; ++index) {
      if (index >= segment.size() || !charsEqual(segment[index], window.at(index), either)) {
        if (index > 0 || segment.empty()) {
          return PartialMatch{index};
        } else {
          return NoMatch{};
        }
      }
    }
    if (index == segment.size()) {
      return FullMatch{};
    } else {
      return PartialMatch{index};
    }
  }

  void replaceChild(NodeId parent, NodeId from, NodeId to) {
    if (parent == NONE) {
      DCHECK_EQ(root, from);
      root = to;
    } else {
      auto& children = nodes[parent].children;
      auto i = std::find(children.begin(), children.end(), from);
      DCHECK(i != children.end());
      *i = to;
    }
  }

  folly::Optional<Closest> closest(KeyWindow& window, bool either) const;

  void dump(NodeId id, std::ostream& s, int indent) const;
  folly::dynamic toDynamic(
    NodeId id, folly::FunctionRef<folly::dynamic(Slot)> value) const;
};

folly::Optional<Tree::Closest> Tree::Impl::closest(
    KeyWindow& window,
    bool either) const {
  if (root == NONE) {
    return folly::none;
  }
  DCHECK_LE(window.pos, window.posMax);
  DCHECK_LE(window.posMax, window.data.size());

  const auto& top = nodes[root];
  const auto first = match(top.key, window, either);
  auto partial = std::get_if<PartialMatch>(&first);
  if (partial == nullptr) {
    return Closest{
      root,
      first,
      top.key,
      std::holds_alternative<FullMatch>(first) ? window.size() : 0};
  }

  const auto origin = window.pos;
  SCOPE_EXIT {
    window.pos = origin;
  };

  Closest result{root, first, top.key, partial->index};
  auto index = partial->index;
  window.pos += index;
  while (index == nodes[result.node].key.size()) {
    auto next = NONE;
    for (auto child : nodes[result.node].children) {
      const auto& node = nodes[child];
      const auto m = match(node.key, window, either);
      if (std::holds_alternative<FullMatch>(m)) {
        return Closest{
          child,
          m,
          result.fullKey + node.key,
          result.consumed + node.key.size()};
      }
      auto p = std::get_if<PartialMatch>(&m);
      if (p != nullptr && p->index > 0) {
        next = child;
        index = p->index;
        break;
      }
    }
    if (next == NONE) {
      break;
    }
    result.node = next;
    result.match = PartialMatch{index};
    result.fullKey += nodes[next].key;
    result.consumed += index;
    window.pos += index;
  }
  return result;
}

Tree::Tree(Options options) : impl(new Impl(options)) {
  DCHECK(options.caseSensitive || !isUpperAscii(options.wildcard))
    << "wildcard '" << options.wildcard
    << "' would be lower-cased out of stored keys";
}

Tree::~Tree() noexcept {
  delete impl;
}

const Options& Tree::options() const noexcept {
  return impl->options;
}

void Tree::clear() noexcept {
  impl->nodes.clear();
  impl->root = NONE;
  impl->count = 0;
}

bool Tree::empty() const noexcept {
  return impl->root == NONE;
}

size_t Tree::size() const noexcept {
  return impl->count;
}

folly::Optional<Tree::Closest> Tree::closest(KeyWindow& window) const {
  return impl->closest(window, true);
}

folly::Optional<Tree::Slot> Tree::find(KeyWindow key) const {
  const auto result = closest(key);
  if (result && std::holds_alternative<FullMatch>(result->match)) {
    return impl->nodes[result->node].value;
  }
  return folly::none;
}

std::pair<Tree::Slot, bool> Tree::insert(folly::StringPiece k, Slot slot) {
  auto key = k.str();
  if (!impl->options.caseSensitive) {
    folly::toLowerAscii(key);
  }

  if (impl->root == NONE) {
    impl->root = impl->alloc(key, slot, NONE);
    ++impl->count;
    return {slot, true};
  }

  KeyWindow window(key);
  const auto result = impl->closest(window, false);
  DCHECK(result.hasValue());
  const auto id = result->node;
  const auto consumed = result->consumed;

  const auto ins = folly::variant_match(
    result->match,
    [&](NoMatch) -> std::pair<Slot, bool> {
      // Nothing in common with the root, so hang the old root and the new
      // key off an empty one.
      const auto old = impl->root;
      const auto root = impl->alloc(std::string(), folly::none, NONE);
      const auto leaf = impl->alloc(key, slot, root);
      impl->nodes[old].parent = root;
      impl->nodes[root].children = {old, leaf};
      impl->root = root;
      VLOG(2) << "split root for '" << key << "'";
      return {slot, true};
    },
    [&](PartialMatch m) -> std::pair<Slot, bool> {
      const auto node_key_size = impl->nodes[id].key.size();
      if (consumed == key.size() && m.index < node_key_size) {
        // The key ends inside the node's segment: insert a parent holding
        // the value.
        const auto parent = impl->nodes[id].parent;
        const auto fresh = impl->alloc(
          impl->nodes[id].key.substr(0, m.index), slot, parent);
        auto& node = impl->nodes[id];
        node.key.erase(0, m.index);
        node.parent = fresh;
        impl->nodes[fresh].children.push_back(id);
        impl->replaceChild(parent, id, fresh);
        VLOG(2) << "inserted parent '" << impl->nodes[fresh].key << "'";
      } else if (m.index < node_key_size) {
        // Divergence inside the node's segment: the node keeps the common
        // prefix and becomes a branch point, its old contents move down.
        DCHECK_LT(consumed, key.size());
        const auto demoted = impl->alloc(
          impl->nodes[id].key.substr(m.index),
          impl->nodes[id].value,
          id);
        const auto leaf = impl->alloc(key.substr(consumed), slot, id);
        auto& node = impl->nodes[id];
        impl->nodes[demoted].children = std::move(node.children);
        for (auto child : impl->nodes[demoted].children) {
          impl->nodes[child].parent = demoted;
        }
        node.key.resize(m.index);
        node.value = folly::none;
        node.children = {demoted, leaf};
        VLOG(2) << "split '" << node.key << "' + '"
          << impl->nodes[demoted].key << "'";
      } else {
        const auto leaf = impl->alloc(key.substr(consumed), slot, id);
        impl->nodes[id].children.push_back(leaf);
        VLOG(2) << "appended '" << impl->nodes[leaf].key << "'";
      }
      return {slot, true};
    },
    [&](FullMatch) -> std::pair<Slot, bool> {
      auto& node = impl->nodes[id];
      if (node.value.hasValue()) {
        return {*node.value, false};
      }
      node.value = slot;
      return {slot, true};
    });

  if (ins.second) {
    ++impl->count;
  }
  return ins;
}

folly::Optional<Tree::Found> Tree::longestPrefix(
    KeyWindow search,
    bool wordBoundaryOnly) const {
  const auto limit = search.posMax;
  while (true) {
    auto result = closest(search);
    if (!result) {
      return folly::none;
    }
    auto id = result->node;
    auto& fullKey = result->fullKey;
    const bool found = folly::variant_match(
      result->match,
      [](NoMatch) { return false; },
      [&](FullMatch) { return impl->nodes[id].value.hasValue(); },
      [&](PartialMatch m) {
        if (m.index == impl->nodes[id].key.size()) {
          return impl->nodes[id].value.hasValue();
        }
        // Fell short inside the node's own segment: back off to the nearest
        // ancestor which carries a value.
        auto node = id;
        while (node != NONE) {
          fullKey.resize(fullKey.size() - impl->nodes[node].key.size());
          node = impl->nodes[node].parent;
          if (node != NONE && impl->nodes[node].value.hasValue()) {
            break;
          }
        }
        id = node;
        return node != NONE;
      });
    if (!found) {
      return folly::none;
    }

    if (wordBoundaryOnly) {
      const auto end = search.pos + fullKey.size();
      if (end < limit && isNonBoundary(search.data[end])) {
        if (fullKey.empty()) {
          return folly::none;
        }
        search.posMax = end - 1;
        continue;
      }
    }
    return Found{std::move(fullKey), *impl->nodes[id].value};
  }
}

Tree::Iterator::Iterator(
    const Impl *impl, NodeId start, std::string key, Order order)
  : impl(impl), order(order) {
  work.emplace_back(start, std::move(key));
  next();
}

Tree::Slot Tree::Iterator::slot() const {
  assert(node != NONE);
  return *impl->nodes[node].value;
}

void Tree::Iterator::next() {
  node = NONE;
  while (!work.empty()) {
    std::pair<NodeId, std::string> item;
    if (order == Order::BreadthFirst) {
      item = std::move(work.front());
      work.pop_front();
    } else {
      item = std::move(work.back());
      work.pop_back();
    }
    const auto& n = impl->nodes[item.first];
    if (order == Order::BreadthFirst) {
      for (auto child : n.children) {
        work.emplace_back(child, item.second + impl->nodes[child].key);
      }
    } else {
      // reversed so that the first child is popped first
      for (auto i = n.children.rbegin(); i != n.children.rend(); ++i) {
        work.emplace_back(*i, item.second + impl->nodes[*i].key);
      }
    }
    if (n.value.hasValue()) {
      node = item.first;
      key = std::move(item.second);
      return;
    }
  }
}

Tree::Iterator Tree::begin(Order order) const {
  if (impl->root == NONE) {
    return {};
  }
  return Iterator(impl, impl->root, impl->nodes[impl->root].key, order);
}

Tree::Iterator Tree::iterate(KeyWindow prefix, Order order) const {
  auto result = closest(prefix);
  if (!result || std::holds_alternative<NoMatch>(result->match)) {
    return {};
  }
  return Iterator(impl, result->node, std::move(result->fullKey), order);
}

std::vector<std::string> Tree::keys() const {
  std::vector<std::string> v;
  for (auto i = begin(); !i.done(); i.next()) {
    v.push_back(i.getKey());
  }
  return v;
}

bool Tree::validate() const {
  if (impl->root == NONE) {
    if (impl->count != 0) {
      LOG(ERROR) << "Tree::validate: empty tree with count " << impl->count;
      return false;
    }
    return true;
  }

  bool ok = true;
  if (impl->nodes[impl->root].parent != NONE) {
    LOG(ERROR) << "Tree::validate: root has a parent";
    ok = false;
  }

  std::vector<bool> seen(impl->nodes.size(), false);
  std::vector<NodeId> stack{impl->root};
  size_t values = 0;
  while (!stack.empty()) {
    const auto id = stack.back();
    stack.pop_back();
    if (seen[id]) {
      LOG(ERROR) << "Tree::validate: node " << id << " reachable twice";
      ok = false;
      continue;
    }
    seen[id] = true;

    const auto& node = impl->nodes[id];
    if (node.value.hasValue()) {
      ++values;
    }
    if (id != impl->root && node.key.empty()) {
      LOG(ERROR) << "Tree::validate: empty segment at node " << id;
      ok = false;
    }
    if (!impl->options.caseSensitive
        && std::any_of(node.key.begin(), node.key.end(), isUpperAscii)) {
      LOG(ERROR) << "Tree::validate: upper case segment '" << node.key << "'";
      ok = false;
    }

    const auto wildcard = impl->options.wildcard;
    for (size_t i = 0; i < node.children.size(); ++i) {
      const auto& child = impl->nodes[node.children[i]];
      if (child.parent != id) {
        LOG(ERROR) << "Tree::validate: invalid parent (expected " << id
          << ", got " << child.parent << ")";
        ok = false;
      }
      if (child.key.empty()) {
        continue;
      }
      for (size_t j = 0; j < i; ++j) {
        const auto& sibling = impl->nodes[node.children[j]];
        if (!sibling.key.empty()
            && child.key[0] != wildcard
            && sibling.key[0] != wildcard
            && child.key[0] == sibling.key[0]) {
          LOG(ERROR) << "Tree::validate: siblings '" << sibling.key
            << "' and '" << child.key << "' share a prefix";
          ok = false;
        }
      }
      stack.push_back(node.children[i]);
    }
  }

  const auto reachable = std::count(seen.begin(), seen.end(), true);
  if (static_cast<size_t>(reachable) != impl->nodes.size()) {
    LOG(ERROR) << "Tree::validate: "
      << impl->nodes.size() - static_cast<size_t>(reachable)
      << " unreachable nodes";
    ok = false;
  }
  if (values != impl->count) {
    LOG(ERROR) << "Tree::validate: " << values << " values, expected "
      << impl->count;
    ok = false;
  }
  return ok;
}

Tree::Stats Tree::stats() const {
  Stats s;
  if (impl->root == NONE) {
    return s;
  }
  std::vector<std::pair<NodeId, size_t>> stack{{impl->root, 1}};
  while (!stack.empty()) {
    const auto [id, depth] = stack.back();
    stack.pop_back();
    const auto& node = impl->nodes[id];
    ++s.nodes;
    if (node.value.hasValue()) {
      ++s.values;
    } else {
      ++s.branches;
    }
    s.key_size += node.key.size();
    s.depth = std::max(s.depth, depth);
    for (auto child : node.children) {
      stack.emplace_back(child, depth + 1);
    }
  }
  return s;
}

namespace {

struct spaces {
  int n;
  explicit spaces(int n) : n(n) {}
};

std::ostream& operator<<(std::ostream& s, spaces x) {
  return s << std::string(x.n, ' ');
}

}

void Tree::Impl::dump(NodeId id, std::ostream& s, int indent) const {
  const auto& node = nodes[id];
  s << spaces(indent) << '[' << node.key << ']';
  if (node.value.hasValue()) {
    s << " = " << *node.value;
  }
  s << std::endl;
  for (auto child : node.children) {
    dump(child, s, indent + 2);
  }
}

void Tree::dump(std::ostream& s) const {
  if (impl->root != NONE) {
    s << "TREE" << std::endl;
    impl->dump(impl->root, s, 2);
  } else {
    s << "TREE {}" << std::endl;
  }
}

folly::dynamic Tree::Impl::toDynamic(
    NodeId id, folly::FunctionRef<folly::dynamic(Slot)> value) const {
  const auto& node = nodes[id];
  auto children = folly::dynamic::array();
  for (auto child : node.children) {
    children.push_back(toDynamic(child, value));
  }
  return folly::dynamic::object
    ("key", node.key)
    ("value", node.value.hasValue() ? value(*node.value) : folly::dynamic(nullptr))
    ("children", std::move(children));
}

folly::dynamic Tree::toDynamic(
    folly::FunctionRef<folly::dynamic(Slot)> value) const {
  if (impl->root == NONE) {
    return nullptr;
  }
  return impl->toDynamic(impl->root, value);
}

}
