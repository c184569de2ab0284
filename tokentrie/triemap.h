/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 * All rights reserved.
 *
 * This source code is licensed under the BSD-style license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "tokentrie/trie.h"

#include <boost/iterator/iterator_facade.hpp>
#include <folly/DynamicConverter.h>
#include <folly/json.h>

#include <initializer_list>
#include <iterator>
#include <type_traits>

namespace tokentrie {

/**
 * A map from strings to T backed by a radix Tree, intended as a tokenizer
 * building block: keys and search text can be windows into a larger buffer,
 * stored keys may contain a single-character wildcard and lookups can find
 * the longest stored prefix of some text.
 *
 * Keys are case insensitive, and stored lower-cased, unless
 * Options::caseSensitive is set.
 */
template<typename T>
class TrieMap final {
public:
  using key_type = std::string;
  using mapped_type = T;
  using value_type = std::pair<std::string, T>;
  using Order = Tree::Order;

  class iterator : public boost::iterator_facade<
      iterator,
      value_type,
      boost::single_pass_traversal_tag,
      std::pair<const std::string&, const T&>> {
  public:
    iterator() = default;

  private:
    friend class TrieMap;
    friend class boost::iterator_core_access;

    iterator(Tree::Iterator it, const std::vector<T> *values)
      : it(std::move(it)), values(values) {}

    std::pair<const std::string&, const T&> dereference() const {
      return {it.getKey(), (*values)[it.slot()]};
    }

    void increment() {
      it.next();
    }

    bool equal(const iterator& other) const {
      return it == other.it;
    }

    Tree::Iterator it;
    const std::vector<T> * FOLLY_NULLABLE values = nullptr;
  };

  using const_iterator = iterator;

  // Every call to begin() starts a fresh traversal.
  class Range {
  public:
    iterator begin() const {
      return iterator(start, values);
    }

    iterator end() const {
      return iterator();
    }

  private:
    friend class TrieMap;

    Range(Tree::Iterator start, const std::vector<T> *values)
      : start(std::move(start)), values(values) {}

    Tree::Iterator start;
    const std::vector<T> *values;
  };

  explicit TrieMap(Options options = {}) : tree(options) {}

  TrieMap(
      std::initializer_list<std::pair<folly::StringPiece, T>> entries,
      Options options = {})
    : tree(options) {
    for (const auto& entry : entries) {
      set(entry.first, entry.second);
    }
  }

  template<
    typename Entries,
    typename = std::enable_if_t<
      !std::is_same_v<std::decay_t<Entries>, TrieMap>>,
    typename = decltype(std::begin(std::declval<const Entries&>()))>
  explicit TrieMap(const Entries& entries, Options options = {})
    : tree(options) {
    for (const auto& [key, value] : entries) {
      set(key, value);
    }
  }

  TrieMap(TrieMap&&) noexcept = default;
  TrieMap& operator=(TrieMap&&) noexcept = default;

  const Options& options() const noexcept {
    return tree.options();
  }

  bool empty() const noexcept {
    return tree.empty();
  }

  size_t size() const noexcept {
    return tree.size();
  }

  void clear() noexcept {
    tree.clear();
    values.clear();
  }

  // Exact match.
  const T * FOLLY_NULLABLE get(const KeyWindow& key) const {
    const auto slot = tree.find(key);
    return slot.hasValue() ? &values[*slot] : nullptr;
  }

  void set(const KeyWindow& key, T value) {
    const auto [slot, fresh] =
      tree.insert(key.range(), static_cast<Tree::Slot>(values.size()));
    if (fresh) {
      values.push_back(std::move(value));
    } else {
      values[slot] = std::move(value);
    }
  }

  /// The stored key (as stored, i.e. lower-cased for case insensitive maps)
  /// and value of the longest key which is a prefix of the search window.
  folly::Optional<value_type> findByLongestPrefix(
      const KeyWindow& search,
      bool wordBoundaryOnly = true) const {
    auto found = tree.longestPrefix(search, wordBoundaryOnly);
    if (!found) {
      return folly::none;
    }
    return value_type(std::move(found->key), values[found->slot]);
  }

  Range iterate(Order order = Order::BreadthFirst) const {
    return Range(tree.begin(order), &values);
  }

  Range iterate(
      const KeyWindow& prefix, Order order = Order::BreadthFirst) const {
    return Range(tree.iterate(prefix, order), &values);
  }

  iterator begin() const {
    return iterator(tree.begin(), &values);
  }

  iterator end() const {
    return iterator();
  }

  std::vector<std::string> keys() const {
    return tree.keys();
  }

  bool validate() const {
    if (tree.size() != values.size()) {
      LOG(ERROR) << "TrieMap::validate: " << values.size()
        << " values for " << tree.size() << " keys";
      return false;
    }
    return tree.validate();
  }

  Tree::Stats stats() const {
    return tree.stats();
  }

  void dump(std::ostream& s) const {
    tree.dump(s);
  }

  // Debugging export, not meant to be read back.
  folly::dynamic toDynamic() const {
    return tree.toDynamic([&](Tree::Slot slot) {
      return folly::toDynamic(values[slot]);
    });
  }

  std::string toJson() const {
    return folly::toJson(toDynamic());
  }

private:
  Tree tree;
  std::vector<T> values;
};

template<typename T>
std::ostream& operator<<(std::ostream& s, const TrieMap<T>& map) {
  map.dump(s);
  return s;
}

}
