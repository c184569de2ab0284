/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 * All rights reserved.
 *
 * This source code is licensed under the BSD-style license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/Range.h>
#include <glog/logging.h>

#include <string>

namespace tokentrie {

/**
 * A zero-copy view of the half-open range [pos, posMax) of a larger buffer,
 * used as a key or as a search target.
 *
 * Preconditions (not checked in release builds):
 *   pos <= posMax <= data.size()
 *
 * The buffer must outlive the window.
 */
struct KeyWindow {
  folly::StringPiece data;
  size_t pos = 0;
  size_t posMax = 0;

  KeyWindow() = default;

  /* implicit */ KeyWindow(folly::StringPiece s)
    : data(s), pos(0), posMax(s.size()) {}

  /* implicit */ KeyWindow(const char *s)
    : KeyWindow(folly::StringPiece(s)) {}

  /* implicit */ KeyWindow(const std::string& s)
    : KeyWindow(folly::StringPiece(s)) {}

  KeyWindow(folly::StringPiece s, size_t pos, size_t posMax)
    : data(s), pos(pos), posMax(posMax) {
    DCHECK_LE(pos, posMax);
    DCHECK_LE(posMax, s.size());
  }

  size_t size() const {
    return posMax - pos;
  }

  bool empty() const {
    return pos >= posMax;
  }

  char at(size_t i) const {
    return data[pos + i];
  }

  folly::StringPiece range() const {
    return data.subpiece(pos, posMax - pos);
  }

  std::string str() const {
    return range().str();
  }
};

}
