/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 * All rights reserved.
 *
 * This source code is licensed under the BSD-style license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

namespace tokentrie {

struct Options {
  // When false, stored keys are lower-cased on insertion and search text is
  // lower-cased character by character during matching.
  bool caseSensitive = false;

  // In a stored key, matches any single character. Lookups also treat it as
  // matching in the search text; insertion compares it literally. Must not
  // be an upper case letter unless caseSensitive is set.
  char wildcard = '*';
};

}
