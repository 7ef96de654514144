/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/verdict.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace nexus::primitives {

  std::string_view toString(Verdict verdict) {
    switch (verdict) {
      case Verdict::Malicious:
        return "malicious";
      case Verdict::Benign:
        return "benign";
      case Verdict::Suspicious:
        return "suspicious";
      case Verdict::Unknown:
        return "unknown";
    }
    return "unknown";
  }

  std::optional<Verdict> verdictFromString(std::string_view str) {
    for (auto verdict : kVerdicts) {
      if (boost::algorithm::iequals(str, toString(verdict))) {
        return verdict;
      }
    }
    return std::nullopt;
  }

}  // namespace nexus::primitives
