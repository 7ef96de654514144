/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace nexus {

  /// Overload set built from lambdas, one per variant alternative
  template <typename... Lambdas>
  struct Overloaded : Lambdas... {
    using Lambdas::operator()...;
  };

  /**
   * @brief Visits \param variant with the lambda accepting its active
   * alternative:
   * @code
   *   visit_in_place(event,
   *                  [](const BountyCompleted &e) { ... },
   *                  [](const PayoutFailed &e) { ... });
   * @nocode
   * Every alternative must be covered, a missing one is a compile error.
   */
  template <typename Variant, typename... Lambdas>
  constexpr decltype(auto) visit_in_place(Variant &&variant,
                                          Lambdas &&...lambdas) {
    return std::visit(
        Overloaded<std::decay_t<Lambdas>...>{std::forward<Lambdas>(lambdas)...},
        std::forward<Variant>(variant));
  }

}  // namespace nexus
