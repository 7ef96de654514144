/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <fmt/format.h>

/// Prints the value of an engaged optional, "none" otherwise
template <typename T>
  requires fmt::is_formattable<T>::value
struct fmt::formatter<std::optional<T>> : fmt::formatter<T> {
  template <typename FormatContext>
  auto format(const std::optional<T> &opt, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (opt.has_value()) {
      return fmt::formatter<T>::format(*opt, ctx);
    }
    return fmt::format_to(ctx.out(), "none");
  }
};
