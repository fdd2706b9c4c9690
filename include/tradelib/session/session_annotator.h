/*
 * tradelib
 * Developed by the tradelib contributors
 *
 * Copyright (c) 2025 tradelib contributors
 * Licensed under the MIT License. See LICENSE file in the project root for full
 * license information.
 */

#pragma once

#include "tradelib/bar/bar.h"
#include "tradelib/bar/bars.h"
#include "tradelib/config/session_config.h"
#include "tradelib/util/base/time.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace tradelib
{

/**
 * Fills in Bar session fields from a chronological bar sequence.
 *
 * Bars whose timestamps fall on the same session day form one session. The last bar
 * of each session is flagged as session close; every bar gets the number of bars that
 * follow it within its session.
 */
class SessionAnnotator
{
 public:
  explicit SessionAnnotator(SessionConfig config = {});

  /// Annotates one symbol's bars and returns the number of sessions seen.
  /// Throws std::invalid_argument for a null entry or out-of-order timestamps, in
  /// which case no bar is modified.
  size_t annotate(std::span<const std::shared_ptr<Bar>> bars) const;

  /// Annotates every symbol found in a chronological sequence of cross-sections.
  /// Each symbol is scanned on its own, so a symbol missing from the last snapshot
  /// of a day still gets its own session close.
  size_t annotate(std::span<const Bars> snapshots) const;

  /// Session day index of a timestamp under this annotator's offset.
  int64_t sessionDay(TimePoint tp) const noexcept;

  const SessionConfig& config() const noexcept { return _config; }

 private:
  size_t annotateSeries(std::span<const std::shared_ptr<Bar>> bars) const;

  SessionConfig _config;
};

}  // namespace tradelib
