#pragma once

#include "trendbook/domain/bar.hpp"
#include "trendbook/time/date.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trendbook {

// -----------------------------------------------------------------------------
// IBarFeed: random-access daily bars with precomputed indicators
// -----------------------------------------------------------------------------
//
// @brief  Read-only, 0-based, integer-indexed view of one instrument's
//         history. Dates are strictly increasing.
//
// @details
// Data ingestion and indicator computation happen upstream; the backtest
// core only reads. Traders hold a shared_ptr<const IBarFeed> and index it
// directly; the engine uses indexOf() to map grid dates onto each feed.
//
// Ownership:
//   Shared between the caller that built it and the SignalTrader that
//   reads it.
// -----------------------------------------------------------------------------
class IBarFeed {
 public:
  virtual ~IBarFeed() = default;

  virtual const std::string& symbol() const = 0;
  virtual std::size_t size() const = 0;

  // @pre index < size()
  virtual const domain::Bar& bar(std::size_t index) const = 0;

  // Index of the bar dated exactly `date`, or nullopt.
  virtual std::optional<std::size_t> indexOf(Date date) const = 0;

  // -------------------------------------------------------------------------
  // prevContext
  // -------------------------------------------------------------------------
  // @brief  Close and indicators of bar `index - 1`.
  //
  // @return PrevBarContext with valid == false when index < 2 or index is
  //         out of range. Indicator fields may still be NaN when valid.
  // -------------------------------------------------------------------------
  domain::PrevBarContext prevContext(std::size_t index) const;
};

// -----------------------------------------------------------------------------
// VectorBarFeed: in-memory IBarFeed over a std::vector<Bar>
// -----------------------------------------------------------------------------
class VectorBarFeed final : public IBarFeed {
 public:
  // @throws std::invalid_argument  if symbol is empty or dates are not
  //                                strictly increasing.
  VectorBarFeed(std::string symbol, std::vector<domain::Bar> bars);

  const std::string& symbol() const override { return symbol_; }
  std::size_t size() const override { return bars_.size(); }
  const domain::Bar& bar(std::size_t index) const override {
    return bars_[index];
  }
  std::optional<std::size_t> indexOf(Date date) const override;

 private:
  std::string symbol_;
  std::vector<domain::Bar> bars_;
};

}  // namespace trendbook
