#pragma once

namespace trendbook {

// -----------------------------------------------------------------------------
// IMarginModel: margin requirement capability
// -----------------------------------------------------------------------------
//
// @brief  Returns the cash that must stay reserved against a position of
//         `quantity` units at `price`.
//
// @details
// The ledger sums this over every held position (with a candidate quantity
// substituted for the symbol being traded) and rejects trades that would
// leave cash below the total.
//
// Ownership:
//   Held by InstrumentSpec through std::shared_ptr<const IMarginModel>.
// -----------------------------------------------------------------------------
class IMarginModel {
 public:
  virtual ~IMarginModel() = default;

  virtual double margin(double quantity, double price,
                        double multiplier) const = 0;
};

}  // namespace trendbook
