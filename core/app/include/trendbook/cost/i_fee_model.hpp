#pragma once

namespace trendbook {

// -----------------------------------------------------------------------------
// IFeeModel: transaction fee capability
// -----------------------------------------------------------------------------
//
// @brief  Returns the fee charged on a trade of the given notional.
//
// @details
// Implementations are immutable after construction and shared between the
// InstrumentSpec that selects them and any copies of that spec.
//
// Ownership:
//   Held by InstrumentSpec through std::shared_ptr<const IFeeModel>.
// -----------------------------------------------------------------------------
class IFeeModel {
 public:
  virtual ~IFeeModel() = default;

  // @param  notional  Trade notional. Only its magnitude is used.
  // @return Non-negative fee in currency units.
  virtual double fee(double notional) const = 0;
};

}  // namespace trendbook
