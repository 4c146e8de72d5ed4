#pragma once

#include "trendbook/domain/side.hpp"
#include "trendbook/time/date.hpp"

namespace trendbook {

// -----------------------------------------------------------------------------
// ITaxModel: transaction tax capability
// -----------------------------------------------------------------------------
//
// @brief  Returns the tax charged on a trade. The effective rate may depend
//         on the trade date and the side; the ledger never hard-codes either.
//
// Ownership:
//   Held by InstrumentSpec through std::shared_ptr<const ITaxModel>.
// -----------------------------------------------------------------------------
class ITaxModel {
 public:
  virtual ~ITaxModel() = default;

  // @param  date      Trade date.
  // @param  side      Buy or Sell.
  // @param  notional  Trade notional. Only its magnitude is used.
  // @return Non-negative tax in currency units.
  virtual double tax(Date date, domain::Side side, double notional) const = 0;
};

}  // namespace trendbook
