#include "trendbook/feed/bar_feed.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace trendbook {

// -----------------------------------------------------------------------------
// prevContext: previous-bar view used by signal decisions
// -----------------------------------------------------------------------------
domain::PrevBarContext IBarFeed::prevContext(std::size_t index) const {
  domain::PrevBarContext ctx;
  if (index < 2 || index >= size()) {
    return ctx;
  }
  const domain::Bar& prev = bar(index - 1);
  ctx.valid = true;
  ctx.close_prev = prev.close;
  ctx.indicators = prev.indicators;
  return ctx;
}

// -----------------------------------------------------------------------------
// VectorBarFeed
// -----------------------------------------------------------------------------
VectorBarFeed::VectorBarFeed(std::string symbol, std::vector<domain::Bar> bars)
    : symbol_(std::move(symbol)), bars_(std::move(bars)) {
  if (symbol_.empty()) {
    throw std::invalid_argument("VectorBarFeed: symbol must not be empty");
  }
  for (std::size_t i = 1; i < bars_.size(); ++i) {
    if (bars_[i].date <= bars_[i - 1].date) {
      throw std::invalid_argument("VectorBarFeed " + symbol_ +
                                  ": dates not strictly increasing at " +
                                  format_date(bars_[i].date));
    }
  }
}

std::optional<std::size_t> VectorBarFeed::indexOf(Date date) const {
  auto it = std::lower_bound(
      bars_.begin(), bars_.end(), date,
      [](const domain::Bar& b, Date d) { return b.date < d; });
  if (it == bars_.end() || it->date != date) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - bars_.begin());
}

}  // namespace trendbook
