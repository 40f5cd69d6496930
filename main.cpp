// -----------------------------------------------------------------------------
// tradekernel_demo — walks one trade through the kernel end to end.
//
//   1) Load KernelConfig from argv[1] when given, defaults otherwise.
//   2) Create a SimulationTimeProvider so every timestamp is deterministic.
//   3) Create the TradeLedger and subscribe a logger to its EventBus.
//   4) Price a market buy against an order-book snapshot.
//   5) Place, submit and fill the entry order; open a LONG position from it.
//   6) Advance the clock and close the position at take profit.
//   7) Print the book, the estimate, the order and the position as JSON.
//
// A DomainError anywhere aborts the run: it is printed as JSON on stderr and
// the process exits with status 1.
// -----------------------------------------------------------------------------

#include "tradekernel/book/order_book_level.hpp"
#include "tradekernel/book/order_book_snapshot.hpp"
#include "tradekernel/config/kernel_config.hpp"
#include "tradekernel/domain/errors.hpp"
#include "tradekernel/domain/fill.hpp"
#include "tradekernel/domain/order_parameters.hpp"
#include "tradekernel/engine/trade_ledger.hpp"
#include "tradekernel/events/event.hpp"
#include "tradekernel/serialization/json.hpp"
#include "tradekernel/time/simulation_time_provider.hpp"
#include "tradekernel/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace tk = tradekernel;
namespace domain = tradekernel::domain;

constexpr std::int64_t kSessionStartMs = 1704067200000;  // 2024-01-01 UTC

void logUpdates(tk::EventBus& bus, int decimals) {
  bus.subscribe<tk::OrderUpdateEvent>([](const tk::OrderUpdateEvent& e) {
    std::cout << "[Ledger] #" << e.sequence_id << " order "
              << e.order.id().value() << " "
              << (e.previous_status ? domain::toString(*e.previous_status)
                                    : "NEW")
              << " -> " << domain::toString(e.order.status()) << "\n";
  });

  bus.subscribe<tk::PositionUpdateEvent>(
      [decimals](const tk::PositionUpdateEvent& e) {
        std::cout << "[Ledger] #" << e.sequence_id << " position "
                  << e.position.id().value() << " "
                  << (e.previous_status ? domain::toString(*e.previous_status)
                                        : "NEW")
                  << " -> " << domain::toString(e.position.status());
        if (e.position.realizedPnL()) {
          std::cout << " realized="
                    << e.position.realizedPnL()->format(decimals);
        }
        std::cout << "\n";
      });
}

int run(const tk::KernelConfig& config) {
  tk::SimulationTimeProvider clock(kSessionStartMs);
  tk::TradeLedger ledger(clock, config);
  logUpdates(ledger.bus(), config.display_decimals);

  const auto btc = domain::Asset::crypto("BTC");
  const auto usdt = domain::Asset::stablecoin("USDT");
  const auto pair = domain::TradingPair::from(btc, usdt);

  const auto level = [&](double price, double quantity) {
    return domain::OrderBookLevel::from(domain::Price::from(price, pair),
                                        domain::Amount::from(quantity, btc));
  };

  // -------------------------------------------------------------------------
  // Order book and pre-trade estimate
  // -------------------------------------------------------------------------
  const auto book = domain::OrderBookSnapshot::from(
      pair, {level(49900, 0.4), level(49800, 1.2), level(49700, 2.0)},
      {level(50100, 0.3), level(50200, 0.5), level(50300, 1.0)},
      tk::ms_to_timestamp(clock.now_ms()));

  const auto size = domain::Amount::from(0.5, btc);
  const auto estimate = book.estimateMarketBuy(size, config.liquidity_mode);

  std::cout << "[main] " << book.toString() << "\n"
            << "[main] bid liquidity (" << config.depth_levels << " levels): "
            << book.bidLiquidity(config.depth_levels)
                   .format(config.display_decimals)
            << "\n";

  // -------------------------------------------------------------------------
  // Entry order and its execution
  // -------------------------------------------------------------------------
  const auto entry_id =
      ledger.placeOrder(domain::OrderParameters::marketBuy(pair, size));
  const auto exchange_id = domain::ExchangeOrderId::from("EX-1001");
  ledger.submitOrder(entry_id, exchange_id);

  clock.advance_by(150);
  const auto fee = estimate.total_cost.multiply(0.001);
  const auto entry_order = ledger.applyFill(
      entry_id,
      domain::Fill::from({pair, exchange_id, estimate.filled_quantity,
                          estimate.average_price, fee,
                          tk::ms_to_timestamp(clock.now_ms()), "T-1"}));

  // -------------------------------------------------------------------------
  // Position lifecycle
  // -------------------------------------------------------------------------
  const auto position_id = ledger.openPosition(
      {pair, domain::PositionSide::Long, book.bestAsk().price(),
       domain::Price::from(49000, pair), domain::Price::from(52000, pair),
       size, entry_id, "demo-agent", std::string("breakout")});
  ledger.linkEntryFill(position_id, entry_id);
  ledger.updateStopLoss(position_id, domain::Price::from(49500, pair));
  ledger.tagPosition(position_id, {{"session", "2024-01-01"}});

  clock.advance_by(4 * 60 * 60 * 1000);
  const auto exit_price = domain::Price::from(52010, pair);
  const auto exit_fee =
      exit_price.convertToQuote(entry_order.totalFilledQuantity())
          .multiply(0.001);
  const auto position = ledger.closePosition(
      position_id, exit_price, domain::PositionExitReason::TakeProfit,
      exit_fee);

  nlohmann::json report{{"book", book},
                        {"estimate", estimate},
                        {"order", ledger.order(entry_id)},
                        {"position", position}};
  std::cout << report.dump(2) << "\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const tk::KernelConfig config =
        argc > 1 ? tk::loadKernelConfig(argv[1]) : tk::KernelConfig{};
    std::cout << "[main] profile=" << domain::toString(config.position_profile)
              << " liquidity=" << domain::toString(config.liquidity_mode)
              << "\n";
    return run(config);
  } catch (const tk::DomainError& e) {
    nlohmann::json error;
    tk::to_json(error, e);
    std::cerr << "[main] ERROR: " << error.dump() << "\n";
    return 1;
  }
}
