/**
 * CSV input (processed close prices per instrument) and trade log output.
 *
 * Price files carry a header row with at least `timestamp` and `close`
 * columns. Timestamps are integer milliseconds or "YYYY-MM-DD HH:MM:SS" UTC.
 */

#ifndef KALMAN_BASIS_CPP_DATA_LOADER_HPP_
#define KALMAN_BASIS_CPP_DATA_LOADER_HPP_

#include "types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace kalman_basis {

struct PricePoint {
  Timestamp timestamp;
  double close;
};

/** Throws DataError on a malformed timestamp. */
Timestamp parse_timestamp(const std::string& text);
/** "YYYY-MM-DD HH:MM:SS", milliseconds appended only when non-zero. */
std::string format_timestamp(Timestamp ts);

std::vector<PricePoint> read_price_csv(std::istream& in, const std::string& source = "<stream>");
std::vector<PricePoint> load_price_csv(const std::string& path);

/** Drop repeated timestamps (first occurrence wins), then sort ascending. */
std::vector<PricePoint> preprocess(std::vector<PricePoint> points);

/** Inner join on timestamp. Both inputs must be preprocessed. */
std::vector<ObservationPair> join_on_timestamp(const std::vector<PricePoint>& perp,
                                               const std::vector<PricePoint>& future);

/** Load, preprocess and join the two processed price files. */
std::vector<ObservationPair> load_observations(const std::string& perp_path,
                                               const std::string& future_path);

void write_trade_log_csv(std::ostream& out, const std::vector<TradeLogEntry>& trade_log);
void save_trade_log_csv(const std::string& path, const std::vector<TradeLogEntry>& trade_log);

}  // namespace kalman_basis

#endif  // KALMAN_BASIS_CPP_DATA_LOADER_HPP_
