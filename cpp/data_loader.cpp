#include "data_loader.hpp"

#include "errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace kalman_basis {

namespace {

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && (std::isspace(static_cast<unsigned char>(s[b])) || s[b] == '"')) ++b;
  while (e > b && (std::isspace(static_cast<unsigned char>(s[e - 1])) || s[e - 1] == '"')) --e;
  return s.substr(b, e - b);
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string field;
  std::istringstream ss(line);
  while (std::getline(ss, field, ',')) fields.push_back(trim(field));
  if (!line.empty() && line.back() == ',') fields.emplace_back();
  return fields;
}

bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  const std::size_t start = s[0] == '-' ? 1 : 0;
  if (start == s.size()) return false;
  return std::all_of(s.begin() + start, s.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

std::ptrdiff_t column_index(const std::vector<std::string>& header, const std::string& name) {
  const auto it = std::find(header.begin(), header.end(), name);
  return it == header.end() ? -1 : std::distance(header.begin(), it);
}

}  // namespace

Timestamp parse_timestamp(const std::string& text) {
  const std::string s = trim(text);
  if (all_digits(s)) return std::stoll(s);

  std::string normalized = s;
  std::replace(normalized.begin(), normalized.end(), 'T', ' ');
  std::tm tm{};
  std::istringstream in(normalized);
  in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (in.fail()) throw DataError("bad timestamp '" + text + "'");

  Timestamp millis = 0;
  if (in.peek() == '.') {
    in.get();
    int digits = 0;
    while (std::isdigit(in.peek()) && digits < 3) {
      millis = millis * 10 + (in.get() - '0');
      ++digits;
    }
    for (; digits < 3; ++digits) millis *= 10;
  }
  return static_cast<Timestamp>(timegm(&tm)) * 1000 + millis;
}

std::string format_timestamp(Timestamp ts) {
  Timestamp secs = ts / 1000;
  Timestamp millis = ts % 1000;
  if (millis < 0) {
    millis += 1000;
    --secs;
  }
  const std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (millis != 0) out << '.' << std::setw(3) << std::setfill('0') << millis;
  return out.str();
}

std::vector<PricePoint> read_price_csv(std::istream& in, const std::string& source) {
  std::string line;
  if (!std::getline(in, line)) throw DataError(source + ": empty file");
  if (!line.empty() && line.back() == '\r') line.pop_back();
  const auto header = split_csv_line(line);
  const auto ts_col = column_index(header, "timestamp");
  const auto close_col = column_index(header, "close");
  if (ts_col < 0 || close_col < 0) {
    throw DataError(source + ": header needs 'timestamp' and 'close' columns");
  }
  const auto needed = static_cast<std::size_t>(std::max(ts_col, close_col));

  std::vector<PricePoint> points;
  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;
    const auto fields = split_csv_line(line);
    if (fields.size() <= needed) {
      throw DataError(source + ":" + std::to_string(line_no) + ": too few columns");
    }
    PricePoint p{};
    try {
      p.timestamp = parse_timestamp(fields[ts_col]);
      p.close = std::stod(fields[close_col]);
    } catch (const std::logic_error& e) {
      throw DataError(source + ":" + std::to_string(line_no) + ": " + e.what());
    } catch (const DataError& e) {
      throw DataError(source + ":" + std::to_string(line_no) + ": " + e.what());
    }
    points.push_back(p);
  }
  return points;
}

std::vector<PricePoint> load_price_csv(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw DataError("cannot open '" + path + "'");
  auto points = read_price_csv(in, path);
  spdlog::info("[DataLoader] {} rows from {}", points.size(), path);
  return points;
}

std::vector<PricePoint> preprocess(std::vector<PricePoint> points) {
  std::unordered_set<Timestamp> seen;
  std::vector<PricePoint> out;
  out.reserve(points.size());
  for (const auto& p : points) {
    if (seen.insert(p.timestamp).second) out.push_back(p);
  }
  if (out.size() != points.size()) {
    spdlog::warn("[DataLoader] dropped {} duplicate timestamps", points.size() - out.size());
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const PricePoint& a, const PricePoint& b) { return a.timestamp < b.timestamp; });
  return out;
}

std::vector<ObservationPair> join_on_timestamp(const std::vector<PricePoint>& perp,
                                               const std::vector<PricePoint>& future) {
  std::vector<ObservationPair> out;
  out.reserve(std::min(perp.size(), future.size()));
  std::size_t i = 0;
  std::size_t j = 0;
  while (i < perp.size() && j < future.size()) {
    if (perp[i].timestamp < future[j].timestamp) {
      ++i;
    } else if (future[j].timestamp < perp[i].timestamp) {
      ++j;
    } else {
      out.push_back({perp[i].timestamp, future[j].close, perp[i].close});
      ++i;
      ++j;
    }
  }
  return out;
}

std::vector<ObservationPair> load_observations(const std::string& perp_path,
                                               const std::string& future_path) {
  const auto perp = preprocess(load_price_csv(perp_path));
  const auto future = preprocess(load_price_csv(future_path));
  auto joined = join_on_timestamp(perp, future);
  spdlog::info("[DataLoader] {} aligned observations ({} perp, {} future)", joined.size(),
               perp.size(), future.size());
  return joined;
}

void write_trade_log_csv(std::ostream& out, const std::vector<TradeLogEntry>& trade_log) {
  out << "timestamp,position,zscore,spread,hedge_ratio,realized_pnl,unrealized_pnl,equity,"
         "entry_signal,exit_signal\n";
  out << std::setprecision(17);
  for (const auto& row : trade_log) {
    out << format_timestamp(row.timestamp) << ',' << to_int(row.position) << ',' << row.zscore
        << ',' << row.spread << ',' << row.hedge_ratio << ',' << row.realized_pnl << ','
        << row.unrealized_pnl << ',' << row.equity << ',' << (row.entry_signal ? "True" : "False")
        << ',' << (row.exit_signal ? "True" : "False") << '\n';
  }
}

void save_trade_log_csv(const std::string& path, const std::vector<TradeLogEntry>& trade_log) {
  const std::filesystem::path parent = std::filesystem::path(path).parent_path();
  std::error_code ec;
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  if (ec) throw DataError("cannot create '" + parent.string() + "': " + ec.message());
  std::ofstream out(path);
  if (!out) throw DataError("cannot write '" + path + "'");
  write_trade_log_csv(out, trade_log);
  if (!out) throw DataError("write failed for '" + path + "'");
  spdlog::info("[DataLoader] saved {} trade log rows to {}", trade_log.size(), path);
}

}  // namespace kalman_basis
