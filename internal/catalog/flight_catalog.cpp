#include "flight_catalog.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace seat::catalog {

namespace {

std::string Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
  return std::string(value);
}

std::string Lower(std::string value) {
  for (auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return value;
}

std::string Upper(std::string value) {
  for (auto& c : value) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return value;
}

std::string NormalizeAirport(const std::string& raw, const char* which, const char* example) {
  auto code = Upper(Trim(raw));
  const bool alpha = std::all_of(code.begin(), code.end(), [](char c) { return std::isalpha(static_cast<unsigned char>(c)); });
  if (code.size() != 3 || !alpha) {
    throw util::InvalidRequest(std::string(which) + " airport must be a 3-letter IATA code (e.g. " + example + ").");
  }
  return code;
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  return Lower(haystack).find(Lower(Trim(needle))) != std::string::npos;
}

model::Flight CopyLocked(FlightCatalog::Entry& entry) {
  std::lock_guard lock(entry.mutex);
  return entry.flight;
}

} // namespace

model::Flight BuildFlight(const NewFlight& request) {
  if (request.rows <= 0) {
    throw util::InvalidRequest("rows must be > 0.");
  }
  if (request.departure_at >= request.arrival_at) {
    throw util::InvalidRequest("departure time must be before arrival time.");
  }

  model::Flight flight;
  flight.departure_city    = Trim(request.departure_city);
  flight.arrival_city      = Trim(request.arrival_city);
  flight.departure_airport = NormalizeAirport(request.departure_airport, "departure", "SFO");
  flight.arrival_airport   = NormalizeAirport(request.arrival_airport, "arrival", "PDX");
  if (flight.departure_city.empty() || flight.arrival_city.empty()) {
    throw util::InvalidRequest("departure and arrival city are required.");
  }

  flight.departure_at   = request.departure_at;
  flight.arrival_at     = request.arrival_at;
  flight.departure_date = util::FormatDate(request.departure_at);

  const auto explicit_id = request.flight_id ? Trim(*request.flight_id) : std::string{};
  flight.id = explicit_id.empty()
                  ? "F-" + flight.departure_airport + "-" + flight.arrival_airport + "-" + util::FormatIdStamp(request.departure_at)
                  : explicit_id;

  flight.seat_map = model::SeatMap::WithRows(request.rows);
  return flight;
}

bool Matches(const model::Flight& flight, const FlightQuery& query) {
  if (query.departing_city && !ContainsIgnoreCase(flight.departure_city, *query.departing_city)) return false;
  if (query.arriving_city && !ContainsIgnoreCase(flight.arrival_city, *query.arriving_city)) return false;
  if (query.departure_time && util::FormatCompact(flight.departure_at).find(Trim(*query.departure_time)) == std::string::npos) return false;
  if (query.arrival_time && util::FormatCompact(flight.arrival_at).find(Trim(*query.arrival_time)) == std::string::npos) return false;
  if (query.departure_date) {
    // blank date means no filter
    const auto date = Trim(*query.departure_date);
    if (!date.empty() && flight.departure_date != date) return false;
  }
  return true;
}

void SortByDeparture(std::vector<model::Flight>& flights) {
  std::sort(flights.begin(), flights.end(), [](const model::Flight& a, const model::Flight& b) {
    if (a.departure_at != b.departure_at) return a.departure_at < b.departure_at;
    return a.id < b.id;
  });
}

std::vector<NewFlight> DefaultSeedFlights() {
  NewFlight sfo_pdx;
  sfo_pdx.departure_city    = "San Francisco";
  sfo_pdx.arrival_city      = "Portland";
  sfo_pdx.departure_airport = "SFO";
  sfo_pdx.arrival_airport   = "PDX";
  sfo_pdx.departure_at      = util::MakeUtc(2025, 3, 1, 8, 45);
  sfo_pdx.arrival_at        = util::MakeUtc(2025, 3, 1, 10, 5);
  sfo_pdx.rows              = kDefaultRows;
  sfo_pdx.flight_id         = "F-SFO-PDX-20250301-0845";
  return {sfo_pdx};
}

// ------------------------------------------------------------
// FlightCatalog
// ------------------------------------------------------------

model::Flight FlightCatalog::Add(model::Flight flight) {
  std::unique_lock lock(mutex_);
  if (flights_.find(flight.id) != flights_.end()) {
    throw util::AlreadyExists("flight_id already exists: " + flight.id);
  }

  auto entry = std::make_shared<Entry>(std::move(flight));
  flights_.emplace(entry->flight.id, entry);
  return entry->flight;
}

std::shared_ptr<FlightCatalog::Entry> FlightCatalog::Get(const std::string& flight_id) const {
  auto entry = Find(flight_id);
  if (!entry) {
    throw util::UnknownFlight(flight_id);
  }
  return entry;
}

std::shared_ptr<FlightCatalog::Entry> FlightCatalog::Find(const std::string& flight_id) const {
  std::shared_lock lock(mutex_);
  auto             it = flights_.find(flight_id);
  if (it == flights_.end()) return nullptr;
  return it->second;
}

std::vector<std::shared_ptr<FlightCatalog::Entry>> FlightCatalog::Entries() const {
  std::shared_lock                    lock(mutex_);
  std::vector<std::shared_ptr<Entry>> entries;
  entries.reserve(flights_.size());
  for (const auto& [_, entry] : flights_) {
    entries.push_back(entry);
  }
  return entries;
}

std::vector<model::Flight> FlightCatalog::List() const {
  std::vector<model::Flight> flights;
  for (const auto& entry : Entries()) {
    flights.push_back(CopyLocked(*entry));
  }
  SortByDeparture(flights);
  return flights;
}

std::vector<model::Flight> FlightCatalog::Search(const FlightQuery& query) const {
  std::vector<model::Flight> flights;
  for (const auto& entry : Entries()) {
    // route and timing never change, only the copy needs the lock
    if (!Matches(entry->flight, query)) continue;
    flights.push_back(CopyLocked(*entry));
  }
  SortByDeparture(flights);
  return flights;
}

void FlightCatalog::Clear() {
  std::unique_lock lock(mutex_);
  flights_.clear();
}

std::size_t FlightCatalog::size() const {
  std::shared_lock lock(mutex_);
  return flights_.size();
}

} // namespace seat::catalog
