#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/model/flight.hpp"
#include "internal/util/time.hpp"

namespace seat::catalog {

inline constexpr int kDefaultRows = 24;

struct NewFlight {
  std::string departure_city;
  std::string arrival_city;
  std::string departure_airport;
  std::string arrival_airport;

  util::TimePoint departure_at{};
  util::TimePoint arrival_at{};

  int                        rows = kDefaultRows;
  std::optional<std::string> flight_id;
};

// All set filters must match.
struct FlightQuery {
  std::optional<std::string> departing_city;  // case-insensitive substring
  std::optional<std::string> arriving_city;   // case-insensitive substring
  std::optional<std::string> departure_time;  // substring of "YYYYMMDD HH:MM:SS"
  std::optional<std::string> arrival_time;    // substring of "YYYYMMDD HH:MM:SS"
  std::optional<std::string> departure_date;  // exact "YYYY-MM-DD"
};

// Validates and normalizes the request; throws util::InvalidRequest.
model::Flight BuildFlight(const NewFlight& request);

bool Matches(const model::Flight& flight, const FlightQuery& query);

// Departure time, then id.
void SortByDeparture(std::vector<model::Flight>& flights);

// Flights created on the first run of an empty store.
std::vector<NewFlight> DefaultSeedFlights();

/*
  FlightCatalog

  Owns every flight. Route and timing fields are immutable once added; the seat
  map is only touched while holding the entry's mutex, which is the per-flight
  exclusive scope of the reservation engine. Flights are never removed, so an
  Entry stays valid for the catalog's lifetime.
*/
class FlightCatalog {
 public:
  struct Entry {
    explicit Entry(model::Flight f) : flight(std::move(f)) {
    }

    std::mutex    mutex;
    model::Flight flight;
  };

  // Throws util::AlreadyExists on a duplicate id.
  model::Flight Add(model::Flight flight);

  // Throws util::UnknownFlight.
  std::shared_ptr<Entry> Get(const std::string& flight_id) const;

  std::shared_ptr<Entry> Find(const std::string& flight_id) const;

  // Ordered by flight id; the order every multi-flight lock must follow.
  std::vector<std::shared_ptr<Entry>> Entries() const;

  // Copies taken under each flight's lock, sorted by departure.
  std::vector<model::Flight> List() const;
  std::vector<model::Flight> Search(const FlightQuery& query) const;

  void Clear();

  std::size_t size() const;

 private:
  mutable std::shared_mutex                      mutex_;
  std::map<std::string, std::shared_ptr<Entry>> flights_;
};

} // namespace seat::catalog
