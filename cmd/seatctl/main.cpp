#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/catalog/flight_catalog.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/reservation_engine.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/render/records.hpp"
#include "internal/service/reservation_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

static void Usage() {
  std::cerr << "Usage:\n"
            << "  seatctl [--state-file <path>] [--config <file.yaml>] <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  search [--departing-city C] [--arriving-city C] [--departure-time T] [--arrival-time T] [--departure-date YYYY-MM-DD]\n"
            << "  seats <flight_id>\n"
            << "  hold <flight_id> --customer C (--seats 12A,12B | --count N) [--hold-minutes M]\n"
            << "  purchase <hold_id>\n"
            << "  cancel <purchase_id>\n"
            << "  debug\n"
            << "  admin-add-flight --departure-city C --arrival-city C --departure-airport AAA --arrival-airport AAA\n"
            << "                   --departure-datetime YYYY-MM-DDTHH:MM --arrival-datetime YYYY-MM-DDTHH:MM [--rows N] [--flight-id ID]\n"
            << "  admin-list-flights\n";
}

namespace {

const std::set<std::string> kCommands = {"search", "seats", "hold", "purchase", "cancel", "debug", "admin-add-flight", "admin-list-flights"};

struct UsageError {
  std::string message;
};

/*
  Positional arguments plus "--name value" options of one subcommand.
*/
class CommandArgs {
 public:
  CommandArgs(int argc, char** argv, int start, const std::set<std::string>& allowed) {
    for (int i = start; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.rfind("--", 0) != 0) {
        positional_.push_back(std::move(arg));
        continue;
      }
      auto name = arg.substr(2);
      if (allowed.count(name) == 0) {
        throw UsageError{"unknown option: " + arg};
      }
      if (i + 1 >= argc) {
        throw UsageError{"missing value for " + arg};
      }
      options_[name] = argv[++i];
    }
  }

  std::optional<std::string> Get(const std::string& name) const {
    auto it = options_.find(name);
    if (it == options_.end()) return std::nullopt;
    return it->second;
  }

  std::string Require(const std::string& name) const {
    auto value = Get(name);
    if (!value) throw UsageError{"missing required option --" + name};
    return *value;
  }

  std::optional<int> GetInt(const std::string& name) const {
    auto value = Get(name);
    if (!value) return std::nullopt;
    char* end    = nullptr;
    long  parsed = std::strtol(value->c_str(), &end, 10);
    if (value->empty() || *end != '\0' || parsed < -1000000 || parsed > 1000000) {
      throw UsageError{"--" + name + " expects an integer, got '" + *value + "'"};
    }
    return static_cast<int>(parsed);
  }

  const std::string& Positional(std::size_t expected_count, const char* what) const {
    if (positional_.size() != expected_count) {
      throw UsageError{std::string("expected ") + what};
    }
    return positional_.front();
  }

  void NoPositional() const {
    if (!positional_.empty()) {
      throw UsageError{"unexpected argument: " + positional_.front()};
    }
  }

 private:
  std::vector<std::string>           positional_;
  std::map<std::string, std::string> options_;
};

std::vector<std::string> SplitSeats(const std::string& raw) {
  std::vector<std::string> seats;
  std::string              current;
  for (char c : raw) {
    if (c == ',') {
      seats.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  seats.push_back(current);
  return seats;
}

seat::util::TimePoint ParseAdminDateTime(const std::string& raw, const std::string& field) {
  auto parsed = seat::util::ParseMinuteDateTime(raw);
  if (!parsed) {
    throw seat::util::InvalidRequest("Invalid " + field + ". Use 'YYYY-MM-DDTHH:MM' (or 'YYYY-MM-DD HH:MM').");
  }
  return *parsed;
}

// ------------------------------------------------------------

int RunCommand(const std::string& cmd, int argc, char** argv, int start, seat::service::ReservationService& svc) {
  if (cmd == "search") {
    CommandArgs args(argc, argv, start, {"departing-city", "arriving-city", "departure-time", "arrival-time", "departure-date"});
    args.NoPositional();

    seat::catalog::FlightQuery query;
    query.departing_city = args.Get("departing-city");
    query.arriving_city  = args.Get("arriving-city");
    query.departure_time = args.Get("departure-time");
    query.arrival_time   = args.Get("arrival-time");
    query.departure_date = args.Get("departure-date");

    seat::render::PrintFlights(std::cout, svc.SearchFlights(query));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "seats") {
    CommandArgs args(argc, argv, start, {});
    const auto& flight_id = args.Positional(1, "<flight_id>");

    seat::render::PrintSeats(std::cout, flight_id, svc.ViewSeats(flight_id));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "hold") {
    CommandArgs args(argc, argv, start, {"customer", "seats", "count", "hold-minutes"});

    seat::core::ReserveRequest req;
    req.flight_id = args.Positional(1, "<flight_id>");
    req.customer  = args.Require("customer");
    if (auto seats = args.Get("seats")) {
      req.seats = SplitSeats(*seats);
    }
    req.count = args.GetInt("count");
    if (auto minutes = args.GetInt("hold-minutes")) {
      req.hold_ttl = std::chrono::minutes(*minutes);
    }

    seat::render::PrintHoldCreated(std::cout, svc.Reserve(req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "purchase") {
    CommandArgs args(argc, argv, start, {});
    seat::render::PrintPurchaseCompleted(std::cout, svc.Purchase(args.Positional(1, "<hold_id>")));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    CommandArgs args(argc, argv, start, {});
    seat::render::PrintPurchaseCancelled(std::cout, svc.Cancel(args.Positional(1, "<purchase_id>")));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "debug") {
    CommandArgs args(argc, argv, start, {});
    args.NoPositional();
    seat::render::PrintDebug(std::cout, svc.Debug());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "admin-add-flight") {
    CommandArgs args(argc, argv, start,
                     {"departure-city", "arrival-city", "departure-airport", "arrival-airport", "departure-datetime", "arrival-datetime", "rows",
                      "flight-id"});
    args.NoPositional();

    seat::catalog::NewFlight req;
    req.departure_city    = args.Require("departure-city");
    req.arrival_city      = args.Require("arrival-city");
    req.departure_airport = args.Require("departure-airport");
    req.arrival_airport   = args.Require("arrival-airport");
    req.departure_at      = ParseAdminDateTime(args.Require("departure-datetime"), "departure datetime");
    req.arrival_at        = ParseAdminDateTime(args.Require("arrival-datetime"), "arrival datetime");
    req.rows              = args.GetInt("rows").value_or(seat::catalog::kDefaultRows);
    req.flight_id         = args.Get("flight-id");

    seat::render::PrintFlightAdded(std::cout, svc.AddFlight(req));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "admin-list-flights") {
    CommandArgs args(argc, argv, start, {});
    args.NoPositional();
    seat::render::PrintFlights(std::cout, svc.ListFlights());
    return 0;
  }

  throw UsageError{"unknown command: " + cmd};
}

} // namespace

int main(int argc, char** argv) {
  std::optional<std::string> state_file;
  std::optional<std::string> config_path;

  int i = 1;
  for (; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--state-file" && i + 1 < argc) {
      state_file = argv[++i];
      continue;
    }
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    }
    break;
  }

  if (i >= argc) {
    Usage();
    return 1;
  }
  const std::string cmd = argv[i];
  if (kCommands.count(cmd) == 0) {
    std::cerr << "ERROR: unknown command: " << cmd << "\n";
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    seat::runtime::config::RuntimeConfig config;
    if (config_path) {
      config = seat::config::ConfigLoader::LoadFromYaml(*config_path);
    }
    seat::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (loads or seeds state)
    // ------------------------------------------------------------
    seat::factory::BuildOverrides overrides;
    overrides.state_file = state_file;
    auto app             = seat::factory::Build(config, overrides);

    int rc = RunCommand(cmd, argc, argv, i + 1, *app.service);
    seat::observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << "ERROR: " << e.message << "\n";
    Usage();
    seat::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    seat::observability::ShutdownLogging();
    return 2;
  }
}
