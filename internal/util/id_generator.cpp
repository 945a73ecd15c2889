#include "id_generator.hpp"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace seat::util {

namespace {

constexpr std::size_t kRandomIdDigits = 10;

// Random RFC4122 version 4 UUID rendered as 32 lowercase hex digits.
std::string RandomUuidHex() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::array<uint8_t, 16> id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(id.size() * 2);
  for (const auto b : id) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace

std::string RandomIdGenerator::Next(std::string_view prefix) {
  return std::string(prefix) + "-" + RandomUuidHex().substr(0, kRandomIdDigits);
}

std::string SequentialIdGenerator::Next(std::string_view prefix) {
  std::ostringstream oss;
  oss << prefix << '-' << std::setw(kRandomIdDigits) << std::setfill('0') << next_.fetch_add(1);
  return oss.str();
}

} // namespace seat::util
