#include "json_file_state_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "state_codec.hpp"

namespace seat::store {

JsonFileStateStore::JsonFileStateStore(std::filesystem::path path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("JsonFileStateStore: empty path");
  }
}

std::optional<model::InventorySnapshot> JsonFileStateStore::Load() {
  std::lock_guard lock(mutex_);

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    if (ec) {
      throw std::runtime_error("failed to stat state file " + path_.string() + ": " + ec.message());
    }
    return std::nullopt;
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open state file " + path_.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  seat::inventory::v1::InventoryState state;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &state, options);
  if (!status.ok()) {
    throw std::runtime_error("corrupt state file " + path_.string() + ": " + std::string(status.message()));
  }

  return DecodeState(state);
}

void JsonFileStateStore::Save(const model::InventorySnapshot& snapshot) {
  std::lock_guard lock(mutex_);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(EncodeState(snapshot), &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode state: " + std::string(status.message()));
  }

  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path());
  }

  auto tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open " + tmp.string() + " for writing");
    }
    out << json;
    out.flush();
    if (!out) {
      throw std::runtime_error("failed to write " + tmp.string());
    }
  }

  std::filesystem::rename(tmp, path_);
}

} // namespace seat::store
