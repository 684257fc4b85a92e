// core/entry.cpp - Catalog entry implementation
#include "entry.hpp"
#include "../utils.hpp"

namespace saveli {

std::optional<PathError> SavePath::resolve() {
  fs::path expanded;
  if (auto err = resolve_save_path(raw, expanded)) {
    return err;
  }
  raw = trim(raw);
  resolved = expanded;
  return std::nullopt;
}

std::optional<PathError> Entry::resolve() {
  for (auto &save : saves) {
    if (auto err = save.resolve()) {
      return err;
    }
  }
  return std::nullopt;
}

Entry Entry::from_json(const json::Value &value) {
  Entry entry;
  entry.title = value.at("title").as_string();
  entry.id = value.at("id").as_string();

  if (const json::Value *custom = value.find("custom")) {
    entry.custom = custom->as_bool();
  }

  for (const auto &save : value.at("saves").items()) {
    SavePath sp;
    sp.id = save.at("id").as_string();
    sp.raw = save.at("path").as_string();
    entry.saves.push_back(sp);
  }

  return entry;
}

json::Value Entry::to_json() const {
  json::Value obj = json::Value::object();
  obj["title"] = json::Value(title);
  obj["id"] = json::Value(id);
  if (custom) {
    obj["custom"] = json::Value(true);
  }

  json::Value save_list = json::Value::array();
  for (const auto &save : saves) {
    json::Value s = json::Value::object();
    s["id"] = json::Value(save.id);
    s["path"] = json::Value(save.raw);
    save_list.push_back(s);
  }
  obj["saves"] = save_list;

  return obj;
}

bool operator==(const Entry &a, const Entry &b) { return a.id == b.id; }

bool operator!=(const Entry &a, const Entry &b) { return !(a == b); }

bool operator<(const Entry &a, const Entry &b) {
  if (a.id != b.id) {
    return a.id < b.id;
  }
  if (a.custom != b.custom) {
    return a.custom;
  }
  return a.title < b.title;
}

} // namespace saveli
