/**
 * @file ParsedOptions.cpp
 * @brief Implementation of the ordered option mapping.
 */

#include "src/input/inc/ParsedOptions.hpp"

#include <utility>

namespace kcheck {

namespace input {

bool ParsedOptions::insert(std::string name, std::string value) {
  if (index_.find(name) != index_.end()) {
    return false;
  }
  index_.emplace(name, entries_.size());
  entries_.push_back(ParsedOption{std::move(name), std::move(value)});
  return true;
}

void ParsedOptions::assign(std::string name, std::string value) {
  const auto IT = index_.find(name);
  if (IT != index_.end()) {
    entries_[IT->second].value = std::move(value);
    return;
  }
  index_.emplace(name, entries_.size());
  entries_.push_back(ParsedOption{std::move(name), std::move(value)});
}

const std::string* ParsedOptions::find(std::string_view name) const noexcept {
  const auto IT = index_.find(name);
  if (IT == index_.end()) {
    return nullptr;
  }
  return &entries_[IT->second].value;
}

} // namespace input

} // namespace kcheck
