#include "parastore/model/ids.hpp"

#include <mutex>
#include <random>
#include <string_view>

namespace parastore::model {

namespace {

constexpr std::string_view kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";

bool is_alphabet_char(const char ch) { return kAlphabet.find(ch) != std::string_view::npos; }

} // namespace

std::string generate_id(const std::string &prefix) {
  static std::mutex rng_mutex;
  static std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);

  std::string id = prefix + "_";
  std::lock_guard<std::mutex> lock(rng_mutex);
  for (std::size_t i = 0; i < kIdSuffixLength; ++i) {
    id.push_back(kAlphabet[pick(rng)]);
  }
  return id;
}

std::string generate_project_id() { return generate_id(kProjectIdPrefix); }
std::string generate_area_id() { return generate_id(kAreaIdPrefix); }
std::string generate_contact_id() { return generate_id(kContactIdPrefix); }
std::string generate_inbox_id() { return generate_id(kInboxIdPrefix); }
std::string generate_resource_id() { return generate_id(kResourceIdPrefix); }
std::string generate_template_id() { return generate_id(kTemplateIdPrefix); }

bool is_valid_id(const std::string &id, const std::string &prefix) {
  const std::string expected = prefix + "_";
  if (id.size() != expected.size() + kIdSuffixLength || id.rfind(expected, 0) != 0) {
    return false;
  }
  for (std::size_t i = expected.size(); i < id.size(); ++i) {
    if (!is_alphabet_char(id[i])) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> id_prefix(const std::string &id) {
  const auto underscore = id.find('_');
  if (underscore == std::string::npos || underscore == 0) {
    return std::nullopt;
  }
  return id.substr(0, underscore);
}

std::optional<std::string> id_suffix(const std::string &id) {
  const auto underscore = id.find('_');
  if (underscore == std::string::npos || underscore + 1 >= id.size()) {
    return std::nullopt;
  }
  return id.substr(underscore + 1);
}

} // namespace parastore::model
