#include "pull_request_provider.hpp"
#include <nlohmann/json.hpp>

namespace stud {

namespace {

std::string string_field(const nlohmann::json &obj, const char *key) {
  if (!obj.is_object())
    return {};
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    return {};
  return it->get<std::string>();
}

std::string repo_full_name(const nlohmann::json &side) {
  if (!side.is_object())
    return {};
  auto repo = side.find("repo");
  if (repo == side.end())
    return {};
  return string_field(*repo, "full_name");
}

} // namespace

std::string to_string(PullRequestState state) {
  switch (state) {
  case PullRequestState::Open:
    return "open";
  case PullRequestState::Closed:
    return "closed";
  case PullRequestState::All:
    break;
  }
  return "all";
}

PullRequestRecord pull_request_from_json(const nlohmann::json &item) {
  PullRequestRecord pr;
  if (!item.is_object())
    return pr;
  auto number = item.find("number");
  if (number != item.end() && number->is_number_integer())
    pr.number = number->get<int>();
  pr.state = string_field(item, "state");
  auto head = item.find("head");
  if (head != item.end()) {
    pr.head_ref = string_field(*head, "ref");
    pr.head_repo = repo_full_name(*head);
  }
  auto base = item.find("base");
  if (base != item.end()) {
    pr.base_repo = repo_full_name(*base);
  }
  return pr;
}

} // namespace stud
