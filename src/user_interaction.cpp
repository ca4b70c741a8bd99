#include "user_interaction.hpp"
#include <algorithm>
#include <cctype>

namespace stud {

void Console::line(const std::string &text) { out_ << text << '\n'; }

void Console::item(const std::string &text) { out_ << "  - " << text << '\n'; }

bool ConsoleInteraction::confirm(const std::string &prompt,
                                 bool default_answer) {
  out_ << prompt << (default_answer ? " [Y/n]: " : " [y/N]: ");
  out_.flush();
  std::string resp;
  if (!std::getline(in_, resp)) {
    out_ << '\n';
    return default_answer;
  }
  resp.erase(std::remove_if(resp.begin(), resp.end(),
                            [](unsigned char c) { return std::isspace(c); }),
             resp.end());
  if (resp.empty()) {
    return default_answer;
  }
  std::transform(resp.begin(), resp.end(), resp.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return resp == "y" || resp == "yes";
}

} // namespace stud
