#ifndef STUD_USER_INTERACTION_HPP
#define STUD_USER_INTERACTION_HPP

#include <iostream>
#include <istream>
#include <ostream>
#include <string>

namespace stud {

/**
 * Command output written to stdout.
 *
 * Kept apart from logging so that results stay visible at any log level.
 */
class Console {
public:
  explicit Console(std::ostream &out = std::cout) : out_(out) {}

  /// Print one line.
  void line(const std::string &text);

  /// Print a line indented as a list item.
  void item(const std::string &text);

  std::ostream &stream() { return out_; }

private:
  std::ostream &out_;
};

/** Asks the user yes/no questions. */
class UserInteraction {
public:
  virtual ~UserInteraction() = default;

  /**
   * @param prompt Question without the answer hint.
   * @param default_answer Answer used for an empty reply.
   * @return The user's decision.
   */
  virtual bool confirm(const std::string &prompt, bool default_answer) = 0;
};

/**
 * Line based confirmation on a pair of streams.
 *
 * An empty reply or end of input selects the default; `y`/`yes` in any case
 * accepts and anything else declines.
 */
class ConsoleInteraction : public UserInteraction {
public:
  ConsoleInteraction(std::istream &in = std::cin, std::ostream &out = std::cout)
      : in_(in), out_(out) {}

  bool confirm(const std::string &prompt, bool default_answer) override;

private:
  std::istream &in_;
  std::ostream &out_;
};

} // namespace stud

#endif // STUD_USER_INTERACTION_HPP
