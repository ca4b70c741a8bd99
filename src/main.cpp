#include "app.hpp"
#include "git_repository.hpp"
#include "log.hpp"
#include "user_interaction.hpp"
#include <exception>

/**
 * Program entry point: parse options, then run the selected command against
 * the repository in the working directory.
 */
int main(int argc, char **argv) {
  stud::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    return ret;
  }
  try {
    stud::GitRepository repo;
    auto provider = app.make_provider(repo);
    stud::ConsoleInteraction ui;
    stud::Console console;
    return app.execute(repo, provider.get(), ui, console);
  } catch (const std::exception &e) {
    stud::category_logger("app")->error("{}", e.what());
    return 1;
  }
}
