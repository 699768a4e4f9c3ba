#pragma once
#include <iosfwd>

namespace gitcli {

class App {
public:
  App();
  App(std::ostream &out, std::ostream &err);

  // 0 on success, 1 when git or parsing fails, 2 on usage errors
  int run(int argc, char **argv);

private:
  std::ostream &out_;
  std::ostream &err_;
};

} // namespace gitcli
