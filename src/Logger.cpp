#include "toolhost/Logger.hpp"

namespace toolhost {

// Single definition so every translation unit shares one logger
SupervisorLogger &SupervisorLogger::instance() {
  static SupervisorLogger logger;
  return logger;
}

} // namespace toolhost
