#include "unique_name.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <random>

namespace soilhex::util {

std::string UniqueToken() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return fmt::format("{}.{:016x}{:016x}", ::getpid(), rng(), rng());
}

} // namespace soilhex::util
