#pragma once

#include <string>

namespace soilhex::util {

/*
  Token that no other writer, in this or any other process, will produce:
      <pid>.<32 hex digits>
  Used for temporary file names next to their final destination.
*/
std::string UniqueToken();

} // namespace soilhex::util
