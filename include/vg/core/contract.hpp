#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace vg::core {

// Reports a broken library-internal contract and terminates. Never used for
// errors a caller can provoke; those travel as result<...>.
[[noreturn]] inline void contract_violation(
    const char *expression,
    const std::source_location location =
        std::source_location::current()) noexcept {
  std::fprintf(stderr, "[vigil] precondition failed: %s at %s:%u in %s\n",
               expression, location.file_name(),
               static_cast<unsigned>(location.line()),
               location.function_name());
  std::abort();
}

} // namespace vg::core

#define vg_precondition(expr)                                                  \
  do {                                                                         \
    if (!(expr)) [[unlikely]] {                                                \
      ::vg::core::contract_violation(#expr);                                   \
    }                                                                          \
  } while (false)
