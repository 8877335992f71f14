#ifndef COMMON_TRY_H_
#define COMMON_TRY_H_

#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Evaluates an absl::StatusOr<T> expression, returning its status from the
// enclosing function on failure and otherwise yielding the contained value.
//
// Uses a GNU statement expression, supported by both gcc and clang.
#define TRY(expr)                                        \
  ({                                                     \
    auto try_result__ = (expr);                          \
    if (!try_result__.ok()) {                            \
      return std::move(try_result__).status();           \
    }                                                    \
    std::move(*try_result__);                            \
  })

// Evaluates an absl::Status expression and returns it from the enclosing
// function if it is not ok.
#define TRYV(expr)                      \
  do {                                  \
    absl::Status try_status__ = (expr); \
    if (!try_status__.ok()) {           \
      return try_status__;              \
    }                                   \
  } while (0)

#endif  // COMMON_TRY_H_
