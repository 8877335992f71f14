#ifndef COMMON_HB_SET_UNIQUE_PTR_H_
#define COMMON_HB_SET_UNIQUE_PTR_H_

#include <memory>

#include "hb.h"

namespace common {

struct HbSetDeleter {
  void operator()(hb_set_t* set) const { hb_set_destroy(set); }
};

typedef std::unique_ptr<hb_set_t, HbSetDeleter> hb_set_unique_ptr;

inline hb_set_unique_ptr make_hb_set() {
  return hb_set_unique_ptr(hb_set_create());
}

}  // namespace common

#endif  // COMMON_HB_SET_UNIQUE_PTR_H_
