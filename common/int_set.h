#ifndef COMMON_INT_SET_H_
#define COMMON_INT_SET_H_

#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "common/hb_set_unique_ptr.h"
#include "hb.h"

namespace common {

class IntSet;

class IntSetIterator {
 public:
  using iterator_category = std::forward_iterator_tag;
  using value_type = hb_codepoint_t;
  using difference_type = std::ptrdiff_t;
  using pointer = const hb_codepoint_t*;
  using reference = hb_codepoint_t;

 private:
  friend class IntSet;

  const hb_set_t* set_ = nullptr;  // nullptr signals we are at the end.
  hb_codepoint_t current_ = HB_SET_VALUE_INVALID;

  explicit IntSetIterator(const hb_set_t* set)
      : set_(set), current_(HB_SET_VALUE_INVALID) {
    // Iteration starts on the first element.
    ++(*this);
  }

 public:
  IntSetIterator() = default;

  reference operator*() const { return current_; }

  IntSetIterator& operator++() {
    if (set_ && !hb_set_next(set_, &current_)) {
      set_ = nullptr;
      current_ = HB_SET_VALUE_INVALID;
    }
    return *this;
  }

  IntSetIterator operator++(int) {
    IntSetIterator temp = *this;
    ++(*this);
    return temp;
  }

  friend bool operator==(const IntSetIterator& a, const IntSetIterator& b) {
    return a.set_ == b.set_ && a.current_ == b.current_;
  }

  friend bool operator!=(const IntSetIterator& a, const IntSetIterator& b) {
    return !(a == b);
  }
};

/**
 * Set of unsigned 32 bit integers backed by a harfbuzz hb_set_t*.
 *
 * Used for the code point and glyph id sets carried by lint filters. hb_set_t
 * stores ranges compactly, so large code point ranges are cheap.
 */
class IntSet {
 public:
  using iterator = IntSetIterator;
  using const_iterator = IntSetIterator;

  IntSet() : set_(make_hb_set()) {}

  IntSet(std::initializer_list<hb_codepoint_t> values) : set_(make_hb_set()) {
    for (auto v : values) {
      insert(v);
    }
  }

  IntSet(const IntSet& other) : set_(make_hb_set()) {
    hb_set_union(set_.get(), other.set_.get());
  }

  IntSet& operator=(const IntSet& other) {
    if (this != &other) {
      hb_set_clear(set_.get());
      hb_set_union(set_.get(), other.set_.get());
    }
    return *this;
  }

  IntSet(IntSet&& other) noexcept : set_(make_hb_set()) {
    // swap pointers so that the moved set is still in a valid state.
    set_.swap(other.set_);
  }

  IntSet& operator=(IntSet&& other) noexcept {
    set_.swap(other.set_);
    return *this;
  }

  bool operator==(const IntSet& other) const {
    return hb_set_is_equal(set_.get(), other.set_.get());
  }

  bool operator!=(const IntSet& other) const { return !(*this == other); }

  const_iterator begin() const { return const_iterator(set_.get()); }
  const_iterator end() const { return const_iterator(); }

  void insert(hb_codepoint_t value) { hb_set_add(set_.get(), value); }

  // Adds every value in [first, last].
  void insert_range(hb_codepoint_t first, hb_codepoint_t last) {
    hb_set_add_range(set_.get(), first, last);
  }

  bool contains(hb_codepoint_t value) const {
    return hb_set_has(set_.get(), value);
  }

  uint64_t size() const { return hb_set_get_population(set_.get()); }

  bool empty() const { return hb_set_is_empty(set_.get()); }

  // Formats the set as a space separated list of values and inclusive
  // ranges, eg. "3 5-7 9". With hex, values are written as zero padded hex
  // digits, which is how code point filters are written in lint specs.
  std::string ToString(bool hex = false) const {
    std::vector<std::string> parts;
    hb_codepoint_t first = HB_SET_VALUE_INVALID;
    hb_codepoint_t last = HB_SET_VALUE_INVALID;
    while (hb_set_next_range(set_.get(), &first, &last)) {
      if (first == last) {
        parts.push_back(Format(first, hex));
      } else {
        parts.push_back(
            absl::StrCat(Format(first, hex), "-", Format(last, hex)));
      }
    }
    return absl::StrJoin(parts, " ");
  }

 private:
  static std::string Format(hb_codepoint_t value, bool hex) {
    if (hex) {
      return absl::StrCat(absl::Hex(value, absl::kZeroPad4));
    }
    return absl::StrCat(value);
  }

  // Note: set_ always points to a valid set that this object exclusively
  // owns. The pointer is never exposed, so the contents can't change outside
  // of this class.
  hb_set_unique_ptr set_;
};

}  // namespace common

#endif  // COMMON_INT_SET_H_
