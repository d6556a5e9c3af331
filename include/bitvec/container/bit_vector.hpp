#pragma once

#include <algorithm>
#include <bitvec/container/bit_slice.hpp>
#include <cassert>
#include <initializer_list>
#include <limits>
#include <memory>
#include <spdlog/spdlog.h>

namespace bitvec::detail {

/**
 * @ingroup container
 *
 * @brief Growable packed bit container.
 *
 * @tparam Order Bit-ordering policy within one element.
 * @tparam T Unsigned integral type used as storage element.
 * @tparam Allocator Allocator type for element storage.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
class BasicBitVector : private detail::BitContainerBase {
 public:
  using value_type = bool;
  using element_type = T;
  using order_type = Order;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using reference = detail::BitReference<Order, element_type>;
  using const_reference = bool;
  using iterator = detail::BitIterator<Order, element_type>;
  using const_iterator = detail::BitConstIterator<Order, element_type>;
  using pointer = iterator;
  using const_pointer = const_iterator;
  using reverse_iterator = std::reverse_iterator<iterator>;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;
  using slice_type = BitSlice<Order, element_type>;
  using const_slice_type = BitSlice<Order, const element_type>;
  using allocator_type = Allocator;
  using allocator_traits = std::allocator_traits<allocator_type>;

  constexpr static std::size_t bits_per_element = Bits<element_type>::width;

 private:
  element_type* begin_{};
  size_type size_{};
  size_type cap_{};
  /*[[no_unique_address]]*/ allocator_type alloc_{};

 public:
  constexpr BasicBitVector() noexcept(
    std::is_nothrow_default_constructible_v<allocator_type>);

  constexpr explicit BasicBitVector(const allocator_type& a) noexcept;

  constexpr ~BasicBitVector();

  constexpr explicit BasicBitVector(size_type n);

  constexpr BasicBitVector(size_type n, const allocator_type& a);

  constexpr BasicBitVector(size_type n, const value_type& x);

  constexpr BasicBitVector(size_type n, const value_type& x,
                           const allocator_type& a);

  constexpr BasicBitVector(std::input_iterator auto first,
                           std::input_iterator auto last);

  constexpr BasicBitVector(std::forward_iterator auto first,
                           std::forward_iterator auto last);

  constexpr BasicBitVector(std::forward_iterator auto first,
                           std::forward_iterator auto last,
                           const allocator_type& a);

  constexpr explicit BasicBitVector(const_slice_type s);

  constexpr BasicBitVector(const BasicBitVector& v);

  constexpr BasicBitVector(const BasicBitVector& v, const allocator_type& a);

  constexpr BasicBitVector&
  operator=(const BasicBitVector& v);

  constexpr BasicBitVector(std::initializer_list<value_type> il);

  constexpr BasicBitVector(std::initializer_list<value_type> il,
                           const allocator_type& a);

  constexpr BasicBitVector(BasicBitVector&& v) noexcept;

  constexpr BasicBitVector(BasicBitVector&& v, const allocator_type& a);

  constexpr BasicBitVector&
  operator=(BasicBitVector&& v) noexcept(
    allocator_traits::propagate_on_container_move_assignment::value
    || allocator_traits::is_always_equal::value);

  constexpr BasicBitVector&
  operator=(std::initializer_list<value_type> il) {
    assign(il.begin(), il.end());
    return *this;
  }

  constexpr void
  assign(std::forward_iterator auto first, std::forward_iterator auto last);

  constexpr void
  assign(size_type n, const value_type& x);

  constexpr void
  assign(std::initializer_list<value_type> il) {
    assign(il.begin(), il.end());
  }

  constexpr allocator_type
  get_allocator() const noexcept {
    return allocator_type(this->alloc_);
  }

  constexpr size_type
  max_size() const noexcept;

  /**
   * Returns the number of bits that can be held without reallocation.
   */
  constexpr size_type
  capacity() const noexcept {
    return internal_cap_to_external(cap_);
  }

  /**
   * Returns the number of stored bits.
   */
  constexpr size_type
  size() const noexcept {
    return size_;
  }

  /**
   * Returns the number of storage elements in use.
   */
  constexpr size_type
  num_elements() const noexcept {
    return empty() ? 0 : external_cap_to_internal(size());
  }

  [[nodiscard]] constexpr bool
  empty() const noexcept {
    return size_ == 0;
  }

  constexpr void
  reserve(size_type n);

  constexpr void
  shrink_to_fit();

  /** @name Iterators */
  /// @{
  constexpr iterator
  begin() noexcept {
    return make_iter(0);
  }

  constexpr const_iterator
  begin() const noexcept {
    return make_iter(0);
  }

  constexpr iterator
  end() noexcept {
    return make_iter(size_);
  }

  constexpr const_iterator
  end() const noexcept {
    return make_iter(size_);
  }

  constexpr reverse_iterator
  rbegin() noexcept {
    return reverse_iterator(end());
  }

  constexpr const_reverse_iterator
  rbegin() const noexcept {
    return const_reverse_iterator(end());
  }

  constexpr reverse_iterator
  rend() noexcept {
    return reverse_iterator(begin());
  }

  constexpr const_reverse_iterator
  rend() const noexcept {
    return const_reverse_iterator(begin());
  }

  constexpr const_iterator
  cbegin() const noexcept {
    return make_iter(0);
  }

  constexpr const_iterator
  cend() const noexcept {
    return make_iter(size_);
  }
  ///@}

  /** @name Element access */
  ///@{
  constexpr reference
  operator[](size_type n) {
    return *make_iter(n);
  }

  constexpr const_reference
  operator[](size_type n) const {
    return *make_iter(n);
  }

  constexpr reference
  at(size_type n);

  constexpr const_reference
  at(size_type n) const;

  /**
   * @throw std::out_of_range if `n >= size()`.
   */
  constexpr bool
  get(size_type n) const {
    return at(n);
  }

  /**
   * @throw std::out_of_range if `n >= size()`; the vector is unchanged.
   */
  constexpr void
  set(size_type n, bool value) {
    at(n) = value;
  }

  constexpr reference
  front() {
    return *begin();
  }

  constexpr const_reference
  front() const {
    return *begin();
  }

  constexpr reference
  back() {
    return *(end() - 1);
  }

  constexpr const_reference
  back() const {
    return *(end() - 1);
  }

  constexpr element_type*
  data() noexcept {
    return begin_;
  }

  constexpr const element_type*
  data() const noexcept {
    return begin_;
  }
  ///@}

  /** @name Slices */
  ///@{
  constexpr slice_type
  as_slice() noexcept {
    return slice_type(begin_, 0, size_);
  }

  constexpr const_slice_type
  as_slice() const noexcept {
    return const_slice_type(begin_, 0, size_);
  }

  /**
   * @throw std::out_of_range if `[first, first + count)` leaves the vector.
   */
  constexpr slice_type
  slice(size_type first, size_type count) {
    return as_slice().slice(first, count);
  }

  constexpr const_slice_type
  slice(size_type first, size_type count) const {
    return as_slice().slice(first, count);
  }
  ///@}

  /** @name Modifiers */
  ///@{
  constexpr void
  push_back(const value_type& x);

  constexpr void
  pop_back() {
    --size_;
  }

  constexpr void
  append(const_slice_type s);

  constexpr iterator
  insert(const_iterator position, const value_type& x);

  constexpr iterator
  insert(const_iterator position, size_type n, const value_type& x);

  constexpr iterator
  insert(const_iterator position, std::forward_iterator auto first,
         std::forward_iterator auto last);

  constexpr iterator
  insert(const_iterator position, std::initializer_list<value_type> il) {
    return insert(position, il.begin(), il.end());
  }

  constexpr iterator
  erase(const_iterator position);

  constexpr iterator
  erase(const_iterator first, const_iterator last);

  constexpr void
  clear() noexcept {
    size_ = 0;
  }

  constexpr void
  swap(BasicBitVector&) noexcept;

  constexpr void
  resize(size_type sz, value_type x = false);

  constexpr void
  flip() noexcept {
    as_slice().flip();
  }

  constexpr void
  fill(bool value) noexcept {
    as_slice().fill(value);
  }

  constexpr void
  shift_left(size_type amount) {
    as_slice().shift_left(amount);
  }

  constexpr void
  shift_right(size_type amount) {
    as_slice().shift_right(amount);
  }
  ///@}

  /** @name Queries */
  ///@{
  constexpr size_type
  count_ones() const noexcept {
    return as_slice().count_ones();
  }

  constexpr size_type
  count_zeros() const noexcept {
    return as_slice().count_zeros();
  }

  constexpr bool
  all() const noexcept {
    return as_slice().all();
  }

  constexpr bool
  any() const noexcept {
    return as_slice().any();
  }

  constexpr bool
  none() const noexcept {
    return as_slice().none();
  }
  ///@}

  /** @name Operators */
  ///@{
  template<ShiftAmount N>
  constexpr BasicBitVector&
  operator<<=(N amount) {
    as_slice() <<= amount;
    return *this;
  }

  template<ShiftAmount N>
  constexpr BasicBitVector&
  operator>>=(N amount) {
    as_slice() >>= amount;
    return *this;
  }

  /**
   * @throw std::length_error if the lengths differ.
   */
  constexpr BasicBitVector&
  operator&=(const_slice_type other) {
    as_slice() &= other;
    return *this;
  }

  constexpr BasicBitVector&
  operator&=(const BasicBitVector& other) {
    return *this &= other.as_slice();
  }

  constexpr BasicBitVector&
  operator|=(const_slice_type other) {
    as_slice() |= other;
    return *this;
  }

  constexpr BasicBitVector&
  operator|=(const BasicBitVector& other) {
    return *this |= other.as_slice();
  }

  constexpr BasicBitVector&
  operator^=(const_slice_type other) {
    as_slice() ^= other;
    return *this;
  }

  constexpr BasicBitVector&
  operator^=(const BasicBitVector& other) {
    return *this ^= other.as_slice();
  }
  ///@}

  /** @name Comparisons */
  ///@{
  constexpr bool
  operator==(const BasicBitVector& other) const {
    return size() == other.size() && std::equal(begin(), end(), other.begin());
  }

  constexpr auto
  operator<=>(const BasicBitVector& other) const {
    return std::lexicographical_compare_three_way(begin(), end(), other.begin(),
                                                  other.end());
  }
  ///@}

 private:
  constexpr bool
  invariants() const;

  constexpr void
  vallocate(size_type n);

  constexpr void
  vdeallocate() noexcept;

  /**
   * @brief Converts an internal capacity (in elements) to an external
   * capacity (in bits).
   */
  constexpr static size_type
  internal_cap_to_external(size_type n) noexcept {
    return n * bits_per_element;
  }

  /**
   * @brief Converts an external capacity (in bits) to an internal capacity
   * (in elements).
   */
  constexpr static size_type
  external_cap_to_internal(size_type n) noexcept {
    return (n - 1) / bits_per_element + 1;
  }

  constexpr static size_type
  align_it(size_type new_size) noexcept {
    return (new_size + (bits_per_element - 1)) / bits_per_element
         * bits_per_element;
  }

  constexpr size_type
  recommend(size_type new_size) const;

  constexpr void
  construct_at_end(size_type n, value_type x);

  constexpr void
  construct_at_end(std::forward_iterator auto first,
                   std::forward_iterator auto last);

  constexpr iterator
  open_gap(const_iterator position, size_type n);

  constexpr iterator
  make_iter(size_type pos) noexcept {
    return iterator(begin_ + pos / bits_per_element,
                    pos & (bits_per_element - 1));
  }

  constexpr const_iterator
  make_iter(size_type pos) const noexcept {
    return const_iterator(begin_ + pos / bits_per_element,
                          pos & (bits_per_element - 1));
  }

  constexpr iterator
  const_iterator_cast(const_iterator p) noexcept {
    return begin() + (p - cbegin());
  }

  constexpr void
  copy_assign_alloc(const BasicBitVector& v) {
    if constexpr (allocator_traits::propagate_on_container_copy_assignment::
                    value) {
      if (alloc_ != v.alloc_)
        vdeallocate();
      alloc_ = v.alloc_;
    }
  }

  constexpr void
  move_assign(BasicBitVector& v) noexcept(
    std::is_nothrow_move_assignable_v<allocator_type>);

  constexpr void
  move_assign_alloc(BasicBitVector& v) noexcept(
    !allocator_traits::propagate_on_container_move_assignment::value
    || std::is_nothrow_move_assignable_v<allocator_type>) {
    if constexpr (allocator_traits::propagate_on_container_move_assignment::
                    value)
      alloc_ = std::move(v.alloc_);
  }
};

/**
 * @brief Allocates zeroed storage for at least `n` bits.
 *
 * @throw std::length_error If `n` exceeds `max_size()`.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::vallocate(size_type n) {
  if (n > max_size())
    this->throw_length_error("BitVector");
  n = external_cap_to_internal(n);
  this->begin_ = allocator_traits::allocate(this->alloc_, n);
  for (size_type i = 0; i < n; ++i)
    allocator_traits::construct(this->alloc_, this->begin_ + i,
                                Bits<element_type>::zero);
  this->size_ = 0;
  this->cap_ = n;
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::vdeallocate() noexcept {
  if (this->begin_ != nullptr) {
    allocator_traits::deallocate(this->alloc_, this->begin_, this->cap_);
    this->begin_ = nullptr;
    this->size_ = this->cap_ = 0;
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::size_type
BasicBitVector<Order, T, Allocator>::max_size() const noexcept {
  size_type amax = allocator_traits::max_size(alloc_);
  size_type nmax = std::numeric_limits<size_type>::max() / 2;
  if (nmax / bits_per_element <= amax)
    return nmax;
  return internal_cap_to_external(amax);
}

/**
 * @brief Suggests a new capacity for growth.
 *
 * @throw std::length_error If `new_size` exceeds `max_size()`.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::size_type
BasicBitVector<Order, T, Allocator>::recommend(size_type new_size) const {
  const size_type ms = max_size();
  if (new_size > ms)
    this->throw_length_error("BitVector");
  const size_type cap = capacity();
  if (cap >= ms / 2)
    return ms;
  return std::max(2 * cap, align_it(new_size));
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::construct_at_end(size_type n,
                                                      value_type x) {
  size_type old_size = this->size_;
  this->size_ += n;
  std::fill_n(make_iter(old_size), n, x);
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::construct_at_end(
  std::forward_iterator auto first, std::forward_iterator auto last) {
  size_type old_size = this->size_;
  this->size_ += std::distance(first, last);
  auto out = make_iter(old_size);
  for (; first != last; ++first, ++out) *out = static_cast<bool>(*first);
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector() noexcept(
  std::is_nothrow_default_constructible_v<allocator_type>) { }

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  const allocator_type& a) noexcept
: cap_(0), alloc_(a) { }

/**
 * @brief Constructs a vector of `n` zero bits.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(size_type n) {
  if (n > 0) {
    vallocate(n);
    construct_at_end(n, false);
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  size_type n, const allocator_type& a)
: cap_(0), alloc_(a) {
  if (n > 0) {
    vallocate(n);
    construct_at_end(n, false);
  }
}

/**
 * @brief Constructs a vector of `n` bits, each equal to `x`.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  size_type n, const value_type& x) {
  if (n > 0) {
    vallocate(n);
    construct_at_end(n, x);
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  size_type n, const value_type& x, const allocator_type& a)
: cap_(0), alloc_(a) {
  if (n > 0) {
    vallocate(n);
    construct_at_end(n, x);
  }
}

/**
 * @brief Constructs a vector from an input range; each element is
 * converted to `bool`.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  std::input_iterator auto first, std::input_iterator auto last) {
  try {
    for (; first != last; ++first) push_back(static_cast<bool>(*first));
  } catch (...) {
    if (begin_ != nullptr)
      allocator_traits::deallocate(alloc_, begin_, cap_);
    throw;
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  std::forward_iterator auto first, std::forward_iterator auto last) {
  const size_type n = std::distance(first, last);
  if (n > 0) {
    vallocate(n);
    construct_at_end(first, last);
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  std::forward_iterator auto first, std::forward_iterator auto last,
  const allocator_type& a)
: cap_(0), alloc_(a) {
  const size_type n = std::distance(first, last);
  if (n > 0) {
    vallocate(n);
    construct_at_end(first, last);
  }
}

/**
 * @brief Constructs an owning copy of the bits viewed by `s`.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  const_slice_type s) {
  if (s.size() > 0) {
    vallocate(s.size());
    construct_at_end(s.begin(), s.end());
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  std::initializer_list<value_type> il) {
  const size_type n = il.size();
  if (n > 0) {
    vallocate(n);
    construct_at_end(il.begin(), il.end());
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  std::initializer_list<value_type> il, const allocator_type& a)
: cap_(0), alloc_(a) {
  const size_type n = il.size();
  if (n > 0) {
    vallocate(n);
    construct_at_end(il.begin(), il.end());
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::~BasicBitVector() {
  if (begin_ != nullptr)
    allocator_traits::deallocate(alloc_, begin_, cap_);
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  const BasicBitVector& v)
: cap_(0),
  alloc_(allocator_traits::select_on_container_copy_construction(v.alloc_)) {
  if (v.size() > 0) {
    vallocate(v.size());
    construct_at_end(v.begin(), v.end());
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  const BasicBitVector& v, const allocator_type& a)
: cap_(0), alloc_(a) {
  if (v.size() > 0) {
    vallocate(v.size());
    construct_at_end(v.begin(), v.end());
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>&
BasicBitVector<Order, T, Allocator>::operator=(const BasicBitVector& v) {
  if (this != &v) {
    copy_assign_alloc(v);
    if (v.size_) {
      if (v.size_ > capacity()) {
        vdeallocate();
        vallocate(v.size_);
      }
      std::copy(v.begin_, v.begin_ + external_cap_to_internal(v.size_), begin_);
    }
    size_ = v.size_;
  }
  return *this;
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  BasicBitVector&& v) noexcept
: begin_(v.begin_), size_(v.size_), cap_(v.cap_), alloc_(v.alloc_) {
  v.begin_ = nullptr;
  v.size_ = 0;
  v.cap_ = 0;
}

/**
 * @brief Moves the contents if the allocators match; otherwise copies.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::BasicBitVector(
  BasicBitVector&& v, const allocator_type& a)
: cap_(0), alloc_(a) {
  if (a == allocator_type(v.alloc_)) {
    this->begin_ = v.begin_;
    this->size_ = v.size_;
    this->cap_ = v.cap_;
    v.begin_ = nullptr;
    v.cap_ = v.size_ = 0;
  } else if (v.size() > 0) {
    vallocate(v.size());
    construct_at_end(v.begin(), v.end());
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>&
BasicBitVector<Order, T, Allocator>::operator=(BasicBitVector&& v) noexcept(
  allocator_traits::propagate_on_container_move_assignment::value
  || allocator_traits::is_always_equal::value) {
  if constexpr (allocator_traits::propagate_on_container_move_assignment::value)
    move_assign(v);
  else {
    if (alloc_ != v.alloc_)
      assign(v.begin(), v.end());
    else
      move_assign(v);
  }
  return *this;
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::move_assign(BasicBitVector& c) noexcept(
  std::is_nothrow_move_assignable_v<allocator_type>) {
  vdeallocate();
  move_assign_alloc(c);
  this->begin_ = c.begin_;
  this->size_ = c.size_;
  this->cap_ = c.cap_;
  c.begin_ = nullptr;
  c.cap_ = c.size_ = 0;
}

/**
 * @brief Replaces the contents with `n` copies of `x`.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::assign(size_type n, const value_type& x) {
  size_ = 0;
  if (n > 0) {
    size_type c = capacity();
    if (n <= c)
      size_ = n;
    else {
      BasicBitVector v(alloc_);
      v.reserve(recommend(n));
      v.size_ = n;
      swap(v);
    }
    std::fill_n(begin(), n, x);
  }
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::assign(std::forward_iterator auto first,
                                            std::forward_iterator auto last) {
  clear();
  difference_type ns = std::distance(first, last);
  assert(ns >= 0 && "invalid range specified");
  const size_type n = ns;
  if (n) {
    if (n > capacity()) {
      vdeallocate();
      vallocate(n);
    }
    construct_at_end(first, last);
  }
}

/**
 * @brief Requests a capacity of at least `n` bits.
 *
 * If `n` exceeds the current capacity, storage is reallocated and every
 * iterator and slice into the vector is invalidated.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::reserve(size_type n) {
  if (n > capacity()) {
    if (!std::is_constant_evaluated())
      spdlog::debug("BitVector<{}, u{}>: reallocating {} -> {} elements",
                    Order::name, bits_per_element, cap_,
                    external_cap_to_internal(n));
    BasicBitVector v(this->alloc_);
    v.vallocate(n);
    v.construct_at_end(this->begin(), this->end());
    swap(v);
  }
  assert(invariants());
}

/**
 * @brief Reduces the capacity to the fewest elements holding `size()` bits.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::shrink_to_fit() {
  if (num_elements() < cap_)
    BasicBitVector(*this, allocator_type(alloc_)).swap(*this);
}

/**
 * @throws std::out_of_range if `n >= size()`.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::reference
BasicBitVector<Order, T, Allocator>::at(size_type n) {
  if (n >= size())
    this->throw_out_of_range("BitVector::at");
  return (*this)[n];
}

/**
 * @throws std::out_of_range if `n >= size()`.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::const_reference
BasicBitVector<Order, T, Allocator>::at(size_type n) const {
  if (n >= size())
    this->throw_out_of_range("BitVector::at");
  return (*this)[n];
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::push_back(const value_type& x) {
  if (this->size_ == this->capacity())
    reserve(recommend(this->size_ + 1));
  ++this->size_;
  back() = x;
  assert(invariants());
}

/**
 * @brief Appends the bits viewed by `s`.
 *
 * `s` may view this vector itself.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::append(const_slice_type s) {
  const size_type n = s.size();
  if (n == 0)
    return;
  if (n <= capacity() && size_ <= capacity() - n)
    construct_at_end(s.begin(), s.end());
  else {
    BasicBitVector v(alloc_);
    v.reserve(recommend(size_ + n));
    v.construct_at_end(cbegin(), cend());
    v.construct_at_end(s.begin(), s.end());
    swap(v);
  }
  assert(invariants());
}

/**
 * @brief Makes room for `n` bits before `position`.
 *
 * Bits from `position` on move `n` places towards the end. The vector
 * is reallocated when the capacity is too small, which invalidates
 * `position`. The returned iterator points at the first bit of the
 * gap; the gap contents are unspecified.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::iterator
BasicBitVector<Order, T, Allocator>::open_gap(const_iterator position,
                                              size_type n) {
  const auto offset = static_cast<size_type>(position - cbegin());
  if (n <= capacity() && size_ <= capacity() - n) {
    const auto tail = cend();
    size_ += n;
    std::copy_backward(position, tail, end());
    assert(invariants());
    return make_iter(offset);
  }
  BasicBitVector grown(alloc_);
  grown.reserve(recommend(size_ + n));
  grown.construct_at_end(cbegin(), position);
  grown.size_ += n;
  grown.construct_at_end(position, cend());
  swap(grown);
  assert(invariants());
  return make_iter(offset);
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::iterator
BasicBitVector<Order, T, Allocator>::insert(const_iterator position,
                                            const value_type& x) {
  auto r = open_gap(position, 1);
  *r = x;
  return r;
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::iterator
BasicBitVector<Order, T, Allocator>::insert(const_iterator position,
                                            size_type n, const value_type& x) {
  auto r = open_gap(position, n);
  std::fill_n(r, n, x);
  return r;
}

/**
 * @brief Inserts the range `[first, last)` before `position`. The range
 * must not refer to this vector.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::iterator
BasicBitVector<Order, T, Allocator>::insert(const_iterator position,
                                            std::forward_iterator auto first,
                                            std::forward_iterator auto last) {
  const auto count = std::distance(first, last);
  assert(count >= 0 && "reversed insert range");
  auto r = open_gap(position, static_cast<size_type>(count));
  std::transform(first, last, r,
                 [](const auto& marker) { return static_cast<bool>(marker); });
  return r;
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::iterator
BasicBitVector<Order, T, Allocator>::erase(const_iterator position) {
  iterator r = const_iterator_cast(position);
  std::copy(position + 1, this->cend(), r);
  --size_;
  assert(invariants());
  return r;
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr BasicBitVector<Order, T, Allocator>::iterator
BasicBitVector<Order, T, Allocator>::erase(const_iterator first,
                                           const_iterator last) {
  iterator r = const_iterator_cast(first);
  difference_type d = last - first;
  std::copy(last, this->cend(), r);
  size_ -= d;
  assert(invariants());
  return r;
}

template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::swap(BasicBitVector& x) noexcept {
  std::swap(this->begin_, x.begin_);
  std::swap(this->size_, x.size_);
  std::swap(this->cap_, x.cap_);
  if constexpr (allocator_traits::propagate_on_container_swap::value)
    std::swap(this->alloc_, x.alloc_);
}

/**
 * @brief Resizes the vector to `sz` bits; bits added at the end are set
 * to `x`.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr void
BasicBitVector<Order, T, Allocator>::resize(size_type sz, value_type x) {
  if (sz <= size_) {
    size_ = sz;
    assert(invariants());
    return;
  }
  const auto n = sz - size_;
  std::fill_n(open_gap(cend(), n), n, x);
}

/**
 * @brief Checks internal container invariants.
 *
 * - If `begin_` is `nullptr`, both `size_` and `cap_` must be zero.
 * - If `begin_` is not `nullptr`, `cap_` must be non-zero.
 * - `size_` must never exceed `capacity()`.
 */
template<BitOrder Order, BitStore T, std::copy_constructible Allocator>
constexpr bool
BasicBitVector<Order, T, Allocator>::invariants() const {
  if (this->begin_ == nullptr) {
    if (this->size_ != 0 || this->cap_ != 0)
      return false;
  } else {
    if (this->cap_ == 0)
      return false;
    if (this->size_ > this->capacity())
      return false;
  }
  return true;
}

}  // namespace bitvec::detail

namespace bitvec {

/**
 * @ingroup container
 * Space-efficient growable sequence of bits, think of it as a
 * `std::vector<bool>` whose storage element and bit order are chosen by
 * the caller.
 *
 * The container surface follows [`vector<bool>`][vector_of_bool], with
 * these additions:
 * ```cpp
 * element_type;                // alias to T.
 * size_type num_elements();    // number of storage elements in use.
 * element_type* data();        // pointer to the storage elements.
 * slice_type as_slice();       // borrowed view over all bits.
 * slice_type slice(first, n);  // borrowed view over n bits.
 * void shift_left(n);          // logical shifts, length unchanged.
 * void shift_right(n);
 * ```
 * plus the shift (`<<=`, `>>=`, `<<`, `>>`) and bitwise (`&=`, `|=`,
 * `^=`, `&`, `|`, `^`, `~`) operators. Shift amounts may be any unsigned
 * integer type.
 *
 * With `BigEndian` the first bit lands in the most significant bit of
 * the first element, so a `BitVector<BigEndian, std::uint8_t>` lays its
 * bits out in the order a bit stream is written:
 * ```cpp
 * auto v = bitvec::BitVector<>{1, 0, 1, 1};
 * assert(v.data()[0] == 0b1011'0000);
 * v <<= 1u;
 * assert((v.data()[0] & 0b1111'0000) == 0b0110'0000);
 * ```
 *
 * [vector_of_bool]: https://en.cppreference.com/w/cpp/container/vector_bool
 *
 * @tparam Order Bit-ordering policy, `BigEndian` by default.
 * @tparam T Storage element, `std::uint8_t` by default.
 */
template<BitOrder Order = DefaultOrder, BitStore T = DefaultElement,
         std::copy_constructible Allocator = std::allocator<T> >
using BitVector = detail::BasicBitVector<Order, T, Allocator>;

template<BitOrder Order, BitStore T, typename A, ShiftAmount N>
constexpr auto
operator<<(detail::BasicBitVector<Order, T, A> v, N amount) {
  v <<= amount;
  return v;
}

template<BitOrder Order, BitStore T, typename A, ShiftAmount N>
constexpr auto
operator>>(detail::BasicBitVector<Order, T, A> v, N amount) {
  v >>= amount;
  return v;
}

/**
 * Shifted owning copy of the bits viewed by `s`; `s` is untouched.
 */
template<BitOrder Order, typename E, ShiftAmount N>
constexpr auto
operator<<(const BitSlice<Order, E>& s, N amount) {
  auto v = BitVector<Order, std::remove_const_t<E>>(s);
  v <<= amount;
  return v;
}

template<BitOrder Order, typename E, ShiftAmount N>
constexpr auto
operator>>(const BitSlice<Order, E>& s, N amount) {
  auto v = BitVector<Order, std::remove_const_t<E>>(s);
  v >>= amount;
  return v;
}

template<BitOrder Order, BitStore T, typename A>
constexpr auto
operator&(detail::BasicBitVector<Order, T, A> a,
          const detail::BasicBitVector<Order, T, A>& b) {
  a &= b;
  return a;
}

template<BitOrder Order, BitStore T, typename A>
constexpr auto
operator|(detail::BasicBitVector<Order, T, A> a,
          const detail::BasicBitVector<Order, T, A>& b) {
  a |= b;
  return a;
}

template<BitOrder Order, BitStore T, typename A>
constexpr auto
operator^(detail::BasicBitVector<Order, T, A> a,
          const detail::BasicBitVector<Order, T, A>& b) {
  a ^= b;
  return a;
}

template<BitOrder Order, BitStore T, typename A>
constexpr auto
operator~(detail::BasicBitVector<Order, T, A> a) {
  a.flip();
  return a;
}

}  // namespace bitvec
