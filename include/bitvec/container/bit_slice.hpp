#pragma once

#include <algorithm>
#include <functional>
#include <bitvec/config.hpp>
#include <bitvec/container/detail/bit_reference.hpp>
#include <bitvec/utility/shift.hpp>
#include <spdlog/spdlog.h>

namespace bitvec {

/**
 * @ingroup container
 * @brief Borrowed view over a run of bits packed in an element buffer.
 *
 * A slice is a pointer to the element holding its first bit, the
 * logical index of that bit inside the element (the head) and a bit
 * count. It owns nothing: it must not outlive the buffer it was taken
 * from, and any reallocation of that buffer invalidates it, just like a
 * `std::span` over a `std::vector`.
 *
 * `BitSlice<Order, T>` can read and write; `BitSlice<Order, const T>` is
 * the read-only counterpart and a mutable slice converts to it
 * implicitly.
 *
 * Every operation works on logical indices and resolves the physical
 * bit through `Order`, so results never depend on the active ordering
 * policy.
 *
 * ```cpp
 * auto v = bitvec::make(1, 0, 1, 1, 0, 0, 0, 0);
 * auto s = v.slice(2, 4);   // bits 1 1 0 0
 * s <<= 1u;                 // bits 1 0 0 0
 * assert(v == bitvec::make(1, 0, 1, 0, 0, 0, 0, 0));
 * ```
 *
 * @tparam Order Bit-ordering policy.
 * @tparam E Storage element type, const-qualified for a read-only view.
 */
template<BitOrder Order, typename E>
  requires BitStore<std::remove_const_t<E>>
class BitSlice : private detail::BitContainerBase {
 public:
  using element_type = std::remove_const_t<E>;
  using order_type = Order;
  using value_type = bool;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using const_reference = bool;
  using const_iterator = detail::BitConstIterator<Order, element_type>;
  using reference =
    std::conditional_t<std::is_const_v<E>, const_reference,
                       detail::BitReference<Order, element_type>>;
  using iterator =
    std::conditional_t<std::is_const_v<E>, const_iterator,
                       detail::BitIterator<Order, element_type>>;

  constexpr static size_type bits_per_element = Bits<element_type>::width;

 private:
  E* data_{};
  size_type head_{};
  size_type size_{};

 public:
  constexpr BitSlice() noexcept = default;

  /**
   * View `size` bits starting at logical bit `first` of `data`.
   *
   * @param data First element of the buffer.
   * @param first Logical bit index of the first viewed bit, counted from
   * the start of `data`.
   * @param size Number of bits viewed.
   */
  constexpr BitSlice(E* data, size_type first, size_type size) noexcept
  : data_(data == nullptr ? data : data + first / bits_per_element),
    head_(first % bits_per_element), size_(size) { }

  /**
   * Read-only view of a mutable slice.
   */
  template<typename U>
    requires std::is_const_v<E> && std::same_as<U, element_type>
  constexpr BitSlice(const BitSlice<Order, U>& s) noexcept
  : BitSlice(s.data(), s.head(), s.size()) { }

  constexpr size_type
  size() const noexcept {
    return size_;
  }

  [[nodiscard]] constexpr bool
  empty() const noexcept {
    return size_ == 0;
  }

  /**
   * Logical index of the first viewed bit inside `data()[0]`.
   */
  constexpr size_type
  head() const noexcept {
    return head_;
  }

  constexpr E*
  data() const noexcept {
    return data_;
  }

  /** @name Iterators */
  ///@{
  constexpr iterator
  begin() const noexcept {
    return make_iter(0);
  }

  constexpr iterator
  end() const noexcept {
    return make_iter(size_);
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
  /**
   * Unchecked access to bit `n`.
   */
  constexpr reference
  operator[](size_type n) const {
    return *make_iter(n);
  }

  /**
   * @throw std::out_of_range if `n >= size()`.
   */
  constexpr bool
  get(size_type n) const {
    if (n >= size_)
      this->throw_out_of_range("BitSlice::get");
    return (*this)[n];
  }

  /**
   * @throw std::out_of_range if `n >= size()`; nothing is written then.
   */
  constexpr void
  set(size_type n, bool value) const
    requires(!std::is_const_v<E>)
  {
    if (n >= size_)
      this->throw_out_of_range("BitSlice::set");
    (*this)[n] = value;
  }

  /**
   * Sub-view of `count` bits starting at bit `first` of this view.
   *
   * @throw std::out_of_range if the range leaves this view.
   */
  constexpr BitSlice
  slice(size_type first, size_type count) const {
    if (first > size_ || count > size_ - first)
      this->throw_out_of_range("BitSlice::slice");
    return BitSlice(data_, head_ + first, count);
  }
  ///@}

  /** @name Queries */
  ///@{
  constexpr size_type
  count_ones() const noexcept {
    auto n = size_type{};
    visit_elements([&n](const element_type& elem, element_type mask) {
      n += Bits<element_type>::count_ones(elem & mask);
    });
    return n;
  }

  constexpr size_type
  count_zeros() const noexcept {
    return size_ - count_ones();
  }

  /**
   * True when every bit is set; vacuously true for an empty view.
   */
  constexpr bool
  all() const noexcept {
    return count_ones() == size_;
  }

  constexpr bool
  any() const noexcept {
    auto found = false;
    visit_elements([&found](const element_type& elem, element_type mask) {
      found = found || (elem & mask) != Bits<element_type>::zero;
    });
    return found;
  }

  constexpr bool
  none() const noexcept {
    return !any();
  }
  ///@}

  /** @name Modifiers */
  ///@{
  constexpr void
  fill(bool value) const noexcept
    requires(!std::is_const_v<E>)
  {
    visit_elements([value](element_type& elem, element_type mask) {
      elem = static_cast<element_type>((elem & ~mask) | (value ? mask : 0));
    });
  }

  constexpr void
  flip() const noexcept
    requires(!std::is_const_v<E>)
  {
    visit_elements(
      [](element_type& elem, element_type mask) { elem ^= mask; });
  }

  /**
   * Copies the bits of `other` into this view. `other` may overlap this
   * view.
   *
   * @throw std::length_error if the lengths differ.
   */
  constexpr void
  copy_from(BitSlice<Order, const element_type> other) const
    requires(!std::is_const_v<E>)
  {
    check_same_length(other, "BitSlice::copy_from");
    combine(other, [](bool, bool src) { return src; });
  }

  /**
   * Shifts the bit sequence towards index 0 by `amount` positions:
   * bit `j` takes the old value of bit `j + amount` and the last
   * `amount` bits become 0. An amount of `size()` or more clears the
   * view.
   */
  constexpr void
  shift_left(size_type amount) const
    requires(!std::is_const_v<E>)
  {
    if (amount == 0 || empty())
      return;
    if (amount >= size_) {
      fill(false);
      return;
    }
    if (element_aligned(amount)) {
      const auto n = size_ / bits_per_element;
      const auto k = amount / bits_per_element;
      std::copy(data_ + k, data_ + n, data_);
      std::fill(data_ + n - k, data_ + n, Bits<element_type>::zero);
      return;
    }
    const auto keep = size_ - amount;
    auto dst = begin();
    auto src = cbegin() + static_cast<difference_type>(amount);
    for (size_type j = 0; j < keep; ++j, ++dst, ++src) *dst = *src;
    slice(keep, amount).fill(false);
  }

  /**
   * Shifts the bit sequence away from index 0 by `amount` positions:
   * bit `j` takes the old value of bit `j - amount` and the first
   * `amount` bits become 0. An amount of `size()` or more clears the
   * view.
   */
  constexpr void
  shift_right(size_type amount) const
    requires(!std::is_const_v<E>)
  {
    if (amount == 0 || empty())
      return;
    if (amount >= size_) {
      fill(false);
      return;
    }
    if (element_aligned(amount)) {
      const auto n = size_ / bits_per_element;
      const auto k = amount / bits_per_element;
      std::copy_backward(data_, data_ + n - k, data_ + n);
      std::fill(data_, data_ + k, Bits<element_type>::zero);
      return;
    }
    std::copy_backward(cbegin(), cend() - static_cast<difference_type>(amount),
                       end());
    slice(0, amount).fill(false);
  }
  ///@}

  /** @name Operators */
  ///@{
  template<ShiftAmount N>
    requires(!std::is_const_v<E>)
  constexpr const BitSlice&
  operator<<=(N amount) const {
    shift_left(normalize_shift(amount));
    return *this;
  }

  template<ShiftAmount N>
    requires(!std::is_const_v<E>)
  constexpr const BitSlice&
  operator>>=(N amount) const {
    shift_right(normalize_shift(amount));
    return *this;
  }

  /**
   * Bitwise combination with a view of the same length; `other` may
   * overlap this view.
   *
   * @throw std::length_error if the lengths differ.
   */
  constexpr const BitSlice&
  operator&=(BitSlice<Order, const element_type> other) const
    requires(!std::is_const_v<E>)
  {
    check_same_length(other, "BitSlice::operator&=");
    combine(other, [](bool dst, bool src) { return dst && src; });
    return *this;
  }

  /**
   * @throw std::length_error if the lengths differ.
   */
  constexpr const BitSlice&
  operator|=(BitSlice<Order, const element_type> other) const
    requires(!std::is_const_v<E>)
  {
    check_same_length(other, "BitSlice::operator|=");
    combine(other, [](bool dst, bool src) { return dst || src; });
    return *this;
  }

  /**
   * @throw std::length_error if the lengths differ.
   */
  constexpr const BitSlice&
  operator^=(BitSlice<Order, const element_type> other) const
    requires(!std::is_const_v<E>)
  {
    check_same_length(other, "BitSlice::operator^=");
    combine(other, [](bool dst, bool src) { return dst != src; });
    return *this;
  }
  ///@}

  /**
   * Bitwise equality; the head offsets of the two views do not matter.
   */
  template<typename U>
    requires std::same_as<std::remove_const_t<U>, element_type>
  constexpr bool
  operator==(const BitSlice<Order, U>& other) const {
    return size_ == other.size()
        && std::equal(cbegin(), cend(), other.cbegin());
  }

 private:
  constexpr iterator
  make_iter(size_type pos) const noexcept {
    const auto idx = head_ + pos;
    return iterator(data_ + idx / bits_per_element,
                    idx & (bits_per_element - 1));
  }

  constexpr bool
  element_aligned(size_type amount) const noexcept {
    return head_ == 0 && size_ % bits_per_element == 0
        && amount % bits_per_element == 0;
  }

  constexpr void
  check_same_length(const BitSlice<Order, const element_type>& other,
                    const char* what) const {
    if (other.size() != size_) {
      if (!std::is_constant_evaluated())
        spdlog::debug("{}: length mismatch ({} vs {} bits)", what, size_,
                      other.size());
      this->throw_length_error(what);
    }
  }

  /**
   * True when `other` starts before this view and runs into it, so a
   * front-to-back walk would overwrite source bits before reading them.
   */
  constexpr bool
  trails(const BitSlice<Order, const element_type>& other) const noexcept {
    const auto before = [](const auto& x, const auto& y) {
      const auto less = std::less<const element_type*>{};
      return less(x.segment(), y.segment())
          || (x.segment() == y.segment() && x.offset() < y.offset());
    };
    const auto dst = cbegin();
    return before(other.cbegin(), dst) && before(dst, other.cend());
  }

  /**
   * Sets every bit of this view to `op(bit, bit of other)`, walking back
   * to front when `other` trails into this view.
   */
  constexpr void
  combine(BitSlice<Order, const element_type> other, auto op) const {
    if (trails(other)) {
      auto src = other.cend();
      for (auto dst = end(); dst != begin();) {
        --dst;
        --src;
        *dst = op(*dst, *src);
      }
    } else {
      auto src = other.cbegin();
      for (auto dst = begin(); dst != end(); ++dst, ++src)
        *dst = op(*dst, *src);
    }
  }

  /**
   * Mask of the physical positions holding logical bits
   * `[first, last)` of one element.
   */
  constexpr static element_type
  span_mask(size_type first, size_type last) noexcept {
    if (first == 0 && last == bits_per_element)
      return Bits<element_type>::ones;
    auto mask = Bits<element_type>::zero;
    for (auto i = first; i < last; ++i)
      mask |= Bits<element_type>::mask(Order::template at<element_type>(i));
    return mask;
  }

  /**
   * Calls `f(element, mask)` for every element the view touches, where
   * `mask` selects the viewed bits of that element.
   */
  constexpr void
  visit_elements(auto f) const {
    if (empty())
      return;
    const auto last = head_ + size_;
    const auto n = (last - 1) / bits_per_element + 1;
    for (size_type e = 0; e < n; ++e) {
      const auto lo = e == 0 ? head_ : 0;
      const auto hi =
        e == n - 1 ? last - e * bits_per_element : bits_per_element;
      f(data_[e], span_mask(lo, hi));
    }
  }
};

}  // namespace bitvec
