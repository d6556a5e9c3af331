#pragma once

#include <bitvec/utility/order.hpp>
#include <compare>
#include <iterator>
#include <stdexcept>
#include <type_traits>

namespace bitvec::detail {

/**
 * @brief A reference to a single bit within an element.
 *
 * @tparam Order Bit-ordering policy resolving the physical position.
 * @tparam T Storage element type.
 */
template<BitOrder Order, BitStore T>
class BitReference {
  T* seg_;
  const std::size_t pos_;

 public:
  /**
   * Construct a reference to a logical bit of an element.
   *
   * @param seg Pointer to the element containing the bit.
   * @param offset Logical index of the bit within the element.
   */
  constexpr BitReference(T* seg, std::size_t offset) noexcept
  : seg_(seg), pos_(Order::template at<T>(offset)) { }

  constexpr operator bool() const noexcept {
    return Bits<T>::test(*seg_, pos_);
  }

  constexpr bool
  operator~() const noexcept {
    return !static_cast<bool>(*this);
  }

  constexpr BitReference&
  flip() noexcept {
    *seg_ ^= Bits<T>::mask(pos_);
    return *this;
  }

  constexpr BitReference&
  operator=(bool x) noexcept {
    Bits<T>::set(*seg_, pos_, x);
    return *this;
  }

  constexpr BitReference&
  operator=(const BitReference& x) noexcept {
    return operator=(static_cast<bool>(x));
  }

  /**
   * Dummy const assignment (no-op), required by `std::indirectly_writable`.
   */
  constexpr void
  operator=(bool) const noexcept { }
};

template<BitOrder Order, BitStore T>
inline void
swap(BitReference<Order, T> x, BitReference<Order, T> y) noexcept {
  bool t = x;
  x = y;
  y = t;
}

template<BitOrder Order, BitStore T>
inline void
swap(BitReference<Order, T> x, bool& y) noexcept {
  bool t = x;
  x = y;
  y = t;
}

template<BitOrder Order, BitStore T>
inline void
swap(bool& x, BitReference<Order, T> y) noexcept {
  bool t = x;
  x = y;
  y = t;
}

/**
 * @brief Base class for bit iterators.
 *
 * The position is kept as (element pointer, logical index inside the
 * element); the ordering policy is consulted only on dereference.
 *
 * @tparam Order Bit-ordering policy.
 * @tparam E Storage element type, possibly const-qualified.
 */
template<BitOrder Order, typename E>
class BitIteratorBase {
 public:
  using iterator_category = std::random_access_iterator_tag;
  using value_type = bool;
  using difference_type = std::ptrdiff_t;
  using pointer = void;

  /**
   * Number of bits stored in one element.
   */
  constexpr static std::size_t bits_per_element =
    Bits<std::remove_const_t<E>>::width;

 protected:
  E* seg_;
  std::size_t offset_;

 public:
  constexpr BitIteratorBase(E* seg, std::size_t offset) noexcept
  : seg_(seg), offset_(offset) { }

  constexpr friend difference_type
  operator-(const BitIteratorBase& x, const BitIteratorBase& y) {
    return (x.seg_ - y.seg_) * static_cast<difference_type>(bits_per_element)
         + static_cast<difference_type>(x.offset_)
         - static_cast<difference_type>(y.offset_);
  }

  constexpr bool
  operator==(const BitIteratorBase& other) const noexcept = default;

  constexpr auto
  operator<=>(const BitIteratorBase& other) const noexcept {
    if (auto cmp = seg_ <=> other.seg_; cmp != 0)
      return cmp;
    return offset_ <=> other.offset_;
  }

  constexpr E*
  segment() const noexcept {
    return seg_;
  }

  constexpr std::size_t
  offset() const noexcept {
    return offset_;
  }

 protected:
  constexpr void
  bump_up() {
    if (offset_ != bits_per_element - 1)
      ++offset_;
    else {
      offset_ = 0;
      ++seg_;
    }
  }

  constexpr void
  bump_down() {
    if (offset_ != 0)
      --offset_;
    else {
      offset_ = bits_per_element - 1;
      --seg_;
    }
  }

  constexpr void
  incr(difference_type n) {
    constexpr auto w = static_cast<difference_type>(bits_per_element);
    const auto pos = static_cast<difference_type>(offset_) + n;
    if (pos >= 0)
      seg_ += pos / w;
    else
      seg_ += (pos - w + 1) / w;
    offset_ = static_cast<std::size_t>(pos & (w - 1));
  }
};

/**
 * @brief Random-access iterator over mutable bits.
 */
template<BitOrder Order, BitStore T>
struct BitIterator : public BitIteratorBase<Order, T> {
  using Base = BitIteratorBase<Order, T>;
  using iterator_category = typename Base::iterator_category;
  using value_type = typename Base::value_type;
  using difference_type = typename Base::difference_type;
  using pointer = typename Base::pointer;
  using reference = BitReference<Order, T>;
  using iterator = BitIterator;

  constexpr BitIterator() noexcept : Base(nullptr, 0) { }

  constexpr BitIterator(T* seg, std::size_t offset) noexcept
  : Base(seg, offset) { }

  constexpr reference
  operator*() const noexcept {
    return reference(this->seg_, this->offset_);
  }

  constexpr reference
  operator[](difference_type n) const {
    return *(*this + n);
  }

  constexpr iterator&
  operator++() {
    this->bump_up();
    return *this;
  }

  constexpr iterator
  operator++(int) {
    iterator tmp = *this;
    this->bump_up();
    return tmp;
  }

  constexpr iterator&
  operator--() {
    this->bump_down();
    return *this;
  }

  constexpr iterator
  operator--(int) {
    iterator tmp = *this;
    this->bump_down();
    return tmp;
  }

  constexpr iterator&
  operator+=(difference_type n) {
    this->incr(n);
    return *this;
  }

  constexpr iterator&
  operator-=(difference_type n) {
    return *this += -n;
  }

  constexpr iterator
  operator+(difference_type n) const {
    iterator tmp(*this);
    tmp += n;
    return tmp;
  }

  constexpr iterator
  operator-(difference_type n) const {
    iterator tmp(*this);
    tmp -= n;
    return tmp;
  }

  constexpr friend iterator
  operator+(difference_type n, const iterator& it) {
    return it + n;
  }
};

/**
 * @brief Random-access iterator over read-only bits.
 */
template<BitOrder Order, BitStore T>
struct BitConstIterator : public BitIteratorBase<Order, const T> {
  using Base = BitIteratorBase<Order, const T>;
  using iterator_category = typename Base::iterator_category;
  using value_type = typename Base::value_type;
  using difference_type = typename Base::difference_type;
  using pointer = typename Base::pointer;
  using reference = value_type;
  using const_reference = value_type;
  using const_iterator = BitConstIterator;

  constexpr BitConstIterator() noexcept : Base(nullptr, 0) { }

  constexpr BitConstIterator(const T* seg, std::size_t offset) noexcept
  : Base(seg, offset) { }

  constexpr BitConstIterator(const BitIterator<Order, T>& x) noexcept
  : Base(x.segment(), x.offset()) { }

  constexpr const_reference
  operator*() const noexcept {
    return Bits<T>::test(*this->seg_, Order::template at<T>(this->offset_));
  }

  constexpr const_reference
  operator[](difference_type n) const {
    return *(*this + n);
  }

  constexpr const_iterator&
  operator++() {
    this->bump_up();
    return *this;
  }

  constexpr const_iterator
  operator++(int) {
    const_iterator tmp = *this;
    this->bump_up();
    return tmp;
  }

  constexpr const_iterator&
  operator--() {
    this->bump_down();
    return *this;
  }

  constexpr const_iterator
  operator--(int) {
    const_iterator tmp = *this;
    this->bump_down();
    return tmp;
  }

  constexpr const_iterator&
  operator+=(difference_type n) {
    this->incr(n);
    return *this;
  }

  constexpr const_iterator&
  operator-=(difference_type n) {
    return *this += -n;
  }

  constexpr const_iterator
  operator+(difference_type n) const {
    const_iterator tmp(*this);
    tmp += n;
    return tmp;
  }

  constexpr const_iterator
  operator-(difference_type n) const {
    const_iterator tmp(*this);
    tmp -= n;
    return tmp;
  }

  constexpr friend const_iterator
  operator+(difference_type n, const const_iterator& it) {
    return it + n;
  }
};

/**
 * @brief Common exception helpers for the bit containers.
 *
 * Throwing is suppressed during constant evaluation.
 */
class BitContainerBase {
 protected:
  constexpr BitContainerBase() = default;

  /**
   * @throw std::length_error Always throws at runtime.
   */
  constexpr void
  throw_length_error(const char* what) const {
    if (!std::is_constant_evaluated())
      throw std::length_error(what);
  }

  /**
   * @throw std::out_of_range Always throws at runtime.
   */
  constexpr void
  throw_out_of_range(const char* what) const {
    if (!std::is_constant_evaluated())
      throw std::out_of_range(what);
  }
};

}  // namespace bitvec::detail
