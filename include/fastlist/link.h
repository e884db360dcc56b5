#pragma once

#include <cstddef>

// Owner tagging turns foreign removal and double insertion into assert
// failures. It changes sizeof(Link), so every translation unit of a program
// must agree on it.
#ifndef FASTLIST_TRACK_OWNER
#ifdef NDEBUG
#define FASTLIST_TRACK_OWNER 0
#else
#define FASTLIST_TRACK_OWNER 1
#endif
#endif

namespace FastList {

template <typename T> class Link;

template <typename T, Link<T> T::*Member> class List;

/**
 * Embedded next/prev pair. A record holds one Link per list it can be a
 * member of. The link owns nothing; boundaries are nullptr, never self.
 *
 * Copying a record yields an unlinked link: the copy is not a member of the
 * source's list.
 */
template <typename T> class Link {
public:
  constexpr Link() noexcept = default;
  constexpr Link(const Link &) noexcept {}
  Link &operator=(const Link &) noexcept { return *this; }

  // False for the sole element of a list, which has no neighbours. Use
  // List::contains for exact membership.
  bool is_linked() const noexcept {
    return next_ != nullptr || prev_ != nullptr;
  }

  const Link *next() const noexcept { return next_; }
  const Link *prev() const noexcept { return prev_; }

private:
  template <typename U, Link<U> U::*M> friend class List;

  void reset() noexcept {
    next_ = nullptr;
    prev_ = nullptr;
#if FASTLIST_TRACK_OWNER
    owner_ = nullptr;
#endif
  }

  Link *next_ = nullptr;
  Link *prev_ = nullptr;
#if FASTLIST_TRACK_OWNER
  const void *owner_ = nullptr; // list currently holding this link
#endif
};

} // namespace FastList
