#pragma once

#include "fastlist/link.h"
#include <cstddef>
#include <type_traits>

namespace FastList {

template <typename T, typename M>
std::size_t offset_of(M T::*member) noexcept {
  // Gets the offset of the member relative to the container. The placeholder
  // only provides a valid, aligned base address; it is never read.
  alignas(T) unsigned char placeholder[sizeof(T)];
  T *base = reinterpret_cast<T *>(placeholder);
  auto *field = reinterpret_cast<unsigned char *>(&(base->*member));
  return static_cast<std::size_t>(field - placeholder);
}

template <typename T, typename M>
T *container_of(M *ptr, std::size_t offset) noexcept {
  // Gets the address of the container from its member and a known offset
  return reinterpret_cast<T *>(reinterpret_cast<char *>(ptr) - offset);
}

template <typename T, typename M>
const T *container_of(const M *ptr, std::size_t offset) noexcept {
  return reinterpret_cast<const T *>(reinterpret_cast<const char *>(ptr) -
                                     offset);
}

template <typename T, typename M> T *container_of(M *ptr, M T::*member) {
  return container_of<T>(ptr, offset_of(member));
}

template <typename T, typename M>
const T *container_of(const M *ptr, M T::*member) {
  return container_of<T>(ptr, offset_of(member));
}

/**
 * Names the link field a record type uses by default. The primary template
 * expects a member called `link`; other names are declared once with
 * FASTLIST_LINK_FIELD at global scope.
 *
 * The member must be the record's real Link field: a wrong capability makes
 * every conversion below point at the wrong bytes.
 */
template <typename T> struct LinkTraits {
  static constexpr Link<T> T::*member = &T::link;
};

/**
 * The only place that converts between records and their links. Everything
 * else in the engine works with record references or Link pointers, never with
 * raw offsets.
 */
template <typename T, Link<T> T::*Member> struct LinkAdapter {
  static_assert(std::is_standard_layout_v<T>,
                "intrusive records need a fixed, standard layout");

  // Computed once per (record type, link field).
  static std::size_t offset() noexcept {
    static const std::size_t value = offset_of(Member);
    return value;
  }

  static Link<T> *to_link(T *record) noexcept { return &(record->*Member); }

  static const Link<T> *to_link(const T *record) noexcept {
    return &(record->*Member);
  }

  static T *to_record(Link<T> *link) noexcept {
    return container_of<T>(link, offset());
  }

  static const T *to_record(const Link<T> *link) noexcept {
    return container_of<T>(link, offset());
  }
};

} // namespace FastList

#define FASTLIST_LINK_FIELD(Type, field)                                       \
  template <> struct FastList::LinkTraits<Type> {                              \
    static constexpr FastList::Link<Type> Type::*member = &Type::field;        \
  }
