#pragma once

#include "fastlist/container_of.h"
#include "fastlist/link.h"
#include "fastlist/telemetry.h"
#include <cassert>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <sstream>
#include <string>
#include <type_traits>

namespace FastList {

/**
 * Doubly linked intrusive list over records of type T, threaded through the
 * Link<T> field named by Member.
 *
 * The list never allocates and never owns records. A record must stay at the
 * same address while linked, and must be linked into at most one list per
 * link field. Records using two link fields are two independent memberships.
 *
 * With a comparator, insert() keeps the list sorted (equal keys in insertion
 * order) and find_equal() searches by it. Without one, insert() appends and
 * find_equal() finds nothing.
 */
template <typename T, Link<T> T::*Member = LinkTraits<T>::member> class List {
  using Adapter = LinkAdapter<T, Member>;
  using Node = Link<T>;

  template <bool Const> class Iterator {
  public:
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = std::conditional_t<Const, const T *, T *>;
    using reference = std::conditional_t<Const, const T &, T &>;

    Iterator() noexcept = default;
    Iterator(const List *list, Node *node) noexcept
        : list_(list), node_(node) {}

    // const_iterator from iterator
    template <bool C = Const, typename = std::enable_if_t<C>>
    Iterator(const Iterator<false> &other) noexcept
        : list_(other.list_), node_(other.node_) {}

    reference operator*() const noexcept { return *Adapter::to_record(node_); }
    pointer operator->() const noexcept { return Adapter::to_record(node_); }

    Iterator &operator++() noexcept {
      node_ = List::next_of(node_);
      return *this;
    }

    Iterator operator++(int) noexcept {
      Iterator prev = *this;
      ++*this;
      return prev;
    }

    // end() steps back to the tail
    Iterator &operator--() noexcept {
      node_ = node_ ? List::prev_of(node_) : list_->tail_;
      return *this;
    }

    Iterator operator--(int) noexcept {
      Iterator prev = *this;
      --*this;
      return prev;
    }

    bool operator==(const Iterator &other) const noexcept {
      return node_ == other.node_;
    }

  private:
    friend class List;
    friend class Iterator<!Const>;

    const List *list_ = nullptr;
    Node *node_ = nullptr;
  };

public:
  // Three-way ordering of two records; a captureless lambda converts.
  using Compare = std::weak_ordering (*)(const T &, const T &);

  using value_type = T;
  using size_type = std::size_t;
  using iterator = Iterator<false>;
  using const_iterator = Iterator<true>;
  using reverse_iterator = std::reverse_iterator<iterator>;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;

  List() noexcept = default;

  explicit List(Compare compare, Telemetry *telemetry = nullptr) noexcept
      : compare_(compare), telemetry_(telemetry) {}

  // Links point back at this object, so a list stays where it was built.
  List(const List &) = delete;
  List &operator=(const List &) = delete;

  // Leaves every remaining record unlinked and reusable. Records still linked
  // here must outlive the list.
  ~List() { clear(); }

  // Appends at the tail. The record must not be linked through this field.
  void push(T &record) noexcept {
    append(Adapter::to_link(&record));
    if (telemetry_)
      telemetry_->record_push();
  }

  // Unlinks and returns the head, nullptr when empty.
  T *pop() noexcept {
    if (head_ == nullptr) {
      if (telemetry_)
        telemetry_->record_pop(true);
      return nullptr;
    }

    Node *node = head_;
    head_ = node->next_;
    if (head_ != nullptr)
      head_->prev_ = nullptr;
    else
      tail_ = nullptr;

    node->reset();
    --size_;

    if (telemetry_)
      telemetry_->record_pop(false);
    return Adapter::to_record(node);
  }

  /**
   * Sorted insert. The record goes before the first element it compares
   * strictly less than, so equal keys keep their insertion order. Appends when
   * no comparator was configured.
   */
  void insert(T &record) noexcept {
    Node *node = Adapter::to_link(&record);
    uint64_t compare_count = 0;

    Node *pos = nullptr;
    if (compare_ != nullptr && head_ != nullptr)
      pos = insert_position(record, compare_count);

    if (pos == nullptr)
      append(node);
    else if (pos == head_)
      prepend(node);
    else
      link_before(pos, node);

    if (telemetry_)
      telemetry_->record_insert(compare_count);
  }

  /**
   * Unlinks a record in O(1). Returns false, changing nothing, when the record
   * is detectably not linked here (for example a second remove). Removing a
   * record linked in another list is undefined; owner tracking asserts on it.
   */
  bool remove(T &record) noexcept {
    Node *node = Adapter::to_link(&record);

    if (!holds(node)) [[unlikely]] {
      if (telemetry_)
        telemetry_->record_remove(true);
      return false;
    }

    if (node->prev_ != nullptr)
      node->prev_->next_ = node->next_;
    else
      head_ = node->next_;

    if (node->next_ != nullptr)
      node->next_->prev_ = node->prev_;
    else
      tail_ = node->prev_;

    node->reset();
    --size_;

    if (telemetry_)
      telemetry_->record_remove(false);
    return true;
  }

  // First record comparing equal to target, nullptr if none or unsorted.
  T *find_equal(const T &target) const noexcept {
    if (compare_ == nullptr)
      return nullptr;

    uint64_t compare_count = 0;
    for (Node *curr = head_; curr != nullptr; curr = curr->next_) {
      T *record = Adapter::to_record(curr);
      ++compare_count;
      if (compare_(*record, target) == 0) {
        if (telemetry_)
          telemetry_->record_find(true, compare_count);
        return record;
      }
    }

    if (telemetry_)
      telemetry_->record_find(false, compare_count);
    return nullptr;
  }

  // Unlinks every record.
  void clear() noexcept {
    Node *curr = head_;
    while (curr != nullptr) {
      Node *next = curr->next_;
      curr->reset();
      curr = next;
    }
    head_ = nullptr;
    tail_ = nullptr;
    size_ = 0;
  }

  /**
   * Whether the record is linked through this field. Exact with owner
   * tracking; otherwise any linked record, or the sole element of this list,
   * reports true.
   */
  bool contains(const T &record) const noexcept {
    return holds(Adapter::to_link(&record));
  }

  T *front() const noexcept {
    return head_ ? Adapter::to_record(head_) : nullptr;
  }

  T *back() const noexcept {
    return tail_ ? Adapter::to_record(tail_) : nullptr;
  }

  size_type size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }

  Compare comparator() const noexcept { return compare_; }
  Telemetry *telemetry() const noexcept { return telemetry_; }
  void set_telemetry(Telemetry *telemetry) noexcept { telemetry_ = telemetry; }

  iterator begin() noexcept { return iterator(this, head_); }
  iterator end() noexcept { return iterator(this, nullptr); }
  const_iterator begin() const noexcept { return const_iterator(this, head_); }
  const_iterator end() const noexcept { return const_iterator(this, nullptr); }
  const_iterator cbegin() const noexcept { return begin(); }
  const_iterator cend() const noexcept { return end(); }

  reverse_iterator rbegin() noexcept { return reverse_iterator(end()); }
  reverse_iterator rend() noexcept { return reverse_iterator(begin()); }
  const_reverse_iterator rbegin() const noexcept {
    return const_reverse_iterator(end());
  }
  const_reverse_iterator rend() const noexcept {
    return const_reverse_iterator(begin());
  }

  // Adjacent records are non-decreasing. Always true without a comparator.
  bool is_sorted() const noexcept {
    if (compare_ == nullptr || head_ == nullptr)
      return true;
    for (Node *curr = head_; curr->next_ != nullptr; curr = curr->next_) {
      if (compare_(*Adapter::to_record(curr),
                   *Adapter::to_record(curr->next_)) > 0)
        return false;
    }
    return true;
  }

  /**
   * Walks the list both ways and checks: prev/next symmetry, null boundaries,
   * walk length == size() in each direction (which also rules out cycles), and
   * the owner tag when tracked.
   */
  bool check_invariants() const noexcept {
    if ((head_ == nullptr) != (tail_ == nullptr))
      return false;
    if (head_ != nullptr && (head_->prev_ != nullptr || tail_->next_ != nullptr))
      return false;

    size_type forward = 0;
    const Node *prev = nullptr;
    for (const Node *curr = head_; curr != nullptr; curr = curr->next_) {
      if (curr->prev_ != prev || ++forward > size_)
        return false;
#if FASTLIST_TRACK_OWNER
      if (curr->owner_ != this)
        return false;
#endif
      prev = curr;
    }
    if (prev != tail_ || forward != size_)
      return false;

    size_type backward = 0;
    for (const Node *curr = tail_; curr != nullptr; curr = curr->prev_) {
      if (++backward > size_)
        return false;
    }
    return backward == size_;
  }

  // `describe` is called as describe(std::ostream &, const T &) per record.
  template <typename Describe>
  std::string to_string(Describe describe) const {
    std::ostringstream oss;
    oss << "List(size=" << size_ << ", sorted=" << (compare_ ? "yes" : "no")
        << ")\n";
    for (const T &record : *this) {
      oss << "  ";
      describe(oss, record);
      oss << "\n";
    }
    return oss.str();
  }

private:
  static Node *next_of(const Node *node) noexcept { return node->next_; }
  static Node *prev_of(const Node *node) noexcept { return node->prev_; }

  // Node the record goes in front of, nullptr for the tail. Checks the tail
  // and head first so in-order and reverse-order feeds stay O(1).
  Node *insert_position(const T &record, uint64_t &compare_count) const
      noexcept {
    ++compare_count;
    if (compare_(record, *Adapter::to_record(tail_)) >= 0)
      return nullptr;

    ++compare_count;
    if (compare_(record, *Adapter::to_record(head_)) < 0)
      return head_;

    // head <= record < tail, so the walk stops before running off the end
    Node *curr = head_->next_;
    for (;; curr = curr->next_) {
      ++compare_count;
      if (compare_(record, *Adapter::to_record(curr)) < 0)
        return curr;
    }
  }

  bool holds(const Node *node) const noexcept {
#if FASTLIST_TRACK_OWNER
    assert((node->owner_ == nullptr || node->owner_ == this) &&
           "record is linked in another list");
    return node->owner_ == this;
#else
    return node->is_linked() || node == head_;
#endif
  }

  void claim([[maybe_unused]] Node *node) noexcept {
    assert(!node->is_linked() && node != head_ && "record is already linked");
#if FASTLIST_TRACK_OWNER
    assert(node->owner_ == nullptr && "record is already linked");
    node->owner_ = this;
#endif
    ++size_;
  }

  void append(Node *node) noexcept {
    claim(node);
    node->next_ = nullptr;
    node->prev_ = tail_;
    if (tail_ != nullptr)
      tail_->next_ = node;
    else
      head_ = node;
    tail_ = node;
  }

  void prepend(Node *node) noexcept {
    claim(node);
    node->prev_ = nullptr;
    node->next_ = head_;
    if (head_ != nullptr)
      head_->prev_ = node;
    else
      tail_ = node;
    head_ = node;
  }

  // pos is linked here and is not the head
  void link_before(Node *pos, Node *node) noexcept {
    claim(node);
    node->next_ = pos;
    node->prev_ = pos->prev_;
    pos->prev_->next_ = node;
    pos->prev_ = node;
  }

  Node *head_ = nullptr;
  Node *tail_ = nullptr;
  size_type size_ = 0;
  Compare compare_ = nullptr;
  Telemetry *telemetry_ = nullptr;
};

} // namespace FastList
