#pragma once
#include <algorithm>
#include <bit>
#include <boost/intrusive/unordered_set.hpp>
#include <functional>
#include <limits>
#include <namedvec/allocator.hpp>
#include <namedvec/allocator_helper.hpp>
#include <namedvec/string.hpp>
#include <string_view>

namespace namedvec {

/**
 * @brief Unordered map from an owned name to a value.
 *
 * Nodes and the bucket array come from the fallible allocator; the table
 * itself is a boost::intrusive::unordered_set, so lookups by
 * std::string_view never build a temporary key. Buckets are allocated on the
 * first insertion or reservation and the load factor stays at or below one.
 */
template <typename V, typename Alloc = core_allocator> class name_index {
public:
  using key_type = basic_string<Alloc>;
  using mapped_type = V;
  using size_type = std::size_t;

  struct node : public boost::intrusive::unordered_set_base_hook<
                    boost::intrusive::store_hash<true>> {
    key_type key;
    V value;

    node(key_type &&k, V &&v) noexcept
        : key(std::move(k)), value(std::move(v)) {}
  };

private:
  struct key_of_node {
    using type = std::string_view;

    std::string_view operator()(const node &n) const noexcept {
      return n.key.view();
    }
  };

  struct name_hash {
    std::size_t operator()(std::string_view name) const noexcept {
      return std::hash<std::string_view>{}(name);
    }
  };

  struct name_equal {
    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
      return lhs == rhs;
    }
  };

  using set_t = boost::intrusive::unordered_set<
      node, boost::intrusive::key_of_value<key_of_node>,
      boost::intrusive::hash<name_hash>, boost::intrusive::equal<name_equal>,
      boost::intrusive::power_2_buckets<true>>;

  using bucket_type = typename set_t::bucket_type;
  using bucket_traits = typename set_t::bucket_traits;

  struct node_disposer {
    allocator_helper helper;
    void operator()(node *n) const noexcept { helper.deallocate(n); }
  };

  static constexpr size_type min_bucket_count = 8;

  Alloc *alloc_;
  set_t *set_ = nullptr;
  bucket_type *buckets_ = nullptr;
  size_type bucket_count_ = 0;

public:
  using iterator = typename set_t::iterator;
  using const_iterator = typename set_t::const_iterator;

  name_index() noexcept : alloc_(&get_default_allocator()) {}
  explicit name_index(Alloc &a) noexcept : alloc_(&a) {}

  // Move-only
  name_index(const name_index &) = delete;
  name_index &operator=(const name_index &) = delete;

  name_index(name_index &&other) noexcept
      : alloc_(other.alloc_), set_(std::exchange(other.set_, nullptr)),
        buckets_(std::exchange(other.buckets_, nullptr)),
        bucket_count_(std::exchange(other.bucket_count_, 0)) {}

  name_index &operator=(name_index &&other) noexcept {
    if (this != &other) {
      release();
      alloc_ = other.alloc_;
      set_ = std::exchange(other.set_, nullptr);
      buckets_ = std::exchange(other.buckets_, nullptr);
      bucket_count_ = std::exchange(other.bucket_count_, 0);
    }
    return *this;
  }

  ~name_index() { release(); }

  static result<name_index> try_allocate(Alloc &alloc,
                                         size_type capacity = 0) noexcept {
    name_index index(alloc);
    if (capacity > 0) {
      auto res = index.try_reserve(capacity);
      if (!res)
        return unexpected(res.error());
    }
    return index;
  }

  static result<name_index> try_create(size_type capacity = 0) noexcept {
    return try_allocate(get_default_allocator(), capacity);
  }

  size_type size() const noexcept { return set_ ? set_->size() : 0; }
  bool empty() const noexcept { return size() == 0; }
  size_type bucket_count() const noexcept { return bucket_count_; }

  // Null iterators compare equal, so an index without buckets is an empty
  // range.
  iterator begin() noexcept { return set_ ? set_->begin() : iterator(); }
  iterator end() noexcept { return set_ ? set_->end() : iterator(); }
  const_iterator begin() const noexcept {
    return set_ ? set_->cbegin() : const_iterator();
  }
  const_iterator end() const noexcept {
    return set_ ? set_->cend() : const_iterator();
  }

  bool contains(std::string_view name) const noexcept {
    return find_node(name) != nullptr;
  }

  [[nodiscard]] result<V *> try_at(std::string_view name) noexcept {
    node *n = find_node(name);
    if (!n)
      return unexpected(error::not_found);
    return &n->value;
  }

  [[nodiscard]] result<const V *> try_at(std::string_view name) const noexcept {
    const node *n = find_node(name);
    if (!n)
      return unexpected(error::not_found);
    return &n->value;
  }

  /**
   * @brief Adds name -> value. Fails with error::already_exists if the name is
   * present; the index is unchanged on any failure.
   */
  [[nodiscard]] result<V *> try_insert(std::string_view name,
                                       V value) noexcept {
    if (contains(name))
      return unexpected(error::already_exists);

    if (auto res = try_reserve(size() + 1); !res)
      return unexpected(res.error());

    auto key_res = key_type::try_allocate(*alloc_, name);
    if (!key_res)
      return unexpected(key_res.error());

    allocator_helper helper(*alloc_);
    auto node_res =
        helper.template try_allocate<node>(std::move(*key_res), std::move(value));
    if (!node_res)
      return unexpected(node_res.error());

    node *n = *node_res;
    set_->insert(*n);
    return &n->value;
  }

  size_type erase(std::string_view name) noexcept {
    if (!set_)
      return 0;
    return set_->erase_and_dispose(name, name_hash{}, name_equal{},
                                   node_disposer{allocator_helper(*alloc_)});
  }

  void clear() noexcept {
    if (set_)
      set_->clear_and_dispose(node_disposer{allocator_helper(*alloc_)});
  }

  /**
   * @brief Grows the bucket array so that `count` names fit without another
   * rehash. Never shrinks.
   */
  [[nodiscard]] result<void> try_reserve(size_type count) noexcept {
    if (count <= bucket_count_)
      return {};
    if (count > (std::numeric_limits<size_type>::max() >> 1) + 1)
      return unexpected(error::integer_overflow);
    return rebucket(std::max(min_bucket_count, std::bit_ceil(count)));
  }

  /**
   * @brief Moves the names into the smallest bucket array that holds them.
   * An empty index releases its buckets entirely.
   */
  [[nodiscard]] result<void> try_shrink_to_fit() noexcept {
    if (!set_)
      return {};
    if (set_->empty()) {
      release();
      return {};
    }
    const size_type wanted = std::max(min_bucket_count, std::bit_ceil(size()));
    if (wanted >= bucket_count_)
      return {};
    return rebucket(wanted);
  }

  [[nodiscard]] result<name_index> try_clone() const noexcept {
    name_index clone(*alloc_);
    if (auto res = clone.try_reserve(size()); !res)
      return unexpected(res.error());

    for (const node &n : *this) {
      V copy = n.value;
      auto res = clone.try_insert(n.key.view(), std::move(copy));
      if (!res)
        return unexpected(res.error());
    }
    return clone;
  }

  Alloc &get_allocator() const noexcept { return *alloc_; }

private:
  node *find_node(std::string_view name) const noexcept {
    if (!set_)
      return nullptr;
    auto it = set_->find(name, name_hash{}, name_equal{});
    if (it == set_->end())
      return nullptr;
    return &*it;
  }

  // Switches to a fresh array of new_count buckets. On failure the current
  // table is untouched.
  [[nodiscard]] result<void> rebucket(size_type new_count) noexcept {
    allocator_helper helper(*alloc_);
    auto array_res = helper.template allocate_array<bucket_type>(new_count);
    if (!array_res)
      return unexpected(array_res.error());

    if (!set_) {
      auto set_res = helper.template try_allocate<set_t>(
          bucket_traits(array_res->unsafe_get(), new_count));
      if (!set_res)
        return unexpected(set_res.error());
      set_ = *set_res;
    } else {
      set_->rehash(bucket_traits(array_res->unsafe_get(), new_count));
      helper.deallocate_array(buckets_, bucket_count_);
    }

    buckets_ = array_res->unsafe_release();
    bucket_count_ = new_count;
    return {};
  }

  void release() noexcept {
    if (!set_)
      return;
    allocator_helper helper(*alloc_);
    set_->clear_and_dispose(node_disposer{helper});
    helper.deallocate(set_);
    helper.deallocate_array(buckets_, bucket_count_);
    set_ = nullptr;
    buckets_ = nullptr;
    bucket_count_ = 0;
  }
};

} // namespace namedvec
