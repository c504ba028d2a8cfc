#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "vg/core/type_utils.hpp"
#include "vg/internal/type_name.hpp"

namespace vg::oracle {

// Identity of a C++ type as seen by descriptors and checkers. Two ids are
// equal when they name the same cv/ref-stripped type.
struct type_id {
  std::uint64_t hash{};
  std::string_view name{};

  [[nodiscard]] constexpr auto empty() const noexcept -> bool {
    return hash == 0U;
  }

  [[nodiscard]] constexpr auto short_name() const noexcept -> std::string_view {
    return ::vg::internal::short_type_name(name);
  }

  [[nodiscard]] friend constexpr auto operator==(const type_id &lhs,
                                                 const type_id &rhs) noexcept
      -> bool {
    return lhs.hash == rhs.hash;
  }
};

template <typename t> [[nodiscard]] constexpr auto make_type_id() noexcept
    -> type_id {
  return type_id{::vg::internal::stable_type_hash<t>(),
                 ::vg::internal::stable_type_name<t>()};
}

// `name` must outlive every registry and descriptor the id is stored in.
[[nodiscard]] constexpr auto make_type_id(const std::string_view name) noexcept
    -> type_id {
  return type_id{::vg::internal::stable_name_hash(name), name};
}

// Specialize to std::true_type to mark a type as a test adapter.
template <typename t> struct adapter_marker : std::false_type {};

template <typename t>
inline constexpr bool adapter_marker_v =
    adapter_marker<core::remove_cvref_t<t>>::value;

// Specialize with `using type = core::type_list<...>` to declare the base
// classes and interfaces a type derives from.
template <typename t> struct type_bases {
  using type = core::type_list<>;
};

} // namespace vg::oracle

namespace std {

template <> struct hash<vg::oracle::type_id> {
  [[nodiscard]] auto operator()(const vg::oracle::type_id &id) const noexcept
      -> std::size_t {
    return static_cast<std::size_t>(id.hash);
  }
};

} // namespace std

namespace vg::oracle {

// Declared type graph plus the memoized adapter classification over it.
// All members are safe to call concurrently.
class type_registry {
public:
  type_registry() = default;
  type_registry(const type_registry &) = delete;
  auto operator=(const type_registry &) -> type_registry & = delete;

  template <typename t> void declare() {
    declare_bases<t>(typename type_bases<core::remove_cvref_t<t>>::type{});
  }

  void declare(const type_id type, const bool marked,
               std::vector<type_id> bases) {
    std::lock_guard lock(mutex_);
    declarations_.insert_or_assign(type, declaration{marked, std::move(bases)});
    cache_.clear();
  }

  [[nodiscard]] auto is_declared(const type_id type) const -> bool {
    std::lock_guard lock(mutex_);
    return declarations_.contains(type);
  }

  // A type is an adapter when it, or any base it transitively declares,
  // carries the adapter marker. Undeclared types are never adapters.
  [[nodiscard]] auto is_adapter(const type_id type) const -> bool {
    std::lock_guard lock(mutex_);
    return classify_locked(type);
  }

  [[nodiscard]] auto cached_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return cache_.size();
  }

  void reset() {
    std::lock_guard lock(mutex_);
    declarations_.clear();
    cache_.clear();
  }

  [[nodiscard]] static auto process() -> type_registry & {
    static type_registry instance;
    return instance;
  }

private:
  struct declaration {
    bool marked{false};
    std::vector<type_id> bases{};
  };

  template <typename t, typename... bases_t>
  void declare_bases(core::type_list<bases_t...>) {
    (declare<bases_t>(), ...);
    declare(make_type_id<t>(), adapter_marker_v<t>,
            std::vector<type_id>{make_type_id<bases_t>()...});
  }

  // Searches everything reachable from `type`. Only the queried type's
  // answer is cached: a member of a cycle cannot be decided until the whole
  // cycle has been walked.
  [[nodiscard]] auto classify_locked(const type_id type) const -> bool {
    if (const auto cached = cache_.find(type); cached != cache_.end()) {
      return cached->second;
    }

    bool adapter = false;
    std::unordered_set<type_id> visited{type};
    std::vector<type_id> pending{type};
    while (!adapter && !pending.empty()) {
      const auto current = pending.back();
      pending.pop_back();
      if (const auto cached = cache_.find(current); cached != cache_.end()) {
        adapter = cached->second;
        continue;
      }
      const auto found = declarations_.find(current);
      if (found == declarations_.end()) {
        continue;
      }
      adapter = found->second.marked;
      for (const auto &base : found->second.bases) {
        if (visited.insert(base).second) {
          pending.push_back(base);
        }
      }
    }

    cache_.insert_or_assign(type, adapter);
    return adapter;
  }

  mutable std::mutex mutex_{};
  std::unordered_map<type_id, declaration> declarations_{};
  mutable std::unordered_map<type_id, bool> cache_{};
};

} // namespace vg::oracle
