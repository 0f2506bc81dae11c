
// C++ file that only does include headers and enable the static_assert checks

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "tracker/tracker.hpp"

namespace dtrack::static_checks
{
  struct not_comparable { int a; };
  struct not_copyable
  {
    not_copyable() = default;
    not_copyable(const not_copyable&) = delete;
    bool operator == (const not_copyable&) const = default;
  };
  struct comparable { int a; bool operator == (const comparable&) const = default; };
  struct not_hashable { int a; bool operator == (const not_hashable&) const = default; };

  static_assert(trackable<int>, "trackable: int should be trackable");
  static_assert(trackable<std::string>, "trackable: std::string should be trackable");
  static_assert(trackable<comparable>, "trackable: a comparable struct should be trackable");
  static_assert(!trackable<not_comparable>, "trackable: BAD: a value without operator == cannot be diffed");
  static_assert(!trackable<not_copyable>, "trackable: BAD: a value that cannot be copied cannot be snapshot");

  static_assert(listener_key<int>, "listener_key: int should be a valid key");
  static_assert(listener_key<std::string>, "listener_key: std::string should be a valid key");
  static_assert(!listener_key<not_hashable>, "listener_key: BAD: no std::hash for not_hashable");

  using tracker_t = tracker<comparable>;
  static_assert(std::is_same_v<tracker_t::key_t, uint64_t>, "tracker: BAD default key type");
  static_assert(!std::is_copy_constructible_v<tracker_t>, "tracker: BAD: must not be copyable");

  static_assert(!std::is_copy_constructible_v<tracker_t::mutation_t>, "mutation: BAD: must not be copyable");
  static_assert(!std::is_move_constructible_v<tracker_t::mutation_t>, "mutation: BAD: must not be movable");
  static_assert(!std::is_copy_constructible_v<tracker_t::read_view_t>, "read_view: BAD: must not be copyable");
  static_assert(!std::is_move_constructible_v<tracker_t::read_view_t>, "read_view: BAD: must not be movable");
  static_assert(std::is_same_v<decltype(*std::declval<const tracker_t::read_view_t&>()), const comparable&>, "read_view: BAD operator * return type");
  static_assert(!std::is_nothrow_destructible_v<tracker_t::mutation_t>, "mutation: BAD: the destructor must be able to propagate listener exceptions");

  static_assert(std::is_same_v<decltype(std::declval<tracker_t&>().begin_mutation()), tracker_t::mutation_t>, "tracker: BAD begin_mutation() return type");
  static_assert(std::is_same_v<decltype(std::declval<const tracker_t&>().read()), const comparable&>, "tracker: BAD read() return type");
  static_assert(std::is_same_v<decltype(std::declval<tracker_t&>().remove_listener(0)), std::optional<tracker_t::callback_t>>, "tracker: BAD remove_listener() return type");
  static_assert(std::is_same_v<decltype(*std::declval<tracker_t::mutation_t&>()), comparable&>, "mutation: BAD operator * return type");
}
