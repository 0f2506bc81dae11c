// listener_registry on its own: keyed insert/remove and notification rounds

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>

#include "../tracker/listener_registry.hpp"
#include "test_helper.hpp"

using namespace dtrack;

using registry_t = listener_registry<int, std::string>;

static bool insert_and_remove()
{
  registry_t registry;
  uint32_t a_count = 0;
  uint32_t b_count = 0;

  bool ok = check::debug::n_check(registry.empty(), "a new registry is empty");

  ok &= check::debug::n_check(!registry.insert("a", [&a_count](const int&, const int&) { ++a_count; }).has_value(), "inserting a new key returns nothing");
  ok &= check::debug::n_check(!registry.insert("b", [&b_count](const int&, const int&) { ++b_count; }).has_value(), "inserting a new key returns nothing");
  ok &= check::debug::n_check(registry.size() == 2, "two entries (got {})", registry.size());
  ok &= check::debug::n_check(registry.contains("a") && registry.contains("b"), "both keys are present");

  auto replaced = registry.insert("a", [](const int&, const int&) {});
  ok &= check::debug::n_check(replaced.has_value(), "inserting over a key returns the previous callback");
  ok &= check::debug::n_check(registry.size() == 2, "replacing does not add an entry");
  if (replaced)
    (*replaced)(1, 2);
  ok &= check::debug::n_check(a_count == 1, "the returned callback is the replaced one");

  auto removed = registry.remove("b");
  ok &= check::debug::n_check(removed.has_value(), "removing a present key returns its callback");
  ok &= check::debug::n_check(!registry.contains("b"), "b is gone");
  ok &= check::debug::n_check(!registry.remove("b").has_value(), "removing an absent key returns nothing");
  ok &= check::debug::n_check(!registry.remove("never-there").has_value(), "removing an unknown key returns nothing");
  ok &= check::debug::n_check(registry.size() == 1, "one entry left (got {})", registry.size());

  registry.notify_all(1, 2);
  ok &= check::debug::n_check(b_count == 0, "a removed callback is not called");
  return ok;
}

static bool notify_all_calls_each_listener_once()
{
  registry_t registry;
  std::multiset<std::string> called;
  bool good_args = true;

  for (const char* key : { "first", "second", "third", "fourth" })
  {
    registry.insert(key, [&called, &good_args, name = std::string(key)](const int& old_value, const int& new_value)
    {
      called.insert(name);
      good_args = good_args && old_value == 10 && new_value == 20;
    });
  }

  registry.notify_all(10, 20);

  bool ok = check::debug::n_check(called.size() == 4, "four calls (got {})", called.size());
  for (const char* key : { "first", "second", "third", "fourth" })
    ok &= check::debug::n_check(called.count(key) == 1, "{} called exactly once (got {})", key, called.count(key));
  ok &= check::debug::n_check(good_args, "every listener got (10, 20)");
  return ok;
}

static bool for_each_visits_every_entry()
{
  registry_t registry;
  registry.insert("x", [](const int&, const int&) {});
  registry.insert("y", [](const int&, const int&) {});

  std::set<std::string> keys;
  registry.for_each([&keys](const std::string& key, registry_t::callback_t&) { keys.insert(key); });

  return check::debug::n_check((keys == std::set<std::string>{"x", "y"}), "for_each visited x and y");
}

static bool empty_callback_is_rejected()
{
  registry_t registry;

  bool ok = check::debug::n_check(throws<invalid_listener>([&] { registry.insert("empty", registry_t::callback_t{}); }), "an empty callback is rejected");
  ok &= check::debug::n_check(registry.empty(), "nothing was registered");
  return ok;
}

// The failure is not caught, listeners after the failing one may not be called for that round.
// The iteration order being unspecified, only bounds can be checked.
static bool listener_failure_propagates()
{
  registry_t registry;
  uint32_t good_count = 0;
  uint32_t failing_count = 0;

  registry.insert("good-1", [&good_count](const int&, const int&) { ++good_count; });
  registry.insert("failing", [&failing_count](const int&, const int&) { ++failing_count; throw std::runtime_error("listener failure"); });
  registry.insert("good-2", [&good_count](const int&, const int&) { ++good_count; });

  const bool propagated = throws<std::runtime_error>([&] { registry.notify_all(0, 1); });

  bool ok = check::debug::n_check(propagated, "the listener exception reaches the caller of notify_all");
  ok &= check::debug::n_check(failing_count == 1, "the failing listener ran once (got {})", failing_count);
  ok &= check::debug::n_check(good_count <= 2, "no listener ran twice (got {} calls)", good_count);

  // the registry is still usable:
  registry.remove("failing");
  good_count = 0;
  registry.notify_all(1, 2);
  ok &= check::debug::n_check(good_count == 2, "the next round calls every listener (got {})", good_count);
  return ok;
}

int main(int, char**)
{
  test_helper_t helper("listener_registry");

  helper.run("insert_and_remove", insert_and_remove);
  helper.run("notify_all_calls_each_listener_once", notify_all_calls_each_listener_once);
  helper.run("for_each_visits_every_entry", for_each_visits_every_entry);
  helper.run("empty_callback_is_rejected", empty_callback_is_rejected);
  helper.run("listener_failure_propagates", listener_failure_propagates);

  return helper.finish();
}
