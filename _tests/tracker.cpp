// Behavior of tracker + mutation: when listeners are called, and with what

#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "../tracker/tracker.hpp"
#include "test_helper.hpp"

using namespace dtrack;

struct my_data
{
  uint8_t a;

  bool operator == (const my_data&) const = default;
};

enum class my_enum
{
  first_value,
  second_value,
};

static bool track_struct()
{
  uint32_t change_count = 0;
  tracker<my_data> tracked_data { my_data { 1 } };

  tracked_data.add_listener(0, [&change_count](const my_data&, const my_data&) { ++change_count; });

  bool ok = check::debug::n_check(change_count == 0, "no change yet");

  [[maybe_unused]] const my_data& x = tracked_data.read();
  ok &= check::debug::n_check(change_count == 0, "read() does not notify");

  {
    auto m = tracked_data.begin_mutation();
    m->a = 10;
  }
  ok &= check::debug::n_check(change_count == 1, "10: one notification (got {})", change_count);

  {
    auto m = tracked_data.begin_mutation();
    m->a = 10;
  }
  ok &= check::debug::n_check(change_count == 1, "10 again: no notification (got {})", change_count);

  {
    auto m = tracked_data.begin_mutation();
    m->a += 10;
  }
  ok &= check::debug::n_check(change_count == 2, "20: one more notification (got {})", change_count);
  ok &= check::debug::n_check(tracked_data.read().a == 20, "final value is 20 (got {})", tracked_data.read().a);
  ok &= check::debug::n_check(change_count == 2, "reading does not notify");

  ok &= check::debug::n_check(tracked_data.remove_listener(0).has_value(), "the listener was registered");
  return ok;
}

static bool track_enum()
{
  uint32_t change_count = 0;
  tracker<my_enum> tracked_data { my_enum::first_value };

  tracked_data.add_listener(0, [&change_count](const my_enum&, const my_enum&) { ++change_count; });

  {
    auto m = tracked_data.begin_mutation();
    *m = my_enum::second_value;
  }

  bool ok = check::debug::n_check(change_count == 1, "one notification (got {})", change_count);
  ok &= check::debug::n_check(tracked_data.read() == my_enum::second_value, "the value is second_value");
  return ok;
}

static bool callback_arg_order()
{
  tracker<my_enum> tracked_data { my_enum::first_value };

  uint32_t run_count = 0;
  bool good_args = false;
  tracked_data.add_listener(0, [&](const my_enum& old_value, const my_enum& new_value)
  {
    ++run_count;
    good_args = old_value == my_enum::first_value && new_value == my_enum::second_value;
  });

  {
    auto m = tracked_data.begin_mutation();
    *m = my_enum::second_value;
  }

  bool ok = check::debug::n_check(run_count == 1, "the listener ran once (ran {} times)", run_count);
  ok &= check::debug::n_check(good_args, "the listener got (first_value, second_value)");
  return ok;
}

static bool writes_collapse_into_one_notification()
{
  tracker<int> tracked_data { 1 };

  std::vector<std::pair<int, int>> calls;
  tracked_data.add_listener(0, [&calls](const int& old_value, const int& new_value) { calls.emplace_back(old_value, new_value); });

  {
    auto m = tracked_data.begin_mutation();
    *m = 5;
    *m = 7;
    *m = 3;
  }

  bool ok = check::debug::n_check(calls.size() == 1, "a single notification (got {})", calls.size());
  ok &= check::debug::n_check((calls.size() == 1 && calls[0] == std::pair{1, 3}), "first value before, last value after");

  // going away and back: nothing changed across the mutation
  {
    auto m = tracked_data.begin_mutation();
    *m = 42;
    *m = 3;
  }
  ok &= check::debug::n_check(calls.size() == 1, "no notification when the value is restored (got {})", calls.size() - 1);

  // no write at all:
  {
    [[maybe_unused]] auto m = tracked_data.begin_mutation();
  }
  ok &= check::debug::n_check(calls.size() == 1, "no notification without writes");
  return ok;
}

static bool every_listener_sees_the_same_pair()
{
  tracker<std::string, std::string> tracked_data { "hello" };

  constexpr uint32_t k_listener_count = 5;
  std::vector<std::vector<std::pair<std::string, std::string>>> calls(k_listener_count);
  for (uint32_t i = 0; i < k_listener_count; ++i)
  {
    tracked_data.add_listener(fmt::format("listener-{}", i), [&calls, i](const std::string& old_value, const std::string& new_value)
    {
      calls[i].emplace_back(old_value, new_value);
    });
  }

  {
    auto m = tracked_data.begin_mutation();
    m->append(", world");
    m->append("!");
  }

  bool ok = true;
  for (uint32_t i = 0; i < k_listener_count; ++i)
  {
    ok &= check::debug::n_check(calls[i].size() == 1, "listener {} called once (got {})", i, calls[i].size());
    ok &= check::debug::n_check(calls[i].size() == 1 && calls[i][0].first == "hello" && calls[i][0].second == "hello, world!",
                                "listener {} got (hello, hello, world!)", i);
  }
  return ok;
}

static bool add_listener_replaces()
{
  tracker<int> tracked_data { 0 };

  uint32_t first_count = 0;
  uint32_t second_count = 0;

  auto previous = tracked_data.add_listener(7, [&first_count](const int&, const int&) { ++first_count; });
  bool ok = check::debug::n_check(!previous.has_value(), "no previous listener under a new key");

  previous = tracked_data.add_listener(7, [&second_count](const int&, const int&) { ++second_count; });
  ok &= check::debug::n_check(previous.has_value(), "the replaced listener is returned");
  ok &= check::debug::n_check(tracked_data.get_number_of_listeners() == 1, "still a single listener");

  // the returned callback is the first one:
  if (previous)
    (*previous)(0, 1);
  ok &= check::debug::n_check(first_count == 1, "the returned listener is the first one");

  tracked_data.modify([](int& v) { v = 1; });
  ok &= check::debug::n_check(first_count == 1, "the replaced listener is no longer called");
  ok &= check::debug::n_check(second_count == 1, "the new listener is called (got {})", second_count);
  return ok;
}

static bool remove_listener()
{
  tracker<int> tracked_data { 0 };

  uint32_t count = 0;
  tracked_data.add_listener(1, [&count](const int&, const int&) { ++count; });

  bool ok = check::debug::n_check(tracked_data.has_listener(1), "listener 1 is registered");
  ok &= check::debug::n_check(!tracked_data.remove_listener(2).has_value(), "removing an absent key returns nothing");
  ok &= check::debug::n_check(tracked_data.has_listener(1), "removing an absent key is a no-op");

  auto removed = tracked_data.remove_listener(1);
  ok &= check::debug::n_check(removed.has_value(), "removing a present key returns the listener");
  ok &= check::debug::n_check(!tracked_data.has_listener(1), "listener 1 is gone");

  tracked_data.modify([](int& v) { v = 12; });
  ok &= check::debug::n_check(count == 0, "a removed listener is never called");

  ok &= check::debug::n_check(!tracked_data.remove_listener(1).has_value(), "removing twice returns nothing");
  return ok;
}

static bool explicit_release()
{
  tracker<int> tracked_data { 0 };

  uint32_t count = 0;
  tracked_data.add_listener(0, [&count](const int&, const int&) { ++count; });

  auto m = tracked_data.begin_mutation();
  *m = 3;
  bool ok = check::debug::n_check(m.has_changed(), "the value differs from the snapshot");
  ok &= check::debug::n_check(m.get_snapshot() == 0, "the snapshot is the initial value");
  ok &= check::debug::n_check(count == 0, "nothing is notified before the release");

  m.release();
  ok &= check::debug::n_check(count == 1, "release() notifies (got {})", count);
  ok &= check::debug::n_check(m.is_released(), "the mutation is released");
  ok &= check::debug::n_check(!tracked_data.is_mutation_in_progress(), "the tracker is idle again");
  ok &= check::debug::n_check(tracked_data.read() == 3, "the tracker can be read after the release");

  ok &= check::debug::n_check(throws<mutation_released>([&] { m.release(); }), "a second release is rejected");
  ok &= check::debug::n_check(throws<mutation_released>([&] { *m = 4; }), "writing through a released mutation is rejected");
  ok &= check::debug::n_check(tracked_data.read() == 3, "the value is untouched");
  ok &= check::debug::n_check(count == 1, "no notification from a rejected access");

  // m goes out of scope here: no second notification
  return ok;
}

static bool release_on_exception()
{
  tracker<my_data> tracked_data { my_data { 1 } };

  uint32_t count = 0;
  tracked_data.add_listener(0, [&count](const my_data&, const my_data&) { ++count; });

  bool caught = false;
  try
  {
    auto m = tracked_data.begin_mutation();
    m->a = 5;
    throw std::runtime_error("leaving the scope early");
  }
  catch (const std::runtime_error&)
  {
    caught = true;
  }

  bool ok = check::debug::n_check(caught, "the exception went through");
  ok &= check::debug::n_check(count == 1, "the release happened while unwinding (got {})", count);
  ok &= check::debug::n_check(!tracked_data.is_mutation_in_progress(), "the tracker is idle again");
  ok &= check::debug::n_check(tracked_data.read().a == 5, "the write is kept");
  return ok;
}

static bool throwing_listener_while_unwinding()
{
  tracker<int> tracked_data { 1 };
  tracked_data.add_listener(0, [](const int&, const int&) { throw std::logic_error("listener failure"); });

  // the listener exception is logged, the exception that started the unwinding is the one caught
  bool caught_first = false;
  try
  {
    auto m = tracked_data.begin_mutation();
    *m = 2;
    throw std::runtime_error("leaving the scope early");
  }
  catch (const std::runtime_error&)
  {
    caught_first = true;
  }

  bool ok = check::debug::n_check(caught_first, "the exception thrown in the mutation scope is propagated");
  ok &= check::debug::n_check(!tracked_data.is_mutation_in_progress(), "the tracker is idle again");
  ok &= check::debug::n_check(tracked_data.read() == 2, "the write is kept");
  return ok;
}

static bool modify()
{
  tracker<my_data> tracked_data { my_data { 1 } };

  std::vector<std::pair<uint8_t, uint8_t>> calls;
  tracked_data.add_listener(0, [&calls](const my_data& old_value, const my_data& new_value) { calls.emplace_back(old_value.a, new_value.a); });

  const int result = tracked_data.modify([](my_data& v)
  {
    v.a = 9;
    return 42;
  });

  bool ok = check::debug::n_check(result == 42, "modify() returns what the function returns");
  ok &= check::debug::n_check((calls.size() == 1 && calls[0] == std::pair<uint8_t, uint8_t>{1, 9}), "modify() notifies (1, 9)");

  tracked_data.modify([](my_data& v) { v.a = 9; });
  ok &= check::debug::n_check(calls.size() == 1, "modify() without change does not notify");
  return ok;
}

namespace
{
  struct change_recorder
  {
    std::vector<int> new_values;

    void on_changed(const int&, const int& new_value)
    {
      new_values.push_back(new_value);
    }
  };
}

static bool member_function_listener()
{
  tracker<int> tracked_data { 0 };
  change_recorder recorder;

  tracked_data.add_listener(0, recorder, &change_recorder::on_changed);
  tracked_data.modify([](int& v) { v = 4; });
  tracked_data.modify([](int& v) { v = 8; });

  return check::debug::n_check((recorder.new_values == std::vector<int>{4, 8}), "the member function got 4 then 8");
}

// the tracker is created here, mutated on a worker thread
static bool mutation_from_another_thread()
{
  tracker<my_data> tracked_data { my_data { 42 } };

  uint32_t count = 0;
  std::thread::id listener_thread;
  tracked_data.add_listener(0, [&](const my_data&, const my_data&)
  {
    ++count;
    listener_thread = std::this_thread::get_id();
  });

  std::thread::id worker_thread;
  std::thread worker([&]
  {
    worker_thread = std::this_thread::get_id();
    auto m = tracked_data.begin_mutation();
    m->a = 123;
  });
  worker.join();

  bool ok = check::debug::n_check(count == 1, "one notification (got {})", count);
  ok &= check::debug::n_check(listener_thread == worker_thread, "the listener ran on the releasing thread");
  ok &= check::debug::n_check(tracked_data.read().a == 123, "the write is visible after join");
  return ok;
}

int main(int, char**)
{
  test_helper_t helper("tracker");

  helper.run("track_struct", track_struct);
  helper.run("track_enum", track_enum);
  helper.run("callback_arg_order", callback_arg_order);
  helper.run("writes_collapse_into_one_notification", writes_collapse_into_one_notification);
  helper.run("every_listener_sees_the_same_pair", every_listener_sees_the_same_pair);
  helper.run("add_listener_replaces", add_listener_replaces);
  helper.run("remove_listener", remove_listener);
  helper.run("explicit_release", explicit_release);
  helper.run("release_on_exception", release_on_exception);
  helper.run("throwing_listener_while_unwinding", throwing_listener_while_unwinding);
  helper.run("modify", modify);
  helper.run("member_function_listener", member_function_listener);
  helper.run("mutation_from_another_thread", mutation_from_another_thread);

  return helper.finish();
}
