// Accesses that must be rejected while a mutation is in progress, and failures during the release

#include <cstdint>
#include <stdexcept>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#include "../tracker/tracker.hpp"
#include "test_helper.hpp"

using namespace dtrack;

static bool second_mutation_is_rejected()
{
  tracker<int> tracked_data { 0 };
  uint32_t count = 0;
  tracked_data.add_listener(0, [&count](const int&, const int&) { ++count; });

  bool ok = true;
  {
    auto m = tracked_data.begin_mutation();
    *m = 1;

    ok &= check::debug::n_check(throws<mutation_in_progress>([&] { [[maybe_unused]] auto m2 = tracked_data.begin_mutation(); }),
                                "a second mutation is rejected");
    ok &= check::debug::n_check(throws<mutation_in_progress>([&] { tracked_data.modify([](int& v) { v = 2; }); }),
                                "modify() is rejected");
    ok &= check::debug::n_check(*m == 1, "the first mutation is untouched");
    ok &= check::debug::n_check(tracked_data.is_mutation_in_progress(), "the first mutation still holds the tracker");
  }

  ok &= check::debug::n_check(count == 1, "only the first mutation notified (got {})", count);
  ok &= check::debug::n_check(tracked_data.read() == 1, "the value is the one written by the first mutation");
  return ok;
}

static bool access_during_mutation_is_rejected()
{
  tracker<int> tracked_data { 0 };
  auto m = tracked_data.begin_mutation();

  bool ok = check::debug::n_check(throws<mutation_in_progress>([&] { [[maybe_unused]] const int& v = tracked_data.read(); }), "read() is rejected");
  ok &= check::debug::n_check(throws<mutation_in_progress>([&] { tracked_data.add_listener(0, [](const int&, const int&) {}); }), "add_listener() is rejected");
  ok &= check::debug::n_check(throws<mutation_in_progress>([&] { tracked_data.remove_listener(0); }), "remove_listener() is rejected");
  ok &= check::debug::n_check(throws<mutation_in_progress>([&] { tracked_data.has_listener(0); }), "has_listener() is rejected");
  ok &= check::debug::n_check(throws<mutation_in_progress>([&] { tracked_data.get_number_of_listeners(); }), "get_number_of_listeners() is rejected");
  ok &= check::debug::n_check(throws<mutation_in_progress>([&] { [[maybe_unused]] auto v = tracked_data.begin_read(); }), "begin_read() is rejected");

  m.release();
  ok &= check::debug::n_check(tracked_data.read() == 0, "read() works again after the release");
  ok &= check::debug::n_check(!tracked_data.add_listener(0, [](const int&, const int&) {}).has_value(), "add_listener() works again after the release");
  return ok;
}

static bool mutation_from_another_thread_is_rejected()
{
  tracker<int> tracked_data { 0 };
  auto m = tracked_data.begin_mutation();

  bool rejected = false;
  std::thread other([&]
  {
    rejected = throws<mutation_in_progress>([&] { [[maybe_unused]] auto m2 = tracked_data.begin_mutation(); });
  });
  other.join();

  return check::debug::n_check(rejected, "a mutation from another thread is rejected while one is in progress");
}

// listeners cannot reach into the tracker: the notification is part of the mutation
static bool listener_calling_back_is_rejected()
{
  tracker<int> tracked_data { 0 };
  bool rejected = false;
  tracked_data.add_listener(0, [&](const int&, const int&)
  {
    rejected = throws<mutation_in_progress>([&] { [[maybe_unused]] const int& v = tracked_data.read(); });
  });

  tracked_data.modify([](int& v) { v = 5; });

  bool ok = check::debug::n_check(rejected, "read() from a listener is rejected");
  ok &= check::debug::n_check(!tracked_data.is_mutation_in_progress(), "the tracker is idle after the notification");
  return ok;
}

static bool throwing_listener_propagates_from_scope_exit()
{
  tracker<int> tracked_data { 0 };
  tracked_data.add_listener(0, [](const int&, const int& new_value)
  {
    if (new_value == 1)
      throw std::runtime_error("listener failure");
  });

  bool caught = false;
  try
  {
    auto m = tracked_data.begin_mutation();
    *m = 1;
  }
  catch (const std::runtime_error&)
  {
    caught = true;
  }

  bool ok = check::debug::n_check(caught, "the listener exception reaches the code that ended the mutation");
  ok &= check::debug::n_check(!tracked_data.is_mutation_in_progress(), "the tracker is idle after the failure");
  ok &= check::debug::n_check(tracked_data.read() == 1, "the write is kept");

  // still usable:
  tracked_data.modify([](int& v) { v = 2; });
  ok &= check::debug::n_check(tracked_data.read() == 2, "a new mutation works");
  return ok;
}

static bool throwing_listener_propagates_from_release()
{
  tracker<int> tracked_data { 0 };
  tracked_data.add_listener(0, [](const int&, const int&) { throw std::runtime_error("listener failure"); });

  auto m = tracked_data.begin_mutation();
  *m = 1;

  bool ok = check::debug::n_check(throws<std::runtime_error>([&] { m.release(); }), "release() propagates the listener exception");
  ok &= check::debug::n_check(m.is_released(), "the mutation is released anyway");
  ok &= check::debug::n_check(!tracked_data.is_mutation_in_progress(), "the tracker is idle after the failure");
  return ok;
}

static bool mutation_during_read_is_rejected()
{
  tracker<int> tracked_data { 4 };
  uint32_t count = 0;
  tracked_data.add_listener(0, [&count](const int&, const int&) { ++count; });

  bool ok = true;
  {
    auto first = tracked_data.begin_read();
    auto second = tracked_data.begin_read();
    ok &= check::debug::n_check(tracked_data.get_number_of_readers() == 2, "two read views (got {})", tracked_data.get_number_of_readers());
    ok &= check::debug::n_check(*first == 4 && *second == 4, "both views see the value");
    ok &= check::debug::n_check(tracked_data.read() == 4, "read() is still allowed");

    ok &= check::debug::n_check(throws<read_in_progress>([&] { [[maybe_unused]] auto m = tracked_data.begin_mutation(); }), "begin_mutation() is rejected");
    ok &= check::debug::n_check(throws<read_in_progress>([&] { tracked_data.modify([](int& v) { v = 5; }); }), "modify() is rejected");
    ok &= check::debug::n_check(!tracked_data.is_mutation_in_progress(), "the rejected mutation left the tracker idle");
    ok &= check::debug::n_check(*first == 4, "the value did not change under the reader");
  }

  ok &= check::debug::n_check(tracked_data.get_number_of_readers() == 0, "no read view left");
  tracked_data.modify([](int& v) { v = 5; });
  ok &= check::debug::n_check(count == 1 && tracked_data.read() == 5, "a mutation works once the views are gone");
  return ok;
}

static bool mutation_from_another_thread_during_read_is_rejected()
{
  tracker<int> tracked_data { 0 };
  auto view = tracked_data.begin_read();

  bool rejected = false;
  std::thread other([&]
  {
    rejected = throws<read_in_progress>([&] { tracked_data.modify([](int& v) { v = 1; }); });
  });
  other.join();

  bool ok = check::debug::n_check(rejected, "a mutation from another thread is rejected while a read view is alive");
  ok &= check::debug::n_check(*view == 0, "the value is untouched");
  return ok;
}

#if !DT_DISABLE_CHECKS
// the failed assertion stops the process, so the destruction happens in a child process
static bool destroying_a_tracker_with_a_live_mutation_stops_the_program()
{
  const pid_t pid = fork();
  if (pid == 0)
  {
    struct holder { tracker<int>::mutation_t m; };

    auto* tracked_data = new tracker<int> { 0 };
    [[maybe_unused]] auto* h = new holder { tracked_data->begin_mutation() };
    delete tracked_data;
    _exit(0);
  }

  int status = 0;
  if (!check::debug::n_check(pid > 0 && waitpid(pid, &status, 0) == pid, "could not run the child process"))
    return false;
  return check::debug::n_check(WIFSIGNALED(status), "the child process was not stopped (status: {})", status);
}
#endif

namespace
{
  // copies fail on demand
  struct fragile
  {
    int v = 0;
    inline static bool fail_copy = false;

    fragile(int _v) : v(_v) {}
    fragile(const fragile& o) : v(o.v)
    {
      if (fail_copy)
        throw std::runtime_error("fragile: copy failed");
    }
    fragile& operator = (const fragile&) = default;

    bool operator == (const fragile&) const = default;
  };
}

static bool failed_snapshot_leaves_the_tracker_idle()
{
  tracker<fragile> tracked_data { fragile { 3 } };

  fragile::fail_copy = true;
  const bool failed = throws<std::runtime_error>([&] { [[maybe_unused]] auto m = tracked_data.begin_mutation(); });
  fragile::fail_copy = false;

  bool ok = check::debug::n_check(failed, "the snapshot copy failure is propagated");
  ok &= check::debug::n_check(!tracked_data.is_mutation_in_progress(), "no mutation is in progress");
  ok &= check::debug::n_check(tracked_data.read().v == 3, "the value is untouched");

  tracked_data.modify([](fragile& f) { f.v = 4; });
  ok &= check::debug::n_check(tracked_data.read().v == 4, "a new mutation works");
  return ok;
}

int main(int, char**)
{
  test_helper_t helper("misuse");

  helper.run("second_mutation_is_rejected", second_mutation_is_rejected);
  helper.run("access_during_mutation_is_rejected", access_during_mutation_is_rejected);
  helper.run("mutation_from_another_thread_is_rejected", mutation_from_another_thread_is_rejected);
  helper.run("listener_calling_back_is_rejected", listener_calling_back_is_rejected);
  helper.run("throwing_listener_propagates_from_scope_exit", throwing_listener_propagates_from_scope_exit);
  helper.run("throwing_listener_propagates_from_release", throwing_listener_propagates_from_release);
  helper.run("failed_snapshot_leaves_the_tracker_idle", failed_snapshot_leaves_the_tracker_idle);
  helper.run("mutation_during_read_is_rejected", mutation_during_read_is_rejected);
  helper.run("mutation_from_another_thread_during_read_is_rejected", mutation_from_another_thread_during_read_is_rejected);
#if !DT_DISABLE_CHECKS
  helper.run("destroying_a_tracker_with_a_live_mutation_stops_the_program", destroying_a_tracker_with_a_live_mutation_stops_the_program);
#endif

  return helper.finish();
}
