// file      : pbuild/process-executor.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/process-executor.hxx>

#include <signal.h> // raise()

#include <chrono>
#include <thread> // this_thread::sleep_for()

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace pbuild
{
  static job
  test_job (job_id i, strings args, bool capture = false)
  {
    job j;
    j.id = i;
    j.origin = "test/job";
    j.args = move (args);
    j.capture = capture;
    return j;
  }

  static int
  main (int, char*[])
  {
    event_loop loop;
    process_executor x (loop);
    loop.source (&x);

    map<job_id, event> done;
    loop.connect (job_completed_event,
                  [&done] (const event& e) {done[e.job] = e;});

    vector<int> sigs;
    loop.connect (SIGINT,
                  [&sigs] (const event& e) {sigs.push_back (e.signal);});

    // Exit status.
    //
    x.spawn (test_job (1, {"true"}));
    x.spawn (test_job (2, {"false"}));
    assert (x.running () == 2);

    loop.run ();

    assert (done.size () == 2);
    assert (done[1].success);
    assert (!done[2].success && !done[2].exhausted);
    assert (!x.active ());

    // Program that cannot be found.
    //
    x.spawn (test_job (3, {"pbuild-no-such-program"}));
    assert (x.running () == 0);

    loop.run ();

    assert (done.count (3) == 1);
    assert (!done[3].success && !done[3].exhausted);

    // Captured output.
    //
    x.spawn (test_job (4, {"sh", "-c", "echo x"}, true));
    x.spawn (test_job (5, {"sh", "-c", "echo y; exit 1"}, true));
    loop.run ();

    assert (done[4].success && done[4].output == "x\n");
    assert (!done[5].success && done[5].output == "y\n");

    // Not captured output.
    //
    x.spawn (test_job (6, {"sh", "-c", "echo z"}));
    loop.run ();

    assert (done[6].success && done[6].output.empty ());

    // Signal caught while a job is running.
    //
    x.spawn (test_job (7, {"sleep", "1"}));
    raise (SIGINT);
    loop.run ();

    assert ((sigs == vector<int> {SIGINT}));
    assert (done[7].success);

    // Killing a job also kills its children which would otherwise keep the
    // output pipe open.
    //
    {
      auto s (chrono::steady_clock::now ());

      x.spawn (test_job (8, {"sh", "-c", "sleep 30 & echo x; wait"}, true));
      this_thread::sleep_for (chrono::milliseconds (500));

      x.kill (8);
      loop.run ();

      assert (!done[8].success);
      assert (chrono::steady_clock::now () - s < chrono::seconds (20));
    }

    // Killing unknown or completed jobs is a noop.
    //
    x.kill (1);
    x.kill (100);
    assert (loop.empty () && !x.active ());

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return pbuild::main (argc, argv);
}
