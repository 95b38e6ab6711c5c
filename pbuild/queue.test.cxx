// file      : pbuild/queue.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/queue.hxx>

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/job.test.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace pbuild
{
  static job
  make_test_job (const string& origin, stage_type t, port_id p = 0)
  {
    job j;
    j.port = p;
    j.type = t;
    j.origin = origin;
    j.args = strings {"true"};
    return j;
  }

  static int
  main (int, char*[])
  {
    assert (stage_queue (stage_type::depend) == queue_id::attr);
    assert (stage_queue (stage_type::checksum) == queue_id::checksum);
    assert (stage_queue (stage_type::clean) == queue_id::clean);

    assert (default_load (queue_id::attr) == cpu_count () * 2);
    assert (default_load (queue_id::build) == cpu_count () * 2);
    assert (default_load (queue_id::fetch) == 1);

    // Load limit and FIFO order.
    //
    {
      event_loop l;
      fake_executor x (l);
      l.source (&x);

      queue_manager q (l, x);
      q.load (queue_id::build, 2);

      vector<port_id> done;
      l.connect (stage_completed_event,
                 [&done] (const event& e)
                 {
                   assert (e.success);
                   done.push_back (e.port);
                 });

      for (port_id i (0); i != 5; ++i)
        q.submit (make_test_job ("devel/p" + to_string (i),
                                 stage_type::build,
                                 i));

      assert (q.running (queue_id::build) == 2);
      assert (q.queued (queue_id::build) == 3);
      assert (x.running () == 2);

      l.run ();

      assert (q.running () == 0);
      assert (q.queued () == 0);
      assert (q.peak (queue_id::build) == 2);
      assert (x.peak[static_cast<size_t> (queue_id::build)] == 2);
      assert ((done == vector<port_id> {0, 1, 2, 3, 4}));
      assert ((x.spawned == strings {"devel/p0 build",
                                     "devel/p1 build",
                                     "devel/p2 build",
                                     "devel/p3 build",
                                     "devel/p4 build"}));
    }

    // Queues are independent.
    //
    {
      event_loop l;
      fake_executor x (l);
      l.source (&x);

      queue_manager q (l, x);
      q.load (queue_id::fetch, 1);
      q.load (queue_id::install, 1);

      q.submit (make_test_job ("devel/a", stage_type::fetch));
      q.submit (make_test_job ("devel/b", stage_type::fetch));
      q.submit (make_test_job ("devel/c", stage_type::install));

      assert (q.running (queue_id::fetch) == 1);
      assert (q.running (queue_id::install) == 1);
      assert (q.queued (queue_id::fetch) == 1);

      l.run ();

      assert (q.peak (queue_id::fetch) == 1);
      assert (q.peak (queue_id::install) == 1);
    }

    // Zero load pauses the queue and raising it resumes.
    //
    {
      event_loop l;
      fake_executor x (l);
      l.source (&x);

      queue_manager q (l, x);
      q.load (queue_id::checksum, 0);

      q.submit (make_test_job ("devel/a", stage_type::checksum));
      l.run ();

      assert (x.spawned.empty ());
      assert (q.queued (queue_id::checksum) == 1);

      q.load (queue_id::checksum, 1);
      assert (q.running (queue_id::checksum) == 1);

      l.run ();
      assert (q.queued () == 0 && q.running () == 0);
      assert (x.count ("devel/a checksum") == 1);
    }

    // Cancel a queued job.
    //
    {
      event_loop l;
      fake_executor x (l);
      l.source (&x);

      queue_manager q (l, x);
      q.load (queue_id::package, 1);

      q.submit (make_test_job ("devel/a", stage_type::package, 0));
      q.submit (make_test_job ("devel/b", stage_type::package, 1));

      assert (!q.cancel (0, 0)); // Running.
      assert (q.cancel (1, 0));
      assert (!q.cancel (1, 0));

      l.run ();

      assert ((x.spawned == strings {"devel/a package"}));
    }

    // Started callback and job ids.
    //
    {
      event_loop l;
      fake_executor x (l);
      l.source (&x);

      queue_manager q (l, x);

      vector<job_id> ids;
      q.started = [&ids] (const job& j) {ids.push_back (j.id);};

      q.submit (make_test_job ("devel/a", stage_type::clean));
      q.submit (make_test_job ("devel/b", stage_type::clean));
      l.run ();

      assert ((ids == vector<job_id> {1, 2}));
    }

    // Failure is reported with the port and stage.
    //
    {
      event_loop l;
      fake_executor x (l);
      l.source (&x);

      queue_manager q (l, x);
      x.failures.insert ("devel/a fetch");

      bool s (true);
      port_id p (0);
      l.connect (stage_completed_event,
                 [&s, &p] (const event& e) {s = e.success; p = e.port;});

      q.submit (make_test_job ("devel/a", stage_type::fetch, 7));
      l.run ();

      assert (!s && p == 7);
    }

    // Resource exhaustion with nothing running.
    //
    {
      event_loop l;
      fake_executor x (l);
      l.source (&x);

      queue_manager q (l, x);
      x.exhausted.insert ("devel/a build");

      size_t n (0);
      l.connect (resource_exhausted_event,
                 [&n] (const event&) {++n;});

      q.submit (make_test_job ("devel/a", stage_type::build));
      l.run ();

      assert (n == 1);
    }

    // Kill all.
    //
    {
      event_loop l;
      fake_executor x (l);
      l.source (&x);

      queue_manager q (l, x);
      q.load (queue_id::build, 2);

      q.submit (make_test_job ("devel/a", stage_type::build, 0));
      q.submit (make_test_job ("devel/b", stage_type::build, 1));

      q.kill_all ();
      assert (x.killed.size () == 2);

      size_t failures (0);
      l.connect (stage_completed_event,
                 [&failures] (const event& e)
                 {
                   if (!e.success)
                     ++failures;
                 });

      l.run ();
      assert (failures == 2);
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return pbuild::main (argc, argv);
}
