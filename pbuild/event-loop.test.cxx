// file      : pbuild/event-loop.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/event-loop.hxx>

#include <csignal>

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace pbuild
{
  // Event source that posts the specified number of events, one per wait.
  //
  class counting_source: public event_source
  {
  public:
    explicit
    counting_source (size_t n): remaining (n) {}

    virtual bool
    active () const override {return remaining != 0;}

    virtual void
    wait (event_loop& l) override
    {
      event e ("tick");
      e.job = remaining--;
      l.post (move (e));
    }

    size_t remaining;
  };

  static int
  main (int, char*[])
  {
    // Delivery order and listener order.
    //
    {
      event_loop l;
      strings r;

      l.connect ("a", [&r] (const event& e) {r.push_back ("a1:" + e.output);});
      l.connect ("a", [&r] (const event& e) {r.push_back ("a2:" + e.output);});
      l.connect ("b", [&r] (const event&) {r.push_back ("b");});

      event a1 ("a");
      a1.output = "x";
      l.post (move (a1));
      l.post (event ("b"));

      event a2 ("a");
      a2.output = "y";
      l.post (move (a2));

      assert (l.pending () == 3);

      l.run ();

      assert (l.empty ());
      assert (l.delivered () == 3);
      assert ((r == strings {"a1:x", "a2:x", "b", "a1:y", "a2:y"}));
    }

    // Events posted by listeners are delivered after the already pending
    // ones.
    //
    {
      event_loop l;
      strings r;

      l.connect ("a",
                 [&l, &r] (const event&)
                 {
                   r.push_back ("a");
                   l.post (event ("c"));
                 });

      l.connect ("b", [&r] (const event&) {r.push_back ("b");});
      l.connect ("c", [&r] (const event&) {r.push_back ("c");});

      l.post (event ("a"));
      l.post (event ("b"));
      l.run ();

      assert ((r == strings {"a", "b", "c"}));
    }

    // Actions and events without listeners.
    //
    {
      event_loop l;
      size_t n (0);

      l.post ([&n] () {++n;});
      l.post (event ("nobody"));
      l.post ([&n] () {n += 10;});
      l.run ();

      assert (n == 11);
      assert (l.delivered () == 3);
    }

    // Disconnect.
    //
    {
      event_loop l;
      size_t n (0);

      event_loop::connection c (
        l.connect ("a", [&n] (const event&) {++n;}));

      l.post (event ("a"));
      l.run ();
      assert (n == 1);

      l.disconnect (c);
      l.post (event ("a"));
      l.run ();
      assert (n == 1);
    }

    // Signal events.
    //
    {
      assert (signal_event (SIGINT) == "SIGINT");
      assert (signal_event (SIGTERM) == "SIGTERM");

      event_loop l;
      int s (0);

      l.connect (SIGINT, [&s] (const event& e) {s = e.signal;});

      event e (signal_event (SIGINT));
      e.signal = SIGINT;
      l.post (move (e));
      l.run ();

      assert (s == SIGINT);
    }

    // Event source is waited on until inactive.
    //
    {
      counting_source src (3);
      event_loop l (&src);
      vector<job_id> r;

      l.connect ("tick", [&r] (const event& e) {r.push_back (e.job);});
      l.run ();

      assert ((r == vector<job_id> {3, 2, 1}));
      assert (!src.active ());
    }

    // Listener exceptions propagate with the remaining events kept.
    //
    {
      event_loop l;
      size_t n (0);

      l.connect ("fail", [] (const event&) {throw failed (3);});
      l.connect ("ok", [&n] (const event&) {++n;});

      l.post (event ("fail"));
      l.post (event ("ok"));

      try
      {
        l.run ();
        assert (false);
      }
      catch (const failed& e)
      {
        assert (e.code == 3);
      }

      assert (l.pending () == 1);

      l.run ();
      assert (n == 1);
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return pbuild::main (argc, argv);
}
