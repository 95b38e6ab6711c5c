// file      : pbuild/event-loop.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/event-loop.hxx>

#include <csignal>

#include <pbuild/diagnostics.hxx>

using namespace std;

namespace pbuild
{
  const string job_completed_event      ("job-completed");
  const string stage_completed_event    ("stage-completed");
  const string pipeline_completed_event ("pipeline-completed");
  const string port_finished_event      ("port-finished");
  const string port_failed_event        ("port-failed");
  const string cycle_event              ("cycle");
  const string resource_exhausted_event ("resource-exhausted");

  string
  signal_event (int s)
  {
    switch (s)
    {
    case SIGINT:  return "SIGINT";
    case SIGTERM: return "SIGTERM";
    case SIGHUP:  return "SIGHUP";
    case SIGCHLD: return "SIGCHLD";
    }

    return "SIG" + to_string (s);
  }

  event_loop::connection event_loop::
  connect (const string& n, listener l)
  {
    connection c (next_++);
    listeners_[n].push_back (slot {c, move (l)});
    return c;
  }

  void event_loop::
  disconnect (connection c)
  {
    for (auto& p: listeners_)
    {
      vector<slot>& ss (p.second);

      for (auto i (ss.begin ()); i != ss.end (); ++i)
      {
        if (i->id == c)
        {
          ss.erase (i);
          return;
        }
      }
    }
  }

  void event_loop::
  post (event e)
  {
    events_.push_back (move (e));
  }

  void event_loop::
  post (function<void ()> f)
  {
    event e;
    e.action = move (f);
    events_.push_back (move (e));
  }

  void event_loop::
  run ()
  {
    tracer trace ("event_loop::run");

    for (;;)
    {
      while (!events_.empty ())
      {
        event e (move (events_.front ()));
        events_.pop_front ();

        ++delivered_;
        dispatch (e);
      }

      if (source_ == nullptr || !source_->active ())
        break;

      l6 ([&]{trace << "waiting for event source";});
      source_->wait (*this);
    }
  }

  void event_loop::
  dispatch (const event& e)
  {
    tracer trace ("event_loop::dispatch");

    if (e.action)
      e.action ();

    if (e.name.empty ())
      return;

    l6 ([&]{trace << e.name;});

    auto i (listeners_.find (e.name));
    if (i == listeners_.end ())
      return;

    // Listeners may connect and disconnect so iterate over a snapshot.
    //
    vector<slot> ss (i->second);
    for (const slot& s: ss)
      s.func (e);
  }
}
