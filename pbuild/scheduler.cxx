// file      : pbuild/scheduler.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/scheduler.hxx>

#include <csignal>

#include <pbuild/diagnostics.hxx>

using namespace std;

namespace pbuild
{
  scheduler::
  scheduler (const configuration& c,
             event_loop& l,
             job_executor& e,
             const package_database& d)
      : conf_ (c),
        loop_ (l),
        queues_ (l, e),
        graph_ (c, l, queues_, d)
  {
    loop_.source (&e);

    // In the resolve-first mode only the attributes are loaded during the
    // first pass.
    //
    for (size_t i (0); i != queue_count; ++i)
    {
      queue_id q (static_cast<queue_id> (i));

      queues_.load (q,
                    conf_.resolve_first && q != queue_id::attr
                    ? 0
                    : conf_.load (q));
    }

    loop_.connect (SIGINT, [this] (const event&) {interrupt ();});
    loop_.connect (SIGTERM, [this] (const event&) {terminate ();});

    loop_.connect (cycle_event,
                   [this] (const event& e)
                   {
                     const port& p (graph_[e.port]);

                     if (p.requested && !fatal_)
                     {
                       error << "requested port " << p << " is part of "
                             << "dependency cycle";

                       fatal_ = true;
                       stop ();
                     }
                   });

    loop_.connect (resource_exhausted_event,
                   [this] (const event&)
                   {
                     if (!fatal_)
                     {
                       error << "unable to start any job: resources exhausted";

                       fatal_ = true;
                       stop ();
                     }
                   });
  }

  port_id scheduler::
  add (const string& o)
  {
    port_id i (graph_.get_port (o));
    port& p (graph_[i]);

    p.requested = true;

    if (conf_.force)
      p.force = true;

    if (find (requested_.begin (), requested_.end (), i) == requested_.end ())
      requested_.push_back (i);

    return i;
  }

  void scheduler::
  run ()
  {
    tracer trace ("scheduler::run");

    loop_.run ();

    if (conf_.resolve_first && !stopped_)
    {
      if (plan)
        plan ();

      l4 ([&]{trace << "starting second pass";});

      for (size_t i (0); i != queue_count; ++i)
      {
        queue_id q (static_cast<queue_id> (i));
        queues_.load (q, conf_.load (q));
      }

      loop_.run ();
    }
  }

  void scheduler::
  stop ()
  {
    tracer trace ("scheduler::stop");

    if (stopped_)
      return;

    l4 ([&]{trace << "stopping";});

    stopped_ = true;
    graph_.stages ().stop ();

    for (size_t i (0); i != queue_count; ++i)
      queues_.load (static_cast<queue_id> (i), 0);
  }

  void scheduler::
  interrupt ()
  {
    if (++interrupts_ == 1)
    {
      info << "interrupted, waiting for " << queues_.running ()
           << " running jobs to finish";
      stop ();
    }
    else
      terminate ();
  }

  void scheduler::
  terminate ()
  {
    error << "terminating, killing " << queues_.running () << " running jobs";

    queues_.kill_all ();
    throw failed (3);
  }

  int scheduler::
  status () const
  {
    if (interrupts_ != 0 && !fatal_)
      return 2;

    if (fatal_)
      return 1;

    for (size_t i (0); i != graph_.size (); ++i)
    {
      if (!graph_[i].succeeded ())
        return 1;
    }

    return 0;
  }
}
