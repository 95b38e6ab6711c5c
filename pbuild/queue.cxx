// file      : pbuild/queue.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/queue.hxx>

#include <pbuild/diagnostics.hxx>

using namespace std;

namespace pbuild
{
  size_t
  default_load (queue_id q)
  {
    switch (q)
    {
    case queue_id::attr:
    case queue_id::build:    return cpu_count () * 2;
    case queue_id::checksum:
    case queue_id::fetch:
    case queue_id::install:
    case queue_id::package:
    case queue_id::clean:    return 1;
    }

    return 1; // Should never reach.
  }

  queue_manager::
  queue_manager (event_loop& l, job_executor& e)
      : loop_ (l), executor_ (e)
  {
    for (size_t i (0); i != queue_count; ++i)
      queues_[i].load = default_load (static_cast<queue_id> (i));

    loop_.connect (job_completed_event,
                   [this] (const event& e) {completed (e);});
  }

  void queue_manager::
  load (queue_id q, size_t n)
  {
    tracer trace ("queue_manager::load");

    l5 ([&]{trace << q << " load " << n;});

    queues_[index (q)].load = n;
    dispatch (q);
  }

  size_t queue_manager::
  queued () const
  {
    size_t r (0);
    for (const queue& q: queues_)
      r += q.jobs.size ();
    return r;
  }

  void queue_manager::
  submit (job j)
  {
    tracer trace ("queue_manager::submit");

    queue_id q (stage_queue (j.type));

    l5 ([&]{trace << j.origin << ' ' << j.type << " to " << q << " queue";});

    queues_[index (q)].jobs.push_back (move (j));
    dispatch (q);
  }

  bool queue_manager::
  cancel (port_id p, size_t s)
  {
    for (queue& q: queues_)
    {
      for (auto i (q.jobs.begin ()); i != q.jobs.end (); ++i)
      {
        if (i->port == p && i->stage == s)
        {
          q.jobs.erase (i);
          return true;
        }
      }
    }

    return false;
  }

  void queue_manager::
  kill_all ()
  {
    tracer trace ("queue_manager::kill_all");

    for (const auto& p: active_)
    {
      l4 ([&]{trace << "killing " << p.second.origin << ' '
                    << p.second.type;});

      executor_.kill (p.first);
    }
  }

  void queue_manager::
  dispatch (queue_id qi)
  {
    tracer trace ("queue_manager::dispatch");

    queue& q (queues_[index (qi)]);

    while (q.running < q.load && !q.jobs.empty ())
    {
      job j (move (q.jobs.front ()));
      q.jobs.pop_front ();

      j.id = next_++;

      if (++q.running > q.peak)
        q.peak = q.running;

      l5 ([&]{trace << "starting " << j.origin << ' ' << j.type << " ("
                    << q.running << '/' << q.load << ')';});

      auto i (active_.emplace (j.id, move (j)).first);

      if (started)
        started (i->second);

      executor_.spawn (i->second);
    }
  }

  void queue_manager::
  completed (const event& e)
  {
    tracer trace ("queue_manager::completed");

    auto i (active_.find (e.job));

    if (i == active_.end ())
    {
      l5 ([&]{trace << "unknown job " << e.job;});
      return;
    }

    job j (move (i->second));
    active_.erase (i);

    queue_id qi (stage_queue (j.type));
    --queues_[index (qi)].running;

    event c (e);
    c.name = stage_completed_event;
    c.port = j.port;
    c.stage = j.stage;
    loop_.post (move (c));

    // If the job could not be started due to the lack of resources and
    // there is nothing running that could free them, then no job will ever
    // start.
    //
    if (e.exhausted && active_.empty ())
    {
      event x (resource_exhausted_event);
      x.port = j.port;
      x.stage = j.stage;
      loop_.post (move (x));
    }

    dispatch (qi);
  }
}
