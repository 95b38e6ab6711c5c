// file      : pbuild/stage-machine.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/stage-machine.hxx>

#include <pbuild/make.hxx>
#include <pbuild/diagnostics.hxx>

using namespace std;

namespace pbuild
{
  stage_machine::
  stage_machine (const configuration& c,
                 event_loop& l,
                 queue_manager& q,
                 port_table& t)
      : conf_ (c), loop_ (l), queues_ (q), ports_ (t)
  {
    queues_.started = [this] (const job& j)
    {
      ports_[j.port].stages[j.stage].state = stage_state::running;
    };

    loop_.connect (stage_completed_event,
                   [this] (const event& e) {completed (e);});
  }

  void stage_machine::
  discover (port& p)
  {
    p.stages.begin_phase ();
    p.stages.append (stage_type::depend, stack_type::common);
    start (p);
  }

  void stage_machine::
  append (port& p, build_method m)
  {
    tracer trace ("stage_machine::append");

    pipeline& ps (p.stages);
    ps.begin_phase ();

    switch (m)
    {
    case build_method::build:
      {
        ps.append (stage_type::checksum, stack_type::build);
        ps.append (stage_type::fetch, stack_type::build);

        if (conf_.fetch_only)
          break;

        ps.append (stage_type::build, stack_type::build);
        ps.append (stage_type::install, stack_type::build);

        if (conf_.package)
        {
          if (p.attributes && p.attributes->no_package)
            l4 ([&]{trace << "not packaging " << p << ": NO_PACKAGE set";});
          else
            ps.append (stage_type::package, stack_type::build);
        }

        if (conf_.clean)
          ps.append (stage_type::clean, stack_type::clean);

        break;
      }
    case build_method::package:
      {
        ps.append (stage_type::install, stack_type::package);
        break;
      }
    }
  }

  void stage_machine::
  compose (port& p, build_method m)
  {
    tracer trace ("stage_machine::compose");

    l4 ([&]{trace << p << " using " << m << " method";});

    append (p, m);
    start (p);
  }

  void stage_machine::
  skip (port& p, build_method m)
  {
    append (p, m);

    pipeline& ps (p.stages);
    for (size_t i (ps.phase ()); i != ps.size (); ++i)
      ps[i].state = stage_state::skipped;
  }

  void stage_machine::
  start (port& p)
  {
    tracer trace ("stage_machine::start");

    while (optional<size_t> i = p.stages.next ())
    {
      if (stopping_)
      {
        l5 ([&]{trace << "not starting " << p << ' ' << p.stages[*i].type
                      << ": stopping";});
        return;
      }

      if (!settle (p, *i))
      {
        submit (p, *i);
        return;
      }
    }

    if (p.stages.finished ())
    {
      event e (pipeline_completed_event);
      e.port = p.id;
      e.stage = p.stages.size () - 1;
      e.success = !p.stages.phase_failed ();
      loop_.post (move (e));
    }
  }

  bool stage_machine::
  settle (port& p, size_t i)
  {
    tracer trace ("stage_machine::settle");

    stage& s (p.stages[i]);

    if ((s.type != stage_type::checksum && s.type != stage_type::fetch) ||
        !p.attributes                                                  ||
        p.attributes->distfiles.empty ()                               ||
        conf_.no_op)
      return false;

    const strings& fs (p.attributes->distfiles);

    auto all = [&fs] (const set<string>& m)
    {
      for (const string& f: fs)
      {
        if (m.find (f) == m.end ())
          return false;
      }
      return true;
    };

    if (all (fetched_))
    {
      l4 ([&]{trace << "skipping " << p << ' ' << s.type
                    << ": distfiles already fetched";});

      s.state = stage_state::skipped;
      return true;
    }

    if (all (fetch_failed_))
    {
      error << p << ' ' << s.type << " failed: distfiles previously failed "
            << "to fetch";

      s.state = stage_state::failed;
      p.stages.fail (s.stack);
      halt (p);
      return true;
    }

    return false;
  }

  void stage_machine::
  halt (port& p)
  {
    tracer trace ("stage_machine::halt");

    for (size_t i: p.stages.halt ())
    {
      l5 ([&]{trace << "cancelling " << p << ' ' << p.stages[i].type;});
      queues_.cancel (p.id, i);
    }
  }

  void stage_machine::
  submit (port& p, size_t i)
  {
    stage& s (p.stages[i]);
    s.state = stage_state::queued;

    queues_.submit (make_job (conf_, p, i));
  }

  void stage_machine::
  completed (const event& e)
  {
    tracer trace ("stage_machine::completed");

    port& p (ports_[e.port]);
    pipeline& ps (p.stages);
    stage& s (ps[e.stage]);

    if (e.success)
    {
      s.state = stage_state::done;

      if (s.type == stage_type::install)
        p.status = install_status::current;

      if ((s.type == stage_type::checksum || s.type == stage_type::fetch) &&
          p.attributes && !conf_.no_op)
      {
        for (const string& f: p.attributes->distfiles)
        {
          fetched_.insert (f);
          fetch_failed_.erase (f);
        }
      }

      l4 ([&]{trace << p << ' ' << s.type << " done";});
    }
    else
    {
      s.state = stage_state::failed;
      ps.fail (s.stack);

      if ((s.type == stage_type::checksum || s.type == stage_type::fetch) &&
          p.attributes)
        fetch_failed_.insert (p.attributes->distfiles.begin (),
                              p.attributes->distfiles.end ());

      // The depend stage failure is reported as an unresolved origin.
      //
      if (s.type != stage_type::depend)
      {
        diag_record dr (error);
        dr << p << ' ' << s.type << " failed";

        path l (log_file (conf_, p));
        if (!l.empty ())
          dr << info << "see " << l << " for details";
      }

      halt (p);
    }

    // The depend stage output is the port attributes.
    //
    if (ps.finished ())
    {
      event c (pipeline_completed_event);
      c.port = p.id;
      c.stage = e.stage;
      c.success = !ps.phase_failed ();

      if (s.type == stage_type::depend)
        c.output = e.output;

      loop_.post (move (c));
    }
    else
      start (p);
  }
}
