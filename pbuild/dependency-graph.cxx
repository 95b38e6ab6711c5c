// file      : pbuild/dependency-graph.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/dependency-graph.hxx>

#include <pbuild/attributes.hxx>
#include <pbuild/diagnostics.hxx>

using namespace std;

namespace pbuild
{
  dependency_graph::
  dependency_graph (const configuration& c,
                    event_loop& l,
                    queue_manager& q,
                    const package_database& d)
      : conf_ (c), loop_ (l), packages_ (d), stages_ (c, l, q, ports_)
  {
    loop_.connect (pipeline_completed_event,
                   [this] (const event& e) {completed (e);});

    loop_.connect (port_finished_event,
                   [this] (const event& e) {finished (e);});
  }

  port_id dependency_graph::
  get_port (const string& o)
  {
    tracer trace ("dependency_graph::get_port");

    pair<port&, bool> r (ports_.insert (o));
    port& p (r.first);

    if (r.second)
    {
      l4 ([&]{trace << "discovering " << p;});

      p.methods = conf_.methods;
      stages_.discover (p);
    }

    return p.id;
  }

  bool dependency_graph::
  needs_build (const port& p) const
  {
    return p.force || p.status < conf_.threshold ();
  }

  vector<port_id> dependency_graph::
  planned () const
  {
    vector<port_id> r;

    for (size_t i (0); i != ports_.size (); ++i)
    {
      const port& p (ports_[i]);

      if (!p.finished () && p.attributes && needs_build (p))
        r.push_back (p.id);
    }

    return r;
  }

  void dependency_graph::
  completed (const event& e)
  {
    tracer trace ("dependency_graph::completed");

    port& p (ports_[e.port]);

    // The pipeline of a failed port may still complete its running stage.
    //
    if (p.finished ())
    {
      l5 ([&]{trace << "ignoring " << p << ": " << p.result;});
      return;
    }

    if (!p.attributes)
    {
      loaded (p, e);
      return;
    }

    if (e.success)
      succeed (p, port_result::success);
    else if (!select (p))
      fail (p, port_result::failed);
  }

  void dependency_graph::
  loaded (port& p, const event& e)
  {
    tracer trace ("dependency_graph::loaded");

    if (!e.success)
    {
      error << "unable to load attributes of port " << p
            << ": no such port";

      fail (p, port_result::unresolved);
      return;
    }

    try
    {
      p.attributes = parse_attributes (e.output, conf_.ports_dir);
    }
    catch (const invalid_argument& x)
    {
      error << "invalid attributes of port " << p << ": " << x;

      p.stages.fail (stack_type::common);
      fail (p, port_result::failed);
      return;
    }

    p.status = packages_.status (p.origin, p.attributes->pkgname);

    l4 ([&]{trace << p << " is " << p.attributes->pkgname << ", installed "
                  << p.status;});

    if (!needs_build (p))
    {
      if (p.status == install_status::newer)
        warn << "newer version of " << p << " than " << p.attributes->pkgname
             << " is installed";

      l4 ([&]{trace << "skipping " << p;});

      stages_.skip (p, conf_.methods.front ());
      succeed (p, port_result::skipped);
      return;
    }

    resolve (p);
  }

  void dependency_graph::
  resolve (port& p)
  {
    tracer trace ("dependency_graph::resolve");

    // Re-resolving is a noop.
    //
    if (p.resolution != dependency_status::unresolved)
      return;

    p.resolution = dependency_status::resolving;

    vector<port_id> cycle;

    for (const string& o: p.attributes->depends ())
    {
      if (o == p.origin)
      {
        cycle.push_back (p.id);
        p.dependencies.emplace_back (o, p.id);
        continue;
      }

      // Note that this can create and start the discovery of a new port.
      //
      port_id di (get_port (o));
      port& d (ports_[di]);

      p.dependencies.emplace_back (o, di);

      if (std::find (d.dependents.begin (), d.dependents.end (), p.id) ==
          d.dependents.end ())
        d.dependents.push_back (p.id);

      if (d.finished ())
      {
        if (d.failed ())
        {
          p.dependency_failed = true;

          if (d.result == port_result::unresolved)
            p.dependencies.back ().port = nullopt;
        }

        continue;
      }

      if (cycle.empty ())
        cycle = path_to (di, p.id);

      p.waiting.insert (di);
    }

    l4 ([&]{trace << p << " waits for " << p.waiting.size () << " of "
                  << p.dependencies.size () << " dependencies";});

    if (!cycle.empty ())
    {
      diag_record dr (error);
      dr << "dependency cycle: ";

      for (port_id i: cycle)
        dr << ports_[i] << " -> ";

      dr << ports_[cycle.front ()];

      deque<port_id> q;
      for (port_id i: cycle)
      {
        port& c (ports_[i]);

        if (!c.finished ())
        {
          c.result = port_result::cycle;
          q.push_back (i);

          event e (cycle_event);
          e.port = i;
          loop_.post (move (e));
        }
      }

      propagate (move (q));
    }
    else if (p.dependency_failed)
      fail (p, port_result::dependency_failed);
    else if (p.waiting.empty ())
      ready (p);
  }

  vector<port_id> dependency_graph::
  path_to (port_id from, port_id to) const
  {
    map<port_id, port_id> parent;
    deque<port_id> q {from};
    parent.emplace (from, from);

    while (!q.empty ())
    {
      port_id i (q.front ());
      q.pop_front ();

      if (i == to)
      {
        vector<port_id> r;
        for (port_id j (to); ; j = parent[j])
        {
          r.push_back (j);

          if (j == from)
            break;
        }

        // Make the path start with the target port.
        //
        reverse (r.begin (), r.end ());
        rotate (r.begin (), r.end () - 1, r.end ());
        return r;
      }

      for (const dependency& d: ports_[i].dependencies)
      {
        if (d.port &&
            !ports_[*d.port].finished () &&
            parent.emplace (*d.port, i).second)
          q.push_back (*d.port);
      }
    }

    return vector<port_id> ();
  }

  void dependency_graph::
  finished (const event& e)
  {
    tracer trace ("dependency_graph::finished");

    const port& x (ports_[e.port]);

    for (port_id i: x.dependents)
    {
      port& d (ports_[i]);

      if (d.finished () || d.waiting.erase (x.id) == 0)
        continue;

      if (d.waiting.empty () && !d.dependency_failed)
      {
        l5 ([&]{trace << d << " dependencies satisfied";});
        ready (d);
      }
    }
  }

  void dependency_graph::
  ready (port& p)
  {
    p.resolution = dependency_status::resolved;

    if (!select (p))
    {
      error << "no method to build port " << p;
      fail (p, port_result::no_method);
    }
  }

  bool dependency_graph::
  applicable (const port& p, build_method m) const
  {
    switch (m)
    {
    case build_method::build: return true;
    case build_method::package:
      {
        if (conf_.fetch_only || p.attributes->pkgfile.empty ())
          return false;

        return exists (chroot_path (conf_.chroot, p.attributes->pkgfile),
                       true /* ignore_error */);
      }
    }

    return false;
  }

  bool dependency_graph::
  select (port& p)
  {
    tracer trace ("dependency_graph::select");

    while (!p.methods.empty ())
    {
      build_method m (p.methods.front ());
      p.methods.erase (p.methods.begin ());

      if (!applicable (p, m))
      {
        l4 ([&]{trace << m << " method not applicable to " << p;});
        continue;
      }

      if (p.method)
        info << "retrying port " << p << " using " << m << " method";

      p.method = m;
      stages_.compose (p, m);
      return true;
    }

    return false;
  }

  void dependency_graph::
  succeed (port& p, port_result r)
  {
    tracer trace ("dependency_graph::succeed");

    l4 ([&]{trace << p << ": " << r;});

    p.result = r;

    event e (port_finished_event);
    e.port = p.id;
    e.success = true;
    loop_.post (move (e));
  }

  void dependency_graph::
  fail (port& p, port_result r)
  {
    p.result = r;
    propagate (deque<port_id> {p.id});
  }

  void dependency_graph::
  propagate (deque<port_id> q)
  {
    tracer trace ("dependency_graph::propagate");

    // Every port in the queue is already marked as failed so each is
    // processed exactly once.
    //
    while (!q.empty ())
    {
      port& x (ports_[q.front ()]);
      q.pop_front ();

      l4 ([&]{trace << x << ": " << x.result;});

      stages_.halt (x);

      event e (port_failed_event);
      e.port = x.id;
      loop_.post (move (e));

      for (port_id i: x.dependents)
      {
        port& d (ports_[i]);

        if (x.result == port_result::unresolved)
        {
          for (dependency& dep: d.dependencies)
          {
            if (dep.port && *dep.port == x.id)
              dep.port = nullopt;
          }
        }

        d.dependency_failed = true;

        if (d.finished ())
          continue;

        d.result = port_result::dependency_failed;
        q.push_back (i);
      }
    }
  }

  set<string> dependency_graph::
  failed_closure (port_id i) const
  {
    set<string> r;
    set<port_id> visited {i};
    deque<port_id> q {i};

    while (!q.empty ())
    {
      const port& p (ports_[q.front ()]);
      q.pop_front ();

      for (const dependency& d: p.dependencies)
      {
        if (!d.port)
        {
          r.insert (d.origin);
          continue;
        }

        if (ports_[*d.port].failed ())
        {
          r.insert (d.origin);

          if (visited.insert (*d.port).second)
            q.push_back (*d.port);
        }
      }
    }

    return r;
  }

  dependency_list dependency_graph::
  bad_dependencies (port_id i) const
  {
    dependency_list fs;
    for (const dependency& d: ports_[i].dependencies)
    {
      if (!d.port || ports_[*d.port].failed ())
        fs.push_back (d);
    }

    // Drop a dependency if it reaches another failed dependency which does
    // not reach it back (as would be the case in a cycle).
    //
    vector<set<string>> cs;
    for (const dependency& d: fs)
      cs.push_back (d.port ? failed_closure (*d.port) : set<string> ());

    dependency_list r;
    for (size_t f (0); f != fs.size (); ++f)
    {
      bool explained (false);

      for (size_t g (0); g != fs.size () && !explained; ++g)
      {
        explained = g != f &&
                    cs[f].find (fs[g].origin) != cs[f].end () &&
                    cs[g].find (fs[f].origin) == cs[g].end ();
      }

      if (!explained)
        r.push_back (fs[f]);
    }

    return r;
  }

  strings dependency_graph::
  root_causes (port_id i) const
  {
    const port& p (ports_[i]);

    if (!p.failed ())
      return strings ();

    if (p.result != port_result::dependency_failed)
      return strings {p.origin};

    set<string> r;
    set<port_id> visited {i};
    deque<port_id> q {i};

    while (!q.empty ())
    {
      const port& x (ports_[q.front ()]);
      q.pop_front ();

      for (const dependency& d: x.dependencies)
      {
        if (!d.port)
        {
          r.insert (d.origin);
          continue;
        }

        const port& y (ports_[*d.port]);

        if (!y.failed () || !visited.insert (y.id).second)
          continue;

        if (y.result == port_result::dependency_failed)
          q.push_back (y.id);
        else
          r.insert (y.origin);
      }
    }

    return strings (r.begin (), r.end ());
  }

  vector<stack_type> dependency_graph::
  failed_stacks (port_id i) const
  {
    const set<stack_type>& s (ports_[i].stages.failed_stacks ());
    return vector<stack_type> (s.begin (), s.end ());
  }
}
