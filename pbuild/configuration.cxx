// file      : pbuild/configuration.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/configuration.hxx>

#include <pbuild/queue.hxx>          // default_load()
#include <pbuild/diagnostics.hxx>
#include <pbuild/pbuild-options.hxx>

using namespace std;

namespace pbuild
{
  configuration::
  configuration ()
  {
    for (size_t i (0); i != queue_count; ++i)
      loads[i] = default_load (static_cast<queue_id> (i));
  }

  configuration
  make_configuration (const options& o)
  {
    configuration r;

    r.ports_dir = o.ports_dir ();
    r.chroot = o.chroot ();
    r.log_dir = o.log_dir ();
    r.make = o.make ();
    r.pkg = o.pkg ();

    r.fetch_only = o.fetch_only ();
    r.force = o.force ();
    r.upgrade = o.upgrade ();
    r.package = o.package ();
    r.clean = !o.no_clean ();
    r.no_op = o.no_op ();
    r.resolve_first = o.resolve_first ();

    if (o.method_specified ())
    {
      r.methods.clear ();

      for (build_method m: o.method ())
      {
        if (find (r.methods.begin (), r.methods.end (), m) != r.methods.end ())
          fail << "method " << m << " specified multiple times";

        r.methods.push_back (m);
      }
    }

    if (o.jobs_specified ())
    {
      if (o.jobs () == 0)
        fail << "invalid --jobs|-j value 0";

      r.load (queue_id::attr, o.jobs ());
      r.load (queue_id::build, o.jobs ());
    }

    for (const auto& p: o.load ())
    {
      queue_id q (queue_id::attr);

      try
      {
        q = to_queue_id (p.first);
      }
      catch (const invalid_argument& e)
      {
        fail << "invalid --load value: " << e;
      }

      if (p.second == 0)
        fail << "invalid --load value: zero load for " << q << " queue";

      r.load (q, p.second);
    }

    if (!r.chroot.empty () && !exists (r.chroot))
      fail << "chroot directory " << r.chroot << " does not exist";

    return r;
  }
}
