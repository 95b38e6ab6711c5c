// file      : pbuild/pbuild.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <signal.h> // signal()

#include <cerrno>
#include <iostream>

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>
#include <pbuild/diagnostics.hxx>

#include <pbuild/scheduler.hxx>
#include <pbuild/event-loop.hxx>
#include <pbuild/configuration.hxx>
#include <pbuild/pbuild-options.hxx>
#include <pbuild/process-executor.hxx>
#include <pbuild/package-database.hxx>

using namespace std;
using namespace butl;

namespace pbuild
{
  static uint16_t
  verbosity (const options& o)
  {
    return o.verbose_specified ()
           ? o.verbose ()
           : o.V () ? 3 : o.v () ? 2 : o.quiet () ? 0 : 1;
  }

  // Verify the port origin is in the <category>/<name> form.
  //
  static void
  verify_origin (const string& o)
  {
    size_t p (o.find ('/'));

    if (p == string::npos || p == 0 || p + 1 == o.size () ||
        o.find ('/', p + 1) != string::npos)
      fail << "invalid port origin '" << o << "'" <<
        info << "expected <category>/<name>";
  }

  static void
  print_plan (const dependency_graph& g)
  {
    for (port_id i: g.planned ())
    {
      const port& p (g[i]);

      diag_record dr (text);
      dr << "build " << p.pkgname () << " (" << p << ")";

      if (p.method)
        dr << " using " << *p.method << " method";
    }

    for (size_t i (0); i != g.size (); ++i)
    {
      const port& p (g[i]);

      if (p.result == port_result::skipped)
        text << "skip " << p.pkgname () << " (" << p << "): " << p.status
             << " version installed";
      else if (p.failed ())
        text << "fail " << p << ": " << p.result;
    }
  }

  static void
  print_summary (const dependency_graph& g)
  {
    size_t built (0), skipped (0), failures (0), incomplete (0);

    for (size_t i (0); i != g.size (); ++i)
    {
      const port& p (g[i]);

      switch (p.result)
      {
      case port_result::success: ++built;      continue;
      case port_result::skipped: ++skipped;    continue;
      case port_result::pending: ++incomplete; continue;
      default:                   ++failures;   break;
      }

      diag_record dr (text);
      dr << "failed " << p << ": " << p.result;

      vector<stack_type> ss (g.failed_stacks (i));
      if (!ss.empty ())
      {
        dr << info << "failed stacks:";
        for (stack_type s: ss)
          dr << ' ' << s;
      }

      if (p.result == port_result::dependency_failed)
      {
        dr << info << "failed dependencies:";
        for (const dependency& d: g.bad_dependencies (i))
          dr << ' ' << d.origin;

        dr << info << "caused by:";
        for (const string& o: g.root_causes (i))
          dr << ' ' << o;
      }
    }

    if (incomplete != 0)
    {
      diag_record dr (text);
      dr << "incomplete:";

      for (size_t i (0); i != g.size (); ++i)
      {
        if (!g[i].finished ())
          dr << ' ' << g[i];
      }
    }

    text << built << " built, " << skipped << " skipped, " << failures
         << " failed, " << incomplete << " incomplete";
  }

  static int
  main (int argc, char* argv[]);
}

int pbuild::
main (int argc, char* argv[])
try
{
  using namespace cli;

  if (fdterm (stderr_fd ()))
    stderr_term = std::getenv ("TERM");

  exec_dir = path (argv[0]).directory ();

  // Job output pipes may be closed by the jobs before we are done.
  //
  if (::signal (SIGPIPE, SIG_IGN) == SIG_ERR)
    fail << "unable to ignore broken pipe (SIGPIPE) signal: "
         << system_error (errno, generic_category ());

  argv_scanner scan (argc, argv);

  options o;
  o.parse (scan, unknown_mode::fail, unknown_mode::stop);

  verb = verbosity (o);

  if (o.version ())
  {
    cout << "pbuild " << PBUILD_VERSION_ID << endl
         << "libbutl " << LIBBUTL_VERSION_ID << endl
         << "Copyright (c) " << PBUILD_COPYRIGHT << "." << endl
         << "This is free software released under the MIT license." << endl;
    return 0;
  }

  if (o.help ())
  {
    options::print_usage (cout);
    return 0;
  }

  strings origins;
  while (scan.more ())
  {
    string a (scan.next ());

    // Allow trailing slashes as produced by shell completion.
    //
    while (a.size () > 1 && a.back () == '/')
      a.pop_back ();

    verify_origin (a);
    origins.push_back (move (a));
  }

  if (origins.empty ())
    fail << "port origin expected" <<
      info << "run 'pbuild --help' for more information";

  const configuration conf (make_configuration (o));

  if (!conf.log_dir.empty ())
    mk_p (conf.log_dir);

  package_database db (package_database::load (conf.pkg, conf.chroot));

  event_loop loop;
  process_executor exec (loop);
  scheduler s (conf, loop, exec, db);

  for (const string& og: origins)
    s.add (og);

  if (conf.resolve_first)
    s.plan = [&s] () {print_plan (s.graph ());};

  s.run ();

  if (verb >= 1)
    print_summary (s.graph ());

  return s.status ();
}
catch (const failed& e)
{
  return e.code; // Diagnostics has already been issued.
}
catch (const cli::exception& e)
{
  error << e;
  return 1;
}

int
main (int argc, char* argv[])
{
  return pbuild::main (argc, argv);
}
