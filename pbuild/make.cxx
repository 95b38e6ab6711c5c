// file      : pbuild/make.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/make.hxx>

#include <pbuild/diagnostics.hxx>

using namespace std;

namespace pbuild
{
  strings
  stage_command (const configuration& c, const port& p, const stage& s)
  {
    strings r;

    if (!c.chroot.empty ())
    {
      r.push_back ("chroot");
      r.push_back (c.chroot.string ());
    }

    // Install from the package file.
    //
    if (s.stack == stack_type::package)
    {
      assert (p.attributes && !p.attributes->pkgfile.empty ());

      r.push_back (c.pkg.string ());
      r.push_back ("add");
      r.push_back (p.attributes->pkgfile);
      return r;
    }

    r.push_back (c.make.string ());
    r.push_back ("-C");
    r.push_back ((c.ports_dir / dir_path (p.origin)).string ());

    if (s.type == stage_type::depend)
    {
      for (size_t i (0); i != attribute_variable_count; ++i)
      {
        r.push_back ("-V");
        r.push_back (attribute_variables[i]);
      }

      return r;
    }

    switch (s.type)
    {
    case stage_type::checksum:
      {
        r.push_back ("checksum");
        r.push_back ("FETCH_REGET=0");
        break;
      }
    case stage_type::fetch:
      {
        r.push_back ("checksum");
        break;
      }
    case stage_type::build:
      {
        r.push_back ("all");
        break;
      }
    case stage_type::install:
      {
        // Replace the installed package of a different version.
        //
        if (p.status != install_status::absent)
          r.push_back ("deinstall");

        r.push_back (p.status != install_status::absent ? "reinstall"
                                                        : "install");
        break;
      }
    case stage_type::package:
      {
        r.push_back ("package");
        break;
      }
    case stage_type::clean:
      {
        r.push_back ("clean");
        r.push_back ("NOCLEANDEPENDS=yes");
        break;
      }
    case stage_type::depend: break; // Handled above.
    }

    r.push_back ("BATCH=yes");
    r.push_back ("NO_DEPENDS=yes");

    return r;
  }

  path
  log_file (const configuration& c, const port& p)
  {
    if (c.log_dir.empty ())
      return path ();

    string n (p.pkgname ());
    replace (n.begin (), n.end (), '/', '_');

    return c.log_dir / path (n + ".log");
  }

  job
  make_job (const configuration& c, const port& p, size_t i)
  {
    const stage& s (p.stages[i]);

    job r;
    r.port = p.id;
    r.stage = i;
    r.type = s.type;
    r.stack = s.stack;
    r.origin = p.origin;
    r.args = stage_command (c, p, s);
    r.capture = s.type == stage_type::depend;
    r.log = log_file (c, p);
    r.print_only = c.no_op && s.type != stage_type::depend;

    return r;
  }
}
