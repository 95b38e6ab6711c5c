// file      : pbuild/attributes.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/attributes.hxx>

#include <sstream>

#include <pbuild/package-database.hxx> // package_version()

using namespace std;
using namespace butl;

namespace pbuild
{
  const char* const attribute_variables[] = {
    "PKGNAME",
    "PORTVERSION",
    "BUILD_DEPENDS",
    "EXTRACT_DEPENDS",
    "FETCH_DEPENDS",
    "LIB_DEPENDS",
    "RUN_DEPENDS",
    "PATCH_DEPENDS",
    "PKG_DEPENDS",
    "DISTFILES",
    "PKGFILE",
    "NO_PACKAGE"};

  const size_t attribute_variable_count (
    sizeof (attribute_variables) / sizeof (attribute_variables[0]));

  strings port_attributes::
  depends () const
  {
    strings r;

    for (const strings* ds: {&build_depends,
                             &extract_depends,
                             &fetch_depends,
                             &lib_depends,
                             &run_depends,
                             &patch_depends,
                             &package_depends})
    {
      for (const string& d: *ds)
      {
        if (find (r.begin (), r.end (), d) == r.end ())
          r.push_back (d);
      }
    }

    return r;
  }

  string
  parse_dependency (const string& e, const dir_path& ports_dir)
  {
    size_t p (e.find (':'));

    if (p == string::npos || p == 0)
      throw invalid_argument ("invalid dependency '" + e + '\'');

    size_t n (e.find (':', p + 1));
    string o (e, p + 1, n != string::npos ? n - p - 1 : string::npos);

    if (!o.empty () && o.front () == '/')
    {
      const string& d (ports_dir.representation ()); // With trailing slash.

      if (o.compare (0, d.size (), d) != 0)
        throw invalid_argument ("dependency '" + e + "' outside ports "
                                "directory " + ports_dir.string ());

      o.erase (0, d.size ());
    }

    // Strip the trailing slash, if any, and verify the category/name form.
    //
    if (!o.empty () && o.back () == '/')
      o.pop_back ();

    size_t s (o.find ('/'));
    if (s == string::npos || s == 0 || s + 1 == o.size () ||
        o.find ('/', s + 1) != string::npos)
      throw invalid_argument ("invalid dependency origin in '" + e + '\'');

    return o;
  }

  port_attributes
  parse_attributes (const string& output, const dir_path& ports_dir)
  {
    istringstream is (output);

    strings ls;
    for (string l; getline (is, l); )
    {
      trim (l);
      ls.push_back (move (l));
    }

    if (ls.size () < attribute_variable_count)
      throw invalid_argument ("expected " +
                              to_string (attribute_variable_count) +
                              " attribute lines instead of " +
                              to_string (ls.size ()));

    auto words = [] (const string& l)
    {
      strings r;
      for (size_t b (0), e (0); next_word (l, b, e); )
        r.push_back (string (l, b, e - b));
      return r;
    };

    auto depends = [&words, &ports_dir] (const string& l)
    {
      strings r;
      for (const string& w: words (l))
      {
        string o (parse_dependency (w, ports_dir));

        if (find (r.begin (), r.end (), o) == r.end ())
          r.push_back (move (o));
      }
      return r;
    };

    port_attributes r;

    r.pkgname = move (ls[0]);
    r.version = move (ls[1]);

    if (r.pkgname.empty ())
      throw invalid_argument ("empty PKGNAME");

    // PKGNAME version is PORTVERSION[_<revision>][,<epoch>].
    //
    if (!r.version.empty ())
    {
      string v (package_version (r.pkgname));
      size_t n (r.version.size ());

      if (v.compare (0, n, r.version) != 0 ||
          (v.size () != n && v[n] != '_' && v[n] != ','))
        throw invalid_argument ("PKGNAME " + r.pkgname +
                                " does not match PORTVERSION " + r.version);
    }

    r.build_depends   = depends (ls[2]);
    r.extract_depends = depends (ls[3]);
    r.fetch_depends   = depends (ls[4]);
    r.lib_depends     = depends (ls[5]);
    r.run_depends     = depends (ls[6]);
    r.patch_depends   = depends (ls[7]);
    r.package_depends = depends (ls[8]);

    // Distribution files may be followed by the :<group> suffix.
    //
    for (string& f: words (ls[9]))
    {
      size_t p (f.find (':'));
      if (p != string::npos)
        f.resize (p);

      r.distfiles.push_back (move (f));
    }

    r.pkgfile = move (ls[10]);
    r.no_package = !ls[11].empty ();

    return r;
  }
}
