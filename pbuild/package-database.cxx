// file      : pbuild/package-database.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/package-database.hxx>

#include <cstdlib> // exit()

#include <pbuild/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace pbuild
{
  string
  to_string (install_status s)
  {
    switch (s)
    {
    case install_status::absent:  return "absent";
    case install_status::older:   return "older";
    case install_status::current: return "current";
    case install_status::newer:   return "newer";
    }

    return string (); // Should never reach.
  }

  static inline bool
  numeric (const string& s)
  {
    if (s.empty ())
      return false;

    for (char c: s)
      if (!digit (c))
        return false;

    return true;
  }

  // Compare two version components. Note that numbers can be arbitrary long
  // so compare them as strings with leading zeros stripped.
  //
  static int
  compare_component (const string& x, const string& y)
  {
    if (numeric (x) && numeric (y))
    {
      size_t xp (x.find_first_not_of ('0'));
      size_t yp (y.find_first_not_of ('0'));

      string xs (xp != string::npos ? string (x, xp) : string ());
      string ys (yp != string::npos ? string (y, yp) : string ());

      if (xs.size () != ys.size ())
        return xs.size () < ys.size () ? -1 : 1;

      return xs.compare (ys);
    }

    return x.compare (y);
  }

  // Split off the suffix after the last occurrence of the delimiter,
  // returning "0" if there is none.
  //
  static string
  split_suffix (string& v, char d)
  {
    size_t p (v.rfind (d));

    if (p == string::npos)
      return "0";

    string r (v, p + 1);
    v.resize (p);
    return r;
  }

  int
  compare_versions (const string& x, const string& y)
  {
    string xv (x);
    string yv (y);

    string xe (split_suffix (xv, ','));
    string ye (split_suffix (yv, ','));

    if (int r = compare_component (xe, ye))
      return r;

    string xr (split_suffix (xv, '_'));
    string yr (split_suffix (yv, '_'));

    strings xcs;
    strings ycs;

    for (size_t b (0), e (0); next_word (xv, b, e, '.'); )
      xcs.push_back (string (xv, b, e - b));

    for (size_t b (0), e (0); next_word (yv, b, e, '.'); )
      ycs.push_back (string (yv, b, e - b));

    for (size_t i (0); i != xcs.size () && i != ycs.size (); ++i)
    {
      if (int r = compare_component (xcs[i], ycs[i]))
        return r < 0 ? -1 : 1;
    }

    if (xcs.size () != ycs.size ())
      return xcs.size () < ycs.size () ? -1 : 1;

    int r (compare_component (xr, yr));
    return r < 0 ? -1 : r > 0 ? 1 : 0;
  }

  string
  package_version (const string& n)
  {
    size_t p (n.rfind ('-'));
    return p != string::npos ? string (n, p + 1) : string ();
  }

  void package_database::
  insert (const string& origin, string pkgname)
  {
    strings& ps (packages_[origin]);

    if (find_if (ps.begin (), ps.end (),
                 [&pkgname] (const string& n) {return n == pkgname;}) ==
        ps.end ())
      ps.push_back (move (pkgname));
  }

  install_status package_database::
  status (const string& origin, const string& pkgname) const
  {
    install_status r (install_status::absent);

    const strings* ps (find (origin));
    if (ps == nullptr)
      return r;

    string v (package_version (pkgname));

    for (const string& p: *ps)
    {
      int c (compare_versions (package_version (p), v));

      install_status s (c < 0  ? install_status::older   :
                        c == 0 ? install_status::current :
                                 install_status::newer);
      if (s > r)
        r = s;
    }

    return r;
  }

  package_database package_database::
  parse (istream& is)
  {
    package_database r;

    string l;
    while (!eof (getline (is, l)))
    {
      trim (l);

      if (l.empty ())
        continue;

      // <pkgname> <origin>
      //
      size_t b (0), e (0);
      next_word (l, b, e);
      string n (l, b, e - b);

      if (!next_word (l, b, e))
        throw invalid_argument ("missing origin in '" + l + '\'');

      string o (l, b, e - b);

      if (next_word (l, b, e))
        throw invalid_argument ("unexpected text in '" + l + '\'');

      if (package_version (n).empty ())
        throw invalid_argument ("missing version in '" + n + '\'');

      r.insert (o, move (n));
    }

    return r;
  }

  package_database package_database::
  load (const path& pkg, const dir_path& chroot)
  {
    tracer trace ("package_database::load");

    cstrings args;

    if (!chroot.empty ())
    {
      args.push_back ("chroot");
      args.push_back (chroot.string ().c_str ());
    }

    args.push_back (pkg.string ().c_str ());
    args.push_back ("query");
    args.push_back ("%n-%v %o");
    args.push_back (nullptr);

    package_database r;

    try
    {
      process_path pp (process::path_search (args[0],
                                             false /* init */,
                                             exec_dir));

      if (verb >= 3)
        print_process (args);

      // Redirect stdout to a pipe and stdin to /dev/null to make sure there
      // are no prompts of any kind.
      //
      process pr (pp, args.data (), -2 /* stdin */, -1 /* stdout */, 2);

      try
      {
        ifdstream is (move (pr.in_ofd), fdstream_mode::skip, ifdstream::badbit);

        auto df = make_diag_frame (
          [&args] (diag_record& dr)
          {
            dr << info << "while parsing output of ";
            print_process (dr, args);
          });

        try
        {
          r = parse (is);
        }
        catch (const invalid_argument& e)
        {
          fail << "invalid package query output: " << e;
        }

        is.close ();
      }
      catch (const io_error& e)
      {
        if (pr.wait ())
          fail << "unable to read " << args[0] << " output: " << e;

        // Fall through.
      }

      if (!pr.wait ())
      {
        diag_record dr (fail);
        dr << args[0] << " exited with non-zero code";

        if (verb < 3)
        {
          dr << info << "command line: ";
          print_process (dr, args);
        }
      }
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << args[0] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }

    l4 ([&]{trace << r.size () << " origins installed";});
    return r;
  }
}
