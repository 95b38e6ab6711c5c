// file      : pbuild/job.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/job.hxx>

using namespace std;

namespace pbuild
{
  cstrings job::
  arguments () const
  {
    cstrings r;
    r.reserve (args.size () + 1);

    for (const string& a: args)
      r.push_back (a.c_str ());

    r.push_back (nullptr);
    return r;
  }
}
