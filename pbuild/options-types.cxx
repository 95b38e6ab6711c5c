// file      : pbuild/options-types.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/options-types.hxx>

using namespace std;

namespace pbuild
{
  string
  to_string (build_method m)
  {
    switch (m)
    {
    case build_method::build:   return "build";
    case build_method::package: return "package";
    }

    return string (); // Should never reach.
  }

  build_method
  to_build_method (const string& s)
  {
         if (s == "build")   return build_method::build;
    else if (s == "package") return build_method::package;
    else throw invalid_argument ("invalid build method '" + s + '\'');
  }
}
