// file      : pbuild/options-types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_OPTIONS_TYPES_HXX
#define PBUILD_OPTIONS_TYPES_HXX

#include <pbuild/types.hxx>

namespace pbuild
{
  // The way a port that needs to be installed is obtained. Methods are tried
  // in the order specified with --method.
  //
  enum class build_method
  {
    build,  // Build from the ports tree.
    package // Install the prebuilt package file.
  };

  using build_methods = vector<build_method>;

  string
  to_string (build_method);

  build_method
  to_build_method (const string&); // May throw invalid_argument.

  inline ostream&
  operator<< (ostream& os, build_method m) {return os << to_string (m);}
}

#endif // PBUILD_OPTIONS_TYPES_HXX
