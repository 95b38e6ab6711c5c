// file      : pbuild/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef PBUILD_TYPES_PARSERS_HXX
#define PBUILD_TYPES_PARSERS_HXX

#include <pbuild/types.hxx>

#include <pbuild/pbuild-options.hxx> // pbuild::cli namespace
#include <pbuild/options-types.hxx>

namespace pbuild
{
  namespace cli
  {
    template <>
    struct parser<path>
    {
      static void
      parse (path&, bool&, scanner&);

      static void
      merge (path& b, const path& a) {b = a;}
    };

    template <>
    struct parser<dir_path>
    {
      static void
      parse (dir_path&, bool&, scanner&);

      static void
      merge (dir_path& b, const dir_path& a) {b = a;}
    };

    template <>
    struct parser<build_method>
    {
      static void
      parse (build_method&, bool&, scanner&);

      static void
      merge (build_method& b, const build_method& a) {b = a;}
    };
  }
}

#endif // PBUILD_TYPES_PARSERS_HXX
