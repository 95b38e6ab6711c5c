// file      : pbuild/attributes.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_ATTRIBUTES_HXX
#define PBUILD_ATTRIBUTES_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

namespace pbuild
{
  // Port attributes obtained from the port's make(1) variables.
  //
  struct port_attributes
  {
    string pkgname;       // <name>-<version>
    string version;       // PORTVERSION

    // Dependency origins by kind, in the declaration order.
    //
    strings build_depends;
    strings extract_depends;
    strings fetch_depends;
    strings lib_depends;
    strings run_depends;
    strings patch_depends;
    strings package_depends;

    strings distfiles;
    string pkgfile;       // Package file path.
    bool no_package = false;

    // All the dependency origins without duplicates, in the declaration
    // order.
    //
    strings
    depends () const;
  };

  // The variables queried with `make -V`, in the order of the output lines.
  //
  extern const char* const attribute_variables[];
  extern const size_t attribute_variable_count;

  // Parse the `make -V` output. Dependency entries have the
  // <object>:<origin>[:<target>] form where origin is either relative or
  // absolute within the ports directory. Throw invalid_argument if the
  // output is malformed.
  //
  port_attributes
  parse_attributes (const string& output, const dir_path& ports_dir);

  // Parse a single dependency entry returning the port origin.
  //
  string
  parse_dependency (const string& entry, const dir_path& ports_dir);
}

#endif // PBUILD_ATTRIBUTES_HXX
