// file      : pbuild/configuration.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_CONFIGURATION_HXX
#define PBUILD_CONFIGURATION_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/stage.hxx>
#include <pbuild/options-types.hxx>
#include <pbuild/package-database.hxx>

namespace pbuild
{
  class options;

  // Run-wide policy, constructed once at startup and passed by reference.
  //
  struct configuration
  {
    dir_path ports_dir = dir_path ("/usr/ports");
    dir_path chroot;
    dir_path log_dir;

    path make = path ("make");
    path pkg = path ("pkg");

    bool fetch_only = false;
    bool force = false;      // Rebuild the requested ports.
    bool upgrade = false;    // Rebuild the ports with older version installed.
    bool package = false;    // Create packages.
    bool clean = true;       // Clean after building.
    bool no_op = false;      // Print the commands instead of running.
    bool resolve_first = false;

    build_methods methods = {build_method::build};

    size_t loads[queue_count];

    configuration ();

    size_t
    load (queue_id q) const {return loads[static_cast<size_t> (q)];}

    void
    load (queue_id q, size_t n) {loads[static_cast<size_t> (q)] = n;}

    // A port with the install status below the threshold needs to be
    // built.
    //
    install_status
    threshold () const
    {
      return upgrade ? install_status::current : install_status::older;
    }
  };

  // Construct the configuration from the command line options. Fail on
  // invalid values.
  //
  configuration
  make_configuration (const options&);
}

#endif // PBUILD_CONFIGURATION_HXX
