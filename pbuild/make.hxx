// file      : pbuild/make.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_MAKE_HXX
#define PBUILD_MAKE_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/job.hxx>
#include <pbuild/port.hxx>
#include <pbuild/configuration.hxx>

namespace pbuild
{
  // Return the command line that executes the stage of the port. All the
  // stages except for the package method's install run make(1) in the port
  // directory, inside the chroot if configured.
  //
  strings
  stage_command (const configuration&, const port&, const stage&);

  // Return the log file for the port or empty path if logging is disabled.
  //
  path
  log_file (const configuration&, const port&);

  // Return the job executing the port's pipeline stage.
  //
  job
  make_job (const configuration&, const port&, size_t stage);
}

#endif // PBUILD_MAKE_HXX
