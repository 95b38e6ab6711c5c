// file      : pbuild/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_UTILITY_HXX
#define PBUILD_UTILITY_HXX

#include <string>    // to_string()
#include <utility>   // move()
#include <cassert>   // assert()
#include <algorithm> // *

#include <libbutl/utility.hxx>         // digit(), trim(), next_word()
#include <libbutl/filesystem.hxx>

#include <pbuild/types.hxx>
#include <pbuild/version.hxx>

namespace pbuild
{
  using std::move;
  using std::to_string;

  // <libbutl/utility.hxx>
  //
  using butl::digit;

  using butl::trim;
  using butl::next_word;

  // Number of online CPUs, at least 1.
  //
  size_t
  cpu_count ();

  // Prefix the path with the chroot directory, unless empty.
  //
  path
  chroot_path (const dir_path& chroot, const string& file);

  // Filesystem.
  //
  bool
  exists (const path&, bool ignore_error = false);

  bool
  exists (const dir_path&, bool ignore_error = false);

  void
  mk_p (const dir_path&);

  // File descriptor streams.
  //
  fdpipe
  open_pipe ();

  // Directory extracted from argv[0] (i.e., this process' recall directory)
  // or empty if there is none. Can be used as a search fallback.
  //
  extern dir_path exec_dir;

  // Diagnostics.
  //
  // If stderr is not a terminal, then the value is absent (so can be used as
  // bool). Otherwise, it is the value of the TERM environment variable (which
  // can be NULL).
  //
  extern optional<const char*> stderr_term;
}

#endif // PBUILD_UTILITY_HXX
