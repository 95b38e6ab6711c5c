// file      : pbuild/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/utility.hxx>

#include <thread> // thread::hardware_concurrency()

#include <libbutl/fdstream.hxx>

#include <pbuild/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace pbuild
{
  optional<const char*> stderr_term = nullopt;

  size_t
  cpu_count ()
  {
    size_t n (thread::hardware_concurrency ());
    return n != 0 ? n : 1;
  }

  path
  chroot_path (const dir_path& chroot, const string& file)
  {
    try
    {
      if (chroot.empty ())
        return path (file);

      // Strip the root so that the file is looked up inside the chroot.
      //
      size_t p (file.find_first_not_of ('/'));
      if (p == string::npos)
        return path_cast<path> (chroot);

      return chroot / path (string (file, p));
    }
    catch (const invalid_path& e)
    {
      fail << "invalid path '" << e.path << "'" << endf;
    }
  }

  bool
  exists (const path& f, bool ignore_error)
  {
    try
    {
      return file_exists (f, true /* follow_symlinks */, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d, bool ignore_error)
  {
    try
    {
      return dir_exists (d, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << d << ": " << e << endf;
    }
  }

  void
  mk_p (const dir_path& d)
  {
    if (verb >= 3)
      text << "mkdir -p " << d;

    try
    {
      try_mkdir_p (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to create directory " << d << ": " << e;
    }
  }

  fdpipe
  open_pipe ()
  {
    try
    {
      return fdopen_pipe ();
    }
    catch (const io_error& e)
    {
      fail << "unable to open pipe: " << e << endf;
    }
  }

  dir_path exec_dir;
}
