// file      : pbuild/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/diagnostics.hxx>

#include <libbutl/process.hxx>    // process_args
#include <libbutl/process-io.hxx> // operator<<(ostream, process_args)

using namespace std;
using namespace butl;

namespace pbuild
{
  // print_process
  //
  void
  print_process (const char* const args[], size_t n)
  {
    diag_record dr (text);
    print_process (dr, args, n);
  }

  void
  print_process (diag_record& dr, const char* const args[], size_t n)
  {
    dr << process_args {args, n};
  }

  // Diagnostics verbosity level.
  //
  uint16_t verb = 1;

  // Diagnostic facility, project specifics.
  //

  void simple_prologue_base::
  operator() (const diag_record& r) const
  {
    if (type_ != nullptr)
      r << type_ << ": ";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  const basic_mark error ("error");
  const basic_mark warn  ("warning");
  const basic_mark info  ("info");
  const basic_mark text  (nullptr, nullptr, nullptr); // No frame.
  const fail_mark  fail  ("error");
  const fail_end   endf;
}
