// file      : pbuild/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_DIAGNOSTICS_HXX
#define PBUILD_DIAGNOSTICS_HXX

#include <libbutl/diagnostics.hxx>

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

namespace pbuild
{
  using butl::diag_record;

  // Throw this exception to terminate the process. The handler should
  // assume that the diagnostics has already been issued. The code is the
  // process exit status.
  //
  class failed: public std::exception
  {
  public:
    explicit
    failed (int c = 1): code (c) {}

    int code;
  };

  // Print process commmand line.
  //
  void
  print_process (diag_record&, const char* const args[], size_t n = 0);

  void
  print_process (const char* const args[], size_t n = 0);

  // The argument list is expected to be NULL-terminated.
  //
  inline void
  print_process (diag_record& dr, const cstrings& args)
  {
    print_process (dr, args.data ());
  }

  inline void
  print_process (const cstrings& args)
  {
    print_process (args.data ());
  }

  // Verbosity level. Update documentation for --verbose if changing.
  //
  // 0 - disabled
  // 1 - high-level information messages
  // 2 - essential underlying commands that are being executed
  // 3 - all underlying commands that are being executed
  // 4 - information that could be helpful to the user
  // 5 - information that could be helpful to the developer
  // 6 - even more detailed information
  //
  // While uint8 is more than enough, use uint16 for the ease of printing.
  //
  extern uint16_t verb;

  template <typename F> inline void l1 (const F& f) {if (verb >= 1) f ();}
  template <typename F> inline void l2 (const F& f) {if (verb >= 2) f ();}
  template <typename F> inline void l3 (const F& f) {if (verb >= 3) f ();}
  template <typename F> inline void l4 (const F& f) {if (verb >= 4) f ();}
  template <typename F> inline void l5 (const F& f) {if (verb >= 5) f ();}
  template <typename F> inline void l6 (const F& f) {if (verb >= 6) f ();}

  // Diagnostic facility, base infrastructure.
  //
  using butl::diag_stream;
  using butl::diag_epilogue;
  using butl::diag_frame;

  // Diagnostic facility, project specifics.
  //
  struct simple_prologue_base
  {
    explicit
    simple_prologue_base (const char* type, const char* name)
        : type_ (type), name_ (name) {}

    void
    operator() (const diag_record& r) const;

  private:
    const char* type_;
    const char* name_;
  };

  struct basic_mark_base
  {
    using simple_prologue = butl::diag_prologue<simple_prologue_base>;

    explicit
    basic_mark_base (const char* type,
                     const char* name = nullptr,
                     diag_epilogue* epilogue = &diag_frame::apply)
        : type_ (type), name_ (name), epilogue_ (epilogue) {}

    simple_prologue
    operator() () const
    {
      return simple_prologue (epilogue_, type_, name_);
    }

  protected:
    const char* type_;
    const char* name_;
    diag_epilogue* const epilogue_;
  };
  using basic_mark = butl::diag_mark<basic_mark_base>;

  extern const basic_mark error;
  extern const basic_mark warn;
  extern const basic_mark info;
  extern const basic_mark text;

  // trace
  //
  struct trace_mark_base: basic_mark_base
  {
    explicit
    trace_mark_base (const char* name)
        : basic_mark_base ("trace", name) {}
  };
  using trace_mark = butl::diag_mark<trace_mark_base>;

  using tracer = trace_mark;

  // fail
  //
  struct fail_mark_base: basic_mark_base
  {
    explicit
    fail_mark_base (const char* type)
        : basic_mark_base (type,
                           nullptr,
                           [](const diag_record& r, butl::diag_writer* w)
                           {
                             diag_frame::apply (r);
                             r.flush (w);
                             throw failed ();
                           }) {}
  };
  using fail_mark = butl::diag_mark<fail_mark_base>;

  struct fail_end_base
  {
    [[noreturn]] void
    operator() (const diag_record& r) const
    {
      // If we just throw then the record's destructor will see an active
      // exception and will not flush the record.
      //
      r.flush ();
      throw failed ();
    }
  };
  using fail_end = butl::diag_noreturn_end<fail_end_base>;

  extern const fail_mark fail;
  extern const fail_end endf;
}

#endif // PBUILD_DIAGNOSTICS_HXX
