// file      : pbuild/stage.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_STAGE_HXX
#define PBUILD_STAGE_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

namespace pbuild
{
  // Pipeline stages in their execution order.
  //
  enum class stage_type
  {
    depend,   // Query the port attributes and dependencies.
    checksum,
    fetch,
    build,
    install,
    package,
    clean
  };

  string
  to_string (stage_type);

  stage_type
  to_stage_type (const string&); // May throw invalid_argument.

  inline ostream&
  operator<< (ostream& os, stage_type t) {return os << to_string (t);}

  enum class stage_state
  {
    pending,
    queued,
    running,
    done,
    failed,
    skipped
  };

  string
  to_string (stage_state);

  inline ostream&
  operator<< (ostream& os, stage_state s) {return os << to_string (s);}

  // A stack is a run of consecutive stages that share the pass/fail verdict.
  // A failure in the common stack fails all the stacks of a port.
  //
  enum class stack_type
  {
    common,  // depend
    build,   // checksum, fetch, build, install, package
    package, // install from the package file
    clean    // clean
  };

  string
  to_string (stack_type);

  stack_type
  to_stack_type (const string&); // May throw invalid_argument.

  inline ostream&
  operator<< (ostream& os, stack_type t) {return os << to_string (t);}

  // Admission queues, one per stage class.
  //
  enum class queue_id
  {
    attr,
    checksum,
    fetch,
    build,
    install,
    package,
    clean
  };

  const size_t queue_count (7);

  string
  to_string (queue_id);

  queue_id
  to_queue_id (const string&); // May throw invalid_argument.

  inline ostream&
  operator<< (ostream& os, queue_id q) {return os << to_string (q);}

  queue_id
  stage_queue (stage_type);

  struct stage
  {
    stage_type type;
    stack_type stack;
    stage_state state = stage_state::pending;

    // Index of the previous stage in the pipeline, if any.
    //
    optional<size_t> prev;

    stage (stage_type t, stack_type s, optional<size_t> p)
        : type (t), stack (s), prev (p) {}

    bool
    finished () const
    {
      return state == stage_state::done   ||
             state == stage_state::failed ||
             state == stage_state::skipped;
    }
  };

  // The per-port sequence of stages. Stages are appended in phases: first
  // the depend stage and then, once the dependencies are satisfied, the
  // stages of the selected build method (possibly several times if methods
  // fall back).
  //
  class pipeline
  {
  public:
    using stages_type = vector<stage>;
    using const_iterator = stages_type::const_iterator;

    size_t
    append (stage_type, stack_type);

    stage&
    operator[] (size_t i) {return stages_[i];}

    const stage&
    operator[] (size_t i) const {return stages_[i];}

    size_t
    size () const {return stages_.size ();}

    bool
    empty () const {return stages_.empty ();}

    const_iterator
    begin () const {return stages_.begin ();}

    const_iterator
    end () const {return stages_.end ();}

    // Index of the first stage of the current phase.
    //
    size_t
    phase () const {return phase_;}

    void
    begin_phase () {phase_ = stages_.size ();}

    // Next pending stage of the current phase, if any.
    //
    optional<size_t>
    next () const;

    // True if the current phase has no pending, queued, or running stages.
    //
    bool
    finished () const;

    // Fail the stack. A failed stack never returns to passing and a failed
    // common stack fails every stack.
    //
    void
    fail (stack_type);

    bool
    failed (stack_type) const;

    // True if any stack of the current phase other than clean failed.
    //
    bool
    phase_failed () const;

    const set<stack_type>&
    failed_stacks () const {return failed_;}

    // Mark the pending and queued stages of the current phase as skipped.
    // Return the indexes of the stages that were queued.
    //
    vector<size_t>
    halt ();

  private:
    stages_type stages_;
    size_t phase_ = 0;
    set<stack_type> failed_;
  };
}

#endif // PBUILD_STAGE_HXX
