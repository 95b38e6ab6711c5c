// file      : pbuild/job.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_JOB_HXX
#define PBUILD_JOB_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/stage.hxx>
#include <pbuild/event-loop.hxx>

namespace pbuild
{
  // External process executing one stage of one port.
  //
  struct job
  {
    job_id id = 0;            // Assigned by the queue manager on dispatch.

    port_id port = 0;
    size_t stage = 0;         // Pipeline index.
    stage_type type = stage_type::depend;
    stack_type stack = stack_type::common;
    string origin;

    strings args;             // Command line, program first.
    bool capture = false;     // Capture stdout into the completion event.
    path log;                 // Append stdout/stderr to this file if not empty.
    bool print_only = false;  // Print the command line instead of running.

    // NULL-terminated argument list for process.
    //
    cstrings
    arguments () const;
  };

  // The job executor starts jobs and reports their completion to the event
  // loop as the job_completed_event with the job id set. A job that cannot
  // be started is reported the same way, as failed.
  //
  // As an event source the executor is active while any job is running and
  // its wait() blocks until a job completes or a signal arrives, which is
  // posted as the corresponding signal event.
  //
  class job_executor: public event_source
  {
  public:
    virtual void
    spawn (const job&) = 0;

    // Terminate the running job. Its completion is still reported.
    //
    virtual void
    kill (job_id) = 0;

    virtual size_t
    running () const = 0;

    virtual bool
    active () const override {return running () != 0;}
  };
}

#endif // PBUILD_JOB_HXX
