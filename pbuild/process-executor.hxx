// file      : pbuild/process-executor.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_PROCESS_EXECUTOR_HXX
#define PBUILD_PROCESS_EXECUTOR_HXX

#include <sys/types.h> // pid_t

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/job.hxx>
#include <pbuild/event-loop.hxx>

namespace pbuild
{
  // Job executor that runs the jobs as child processes.
  //
  // Each job runs in its own process group which is killed as a whole. As a
  // result, the terminal interrupt only reaches pbuild itself.
  //
  // SIGCHLD, SIGINT, and SIGTERM are caught while the executor exists. The
  // handlers only write the signal number into a pipe that wait() selects
  // on together with the captured job outputs. There can only be one
  // instance at a time.
  //
  class process_executor: public job_executor
  {
  public:
    explicit
    process_executor (event_loop&);

    // Kill and wait for the remaining jobs.
    //
    ~process_executor ();

    process_executor (const process_executor&) = delete;
    process_executor& operator= (const process_executor&) = delete;

    virtual void
    spawn (const job&) override;

    virtual void
    kill (job_id) override;

    virtual size_t
    running () const override {return jobs_.size ();}

    virtual void
    wait (event_loop&) override;

  private:
    struct running_job
    {
      job_id id;
      string origin;
      pid_t pid;                 // Also the process group id.

      unique_ptr<ifdstream> out; // Open while capturing.
      string output;
      bool read_failed = false;

      bool exited = false;
      bool success = false;

      running_job (const job& j, pid_t p, unique_ptr<ifdstream>&& o)
          : id (j.id), origin (j.origin), pid (p), out (move (o)) {}

      running_job (const running_job&) = delete;
      running_job& operator= (const running_job&) = delete;

      ~running_job ();
    };

    void
    complete (job_id, bool success, string output, bool exhausted = false);

    void
    read (running_job&);

    void
    reap (running_job&);

  private:
    event_loop& loop_;
    map<job_id, unique_ptr<running_job>> jobs_;

    auto_fd signal_in_;
    auto_fd signal_out_;
  };
}

#endif // PBUILD_PROCESS_EXECUTOR_HXX
