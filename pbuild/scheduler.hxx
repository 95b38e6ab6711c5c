// file      : pbuild/scheduler.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_SCHEDULER_HXX
#define PBUILD_SCHEDULER_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/job.hxx>
#include <pbuild/port.hxx>
#include <pbuild/queue.hxx>
#include <pbuild/event-loop.hxx>
#include <pbuild/configuration.hxx>
#include <pbuild/dependency-graph.hxx>
#include <pbuild/package-database.hxx>

namespace pbuild
{
  // Top-level orchestration of a run.
  //
  // The first SIGINT stops the run gracefully: no further stage is started
  // but the running jobs are allowed to finish. The second SIGINT or a
  // SIGTERM kills the running jobs and throws failed with the exit code 3.
  //
  class scheduler
  {
  public:
    scheduler (const configuration&,
               event_loop&,
               job_executor&,
               const package_database&);

    scheduler (const scheduler&) = delete;
    scheduler& operator= (const scheduler&) = delete;

    // Request the port to be built. Should be called before run().
    //
    port_id
    add (const string& origin);

    port_id
    get_port (const string& origin) {return graph_.get_port (origin);}

    // Run until no work remains. In the resolve-first mode the first pass
    // only resolves the dependency graph, then the plan callback is called,
    // the configured loads are restored, and the second pass runs the
    // stages.
    //
    void
    run ();

    // Called between the passes in the resolve-first mode.
    //
    function<void ()> plan;

    // Stop starting new stages.
    //
    void
    stop ();

    // Kill the running jobs and throw failed.
    //
    [[noreturn]] void
    terminate ();

    bool
    stopped () const {return stopped_;}

    bool
    interrupted () const {return interrupts_ != 0;}

    // True if a run-wide fatal condition (a cycle involving a requested port
    // or resource exhaustion) was encountered.
    //
    bool
    fatal () const {return fatal_;}

    // Process exit status: 0 if all the ports succeeded, 2 if interrupted,
    // and 1 otherwise.
    //
    int
    status () const;

    const vector<port_id>&
    requested () const {return requested_;}

    dependency_graph&
    graph () {return graph_;}

    const dependency_graph&
    graph () const {return graph_;}

    queue_manager&
    queues () {return queues_;}

  private:
    void
    interrupt ();

  private:
    const configuration& conf_;
    event_loop& loop_;

    queue_manager queues_;
    dependency_graph graph_;

    vector<port_id> requested_;

    size_t interrupts_ = 0;
    bool stopped_ = false;
    bool fatal_ = false;
  };
}

#endif // PBUILD_SCHEDULER_HXX
