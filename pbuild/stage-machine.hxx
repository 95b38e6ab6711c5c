// file      : pbuild/stage-machine.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_STAGE_MACHINE_HXX
#define PBUILD_STAGE_MACHINE_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/port.hxx>
#include <pbuild/queue.hxx>
#include <pbuild/stage.hxx>
#include <pbuild/event-loop.hxx>
#include <pbuild/configuration.hxx>

namespace pbuild
{
  // Drives the ports' pipelines through the queues.
  //
  // Stages of a port run one at a time: once a stage is done the next
  // pending stage of the phase is submitted and once a stage fails the rest
  // of the phase is skipped. When the phase has no unfinished stages left
  // the pipeline_completed_event is posted for the port (with the depend
  // stage output, if it was the last stage).
  //
  // Distribution files are tracked across ports: the checksum and fetch
  // stages of a port whose distfiles are all already fetched are skipped and
  // fail without running if they all failed to checksum or fetch before.
  //
  class stage_machine
  {
  public:
    stage_machine (const configuration&,
                   event_loop&,
                   queue_manager&,
                   port_table&);

    stage_machine (const stage_machine&) = delete;
    stage_machine& operator= (const stage_machine&) = delete;

    // Start the depend phase of a new port.
    //
    void
    discover (port&);

    // Begin a new phase with the stages of the build method and start it.
    //
    void
    compose (port&, build_method);

    // Begin a new phase with the stages of the build method marked as
    // skipped.
    //
    void
    skip (port&, build_method);

    // Submit the next pending stage of the current phase. If there is none
    // and the phase is finished, post the pipeline_completed_event.
    //
    void
    start (port&);

    // Skip the pending and queued stages of the current phase. The running
    // stage, if any, is allowed to finish.
    //
    void
    halt (port&);

    // Stop submitting stages. The queued and running stages are unaffected.
    //
    void
    stop () {stopping_ = true;}

    bool
    stopping () const {return stopping_;}

  private:
    void
    append (port&, build_method);

    void
    submit (port&, size_t);

    void
    completed (const event&);

    // Return true if the stage was settled without running.
    //
    bool
    settle (port&, size_t);

  private:
    const configuration& conf_;
    event_loop& loop_;
    queue_manager& queues_;
    port_table& ports_;

    bool stopping_ = false;

    set<string> fetched_;
    set<string> fetch_failed_;
  };
}

#endif // PBUILD_STAGE_MACHINE_HXX
