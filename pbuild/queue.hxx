// file      : pbuild/queue.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_QUEUE_HXX
#define PBUILD_QUEUE_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/job.hxx>
#include <pbuild/stage.hxx>
#include <pbuild/event-loop.hxx>

namespace pbuild
{
  // Default queue load.
  //
  size_t
  default_load (queue_id);

  // Load-limited admission queues, one per stage class.
  //
  // A submitted job is started if fewer than load jobs of its queue are
  // running and is otherwise kept in the FIFO order. Once a job completes
  // the stage_completed_event is posted and the next job of the queue is
  // started. A queue with zero load is paused: its jobs are kept but not
  // started.
  //
  class queue_manager
  {
  public:
    queue_manager (event_loop&, job_executor&);

    queue_manager (const queue_manager&) = delete;
    queue_manager& operator= (const queue_manager&) = delete;

    size_t
    load (queue_id q) const {return queues_[index (q)].load;}

    // Set the queue load, starting the queued jobs if it was raised.
    //
    void
    load (queue_id, size_t);

    void
    submit (job);

    // Remove the queued (but not yet started) job of the port stage. Return
    // false if there is no such job.
    //
    bool
    cancel (port_id, size_t stage);

    // Kill all the running jobs. Their completions are still delivered.
    //
    void
    kill_all ();

    size_t
    running (queue_id q) const {return queues_[index (q)].running;}

    size_t
    running () const {return active_.size ();}

    size_t
    queued (queue_id q) const {return queues_[index (q)].jobs.size ();}

    size_t
    queued () const;

    // Maximum number of jobs of the queue running simultaneously so far.
    //
    size_t
    peak (queue_id q) const {return queues_[index (q)].peak;}

    // Called when a job is started, before it is passed to the executor.
    //
    function<void (const job&)> started;

  private:
    static size_t
    index (queue_id q) {return static_cast<size_t> (q);}

    void
    dispatch (queue_id);

    void
    completed (const event&);

  private:
    event_loop& loop_;
    job_executor& executor_;

    struct queue
    {
      size_t load = 1;
      size_t running = 0;
      size_t peak = 0;
      deque<job> jobs;
    };

    queue queues_[queue_count];

    map<job_id, job> active_;
    job_id next_ = 1;
  };
}

#endif // PBUILD_QUEUE_HXX
