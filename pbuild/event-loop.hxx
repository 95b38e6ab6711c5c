// file      : pbuild/event-loop.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_EVENT_LOOP_HXX
#define PBUILD_EVENT_LOOP_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

namespace pbuild
{
  using job_id = uint64_t;

  // Event names.
  //
  extern const string job_completed_event;      // Job exited or failed to start.
  extern const string stage_completed_event;    // Queue slot released.
  extern const string pipeline_completed_event; // Port phase finished.
  extern const string port_finished_event;      // Port reached terminal state.
  extern const string port_failed_event;        // Posted once per failed port.
  extern const string cycle_event;              // Dependency cycle detected.
  extern const string resource_exhausted_event; // No job can be started.

  // Return the event name for the signal ("SIGINT", "SIGTERM", etc).
  //
  string
  signal_event (int);

  // A unit of deferred work. Besides the name only the members relevant to
  // the particular event are set.
  //
  struct event
  {
    string name;

    port_id port = 0;
    size_t stage = 0;      // Pipeline index.
    job_id job = 0;
    int signal = 0;

    bool success = false;
    bool exhausted = false; // Job could not start due to lack of resources.
    string output;

    function<void ()> action; // Executed before the listeners, if present.

    event () = default;

    explicit
    event (string n): name (move (n)) {}
  };

  class event_loop;

  // Source of events external to the loop (for example, job completions and
  // OS signals). While the source is active the loop blocks in wait() once
  // the queue is drained. The wait() implementation should post at least one
  // event before returning, unless interrupted.
  //
  class event_source
  {
  public:
    virtual
    ~event_source () = default;

    virtual bool
    active () const = 0;

    virtual void
    wait (event_loop&) = 0;
  };

  // Single-threaded event loop. Events are delivered in the post order with
  // listeners posting further events rather than calling each other
  // directly.
  //
  class event_loop
  {
  public:
    using listener = function<void (const event&)>;
    using connection = size_t;

    explicit
    event_loop (event_source* s = nullptr): source_ (s) {}

    event_loop (const event_loop&) = delete;
    event_loop& operator= (const event_loop&) = delete;

    void
    source (event_source* s) {source_ = s;}

    event_source*
    source () const {return source_;}

    // Register a listener for the named event. Listeners are called in the
    // registration order.
    //
    connection
    connect (const string& name, listener);

    // Register a listener for the OS signal.
    //
    connection
    connect (int signal, listener l) {return connect (signal_event (signal),
                                                      move (l));}

    void
    disconnect (connection);

    void
    post (event);

    void
    post (function<void ()>);

    // Deliver the pending events until none remain and the event source is
    // no longer active. Exceptions thrown by listeners are propagated with
    // the remaining events left in the queue. Can be called again.
    //
    void
    run ();

    bool
    empty () const {return events_.empty ();}

    size_t
    pending () const {return events_.size ();}

    // Number of events delivered so far.
    //
    size_t
    delivered () const {return delivered_;}

  private:
    void
    dispatch (const event&);

  private:
    event_source* source_;

    deque<event> events_;
    size_t delivered_ = 0;

    struct slot
    {
      connection id;
      listener func;
    };

    map<string, vector<slot>> listeners_;
    connection next_ = 1;
  };
}

#endif // PBUILD_EVENT_LOOP_HXX
