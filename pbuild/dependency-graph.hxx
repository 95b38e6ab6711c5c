// file      : pbuild/dependency-graph.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_DEPENDENCY_GRAPH_HXX
#define PBUILD_DEPENDENCY_GRAPH_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/port.hxx>
#include <pbuild/queue.hxx>
#include <pbuild/event-loop.hxx>
#include <pbuild/configuration.hxx>
#include <pbuild/stage-machine.hxx>
#include <pbuild/package-database.hxx>

namespace pbuild
{
  // The port dependency graph.
  //
  // A port is discovered by running its depend stage. Once its attributes
  // are loaded the port is either skipped (already installed and not
  // forced) or its dependencies are discovered in turn. When all the
  // dependencies have finished successfully the first applicable build
  // method is composed into the port's pipeline, falling back to the next
  // method if it fails.
  //
  // A failed port fails all its dependents, transitively, with the
  // port_failed_event posted exactly once for each. A successfully finished
  // port posts the port_finished_event.
  //
  class dependency_graph
  {
  public:
    dependency_graph (const configuration&,
                      event_loop&,
                      queue_manager&,
                      const package_database&);

    dependency_graph (const dependency_graph&) = delete;
    dependency_graph& operator= (const dependency_graph&) = delete;

    // Return the port with the specified origin, creating it and starting
    // its discovery if it is not yet known.
    //
    port_id
    get_port (const string& origin);

    port&
    operator[] (port_id i) {return ports_[i];}

    const port&
    operator[] (port_id i) const {return ports_[i];}

    port*
    find (const string& origin) {return ports_.find (origin);}

    const port*
    find (const string& origin) const {return ports_.find (origin);}

    size_t
    size () const {return ports_.size ();}

    stage_machine&
    stages () {return stages_;}

    // Failed direct dependencies of the port, except for those that failed
    // only because another of these dependencies failed.
    //
    dependency_list
    bad_dependencies (port_id) const;

    // Origins of the ports (and of the unresolved names) that caused the port
    // to fail, sorted.
    //
    strings
    root_causes (port_id) const;

    vector<stack_type>
    failed_stacks (port_id) const;

    // True if the port has to be built according to the install status and
    // the policy.
    //
    bool
    needs_build (const port&) const;

    // Unfinished ports that have to be built, including those still waiting
    // for their dependencies, in the discovery order.
    //
    vector<port_id>
    planned () const;

  private:
    void
    completed (const event&);

    void
    finished (const event&);

    void
    loaded (port&, const event&);

    void
    resolve (port&);

    void
    ready (port&);

    bool
    applicable (const port&, build_method) const;

    bool
    select (port&);

    void
    succeed (port&, port_result);

    void
    fail (port&, port_result);

    void
    propagate (deque<port_id>);

    // Return the dependency path from the port to the target port (both
    // inclusive) through the unfinished ports, or empty if there is none.
    //
    vector<port_id>
    path_to (port_id from, port_id to) const;

    // Origins reachable from the port through the failed dependencies.
    //
    set<string>
    failed_closure (port_id) const;

  private:
    const configuration& conf_;
    event_loop& loop_;
    const package_database& packages_;

    port_table ports_;
    stage_machine stages_;
  };
}

#endif // PBUILD_DEPENDENCY_GRAPH_HXX
