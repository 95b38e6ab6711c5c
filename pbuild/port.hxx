// file      : pbuild/port.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_PORT_HXX
#define PBUILD_PORT_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#include <pbuild/stage.hxx>
#include <pbuild/attributes.hxx>
#include <pbuild/options-types.hxx>
#include <pbuild/package-database.hxx>

namespace pbuild
{
  enum class dependency_status
  {
    unresolved, // Dependencies are not yet known.
    resolving,  // Waiting for some dependencies to finish.
    resolved
  };

  string
  to_string (dependency_status);

  inline ostream&
  operator<< (ostream& os, dependency_status s) {return os << to_string (s);}

  // Terminal classification of a port. Pending ports at the end of a run are
  // incomplete.
  //
  enum class port_result
  {
    pending,
    success,           // Built (or installed) successfully.
    skipped,           // Already installed, nothing to do.
    failed,            // A stage failed.
    dependency_failed, // A dependency failed.
    no_method,         // No applicable build method.
    cycle,             // Part of a dependency cycle.
    unresolved         // No such port.
  };

  string
  to_string (port_result);

  inline ostream&
  operator<< (ostream& os, port_result r) {return os << to_string (r);}

  // A dependency is either a port or an origin that does not name any port.
  //
  struct dependency
  {
    string origin;
    optional<port_id> port; // Absent if unresolved.

    explicit
    dependency (string o, optional<port_id> p = nullopt)
        : origin (move (o)), port (p) {}
  };

  using dependency_list = vector<dependency>;

  class port
  {
  public:
    port (port_id i, string o): id (i), origin (move (o)) {}

    port (const port&) = delete;
    port& operator= (const port&) = delete;

    const port_id id;
    const string origin; // <category>/<name>

    optional<port_attributes> attributes;
    install_status status = install_status::absent;

    bool requested = false; // Explicitly requested on the command line.
    bool force = false;     // Rebuild regardless of the install status.

    pipeline stages;

    // Build methods not yet tried, in the preference order, and the one
    // currently in use.
    //
    build_methods methods;
    optional<build_method> method;

    // Dependency relation.
    //
    dependency_list dependencies;
    dependency_status resolution = dependency_status::unresolved;
    set<port_id> waiting;   // Dependencies not yet finished.
    bool dependency_failed = false;

    // Dependent relation.
    //
    vector<port_id> dependents;

    port_result result = port_result::pending;

    bool
    finished () const {return result != port_result::pending;}

    bool
    succeeded () const
    {
      return result == port_result::success || result == port_result::skipped;
    }

    // True if the port cannot satisfy its dependents.
    //
    bool
    failed () const {return finished () && !succeeded ();}

    const string&
    pkgname () const
    {
      return attributes ? attributes->pkgname : origin;
    }
  };

  inline ostream&
  operator<< (ostream& os, const port& p) {return os << p.origin;}

  // Port arena. Exactly one port exists per origin and ports are never
  // destroyed before the table.
  //
  class port_table
  {
  public:
    // Return the port with the specified origin, creating it if not present.
    // The second member is true if the port was created.
    //
    pair<port&, bool>
    insert (const string& origin);

    port*
    find (const string& origin);

    const port*
    find (const string& origin) const;

    port&
    operator[] (port_id i) {return *ports_[i];}

    const port&
    operator[] (port_id i) const {return *ports_[i];}

    size_t
    size () const {return ports_.size ();}

    bool
    empty () const {return ports_.empty ();}

  private:
    vector<unique_ptr<port>> ports_;
    map<string, port_id> index_;
  };
}

#endif // PBUILD_PORT_HXX
