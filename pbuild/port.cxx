// file      : pbuild/port.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/port.hxx>

using namespace std;

namespace pbuild
{
  string
  to_string (dependency_status s)
  {
    switch (s)
    {
    case dependency_status::unresolved: return "unresolved";
    case dependency_status::resolving:  return "resolving";
    case dependency_status::resolved:   return "resolved";
    }

    return string (); // Should never reach.
  }

  string
  to_string (port_result r)
  {
    switch (r)
    {
    case port_result::pending:           return "incomplete";
    case port_result::success:           return "success";
    case port_result::skipped:           return "skipped";
    case port_result::failed:            return "failed";
    case port_result::dependency_failed: return "dependency failed";
    case port_result::no_method:         return "no method";
    case port_result::cycle:             return "dependency cycle";
    case port_result::unresolved:        return "unresolved";
    }

    return string (); // Should never reach.
  }

  pair<port&, bool> port_table::
  insert (const string& o)
  {
    auto i (index_.find (o));

    if (i != index_.end ())
      return pair<port&, bool> (*ports_[i->second], false);

    port_id id (ports_.size ());
    ports_.push_back (unique_ptr<port> (new port (id, o)));
    index_.emplace (o, id);

    return pair<port&, bool> (*ports_.back (), true);
  }

  port* port_table::
  find (const string& o)
  {
    auto i (index_.find (o));
    return i != index_.end () ? ports_[i->second].get () : nullptr;
  }

  const port* port_table::
  find (const string& o) const
  {
    auto i (index_.find (o));
    return i != index_.end () ? ports_[i->second].get () : nullptr;
  }
}
