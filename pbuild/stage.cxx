// file      : pbuild/stage.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/stage.hxx>

using namespace std;

namespace pbuild
{
  string
  to_string (stage_type t)
  {
    switch (t)
    {
    case stage_type::depend:   return "depend";
    case stage_type::checksum: return "checksum";
    case stage_type::fetch:    return "fetch";
    case stage_type::build:    return "build";
    case stage_type::install:  return "install";
    case stage_type::package:  return "package";
    case stage_type::clean:    return "clean";
    }

    return string (); // Should never reach.
  }

  stage_type
  to_stage_type (const string& s)
  {
         if (s == "depend")   return stage_type::depend;
    else if (s == "checksum") return stage_type::checksum;
    else if (s == "fetch")    return stage_type::fetch;
    else if (s == "build")    return stage_type::build;
    else if (s == "install")  return stage_type::install;
    else if (s == "package")  return stage_type::package;
    else if (s == "clean")    return stage_type::clean;
    else throw invalid_argument ("invalid stage '" + s + '\'');
  }

  string
  to_string (stage_state s)
  {
    switch (s)
    {
    case stage_state::pending: return "pending";
    case stage_state::queued:  return "queued";
    case stage_state::running: return "running";
    case stage_state::done:    return "done";
    case stage_state::failed:  return "failed";
    case stage_state::skipped: return "skipped";
    }

    return string (); // Should never reach.
  }

  string
  to_string (stack_type t)
  {
    switch (t)
    {
    case stack_type::common:  return "common";
    case stack_type::build:   return "build";
    case stack_type::package: return "package";
    case stack_type::clean:   return "clean";
    }

    return string (); // Should never reach.
  }

  stack_type
  to_stack_type (const string& s)
  {
         if (s == "common")  return stack_type::common;
    else if (s == "build")   return stack_type::build;
    else if (s == "package") return stack_type::package;
    else if (s == "clean")   return stack_type::clean;
    else throw invalid_argument ("invalid stack '" + s + '\'');
  }

  string
  to_string (queue_id q)
  {
    switch (q)
    {
    case queue_id::attr:     return "attr";
    case queue_id::checksum: return "checksum";
    case queue_id::fetch:    return "fetch";
    case queue_id::build:    return "build";
    case queue_id::install:  return "install";
    case queue_id::package:  return "package";
    case queue_id::clean:    return "clean";
    }

    return string (); // Should never reach.
  }

  queue_id
  to_queue_id (const string& s)
  {
         if (s == "attr")     return queue_id::attr;
    else if (s == "checksum") return queue_id::checksum;
    else if (s == "fetch")    return queue_id::fetch;
    else if (s == "build")    return queue_id::build;
    else if (s == "install")  return queue_id::install;
    else if (s == "package")  return queue_id::package;
    else if (s == "clean")    return queue_id::clean;
    else throw invalid_argument ("invalid queue '" + s + '\'');
  }

  queue_id
  stage_queue (stage_type t)
  {
    switch (t)
    {
    case stage_type::depend:   return queue_id::attr;
    case stage_type::checksum: return queue_id::checksum;
    case stage_type::fetch:    return queue_id::fetch;
    case stage_type::build:    return queue_id::build;
    case stage_type::install:  return queue_id::install;
    case stage_type::package:  return queue_id::package;
    case stage_type::clean:    return queue_id::clean;
    }

    return queue_id::attr; // Should never reach.
  }

  // pipeline
  //
  size_t pipeline::
  append (stage_type t, stack_type s)
  {
    optional<size_t> p;
    if (!stages_.empty ())
      p = stages_.size () - 1;

    stages_.emplace_back (t, s, p);
    return stages_.size () - 1;
  }

  optional<size_t> pipeline::
  next () const
  {
    for (size_t i (phase_); i != stages_.size (); ++i)
    {
      if (stages_[i].state == stage_state::pending)
        return i;
    }

    return nullopt;
  }

  bool pipeline::
  finished () const
  {
    for (size_t i (phase_); i != stages_.size (); ++i)
    {
      if (!stages_[i].finished ())
        return false;
    }

    return true;
  }

  void pipeline::
  fail (stack_type s)
  {
    failed_.insert (s);
  }

  bool pipeline::
  failed (stack_type s) const
  {
    return failed_.find (s) != failed_.end () ||
           failed_.find (stack_type::common) != failed_.end ();
  }

  bool pipeline::
  phase_failed () const
  {
    for (size_t i (phase_); i != stages_.size (); ++i)
    {
      const stage& s (stages_[i]);

      // Clean failures are only reported.
      //
      if (s.stack == stack_type::clean)
        continue;

      if (s.state == stage_state::failed || failed (s.stack))
        return true;
    }

    return false;
  }

  vector<size_t> pipeline::
  halt ()
  {
    vector<size_t> r;

    for (size_t i (phase_); i != stages_.size (); ++i)
    {
      stage& s (stages_[i]);

      if (s.state == stage_state::queued)
        r.push_back (i);

      if (s.state == stage_state::pending || s.state == stage_state::queued)
        s.state = stage_state::skipped;
    }

    return r;
  }
}
