// file      : pbuild/stage.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/stage.hxx>

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace pbuild
{
  static int
  main (int, char*[])
  {
    assert (to_stage_type ("fetch") == stage_type::fetch);
    assert (to_stack_type ("clean") == stack_type::clean);
    assert (to_queue_id ("attr") == queue_id::attr);
    assert (to_string (queue_id::package) == "package");

    try
    {
      to_queue_id ("link");
      assert (false);
    }
    catch (const invalid_argument&) {}

    // Phases.
    //
    {
      pipeline ps;

      ps.begin_phase ();
      assert (ps.append (stage_type::depend, stack_type::common) == 0);
      assert (!ps[0].prev);

      assert (*ps.next () == 0);
      assert (!ps.finished ());

      ps[0].state = stage_state::running;
      assert (!ps.next ());
      assert (!ps.finished ());

      ps[0].state = stage_state::done;
      assert (ps.finished () && !ps.phase_failed ());

      ps.begin_phase ();
      assert (ps.phase () == 1);

      ps.append (stage_type::checksum, stack_type::build);
      ps.append (stage_type::fetch, stack_type::build);
      ps.append (stage_type::clean, stack_type::clean);

      assert (ps.size () == 4);
      assert (*ps[3].prev == 2);
      assert (*ps.next () == 1);

      ps[1].state = stage_state::done;
      assert (*ps.next () == 2);

      // Failure halts the rest of the phase.
      //
      ps[2].state = stage_state::failed;
      ps.fail (stack_type::build);

      assert (ps.failed (stack_type::build));
      assert (!ps.failed (stack_type::clean));
      assert (ps.phase_failed ());

      assert (ps.halt ().empty ());
      assert (ps[3].state == stage_state::skipped);
      assert (ps.finished ());

      // New phase does not inherit the failure of the build stack.
      //
      ps.begin_phase ();
      ps.append (stage_type::install, stack_type::package);
      assert (!ps.phase_failed ());

      ps[4].state = stage_state::done;
      assert (ps.finished () && !ps.phase_failed ());

      assert ((ps.failed_stacks () == set<stack_type> {stack_type::build}));
    }

    // Common stack failure fails every stack.
    //
    {
      pipeline ps;
      ps.append (stage_type::depend, stack_type::common);
      ps.fail (stack_type::common);

      assert (ps.failed (stack_type::build));
      assert (ps.failed (stack_type::clean));
    }

    // Clean failure does not fail the phase.
    //
    {
      pipeline ps;
      ps.append (stage_type::build, stack_type::build);
      ps.append (stage_type::clean, stack_type::clean);

      ps[0].state = stage_state::done;
      ps[1].state = stage_state::failed;
      ps.fail (stack_type::clean);

      assert (ps.finished () && !ps.phase_failed ());
      assert (ps.failed (stack_type::clean) && !ps.failed (stack_type::build));
    }

    // Halt reports the queued stages.
    //
    {
      pipeline ps;
      ps.append (stage_type::checksum, stack_type::build);
      ps.append (stage_type::fetch, stack_type::build);
      ps.append (stage_type::build, stack_type::build);

      ps[0].state = stage_state::done;
      ps[1].state = stage_state::queued;

      assert ((ps.halt () == vector<size_t> {1}));
      assert (ps[1].state == stage_state::skipped);
      assert (ps[2].state == stage_state::skipped);
      assert (ps[0].state == stage_state::done);
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return pbuild::main (argc, argv);
}
