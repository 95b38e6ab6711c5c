// file      : pbuild/process-executor.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/process-executor.hxx>

#include <spawn.h>
#include <errno.h>
#include <fcntl.h>    // O_*
#include <signal.h>
#include <unistd.h>   // read(), write()
#include <sys/wait.h>

#include <libbutl/fdstream.hxx> // fdselect(), fdmode()

#include <pbuild/diagnostics.hxx>

extern char** environ;

using namespace std;
using namespace butl;

namespace pbuild
{
  static const int signals[] = {SIGCHLD, SIGINT, SIGTERM};

  static int signal_fd (-1);
  static struct sigaction signal_actions[sizeof (signals) / sizeof (int)];

  extern "C" void
  pbuild_signal_handler (int s)
  {
    int e (errno);

    unsigned char c (static_cast<unsigned char> (s));
    if (::write (signal_fd, &c, 1) == -1)
    {
      // Nothing we can do if the pipe is full: the pending bytes will wake
      // up the select anyway.
    }

    errno = e;
  }

  // Return true if the error code indicates lack of system resources.
  //
  static bool
  exhausted (int c)
  {
    return c == EAGAIN || c == ENOMEM || c == EMFILE || c == ENFILE;
  }

  // Start the process in a new process group with stdin redirected to
  // /dev/null and stdout and stderr redirected to the specified file
  // descriptors (-1 to inherit, -2 for /dev/null). Return 0 or the error
  // code.
  //
  static int
  start_process (const process_path& pp,
                 const cstrings& args,
                 int out,
                 int err,
                 pid_t& pid)
  {
    posix_spawn_file_actions_t fa;
    posix_spawnattr_t a;

    int r (posix_spawn_file_actions_init (&fa));
    if (r != 0)
      return r;

    if ((r = posix_spawnattr_init (&a)) != 0)
    {
      posix_spawn_file_actions_destroy (&fa);
      return r;
    }

    auto redirect = [&fa] (int fd, int to, int flags)
    {
      return to == -1 ? 0
           : to == -2 ? posix_spawn_file_actions_addopen (&fa,
                                                          fd,
                                                          "/dev/null",
                                                          flags,
                                                          0)
           :            posix_spawn_file_actions_adddup2 (&fa, to, fd);
    };

    if ((r = redirect (0, -2, O_RDONLY))                         == 0 &&
        (r = redirect (1, out, O_WRONLY))                        == 0 &&
        (r = redirect (2, err, O_WRONLY))                        == 0 &&
        (r = posix_spawnattr_setpgroup (&a, 0))                  == 0 &&
        (r = posix_spawnattr_setflags (&a, POSIX_SPAWN_SETPGROUP)) == 0)
    {
      r = posix_spawn (&pid,
                       pp.effect_string (),
                       &fa,
                       &a,
                       const_cast<char* const*> (args.data ()),
                       environ);
    }

    posix_spawnattr_destroy (&a);
    posix_spawn_file_actions_destroy (&fa);

    return r;
  }

  // Kill the process group. Return 0 or the error code.
  //
  static int
  kill_group (pid_t pid)
  {
    return ::kill (-pid, SIGKILL) == -1 && errno != ESRCH ? errno : 0;
  }

  process_executor::running_job::
  ~running_job ()
  {
    if (exited)
      return;

    kill_group (pid);

    while (::waitpid (pid, nullptr, 0) == -1 && errno == EINTR) ;
  }

  process_executor::
  process_executor (event_loop& l)
      : loop_ (l)
  {
    assert (signal_fd == -1);

    fdpipe p (open_pipe ());

    try
    {
      fdmode (p.in.get (), fdstream_mode::non_blocking);
      fdmode (p.out.get (), fdstream_mode::non_blocking);
    }
    catch (const io_error& e)
    {
      fail << "unable to set signal pipe mode: " << e;
    }

    signal_in_ = move (p.in);
    signal_out_ = move (p.out);
    signal_fd = signal_out_.get ();

    struct sigaction a;
    a.sa_handler = &pbuild_signal_handler;
    sigemptyset (&a.sa_mask);

    for (size_t i (0); i != sizeof (signals) / sizeof (int); ++i)
    {
      a.sa_flags = SA_RESTART | (signals[i] == SIGCHLD ? SA_NOCLDSTOP : 0);

      if (sigaction (signals[i], &a, &signal_actions[i]) == -1)
        fail << "unable to install " << signal_event (signals[i])
             << " handler: " << system_error (errno, generic_category ());
    }
  }

  process_executor::
  ~process_executor ()
  {
    // Wait for the remaining jobs before restoring the signal handlers.
    //
    jobs_.clear ();

    for (size_t i (0); i != sizeof (signals) / sizeof (int); ++i)
      sigaction (signals[i], &signal_actions[i], nullptr);

    signal_fd = -1;
  }

  void process_executor::
  complete (job_id id, bool s, string o, bool x)
  {
    event e (job_completed_event);
    e.job = id;
    e.success = s;
    e.output = move (o);
    e.exhausted = x;
    loop_.post (move (e));
  }

  void process_executor::
  spawn (const job& j)
  {
    tracer trace ("process_executor::spawn");

    cstrings args (j.arguments ());

    if (j.print_only)
    {
      print_process (args);
      complete (j.id, true, string ());
      return;
    }

    // Note that the path search can only fail if the program is not found.
    //
    process_path pp;
    try
    {
      pp = process::path_search (args[0], false /* init */, exec_dir);
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << args[0] << ": " << e;

      complete (j.id, false, string ());
      return;
    }

    if (verb >= 2)
      print_process (args);

    // Append both stdout and stderr to the log file, if any. The captured
    // stdout goes to a pipe. Note that these file descriptors are opened
    // with FD_CLOEXEC.
    //
    auto_fd lfd;
    if (!j.log.empty ())
    try
    {
      lfd = fdopen (j.log,
                    fdopen_mode::out    |
                    fdopen_mode::create |
                    fdopen_mode::append);
    }
    catch (const io_error& e)
    {
      error << "unable to open log file " << j.log << ": " << e;

      complete (j.id, false, string (), exhausted (e.code ().value ()));
      return;
    }

    auto_fd ofd;
    unique_ptr<ifdstream> is;
    if (j.capture)
    try
    {
      fdpipe p (fdopen_pipe ());
      ofd = move (p.out);
      is.reset (new ifdstream (move (p.in),
                               fdstream_mode::non_blocking,
                               ifdstream::badbit));
    }
    catch (const io_error& e)
    {
      error << "unable to open " << j.origin << " job output pipe: " << e;

      complete (j.id, false, string (), exhausted (e.code ().value ()));
      return;
    }

    int lf (lfd.get ());
    int out (j.capture ? ofd.get () : lf != -1 ? lf : -2);
    int err (lf != -1 ? lf : j.capture ? -1 : -2);

    pid_t pid (0);
    if (int r = start_process (pp, args, out, err, pid))
    {
      error << "unable to execute " << args[0] << ": "
            << system_error (r, generic_category ());

      complete (j.id, false, string (), exhausted (r));
      return;
    }

    l5 ([&]{trace << j.origin << ' ' << j.type << " started as job "
                  << j.id << " (process " << pid << ')';});

    jobs_.emplace (j.id,
                   unique_ptr<running_job> (
                     new running_job (j, pid, move (is))));
  }

  void process_executor::
  kill (job_id id)
  {
    auto i (jobs_.find (id));

    if (i == jobs_.end ())
      return;

    running_job& r (*i->second);

    if (r.exited)
      return;

    if (int e = kill_group (r.pid))
      error << "unable to kill " << r.origin << " job: "
            << system_error (e, generic_category ());
  }

  void process_executor::
  read (running_job& r)
  {
    ifdstream& is (*r.out);

    try
    {
      char buf[4096];

      // Note that the eof check is important: if the stream is at eof, this
      // and all subsequent readsome() calls will return 0.
      //
      for (streamsize n; (n = is.readsome (buf, sizeof (buf))) != 0; )
        r.output.append (buf, static_cast<size_t> (n));

      if (is.eof ())
      {
        is.close ();
        r.out.reset ();
      }
    }
    catch (const io_error& e)
    {
      error << "unable to read " << r.origin << " job output: " << e;

      r.out.reset ();
      r.read_failed = true;
      r.output.clear ();
    }
  }

  void process_executor::
  reap (running_job& r)
  {
    int s;
    pid_t p (::waitpid (r.pid, &s, WNOHANG));

    if (p == 0 || (p == -1 && errno == EINTR))
      return;

    r.exited = true;

    if (p == -1)
    {
      error << "unable to wait for " << r.origin << " job: "
            << system_error (errno, generic_category ());

      r.success = false;
    }
    else
      r.success = WIFEXITED (s) && WEXITSTATUS (s) == 0;
  }

  void process_executor::
  wait (event_loop& l)
  {
    tracer trace ("process_executor::wait");

    fdselect_set fds {signal_in_.get ()};

    for (const auto& p: jobs_)
    {
      if (p.second->out != nullptr)
        fds.push_back (p.second->out->fd ());
    }

    try
    {
      ifdselect (fds);
    }
    catch (const system_error& e)
    {
      fail << "unable to wait for jobs: " << e;
    }

    // Translate the caught signals into events.
    //
    if (fds[0].ready)
    {
      unsigned char buf[64];

      for (ssize_t n; (n = ::read (signal_in_.get (), buf, sizeof (buf))) > 0; )
      {
        for (ssize_t i (0); i != n; ++i)
        {
          int s (buf[i]);

          if (s == SIGCHLD)
            continue;

          l4 ([&]{trace << "caught " << signal_event (s);});

          event e (signal_event (s));
          e.signal = s;
          l.post (move (e));
        }
      }
    }

    for (auto i (jobs_.begin ()); i != jobs_.end (); )
    {
      running_job& r (*i->second);

      if (r.out != nullptr)
        read (r);

      if (!r.exited)
        reap (r);

      // Wait until both the process has exited and its output is read.
      //
      if (r.exited && r.out == nullptr)
      {
        bool s (r.success && !r.read_failed);

        l5 ([&]{trace << r.origin << " job " << r.id << " exited, "
                      << (s ? "success" : "failure");});

        complete (r.id, s, move (r.output));
        i = jobs_.erase (i);
      }
      else
        ++i;
    }
  }
}
