// file      : pbuild/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_TYPES_HXX
#define PBUILD_TYPES_HXX

#include <map>
#include <set>
#include <deque>
#include <vector>
#include <string>
#include <memory>        // unique_ptr
#include <utility>       // pair
#include <cstddef>       // size_t, nullptr_t
#include <cstdint>       // uint{8,16,32,64}_t
#include <istream>
#include <ostream>
#include <functional>    // function

#include <ios>           // ios_base::failure
#include <exception>     // exception
#include <stdexcept>     // invalid_argument
#include <system_error>

#include <libbutl/path.hxx>
#include <libbutl/process.hxx>
#include <libbutl/optional.hxx>
#include <libbutl/fdstream.hxx>

namespace pbuild
{
  // Commonly-used types.
  //
  using std::uint16_t;
  using std::uint64_t;

  using std::size_t;

  using std::pair;
  using std::string;
  using std::function;

  using std::unique_ptr;

  using std::map;
  using std::set;
  using std::deque;
  using std::vector;

  using strings = vector<string>;
  using cstrings = vector<const char*>;

  using std::istream;
  using std::ostream;

  // Exceptions. While <exception> is included, there is no using for
  // std::exception -- use qualified.
  //
  using std::invalid_argument;
  using std::system_error;
  using io_error = std::ios_base::failure;

  // <libbutl/optional.hxx>
  //
  using butl::optional;
  using butl::nullopt;

  // <libbutl/path.hxx>
  //
  using butl::path;
  using butl::dir_path;
  using butl::invalid_path;

  // <libbutl/process.hxx>
  //
  using butl::process;
  using butl::process_path;
  using butl::process_error;

  // <libbutl/fdstream.hxx>
  //
  using butl::auto_fd;
  using butl::fdpipe;
  using butl::ifdstream;
  using butl::fdopen_mode;
  using butl::fdstream_mode;

  // Port identity. Ports live in the dependency graph's arena for the
  // lifetime of the process and are referred to by their index there.
  //
  using port_id = size_t;
}

// In order to be found (via ADL) these have to be either in std:: or in
// butl::. The latter is bad idea since libbutl includes the default
// implementation.
//
namespace std
{
  // Custom path printing (canonicalized, with trailing slash for directories).
  //
  inline ostream&
  operator<< (ostream& os, const ::butl::path& p)
  {
    string r (p.representation ());
    ::butl::path::traits_type::canonicalize (r);
    return os << r;
  }
}

#endif // PBUILD_TYPES_HXX
