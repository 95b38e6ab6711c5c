// file      : pbuild/package-database.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef PBUILD_PACKAGE_DATABASE_HXX
#define PBUILD_PACKAGE_DATABASE_HXX

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

namespace pbuild
{
  // The installed package version compared to the port version. The order
  // is significant.
  //
  enum class install_status
  {
    absent, // Not installed.
    older,  // Older version installed.
    current,
    newer   // Newer version installed.
  };

  string
  to_string (install_status);

  inline ostream&
  operator<< (ostream& os, install_status s) {return os << to_string (s);}

  // Compare two FreeBSD package versions in the [<version>][_<revision>]
  // [,<epoch>] form, returning negative, zero, or positive value if the
  // first version is less, equal, or greater than the second, respectively.
  //
  // Epochs are compared first, then the dot-separated version components
  // (numerically if both are numbers and lexicographically otherwise, with
  // the version that has more components being greater), and finally the
  // revisions.
  //
  int
  compare_versions (const string&, const string&);

  // Return the version part of a package name (everything after the last
  // dash) or empty string if there is none.
  //
  string
  package_version (const string& pkgname);

  // Installed packages by port origin.
  //
  class package_database
  {
  public:
    package_database () = default;

    // Load the installed packages by running `pkg query '%n-%v %o'`, inside
    // the chroot if specified. Fail if the query cannot be executed.
    //
    static package_database
    load (const path& pkg, const dir_path& chroot);

    // Parse the query output, one `<pkgname> <origin>` per line. Throw
    // invalid_argument if a line is malformed.
    //
    static package_database
    parse (istream&);

    void
    insert (const string& origin, string pkgname);

    void
    erase (const string& origin) {packages_.erase (origin);}

    // Return the install status of the port with the specified origin and
    // package name. If several packages of the origin are installed, then
    // the greatest status is returned.
    //
    install_status
    status (const string& origin, const string& pkgname) const;

    const strings*
    find (const string& origin) const
    {
      auto i (packages_.find (origin));
      return i != packages_.end () ? &i->second : nullptr;
    }

    size_t
    size () const {return packages_.size ();}

  private:
    map<string, strings> packages_;
  };
}

#endif // PBUILD_PACKAGE_DATABASE_HXX
