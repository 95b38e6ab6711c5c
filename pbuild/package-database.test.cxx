// file      : pbuild/package-database.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/package-database.hxx>

#include <sstream>

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace pbuild
{
  static bool
  invalid (const string& s)
  {
    istringstream is (s);

    try
    {
      package_database::parse (is);
      return false;
    }
    catch (const invalid_argument&)
    {
      return true;
    }
  }

  static int
  main (int, char*[])
  {
    // Versions.
    //
    assert (compare_versions ("1.0", "1.0") == 0);
    assert (compare_versions ("1.0", "1.1") < 0);
    assert (compare_versions ("1.10", "1.9") > 0);
    assert (compare_versions ("1.010", "1.10") == 0);
    assert (compare_versions ("2.0", "10.0") < 0);
    assert (compare_versions ("1.0.1", "1.0") > 0);
    assert (compare_versions ("1.0", "1.0.1") < 0);
    assert (compare_versions ("1.0a", "1.0b") < 0);

    // Revisions and epochs.
    //
    assert (compare_versions ("1.0_1", "1.0") > 0);
    assert (compare_versions ("1.0_1", "1.0_2") < 0);
    assert (compare_versions ("1.0_10", "1.0_9") > 0);
    assert (compare_versions ("1.1", "1.0_5") > 0);
    assert (compare_versions ("1.0,1", "2.0") > 0);
    assert (compare_versions ("2.0,1", "1.0,2") < 0);
    assert (compare_versions ("1.0_1,1", "1.0_1,1") == 0);

    assert (package_version ("curl-8.4.0") == "8.4.0");
    assert (package_version ("p5-libwww-6.72") == "6.72");
    assert (package_version ("curl").empty ());

    // Query output.
    //
    {
      istringstream is ("curl-8.4.0 ftp/curl\n"
                        "\n"
                        "  p5-libwww-6.72   www/p5-libwww  \n"
                        "python39-3.9.18 lang/python39\n"
                        "python39-3.9.17 lang/python39\n");

      package_database db (package_database::parse (is));

      assert (db.size () == 3);
      assert (db.find ("ftp/curl") != nullptr);
      assert (db.find ("devel/gmake") == nullptr);
      assert (db.find ("lang/python39")->size () == 2);

      assert (db.status ("ftp/curl", "curl-8.4.0") ==
              install_status::current);
      assert (db.status ("ftp/curl", "curl-8.5.0") ==
              install_status::older);
      assert (db.status ("ftp/curl", "curl-8.3.0") ==
              install_status::newer);
      assert (db.status ("ftp/curl", "curl-8.4.0_1") ==
              install_status::older);
      assert (db.status ("devel/gmake", "gmake-4.4") ==
              install_status::absent);
      assert (db.status ("www/p5-libwww", "p5-libwww-6.72") ==
              install_status::current);

      // The greatest status wins.
      //
      assert (db.status ("lang/python39", "python39-3.9.18") ==
              install_status::current);
      assert (db.status ("lang/python39", "python39-3.9.17_1") ==
              install_status::newer);

      db.insert ("devel/gmake", "gmake-4.3");
      assert (db.status ("devel/gmake", "gmake-4.4") ==
              install_status::older);

      db.erase ("devel/gmake");
      assert (db.status ("devel/gmake", "gmake-4.4") ==
              install_status::absent);
    }

    assert (install_status::absent < install_status::older);
    assert (install_status::older < install_status::current);
    assert (install_status::current < install_status::newer);
    assert (to_string (install_status::older) == "older");

    // Malformed query output.
    //
    assert (!invalid (""));
    assert (invalid ("curl-8.4.0\n"));
    assert (invalid ("curl ftp/curl\n"));
    assert (invalid ("curl-8.4.0 ftp/curl extra\n"));

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return pbuild::main (argc, argv);
}
