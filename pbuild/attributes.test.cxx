// file      : pbuild/attributes.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <pbuild/attributes.hxx>

#include <pbuild/types.hxx>
#include <pbuild/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace pbuild
{
  static bool
  invalid_dependency (const string& e, const dir_path& d)
  {
    try
    {
      parse_dependency (e, d);
      return false;
    }
    catch (const invalid_argument&)
    {
      return true;
    }
  }

  static bool
  invalid_attributes (const string& o, const dir_path& d)
  {
    try
    {
      parse_attributes (o, d);
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
    dir_path d ("/usr/ports");

    assert (attribute_variable_count == 12);
    assert (string (attribute_variables[0]) == "PKGNAME");
    assert (string (attribute_variables[11]) == "NO_PACKAGE");

    // Dependency entries.
    //
    assert (parse_dependency ("gmake:devel/gmake", d) == "devel/gmake");
    assert (parse_dependency ("gmake:/usr/ports/devel/gmake", d) ==
            "devel/gmake");
    assert (parse_dependency ("libz.so:/usr/ports/archivers/zlib:build", d) ==
            "archivers/zlib");
    assert (parse_dependency ("${LOCALBASE}/bin/perl:lang/perl5/", d) ==
            "lang/perl5");
    assert (parse_dependency ("x:devel/gmake:patch", d) == "devel/gmake");

    assert (invalid_dependency ("devel/gmake", d));
    assert (invalid_dependency (":devel/gmake", d));
    assert (invalid_dependency ("x:/opt/ports/devel/gmake", d));
    assert (invalid_dependency ("x:gmake", d));
    assert (invalid_dependency ("x:/devel", d));
    assert (invalid_dependency ("x:devel/gmake/extra", d));
    assert (invalid_dependency ("x:", d));

    // Full output.
    //
    {
      string o ("curl-8.4.0\n"
                "8.4.0\n"
                "pkgconf:/usr/ports/devel/pkgconf gmake:devel/gmake\n"
                "xz:archivers/xz\n"
                "\n"
                "libnghttp2.so:www/libnghttp2 "
                "libpkgconf.so:devel/pkgconf\n"
                "ca_root_nss>0:security/ca_root_nss\n"
                "\n"
                "pkg:ports-mgmt/pkg\n"
                "curl-8.4.0.tar.xz curl-8.4.0.asc:sig\n"
                "/usr/ports/packages/All/curl-8.4.0.pkg\n"
                "\n");

      port_attributes a (parse_attributes (o, d));

      assert (a.pkgname == "curl-8.4.0");
      assert (a.version == "8.4.0");
      assert ((a.build_depends == strings {"devel/pkgconf", "devel/gmake"}));
      assert ((a.extract_depends == strings {"archivers/xz"}));
      assert (a.fetch_depends.empty ());
      assert ((a.lib_depends == strings {"www/libnghttp2", "devel/pkgconf"}));
      assert ((a.run_depends == strings {"security/ca_root_nss"}));
      assert (a.patch_depends.empty ());
      assert ((a.package_depends == strings {"ports-mgmt/pkg"}));
      assert ((a.distfiles == strings {"curl-8.4.0.tar.xz",
                                       "curl-8.4.0.asc"}));
      assert (a.pkgfile == "/usr/ports/packages/All/curl-8.4.0.pkg");
      assert (!a.no_package);

      // Deduplicated in the declaration order.
      //
      assert ((a.depends () == strings {"devel/pkgconf",
                                        "devel/gmake",
                                        "archivers/xz",
                                        "www/libnghttp2",
                                        "security/ca_root_nss",
                                        "ports-mgmt/pkg"}));
    }

    // NO_PACKAGE, duplicates within a kind, and no dependencies.
    //
    {
      string o ("foo-1.0_1\n"
                "1.0\n"
                "a:devel/bar b:/usr/ports/devel/bar\n"
                "\n\n\n\n\n\n"
                "\n"
                "\n"
                "restricted license\n");

      port_attributes a (parse_attributes (o, d));

      assert (a.pkgname == "foo-1.0_1");
      assert ((a.build_depends == strings {"devel/bar"}));
      assert ((a.depends () == strings {"devel/bar"}));
      assert (a.distfiles.empty ());
      assert (a.pkgfile.empty ());
      assert (a.no_package);
    }

    // Ports directory with a trailing slash.
    //
    {
      dir_path t ("/usr/ports/");
      assert (parse_dependency ("x:/usr/ports/devel/gmake", t) ==
              "devel/gmake");
    }

    // Malformed output.
    //
    assert (invalid_attributes ("", d));
    assert (invalid_attributes ("foo-1.0\n1.0\n", d));
    assert (invalid_attributes ("\n1.0\n\n\n\n\n\n\n\n\n\n\n", d));
    assert (invalid_attributes ("foo-1.0\n1.0\nbogus\n\n\n\n\n\n\n\n\n\n", d));

    // PKGNAME and PORTVERSION mismatch.
    //
    assert (invalid_attributes ("foo-1.1\n1.0\n\n\n\n\n\n\n\n\n\n\n", d));
    assert (invalid_attributes ("foo-1.0\n1.0.1\n\n\n\n\n\n\n\n\n\n\n", d));
    assert (invalid_attributes ("foo-1.01\n1.0\n\n\n\n\n\n\n\n\n\n\n", d));
    assert (!invalid_attributes ("foo-1.0,2\n1.0\n\n\n\n\n\n\n\n\n\n\n", d));

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return pbuild::main (argc, argv);
}
