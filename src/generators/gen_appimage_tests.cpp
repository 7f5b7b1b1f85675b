#include "generators/gen_appimage.h"

#include "errors.h"
#include "test_support.h"
#include "tools.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

TEST_CASE("appimage_desktop_entry describes the launcher") {
  packup::deploy_config cfg;
  cfg.name = "hello";
  cfg.appimage.categories = "Development;";

  CHECK(packup::appimage_desktop_entry(cfg) ==
        "[Desktop Entry]\n"
        "Type=Application\n"
        "Name=hello\n"
        "Exec=hello.sh\n"
        "Icon=hello\n"
        "Categories=Development;\n"
        "Terminal=true\n");
}

TEST_CASE("appimage_default_icon_svg is an svg showing the first letter") {
  auto const svg{ packup::appimage_default_icon_svg("hello") };
  CHECK(svg.rfind("<svg ", 0) == 0);
  CHECK(svg.find(">h</text>") != std::string::npos);
  CHECK(svg.find("</svg>") != std::string::npos);
}

TEST_CASE_FIXTURE(packup::test::deploy_fixture, "appimage_prepare_appdir lays out an AppDir") {
  auto const apprun{ root / "AppRun-x86_64" };
  packup::util_write_file(apprun, "apprun");
  auto const appdir{ root / "hello.AppDir" };

  packup::appimage_prepare_appdir(context(), appdir, apprun);

  auto const files{ packup::test::collect_files_recursive(appdir) };
  CHECK(files == std::vector<std::string>{ "AppRun",
                                           "hello.desktop",
                                           "hello.svg",
                                           "usr/bin/bin/helper",
                                           "usr/bin/hello",
                                           "usr/bin/hello.sh",
                                           "usr/bin/lib/libtool.so",
                                           "usr/bin/lib/libz.so.1" });

  auto const perms{ fs::status(appdir / "AppRun").permissions() };
  CHECK((perms & fs::perms::owner_exec) != fs::perms::none);

  auto const script{ packup::test::read_file(appdir / "usr" / "bin" / "hello.sh") };
  CHECK(script.find("export PATH=$PATH:$APPDIR/usr/bin/bin\n") != std::string::npos);
  CHECK(script.find("export LD_LIBRARY_PATH=$LD_LIBRARY_PATH:$APPDIR/usr/bin/lib\n") !=
        std::string::npos);
  CHECK(script.find("cd \"$APPDIR/usr/bin\"") != std::string::npos);
  CHECK(script.find("APPDIR=") == std::string::npos);
}

TEST_CASE_FIXTURE(packup::test::deploy_fixture, "appimage_prepare_appdir copies a configured icon") {
  auto const apprun{ root / "AppRun-x86_64" };
  packup::util_write_file(apprun, "apprun");
  packup::util_write_file(root / "assets" / "icon.png", "png-bytes");
  config.appimage.icon = root / "assets" / "icon.png";

  auto const appdir{ root / "hello.AppDir" };
  packup::appimage_prepare_appdir(context(), appdir, apprun);

  CHECK(packup::test::read_file(appdir / "hello.png") == "png-bytes");
  CHECK_FALSE(fs::exists(appdir / "hello.svg"));
}

namespace {

void seed_apprun(packup::cache &c) {
  packup::test::seed_tool(c,
                          packup::kAppRunTool.name,
                          packup::kAppRunTool.version,
                          packup::kAppRunTool.file_name,
                          "#!/bin/sh\n");
}

}  // namespace

TEST_CASE_FIXTURE(packup::test::deploy_fixture, "gen_appimage runs appimagetool on the AppDir") {
  seed_apprun(*tools);
  packup::test::seed_tool(*tools,
                          packup::kAppImageTool.name,
                          packup::kAppImageTool.version,
                          packup::kAppImageTool.file_name,
                          "#!/bin/sh\n"
                          "[ \"$ARCH\" = x86_64 ] || exit 7\n"
                          "[ \"$APPIMAGE_EXTRACT_AND_RUN\" = 1 ] || exit 6\n"
                          "[ -x \"$1/AppRun\" ] || exit 5\n"
                          "[ -f \"$1/hello.desktop\" ] || exit 4\n"
                          "echo appimage > \"$2\"\n");

  packup::gen_appimage gen;
  auto const artifact{ gen.run(context()) };

  CHECK(artifact == out_dir / "hello-x86_64.AppImage");
  CHECK(packup::test::read_file(artifact) == "appimage\n");
}

TEST_CASE_FIXTURE(packup::test::deploy_fixture, "gen_appimage propagates an appimagetool failure") {
  seed_apprun(*tools);
  packup::test::seed_tool(*tools,
                          packup::kAppImageTool.name,
                          packup::kAppImageTool.version,
                          packup::kAppImageTool.file_name,
                          "#!/bin/sh\necho 'appimagetool: no squashfs' 1>&2\nexit 4\n");

  packup::gen_appimage gen;
  try {
    gen.run(context());
    FAIL("expected external_tool_error");
  } catch (packup::external_tool_error const &e) {
    CHECK(e.tool() == std::string{ packup::kAppImageTool.file_name });
    CHECK(e.exit_code() == 4);
    CHECK(std::string{ e.what() }.find("no squashfs") != std::string::npos);
  }
  CHECK_FALSE(fs::exists(out_dir / "hello-x86_64.AppImage"));
}
