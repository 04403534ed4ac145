#include <larder/fs/app_dirs.hpp>

#include <larder/fs/file_io.h>
#include <larder/fs/utilities.h>
#include <larder/utilities/environment.h>
#include <larder/utilities/testing.h>

using namespace larder;

TEST_CASE("XDG app directories", "[fs][app_dirs]")
{
    auto app = string("larder_xdg_test_case_app");

    // Keep everything we're doing local to the test directory.
    auto cwd = std::filesystem::current_path();
    auto home_dir = cwd / "xdg_home";
    reset_directory(home_dir);

    // If none of the relevant environment variables are set, it should be an
    // error to get the app directories.
    scoped_environment_variable home("HOME", none);
    scoped_environment_variable config_home("XDG_CONFIG_HOME", none);
    scoped_environment_variable config_dirs("XDG_CONFIG_DIRS", none);
    scoped_environment_variable cache_home("XDG_CACHE_HOME", none);
    scoped_environment_variable state_home("XDG_STATE_HOME", none);
    REQUIRE_THROWS(get_user_config_dir(app));
    REQUIRE_THROWS(get_user_cache_dir(app));
    REQUIRE_THROWS(get_user_logs_dir(app));

    // If only HOME is set, the results should be based on that.
    set_environment_variable("HOME", home_dir.string());
    // config
    auto default_config_dir = home_dir / ".config" / app;
    REQUIRE(get_user_config_dir(app) == default_config_dir);
    REQUIRE(exists(default_config_dir));
    reset_directory(home_dir);
    // cache
    auto default_cache_dir = home_dir / ".cache" / app;
    REQUIRE(get_user_cache_dir(app) == default_cache_dir);
    REQUIRE(exists(default_cache_dir));
    reset_directory(home_dir);
    // logs
    auto default_logs_dir = home_dir / ".local" / "state" / app / "logs";
    REQUIRE(get_user_logs_dir(app) == default_logs_dir);
    REQUIRE(exists(default_logs_dir));
    reset_directory(home_dir);

    // If we try getting the config search path now, it should be empty
    // because the app directory doesn't exist.
    REQUIRE(get_config_search_path(app) == std::vector<file_path>());
    // If we create the user config directory, it should then be part of
    // the path.
    get_user_config_dir(app);
    REQUIRE(
        get_config_search_path(app)
        == std::vector<file_path>({get_user_config_dir(app)}));
    reset_directory(home_dir);

    // Check that relative paths aren't used.
    set_environment_variable("XDG_CONFIG_HOME", "abc/def");
    REQUIRE(get_user_config_dir(app) == default_config_dir);
    set_environment_variable("XDG_CACHE_HOME", "abc/def");
    REQUIRE(get_user_cache_dir(app) == default_cache_dir);
    set_environment_variable("XDG_STATE_HOME", "abc/def");
    REQUIRE(get_user_logs_dir(app) == default_logs_dir);

    // Set some custom directories and check that they're used.
    auto custom_config_dir = cwd / "xdg_config";
    reset_directory(custom_config_dir);
    set_environment_variable("XDG_CONFIG_HOME", custom_config_dir.string());
    REQUIRE(get_user_config_dir(app) == custom_config_dir / app);
    auto custom_cache_dir = cwd / "xdg_cache";
    reset_directory(custom_cache_dir);
    set_environment_variable("XDG_CACHE_HOME", custom_cache_dir.string());
    REQUIRE(get_user_cache_dir(app) == custom_cache_dir / app);
    auto custom_state_dir = cwd / "xdg_state";
    reset_directory(custom_state_dir);
    set_environment_variable("XDG_STATE_HOME", custom_state_dir.string());
    REQUIRE(get_user_logs_dir(app) == custom_state_dir / app / "logs");

    // Also add some config dirs (including some relative ones and some
    // without app dirs) and check that the search path is adjusted correctly.
    auto system_config_dir_a = cwd / "xdg_sys_config_a";
    reset_directory(system_config_dir_a);
    create_directory(system_config_dir_a / app);
    auto system_config_dir_b = cwd / "xdg_sys_config_b";
    reset_directory(system_config_dir_b);
    auto system_config_dir_c = cwd / "xdg_sys_config_c";
    reset_directory(system_config_dir_c);
    create_directory(system_config_dir_c / app);
    set_environment_variable(
        "XDG_CONFIG_DIRS",
        system_config_dir_b.string() + ":" + system_config_dir_a.string()
            + ":xdg_sys_config_c");
    REQUIRE(
        get_config_search_path(app)
        == std::vector<file_path>(
            {custom_config_dir / app, system_config_dir_a / app}));
}

TEST_CASE("search paths", "[fs][app_dirs]")
{
    auto cwd = std::filesystem::current_path();
    auto search_dir = cwd / "search_paths";
    reset_directory(search_dir);
    create_directory(search_dir / "a");
    create_directory(search_dir / "b");
    create_directory(search_dir / "c");
    dump_string_to_file(search_dir / "a" / "foo.txt", "foo");
    dump_string_to_file(search_dir / "c" / "foo.txt", "foo");

    auto search_path = std::vector<file_path>(
        {search_dir,
         search_dir / "b",
         search_dir / "d",
         search_dir / "c",
         search_dir / "a"});

    REQUIRE(
        search_in_path(search_path, "foo.txt") == search_dir / "c" / "foo.txt");
    REQUIRE(search_in_path(search_path, "bar.txt") == none);
}
