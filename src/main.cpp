#include <iostream>

#include <boost/algorithm/string/join.hpp>
#include <boost/program_options.hpp>

#include <cppcoro/sync_wait.hpp>
#include <cppcoro/when_all.hpp>

#include <fmt/format.h>

#include <larder/fs/app_dirs.hpp>
#include <larder/loader/config.hpp>
#include <larder/loader/core.h>
#include <larder/utilities/logging.h>
#include <larder/utilities/text.h>

using namespace larder;

static void
add_transformation_types(
    std::vector<string>& details,
    char const* label,
    transformation_type_list const& types)
{
    if (types.empty())
        return;
    std::vector<string> names;
    for (auto type : types)
        names.push_back(get_transformation_name(type));
    details.push_back(
        fmt::format("{}: {}", label, boost::algorithm::join(names, " ")));
}

static void
print_result(std::ostream& out, load_result const& result)
{
    std::vector<string> details;
    if (result.image)
    {
        details.push_back(
            fmt::format("{}x{}", result.image->width, result.image->height));
    }
    add_transformation_types(details, "applied", result.applied);
    add_transformation_types(details, "skipped", result.skipped);
    if (result.from_cache)
        details.push_back("from cache");
    if (result.error)
        details.push_back(*result.error);

    out << result.key << ": " << result.status;
    if (!details.empty())
        out << " (" << boost::algorithm::join(details, ", ") << ")";
    out << "\n";
}

static void
print_entry_list(std::ostream& out, disk_cache& cache)
{
    auto info = cache.get_summary_info();
    out << info.directory << ": " << info.entry_count << " entries, "
        << info.total_size << " of " << info.size_limit << " bytes\n";
    for (auto const& entry : cache.get_entry_list())
        out << "  " << entry.record << "\n";
}

// Collect the transformation options in the order in which they were given.
static transformation_list
get_transformations(boost::program_options::parsed_options const& parsed)
{
    std::vector<transformation> transformations;
    for (auto const& option : parsed.options)
    {
        if (option.string_key == "center-crop")
        {
            auto [width, height] = parse_dimensions(option.value.at(0));
            transformations.push_back(center_crop{width, height});
        }
        else if (option.string_key == "resize")
        {
            auto [width, height] = parse_dimensions(option.value.at(0));
            transformations.push_back(resize{width, height});
        }
        else if (option.string_key == "circle-crop")
        {
            transformations.push_back(circle_crop());
        }
    }
    return transformation_list(std::move(transformations));
}

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("config-file", po::value<string>(),
            "specify the configuration file to use")
        ("cache-dir", po::value<string>(), "override the cache directory")
        ("budget", po::value<integer>(), "override the cache budget (bytes)")
        ("workers", po::value<integer>(),
            "override the number of concurrent requests")
        ("save-transformed", "cache transformed images rather than originals")
        ("center-crop", po::value<string>(), "center crop to WxH")
        ("resize", po::value<string>(), "resize to WxH")
        ("circle-crop", "crop to a circle")
        ("clear", "clear the cache before loading anything")
        ("list", "list the cache entries after loading")
        ("url", po::value<std::vector<string>>(), "an image URL to load");

    po::positional_options_description positional;
    positional.add("url", -1);

    try
    {
        auto parsed = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(positional)
                          .run();
        po::variables_map vm;
        po::store(parsed, vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::cout << "usage: larder [options] URL...\n" << desc;
            return 0;
        }

        optional<file_path> config_path;
        if (vm.count("config-file"))
            config_path = vm["config-file"].as<string>();
        else
            config_path = find_config_file();

        larder_config config;
        if (config_path)
            config = read_config_file(*config_path);
        if (vm.count("cache-dir"))
            config.cache_directory = vm["cache-dir"].as<string>();
        if (vm.count("budget"))
            config.cache_budget = vm["budget"].as<integer>();
        if (vm.count("workers"))
            config.worker_count = vm["workers"].as<integer>();

        initialize_logging(
            config.log_to_file ? some(
                (get_user_logs_dir("larder") / "larder.log").string())
                               : none,
            get_log_level(config));

        auto transformations = get_transformations(parsed);

        image_loader loader(
            image_loader_config{
                make_disk_cache_config(config), config.worker_count},
            std::make_shared<http_image_fetcher>());

        if (vm.count("clear"))
            loader.clear_cache();

        bool all_completed = true;
        if (vm.count("url"))
        {
            std::vector<cppcoro::task<load_result>> tasks;
            for (auto const& url : vm["url"].as<std::vector<string>>())
            {
                load_request request;
                request.key = url;
                request.transformations = transformations;
                request.strategy = vm.count("save-transformed")
                                       ? save_strategy::SAVE_TRANSFORMED
                                       : save_strategy::SAVE_ORIGINAL;
                tasks.push_back(loader.load(std::move(request)));
            }
            auto results
                = cppcoro::sync_wait(cppcoro::when_all(std::move(tasks)));
            for (auto const& result : results)
            {
                print_result(std::cout, result);
                if (result.status != load_status::COMPLETED)
                    all_completed = false;
            }
        }

        if (vm.count("list"))
            print_entry_list(std::cout, loader.cache());

        return all_completed ? 0 : 1;
    }
    catch (po::error& e)
    {
        std::cerr << e.what() << "\n" << desc;
        return 2;
    }
    catch (std::exception& e)
    {
        std::cerr << boost::diagnostic_information(e) << "\n";
        return 2;
    }
}
