#include "frontier/core/config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Frontier {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["compressed"])
            config.compressed = yaml["compressed"].as<bool>();
        if (yaml["strict"])
            config.strict = yaml["strict"].as<bool>();
        if (yaml["verbose"])
            config.verbose = yaml["verbose"].as<bool>();
        if (yaml["language"])
            config.language = yaml["language"].as<std::string>();
        if (yaml["delay"])
            config.delay = yaml["delay"].as<double>();
        if (yaml["crawl_delay"])
            config.delay = yaml["crawl_delay"].as<double>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["time_limit"])
            config.time_limit = yaml["time_limit"].as<double>();
        if (yaml["schedule"])
            config.schedule = yaml["schedule"].as<size_t>();

        if (YAML::Node sampling = yaml["sampling"]; sampling && sampling.IsMap()) {
            if (sampling["size"])
                config.sample = sampling["size"].as<size_t>();
            if (sampling["exclude_min"])
                config.exclude_min = sampling["exclude_min"].as<size_t>();
            if (sampling["exclude_max"])
                config.exclude_max = sampling["exclude_max"].as<size_t>();
            if (sampling["seed"])
                config.seed = sampling["seed"].as<uint32_t>();
        }

        if (yaml["inputs"] && yaml["inputs"].IsSequence()) {
            for (const auto& node : yaml["inputs"])
                config.inputs.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Store::StoreOptions Config::to_store_options() const {
    Store::StoreOptions options;
    options.compressed          = compressed;
    options.strict              = strict;
    options.verbose             = verbose;
    options.default_crawl_delay = delay;
    if (!language.empty())
        options.language = language;
    return options;
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Frontier - URL store and politeness scheduler for web crawls"};

    app.set_version_flag("--version", Constants::VERSION);

    app.add_option("-i,--input", config.inputs, "Files with one URL per line ('-' for stdin)");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("-l,--language", config.language, "Keep URLs targeting this language");
    app.add_option("--delay", config.delay, "Default crawl delay in seconds");
    app.add_option("-t,--threads", config.threads, "Threads used to read the input files");

    app.add_option("--sample", config.sample, "Sample N URLs per domain");
    app.add_option("--exclude-min", config.exclude_min, "Skip domains with fewer URLs");
    app.add_option("--exclude-max", config.exclude_max, "Skip domains with more URLs");
    app.add_option("--seed", config.seed, "Random seed for sampling");

    app.add_option("--schedule", config.schedule, "Print a download schedule of N URLs");
    app.add_option("--time-limit", config.time_limit, "Scheduling lookahead in seconds");

    app.add_option("--save", config.save_path, "Write the store to a binary snapshot");
    app.add_option("--load", config.load_path, "Read a binary snapshot before the inputs");

    app.add_flag("--compressed", config.compressed, "Compress stored URLs");
    app.add_flag("--strict", config.strict, "Strict URL filtering");
    app.add_flag("-v,--verbose", config.verbose, "Debug output");
    app.add_flag("--unvisited", config.unvisited, "Print unvisited URLs only");
    app.add_flag("--counts", config.counts, "Print URL counts per domain");
    app.add_flag("--dump", config.dump, "Print the store as JSON lines");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    return config;
}

}  // namespace Core
}  // namespace Frontier
