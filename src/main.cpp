#include <algorithm>
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include "frontier/core/config.hpp"
#include "frontier/core/logger.hpp"
#include "frontier/sampling/sampler.hpp"
#include "frontier/store/url_store.hpp"
#include "frontier/utils/string_utils.hpp"

using namespace Frontier;
using Frontier::Core::Logger;

namespace {

std::vector<std::string> read_lines(std::istream& in) {
    std::vector<std::string> lines;
    std::string              line;
    while (std::getline(in, line)) {
        line = Utils::Text::trim(line);
        if (!line.empty() && line[0] != '#')
            lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> read_input(const std::string& path) {
    if (path == "-")
        return read_lines(std::cin);

    std::ifstream file(path);
    if (!file) {
        Logger::error("Cannot open input file: " + path);
        return {};
    }
    return read_lines(file);
}

// Files are read on a worker pool; stdin stays on the calling thread.
std::vector<std::string> collect_inputs(const Core::Config& config) {
    std::vector<std::string> urls;
    std::mutex               mutex;
    boost::asio::thread_pool pool(std::max(1, config.threads));

    for (const auto& path : config.inputs) {
        if (path == "-")
            continue;
        boost::asio::post(pool, [&urls, &mutex, path]() {
            auto lines = read_input(path);
            Logger::debug("Read " + std::to_string(lines.size()) + " URLs from " + path);
            std::lock_guard<std::mutex> lock(mutex);
            urls.insert(urls.end(), lines.begin(), lines.end());
        });
    }
    for (const auto& path : config.inputs) {
        if (path == "-") {
            auto lines = read_input(path);
            std::lock_guard<std::mutex> lock(mutex);
            urls.insert(urls.end(), lines.begin(), lines.end());
        }
    }

    pool.join();
    return urls;
}

void ingest_inputs(const Core::Config& config, Store::UrlStore& store) {
    std::atomic<size_t>      added{0};
    boost::asio::thread_pool pool(std::max(1, config.threads));

    for (const auto& path : config.inputs) {
        if (path == "-") {
            added += store.add_urls(read_input(path));
            continue;
        }
        boost::asio::post(pool, [&store, &added, path]() { added += store.add_urls(read_input(path)); });
    }

    pool.join();
    Logger::info("Stored " + std::to_string(added.load()) + " new URLs across "
                 + std::to_string(store.get_known_domains().size()) + " domains");
}

int run_sampling(const Core::Config& config) {
    Sampling::SampleOptions options;
    options.size    = config.sample;
    options.strict  = config.strict;
    options.verbose = config.verbose;
    options.seed    = config.seed;
    if (config.exclude_min > 0)
        options.exclude_min = config.exclude_min;
    if (config.exclude_max > 0)
        options.exclude_max = config.exclude_max;

    for (const auto& url : Sampling::sample_urls(collect_inputs(config), options))
        std::cout << url << "\n";
    std::cout.flush();
    return 0;
}

void print_schedule(Store::UrlStore& store, const Core::Config& config) {
    auto plan = store.establish_download_schedule(config.schedule, config.time_limit);
    for (const auto& entry : plan)
        std::cout << std::fixed << std::setprecision(2) << entry.wait << "\t" << entry.url() << "\n";
    Logger::info("Scheduled " + std::to_string(plan.size()) + " URLs");
}

void print_counts(const Store::UrlStore& store) {
    for (const auto& [domain, counts] : store.get_all_counts())
        std::cout << domain << "\t" << counts.total << "\t" << counts.visited << "\n";
}

int run_store(const Core::Config& config) {
    Store::UrlStore store(config.to_store_options());

    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&store, &config](const boost::system::error_code& error, int signal_number) {
        if (error)
            return;
        Logger::warn("Signal " + std::to_string(signal_number) + " received. Exiting...");
        if (config.verbose) {
            try {
                store.write_json_lines(std::cerr);
            } catch (const std::exception& e) {
                Logger::error("Snapshot dump failed: " + std::string(e.what()));
            }
        }
        std::cerr.flush();
        std::_Exit(128 + signal_number);
    });
    std::thread signal_thread([&ioc]() { ioc.run(); });

    int status = 0;
    try {
        if (!config.load_path.empty())
            store.load(config.load_path);
        ingest_inputs(config, store);

        if (config.schedule > 0)
            print_schedule(store, config);
        if (config.counts)
            print_counts(store);

        if (config.dump)
            store.write_json_lines(std::cout);
        else if (config.unvisited)
            store.print_unvisited_urls(std::cout);
        else if (config.schedule == 0 && !config.counts)
            store.print_urls(std::cout);

        if (!config.save_path.empty())
            store.save(config.save_path);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        status = 1;
    }

    signals.cancel();
    ioc.stop();
    signal_thread.join();
    return status;
}

}  // namespace

int main(int argc, char* argv[]) {
    Core::Config config;
    try {
        config = Core::Config::parse(argc, argv);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    if (config.verbose)
        Logger::set_level(Core::LOG_ALL);

    if (config.inputs.empty() && config.load_path.empty()) {
        Logger::error("No input provided. Use -i FILE or --load SNAPSHOT.");
        return 1;
    }

    if (config.sample > 0)
        return run_sampling(config);
    return run_store(config);
}
