#include <chrono>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <clu/text/print.h>
#include <clu/parse.h>
#include <clu/chrono_utils.h>

#include <estuary/arena/lowest_edge_strategy.h>
#include <estuary/arena/searching_strategy.h>
#include <estuary/arena/simulator.h>
#include <estuary/maps/builtin_maps.h>
#include <estuary/utils/report.h>

namespace
{
    struct Config
    {
        est::MapDescription map;
        std::vector<std::unique_ptr<est::Strategy>> strategies;
    };

    const std::string help = //
        R"(Usage: simulate <map> [competitor...]
    <map>           sample, grid:<rows>x<cols> or ring:<sites>
    [competitor]    lowest, brute<depth> or minimax<depth>
                    defaults to: brute1 brute3 minimax3)";

    std::size_t parse_size(const std::string_view text)
    {
        const auto value = clu::parse<std::size_t>(text);
        if (!value || *value == 0)
            throw std::runtime_error(help);
        return *value;
    }

    est::MapDescription load_map(const std::string_view map_name)
    {
        if (map_name == "sample")
            return est::sample_map();
        if (map_name.starts_with("grid:"))
        {
            const std::string_view dims = map_name.substr(5);
            const std::size_t x = dims.find('x');
            if (x == std::string_view::npos)
                throw std::runtime_error(help);
            const std::size_t rows = parse_size(dims.substr(0, x));
            const std::size_t cols = parse_size(dims.substr(x + 1));
            // Mines on two opposite corners
            const auto last = static_cast<est::SiteId>(rows * cols - 1);
            return est::grid_map(rows, cols, last == 0 ? std::vector<est::SiteId>{0} : std::vector<est::SiteId>{0, last});
        }
        if (map_name.starts_with("ring:"))
        {
            const std::size_t sites = parse_size(map_name.substr(5));
            return est::ring_map(sites, {0, static_cast<est::SiteId>(sites / 2)});
        }
        throw std::runtime_error(help);
    }

    std::unique_ptr<est::Strategy> make_strategy(const std::string_view name)
    {
        if (name == "lowest")
            return std::make_unique<est::LowestEdgeStrategy>();
        if (name.starts_with("brute"))
            return std::make_unique<est::BruteForceStrategy>(static_cast<int>(parse_size(name.substr(5))));
        if (name.starts_with("minimax"))
            return std::make_unique<est::MinimaxStrategy>(static_cast<int>(parse_size(name.substr(7))));
        throw std::runtime_error(std::format("Unknown competitor: {}\n{}", name, help));
    }

    auto process_args(const int argc, const char* argv[])
    {
        if (argc < 2)
            throw std::runtime_error(help);
        Config config{.map = load_map(argv[1])};
        if (argc == 2)
        {
            config.strategies.push_back(std::make_unique<est::BruteForceStrategy>(1));
            config.strategies.push_back(std::make_unique<est::BruteForceStrategy>(3));
            config.strategies.push_back(std::make_unique<est::MinimaxStrategy>(3));
            return config;
        }
        for (int i = 2; i < argc; i++)
            config.strategies.push_back(make_strategy(argv[i]));
        return config;
    }

    void run_simulation(const Config& config)
    {
        const est::Graph graph = est::Graph::from_map(config.map);
        est::print_map_summary(graph);
        std::vector<est::Score> scores;
        const auto elapsed =
            clu::timeit([&] { scores = est::simulate(graph, config.strategies, {}, est::step_printer()); });
        est::print_scores(config.strategies, scores);
        clu::println("Elapsed: {}", std::chrono::duration_cast<std::chrono::milliseconds>(elapsed));
    }
} // namespace

int main(const int argc, const char* argv[])
try
{
    const auto config = process_args(argc, argv);
    run_simulation(config);
    return 0;
}
catch (const std::exception& e)
{
    clu::println("Error due to exception:\n{}", e.what());
    return 1;
}
