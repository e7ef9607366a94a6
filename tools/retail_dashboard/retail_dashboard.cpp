//
// Retail Dashboard Tool
// Loads the transactions file, applies the filter flags and prints every view
//

#include <cstdlib>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <arrow/compute/initialize.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <retail_lens/dashboard/dashboard.h>
#include <retail_lens/views/view_registry.h>

namespace rl = retail_lens;

struct ToolOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> source;
    std::optional<std::vector<std::string>> views;
    std::optional<std::set<std::string>> days;
    std::optional<std::set<std::string>> seasons;
    std::optional<std::set<std::string>> months;
    std::optional<std::string> date_from;
    std::optional<std::string> date_to;
    std::optional<std::string> bins;
    std::string log_level = "warn";
};

void PrintUsage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  --config FILE           YAML dashboard configuration\n"
              << "  --source FILE           Transactions CSV (default: " << rl::DEFAULT_SOURCE_FILE << ")\n"
              << "  --views a,b             Views to compute (default: all)\n"
              << "  --days a,b              Weekdays to keep, e.g. Monday,Friday\n"
              << "  --seasons a,b           Seasons to keep\n"
              << "  --months a,b            Month buckets to keep, e.g. 2024-01,2024-02\n"
              << "  --from YYYY-MM-DD       First date to keep\n"
              << "  --to YYYY-MM-DD         Last date to keep\n"
              << "  --bins N                Customer traffic bins of the density view (default: "
              << rl::DEFAULT_DENSITY_BINS << ")\n"
              << "  --log-level LEVEL       trace, debug, info, warn, error (default: warn)\n"
              << "  --help                  Show this help\n";
}

std::vector<std::string> SplitList(std::string const& text) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(',', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            items.emplace_back(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return items;
}

std::set<std::string> SplitSet(std::string const& text) {
    auto items = SplitList(text);
    return {items.begin(), items.end()};
}

[[noreturn]] void UsageError(const char* prog_name, std::string const& message) {
    std::cerr << message << "\n";
    PrintUsage(prog_name);
    std::exit(2);
}

ToolOptions ParseArgs(int argc, char* argv[]) {
    ToolOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (i + 1 >= argc) {
            UsageError(argv[0], "Unknown argument or missing value: " + arg);
        } else if (arg == "--config") {
            options.config_path = argv[++i];
        } else if (arg == "--source") {
            options.source = argv[++i];
        } else if (arg == "--views") {
            options.views = SplitList(argv[++i]);
        } else if (arg == "--days") {
            options.days = SplitSet(argv[++i]);
        } else if (arg == "--seasons") {
            options.seasons = SplitSet(argv[++i]);
        } else if (arg == "--months") {
            options.months = SplitSet(argv[++i]);
        } else if (arg == "--from") {
            options.date_from = argv[++i];
        } else if (arg == "--to") {
            options.date_to = argv[++i];
        } else if (arg == "--bins") {
            options.bins = argv[++i];
        } else if (arg == "--log-level") {
            options.log_level = argv[++i];
        } else {
            UsageError(argv[0], "Unknown argument: " + arg);
        }
    }

    return options;
}

rl::calendar::Date ParseDateFlag(const char* prog_name, std::string const& flag,
                                 std::string const& text) {
    auto date = rl::calendar::ParseDate(text);
    if (!date) {
        UsageError(prog_name, fmt::format("Invalid date for {}: '{}'", flag, text));
    }
    return *date;
}

// Flags override whatever the configuration file set
rl::dashboard::DashboardConfig BuildConfig(const char* prog_name, ToolOptions const& options) {
    auto config = options.config_path
                      ? rl::dashboard::DashboardConfig::FromFile(*options.config_path)
                      : rl::dashboard::DashboardConfig::Defaults();

    if (options.source) {
        config.source = *options.source;
    }
    if (options.views) {
        config.views = *options.views;
    }
    if (options.bins) {
        try {
            auto bins = std::stoll(*options.bins);
            if (bins <= 0) {
                UsageError(prog_name, "--bins must be at least 1");
            }
            config.densityBins = static_cast<size_t>(bins);
        } catch (std::logic_error const&) {
            UsageError(prog_name, "Invalid value for --bins: " + *options.bins);
        }
    }

    auto& filter = config.initialFilter;
    if (options.days) {
        filter.days = *options.days;
    }
    if (options.seasons) {
        filter.seasons = *options.seasons;
    }
    if (options.months) {
        filter.months = *options.months;
    }
    if (options.date_from) {
        filter.dateFrom = ParseDateFlag(prog_name, "--from", *options.date_from);
    }
    if (options.date_to) {
        filter.dateTo = ParseDateFlag(prog_name, "--to", *options.date_to);
    }

    try {
        config.Validate();
    } catch (std::invalid_argument const& e) {
        UsageError(prog_name, e.what());
    }
    return config;
}

void PrintTable(epoch_frame::DataFrame const& table) {
    auto const columns = table.column_names();
    fmt::print("  {}\n", fmt::join(columns, " | "));
    for (size_t row = 0; row < table.num_rows(); ++row) {
        std::vector<std::string> cells;
        cells.reserve(columns.size());
        for (auto const& column : columns) {
            cells.push_back(table[column].iloc(static_cast<int64_t>(row)).repr());
        }
        fmt::print("  {}\n", fmt::join(cells, " | "));
    }
}

void PrintBundle(rl::dashboard::Dashboard const& dashboard,
                 rl::dashboard::ViewBundle const& bundle) {
    if (bundle.status == epoch_core::BundleStatus::EmptyResult) {
        fmt::print("no data for current filters\n");
        return;
    }

    fmt::print("Records: {}\n", bundle.recordCount);
    if (bundle.headline) {
        auto const& headline = *bundle.headline;
        fmt::print("Total sales: {:.2f}\n", headline.totalSales);
        fmt::print("Average conversion: {:.2f}% (gauge 0-{:.0f}%)\n",
                   headline.avgConversionPct, headline.gaugeMaxPct);
    } else {
        fmt::print("Headline unavailable, missing columns: {}\n",
                   fmt::join(bundle.headlineMissingColumns, ", "));
    }

    auto const& registry = rl::views::ViewRegistry::GetInstance();
    for (auto const& view : bundle.views) {
        auto metadata = registry.GetMetaData(view.id);
        fmt::print("\n== {} ({}) ==\n", metadata ? metadata->get().name : view.id, view.id);
        switch (view.status) {
        case epoch_core::ViewStatus::Ok:
            PrintTable(*view.table);
            break;
        case epoch_core::ViewStatus::SchemaInvalid:
            fmt::print("  unavailable, missing columns: {}\n",
                       fmt::join(view.missingColumns, ", "));
            break;
        default:
            fmt::print("  {}\n", epoch_core::ViewStatusWrapper::ToString(view.status));
            break;
        }
    }
    SPDLOG_DEBUG("Printed {} views from {}", bundle.views.size(),
                 dashboard.Config().source.string());
}

int main(int argc, char* argv[]) {
    auto options = ParseArgs(argc, argv);

    auto level = spdlog::level::from_str(options.log_level);
    if (level == spdlog::level::off && options.log_level != "off") {
        UsageError(argv[0], "Unknown log level: " + options.log_level);
    }
    spdlog::set_level(level);

    auto arrowComputeStatus = arrow::compute::Initialize();
    if (!arrowComputeStatus.ok()) {
        SPDLOG_ERROR("arrow compute initialization failed: {}", arrowComputeStatus.ToString());
        return 1;
    }

    try {
        auto config = BuildConfig(argv[0], options);
        auto store = rl::data::RecordStore::Load(config.source);
        auto initialFilter = config.initialFilter;

        rl::dashboard::Dashboard dashboard{std::move(store), std::move(config)};
        PrintBundle(dashboard, dashboard.Recompute(initialFilter));
    } catch (std::invalid_argument const& e) {
        // Rejected configuration file
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (std::exception const& e) {
        SPDLOG_ERROR("{}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
