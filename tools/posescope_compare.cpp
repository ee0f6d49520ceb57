// posescope_compare.cpp — CLI tool for group comparisons of trial-level features
//
// Pipeline: config -> TrialCatalog -> TrackSource -> AnalysisEngine -> CSV on stdout.
//
// Usage: ./posescope_compare --config <yaml> --feature <name>
//            --group <label>=<treatment> --group <label>=<treatment> [...]
//            [--task <task>]... [--strain <strain>] [--exclude <trial id>]...
//            [--threshold <theta>] [--landmark <name>] [--smoothing <frames>]
//            [--derivative-window <frames>] [--min-speed <v>] [--time-limit <s>]
//            [--sweep <parameter>=<v1>,<v2>,...]
//
// <treatment> is "none" for untreated trials, "any" for every trial, or a label.

#include "posescope/AnalysisEngine.h"
#include "posescope/Config.h"
#include "posescope/Errors.h"
#include "posescope/Logging.h"
#include "posescope/TrackSource.h"
#include "posescope/Utility.h"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --config <yaml> --feature <name>\n"
              << "         --group <label>=<treatment> --group <label>=<treatment> [...]\n"
              << "         [--task <task>]... [--strain <strain>] [--exclude <trial id>]...\n"
              << "         [--threshold <theta>] [--landmark <name>] [--smoothing <frames>]\n"
              << "         [--derivative-window <frames>] [--min-speed <v>] [--time-limit <s>]\n"
              << "         [--sweep <parameter>=<v1>,<v2>,...]\n"
              << "Features: mean_speed, total_distance, velocity_per_min, stop_count, mean_curvature,\n"
              << "          mean_misalignment, mean_head_body_misalignment, mean_tail_bend, mean_angular_speed,\n"
              << "          time_in_center, time_in_corners, spatial_entropy, accel_outlier_count, jerk_outlier_count\n"
              << "Sweep parameters: likelihood_threshold, smoothing_window, derivative_window, time_limit_s\n";
}

std::string significance_stars(const posescope::MaybeValue& p) {
    if (!p) return "";
    if (*p < 0.001) return "***";
    if (*p < 0.01) return "**";
    if (*p < 0.05) return "*";
    return "ns";
}

std::string fmt_value(const posescope::MaybeValue& v) {
    if (!v) return "";
    std::ostringstream os;
    os << std::setprecision(8) << *v;
    return os.str();
}

std::vector<double> parse_values(const std::string& list) {
    std::vector<double> out;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        out.push_back(std::stod(item));
    }
    return out;
}

void write_csv(std::ostream& os, const posescope::BatchReport& report) {
    os << "feature,parameter,parameter_value,group_a,n_a,mean_a,se_a,group_b,n_b,mean_b,se_b,"
          "t,df,p,cohens_d,significance\n";
    for (const auto& row : report.rows) {
        const auto& s = row.stat;
        os << row.feature << ',' << row.parameter << ',' << fmt_value(row.parameterValue) << ','
           << s.first.label << ',' << s.first.n << ',' << fmt_value(s.first.mean) << ','
           << fmt_value(s.first.standardError) << ',' << s.second.label << ',' << s.second.n << ','
           << fmt_value(s.second.mean) << ',' << fmt_value(s.second.standardError) << ','
           << fmt_value(s.comparison.tStatistic) << ',' << fmt_value(s.comparison.degreesOfFreedom) << ','
           << fmt_value(s.comparison.pValue) << ',' << fmt_value(s.comparison.effectSize) << ','
           << significance_stars(s.comparison.pValue) << '\n';
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string feature_name;
    std::vector<std::pair<std::string, std::string>> group_specs;
    std::vector<std::string> tasks;
    std::optional<std::string> strain;
    std::vector<std::string> excluded;
    std::optional<double> threshold;
    std::optional<std::string> landmark;
    std::optional<double> smoothing;
    std::optional<double> derivative_window;
    std::optional<double> min_speed;
    std::optional<double> time_limit;
    std::string sweep_spec;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--feature" && i + 1 < argc) {
                feature_name = argv[++i];
            } else if (arg == "--group" && i + 1 < argc) {
                const std::string spec = argv[++i];
                const auto eq = spec.find('=');
                if (eq == std::string::npos || eq == 0) {
                    std::cerr << "Error: --group expects <label>=<treatment>, got '" << spec << "'\n";
                    return 1;
                }
                group_specs.emplace_back(spec.substr(0, eq), spec.substr(eq + 1));
            } else if (arg == "--task" && i + 1 < argc) {
                tasks.push_back(argv[++i]);
            } else if (arg == "--strain" && i + 1 < argc) {
                strain = argv[++i];
            } else if (arg == "--exclude" && i + 1 < argc) {
                excluded.push_back(argv[++i]);
            } else if (arg == "--threshold" && i + 1 < argc) {
                threshold = std::stod(argv[++i]);
            } else if (arg == "--landmark" && i + 1 < argc) {
                landmark = argv[++i];
            } else if (arg == "--smoothing" && i + 1 < argc) {
                smoothing = std::stod(argv[++i]);
            } else if (arg == "--derivative-window" && i + 1 < argc) {
                derivative_window = std::stod(argv[++i]);
            } else if (arg == "--min-speed" && i + 1 < argc) {
                min_speed = std::stod(argv[++i]);
            } else if (arg == "--time-limit" && i + 1 < argc) {
                time_limit = std::stod(argv[++i]);
            } else if (arg == "--sweep" && i + 1 < argc) {
                sweep_spec = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Error: unknown or incomplete argument '" << arg << "'\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: bad numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (config_path.empty() || feature_name.empty() || group_specs.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        const posescope::PipelineConfig config = posescope::load_config(config_path);
        posescope::configure_logging(config.logLevel);
        posescope::validate_config(config);
        spdlog::debug("[Compare] Core contract {}", posescope::contract::CORE_CONTRACT_VERSION);

        posescope::FeatureRequest request;
        request.kind = posescope::feature_kind_from_string(feature_name);
        request.likelihoodThreshold = threshold.value_or(config.analysis.likelihoodThreshold);
        if (landmark) {
            request.motion.landmark = *landmark;
            request.stops.landmark = *landmark;
            request.curvature.landmark = *landmark;
            request.angle.motionLandmark = *landmark;
            request.occupancy.landmark = *landmark;
        }
        if (smoothing) request = posescope::with_parameter(request, posescope::SweepParameter::SmoothingWindow, *smoothing);
        if (derivative_window) {
            request = posescope::with_parameter(request, posescope::SweepParameter::DerivativeWindow, *derivative_window);
        }
        if (time_limit) request = posescope::with_parameter(request, posescope::SweepParameter::TimeLimitSeconds, *time_limit);
        if (min_speed) request.curvature.minSpeed = *min_speed;

        std::vector<posescope::GroupDefinition> groups;
        for (const auto& [label, treatment] : group_specs) {
            posescope::GroupDefinition group;
            group.label = label;
            group.filter.tasks = tasks;
            group.filter.treatment = posescope::treatment_filter_from_string(treatment);
            group.filter.strain = strain;
            group.filter.excludedIds = excluded;
            groups.push_back(std::move(group));
        }

        auto catalog = posescope::load_catalog(config);
        std::shared_ptr<const posescope::TrackSource> source = posescope::make_track_source(config, catalog);
        spdlog::info("[Compare] Track source: {}", source->describe());

        posescope::AnalysisEngine engine(catalog, source, posescope::EngineOptions::fromConfig(config.analysis));

        posescope::BatchReport report;
        if (sweep_spec.empty()) {
            report = engine.compare(request, groups);
        } else {
            const auto eq = sweep_spec.find('=');
            if (eq == std::string::npos) {
                std::cerr << "Error: --sweep expects <parameter>=<v1>,<v2>,...\n";
                return 1;
            }
            const auto parameter = posescope::sweep_parameter_from_string(sweep_spec.substr(0, eq));
            report = engine.sweep(request, parameter, parse_values(sweep_spec.substr(eq + 1)), groups);
        }

        write_csv(std::cout, report);
        if (!report.issues.empty()) {
            spdlog::warn("[Compare] {} trial(s) excluded from aggregation", report.issues.size());
        }
    } catch (const posescope::ConfigurationError& e) {
        spdlog::error("[Compare] Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("[Compare] {}", e.what());
        return 1;
    }
    return 0;
}
