/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <satlink.hpp>
#include <CLI/CLI.hpp>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Convert azimuth in degrees to compass direction string */
std::string azimuthToCompass(double deg) {
    if (deg < 0) deg += 360.0;
    if (deg >= 360.0) deg -= 360.0;

    if (deg < 11.25) return "N";
    if (deg < 33.75) return "NNE";
    if (deg < 56.25) return "NE";
    if (deg < 78.75) return "ENE";
    if (deg < 101.25) return "E";
    if (deg < 123.75) return "ESE";
    if (deg < 146.25) return "SE";
    if (deg < 168.75) return "SSE";
    if (deg < 191.25) return "S";
    if (deg < 213.75) return "SSW";
    if (deg < 236.25) return "SW";
    if (deg < 258.75) return "WSW";
    if (deg < 281.25) return "W";
    if (deg < 303.75) return "WNW";
    if (deg < 326.25) return "NW";
    if (deg < 348.75) return "NNW";
    return "N";
}

void printDocument(rapidjson::Document &doc) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);

    std::cout << buffer.GetString() << std::endl;
}

rapidjson::Value toJSON(const std::string &s, rapidjson::Document::AllocatorType &alloc) {
    return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
}

rapidjson::Value toJSON(const satlink::ElementMetadata &metadata, rapidjson::Document::AllocatorType &alloc) {
    rapidjson::Value value(rapidjson::kObjectType);
    value.AddMember("catalog_number", metadata.catalogNumber, alloc);
    value.AddMember("tle_epoch", toJSON(satlink::formatTimestamp(metadata.epoch), alloc), alloc);
    value.AddMember("tle_age_days", metadata.ageInDays, alloc);
    if (metadata.source) {
        value.AddMember("tle_source", toJSON(*metadata.source, alloc), alloc);
    } else {
        value.AddMember("tle_source", rapidjson::Value(rapidjson::kNullType), alloc);
    }
    return value;
}

rapidjson::Value toJSON(const satlink::TopocentricSample &sample, rapidjson::Document::AllocatorType &alloc) {
    rapidjson::Value value(rapidjson::kObjectType);
    value.AddMember("time", toJSON(satlink::formatTimestamp(sample.timestamp), alloc), alloc);
    value.AddMember("azimuth_deg", sample.azimuthInDegrees, alloc);
    value.AddMember("elevation_deg", sample.elevationInDegrees, alloc);
    value.AddMember("range_km", sample.rangeInKilometers, alloc);
    value.AddMember("range_rate_km_s", sample.rangeRateInKmPerSecond, alloc);
    return value;
}

void printPassesJSON(const satlink::OrbitalElements &elements, const satlink::PassPrediction &prediction) {
    rapidjson::Document doc;
    doc.SetObject();
    auto &alloc = doc.GetAllocator();

    doc.AddMember("name", toJSON(elements.getName(), alloc), alloc);
    doc.AddMember("metadata", toJSON(prediction.metadata, alloc), alloc);

    rapidjson::Value passes(rapidjson::kArrayType);
    for (const auto &pass : prediction.passes) {
        rapidjson::Value p(rapidjson::kObjectType);
        p.AddMember("rise", toJSON(satlink::formatTimestamp(pass.window.riseTime), alloc), alloc);
        p.AddMember("set", toJSON(satlink::formatTimestamp(pass.window.setTime), alloc), alloc);
        p.AddMember("max_time", toJSON(satlink::formatTimestamp(pass.window.maxElevationTime), alloc), alloc);
        p.AddMember("max_elevation_deg", pass.window.maxElevationInDegrees, alloc);
        p.AddMember("duration_s", pass.window.durationInSeconds, alloc);
        p.AddMember("truncated", pass.window.truncated, alloc);
        p.AddMember("at_rise", toJSON(pass.atRise, alloc), alloc);
        p.AddMember("at_max", toJSON(pass.atMax, alloc), alloc);
        p.AddMember("at_set", toJSON(pass.atSet, alloc), alloc);
        passes.PushBack(p, alloc);
    }
    doc.AddMember("passes", passes, alloc);

    printDocument(doc);
}

void printMarginJSON(const satlink::OrbitalElements &elements, const satlink::MarginSeries &series) {
    rapidjson::Document doc;
    doc.SetObject();
    auto &alloc = doc.GetAllocator();

    doc.AddMember("name", toJSON(elements.getName(), alloc), alloc);
    doc.AddMember("metadata", toJSON(series.metadata, alloc), alloc);

    const auto &rf = series.rfConfig;
    rapidjson::Value config(rapidjson::kObjectType);
    config.AddMember("band", toJSON(std::string(satlink::toString(rf.band)), alloc), alloc);
    config.AddMember("frequency_ghz", series.frequencyInGHz, alloc);
    config.AddMember("tx_power_dbw", rf.txPowerInDbw, alloc);
    config.AddMember("tx_gain_dbi", rf.txGainInDbi, alloc);
    config.AddMember("rx_gain_dbi", rf.rxGainInDbi, alloc);
    config.AddMember("bandwidth_hz", rf.bandwidthInHz, alloc);
    config.AddMember("system_noise_temp_k", rf.systemNoiseTempInKelvin, alloc);
    config.AddMember("noise_figure_db", rf.noiseFigureInDb, alloc);
    config.AddMember("atm_loss_db", rf.atmosphericLossInDb, alloc);
    config.AddMember("rain_loss_db", rf.rainLossInDb, alloc);
    config.AddMember("pointing_loss_db", rf.pointingLossInDb, alloc);
    config.AddMember("required_snr_db", rf.requiredSnrInDb, alloc);
    config.AddMember("loss_model", toJSON(rf.lossModel->name(), alloc), alloc);
    doc.AddMember("rf_config", config, alloc);

    rapidjson::Value samples(rapidjson::kArrayType);
    for (const auto &sample : series.samples) {
        rapidjson::Value s(rapidjson::kObjectType);
        s.AddMember("time", toJSON(satlink::formatTimestamp(sample.timestamp), alloc), alloc);
        s.AddMember("snr_db", sample.snrInDb, alloc);
        s.AddMember("margin_db", sample.marginInDb, alloc);
        s.AddMember("range_km", sample.rangeInKilometers, alloc);
        s.AddMember("elevation_deg", sample.elevationInDegrees, alloc);
        s.AddMember("azimuth_deg", sample.azimuthInDegrees, alloc);
        samples.PushBack(s, alloc);
    }
    doc.AddMember("samples", samples, alloc);

    rapidjson::Value skipped(rapidjson::kArrayType);
    for (const auto &sample : series.skipped) {
        rapidjson::Value s(rapidjson::kObjectType);
        s.AddMember("time", toJSON(satlink::formatTimestamp(sample.timestamp), alloc), alloc);
        s.AddMember("reason", toJSON(sample.message, alloc), alloc);
        skipped.PushBack(s, alloc);
    }
    doc.AddMember("skipped", skipped, alloc);

    printDocument(doc);
}

void printPasses(const satlink::OrbitalElements &elements, const satlink::PassPrediction &prediction) {
    using namespace std::chrono;

    constexpr std::string_view rowFormat = "{:^21} {:^21} {:^10} {:^12} {:^12} {:^12} {:^10}";
    constexpr std::string_view durationFormat = "{:>3}m {:>2}s{}";
    constexpr std::string_view azFormat = "{:>6.2f} {:<3}";
    constexpr std::string_view elFormat = "{:<5.2f}";

    std::string sep21(21, '-');
    std::string sep12(12, '-');
    std::string sep10(10, '-');

    std::cout << "Passes for " << elements.getName() << " (" << elements.getCatalogNumber() << "):" << std::endl;
    std::cout << std::format(rowFormat, "Start", "End", "Duration", "Start Az", "Max Az", "End Az", "Max Elev") << std::endl;
    std::cout << std::format(rowFormat, sep21, sep21, sep10, sep12, sep12, sep12, sep10) << std::endl;
    for (const auto &pass : prediction.passes) {
        auto duration = duration_cast<seconds>(pass.window.setTime - pass.window.riseTime);
        auto durationMins = duration_cast<minutes>(duration).count();
        auto durationSecs = duration_cast<seconds>(duration % minutes(1)).count();

        std::cout << std::format(rowFormat,
            satlink::formatTimestamp(pass.window.riseTime),
            satlink::formatTimestamp(pass.window.setTime),
            std::format(durationFormat, durationMins, durationSecs, pass.window.truncated ? "*" : ""),
            std::format(azFormat, pass.atRise.azimuthInDegrees, azimuthToCompass(pass.atRise.azimuthInDegrees)),
            std::format(azFormat, pass.atMax.azimuthInDegrees, azimuthToCompass(pass.atMax.azimuthInDegrees)),
            std::format(azFormat, pass.atSet.azimuthInDegrees, azimuthToCompass(pass.atSet.azimuthInDegrees)),
            std::format(elFormat, pass.window.maxElevationInDegrees)) << std::endl;
    }
    if (prediction.passes.empty()) {
        std::cout << "No passes found." << std::endl;
    }
    std::cout << "Element age: " << std::format("{:.2f}", prediction.metadata.ageInDays) << " days"
              << " (* = clipped by the search window)" << std::endl;
    std::cout << std::endl;
}

void printMargin(const satlink::OrbitalElements &elements, const satlink::MarginSeries &series) {
    constexpr std::string_view headerFormat = "{:^21} {:>12} {:>10} {:>11} {:>9} {:>11}";
    constexpr std::string_view rowFormat = "{:^21} {:>8.2f} {:<3} {:>10.2f} {:>11.1f} {:>9.2f} {:>11.2f}";

    std::cout << "Link margin for " << elements.getName() << " (" << elements.getCatalogNumber() << ") on "
              << series.rfConfig.band << " (" << series.frequencyInGHz << " GHz, "
              << series.rfConfig.lossModel->name() << " losses):" << std::endl;
    std::cout << std::format(headerFormat, "Time", "Azimuth", "Elevation", "Range (km)", "SNR (dB)", "Margin (dB)") << std::endl;
    std::cout << std::string(79, '-') << std::endl;
    for (const auto &sample : series.samples) {
        std::cout << std::format(rowFormat,
            satlink::formatTimestamp(sample.timestamp),
            sample.azimuthInDegrees,
            azimuthToCompass(sample.azimuthInDegrees),
            sample.elevationInDegrees,
            sample.rangeInKilometers,
            sample.snrInDb,
            sample.marginInDb) << std::endl;
    }
    for (const auto &sample : series.skipped) {
        std::cout << std::format("{:^21} skipped: {}", satlink::formatTimestamp(sample.timestamp), sample.message) << std::endl;
    }
    std::cout << std::endl;
}

const satlink::OrbitalElements* findElements(const std::map<int, satlink::OrbitalElements> &satellites, int noradID) {
    auto it = satellites.find(noradID);
    if (it == satellites.end()) {
        std::cerr << "Satellite with Norad ID " << noradID << " not found in the local TLE database." << std::endl;
        return nullptr;
    }
    return &it->second;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    satlink::Config config;
    config.setTime(std::chrono::system_clock::now());
    config.setTLEFile(expandTilde("~/.satlink.tle"));

    auto configFile = expandTilde("~/.satlink.toml");

    auto logger = spdlog::stderr_color_mt("satlink");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);

    CLI::App app{"SatLink"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<double>("--lat",
        [&config](const double l) { config.setLatitude(l); },
        "The latitude of the ground station (in decimal format)");
    app.add_option_function<double>("--long",
        [&config](const double l) { config.setLongitude(l); },
        "The longitude of the ground station (in decimal format)");
    app.add_option_function<double>("--alt",
        [&config](const double e) { config.setAltitude(e); },
        "Altitude above the WGS84 ellipsoid in meters");
    app.add_option_function<std::string>("--tle",
        [&config](const std::string &path) { config.setTLEFile(expandTilde(path)); },
        "TLE file to read satellites from (default: ~/.satlink.tle)");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(config.getVerbose() ? spdlog::level::debug : spdlog::level::info);
        },
        "Display debugging information");

    app.ignore_case();

    auto timeOption = [&config](const std::string &timeStr) {
        try {
            config.setTime(satlink::parseTimestamp(timeStr));
        } catch (const satlink::InvalidInputException &err) {
            throw CLI::ValidationError("--start", err.what());
        }
    };

    // Info command - element metadata from the local TLE file
    auto infoCommand = app.add_subcommand("info", "View satellite information from the local TLE database");

    std::vector<int> infoIDs;
    infoCommand->add_option("id", infoIDs, "Norad ID(s) of satellite(s) (ie. 25544)");

    // Passes command - pass prediction
    auto passesCommand = app.add_subcommand("passes", "Predict satellite passes");

    std::vector<int> passesIDs;
    passesCommand->add_option("id", passesIDs, "Norad ID(s) of satellite(s) (ie. 25544)");
    passesCommand->add_option_function<std::string>("--start", timeOption,
        "Start of the search window (format: YYYY-MM-DDTHH:MM:SSZ, default now)");
    passesCommand->add_option_function<int>("--hours",
        [&config](const int hours) { config.setHours(hours); },
        "Length of the search window in hours (default 24, max 720)");
    passesCommand->add_option_function<double>("--mask",
        [&config](const double mask) { config.setMask(mask); },
        "Elevation mask in degrees (default 10)");
    passesCommand->add_option_function<double>("--step",
        [&config](const double step) { config.setStep(step); },
        "Search step in seconds (default 10)");
    passesCommand->add_option_function<int>("--max",
        [&config](const int max) { config.setMaxPasses(max); },
        "Maximum number of passes per satellite (default 20, max 100)");
    passesCommand->add_option_function<std::string>("--horizon-mask",
        [&config](const std::string &path) { config.setHorizonMaskFile(expandTilde(path)); },
        "File of 360 terrain elevations, one per degree of azimuth");
    passesCommand->add_flag_function("--json",
        [&config](const int64_t j) { config.setJSON(j > 0); },
        "Print results as JSON");

    // Margin command - link budget over time
    auto marginCommand = app.add_subcommand("margin", "Forecast link margin over time");

    auto &rf = config.getRFConfiguration();
    std::vector<int> marginIDs;
    marginCommand->add_option("id", marginIDs, "Norad ID(s) of satellite(s) (ie. 25544)");
    marginCommand->add_option_function<std::string>("--start", timeOption,
        "Start of the forecast (format: YYYY-MM-DDTHH:MM:SSZ, default now)");
    marginCommand->add_option_function<int>("--hours",
        [&config](const int hours) { config.setHours(hours, satlink::MAX_MARGIN_HOURS); },
        "Length of the forecast in hours (default 24, max 168)");
    marginCommand->add_option_function<double>("--step",
        [&config](const double step) { config.setStep(step); },
        "Sample spacing in seconds (default 10)");
    marginCommand->add_option_function<double>("--mask",
        [&config](const double mask) { config.setMask(mask); },
        "Elevation mask in degrees used by --visible-only (default 10)");
    marginCommand->add_option_function<std::string>("--band",
        [&rf](const std::string &band) {
            try {
                rf.band = satlink::parseBand(band);
            } catch (const satlink::InvalidInputException &err) {
                throw CLI::ValidationError("--band", err.what());
            }
        },
        "Band: VHF, UHF, L, S, C, X, Ku or Ka (default UHF)");
    marginCommand->add_option("--tx-power", rf.txPowerInDbw, "Transmit power in dBW (default 10)");
    marginCommand->add_option("--tx-gain", rf.txGainInDbi, "Transmit antenna gain in dBi (default 5)");
    marginCommand->add_option("--rx-gain", rf.rxGainInDbi, "Receive antenna gain in dBi (default 20)");
    marginCommand->add_option("--bandwidth", rf.bandwidthInHz, "Receiver bandwidth in Hz (default 20000)");
    marginCommand->add_option("--noise-temp", rf.systemNoiseTempInKelvin, "System noise temperature in K (default 290)");
    marginCommand->add_option("--noise-figure", rf.noiseFigureInDb, "Receiver noise figure in dB (default 2)");
    marginCommand->add_option("--atm-loss", rf.atmosphericLossInDb, "Atmospheric loss in dB (default 1)");
    marginCommand->add_option("--rain-loss", rf.rainLossInDb, "Rain loss in dB (default 0)");
    marginCommand->add_option("--pointing-loss", rf.pointingLossInDb, "Pointing loss in dB (default 0.5)");
    marginCommand->add_option("--required-snr", rf.requiredSnrInDb, "SNR required by the modem in dB (default 3)");
    marginCommand->add_flag_function("--slant-path",
        [&rf](const int64_t s) {
            if (s > 0) {
                rf.lossModel = std::make_shared<satlink::SlantPathLossModel>();
            }
        },
        "Scale atmospheric and rain losses with the slant path length");
    marginCommand->add_flag_function("--visible-only",
        [&config](const int64_t v) { config.setVisibleOnly(v > 0); },
        "Only report samples at or above the elevation mask");
    marginCommand->add_flag_function("--json",
        [&config](const int64_t j) { config.setJSON(j > 0); },
        "Print results as JSON");

    // Command callbacks

    infoCommand->final_callback([infoCommand, &config, &infoIDs](void) {
        try {
            if (infoIDs.empty()) {
                std::cerr << "Please provide at least one satellite's Norad ID." << std::endl;
                std::cerr << infoCommand->help() << std::endl;
                std::exit(1);
            }
            std::map<int, satlink::OrbitalElements> satellites;
            satlink::loadElements(config.getTLEFile(), satellites);
            auto now = std::chrono::system_clock::now();
            for (auto noradID : infoIDs) {
                auto elements = findElements(satellites, noradID);
                if (elements) {
                    elements->printInfo(std::cout, now);
                    std::cout << std::endl;
                }
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    passesCommand->final_callback([passesCommand, &config, &passesIDs](void) {
        try {
            if (passesIDs.empty()) {
                std::cerr << "Please provide at least one satellite's Norad ID." << std::endl;
                std::cerr << passesCommand->help() << std::endl;
                std::exit(1);
            }
            std::map<int, satlink::OrbitalElements> satellites;
            satlink::loadElements(config.getTLEFile(), satellites);

            std::optional<satlink::HorizonMask> horizonMask;
            if (config.hasHorizonMaskFile()) {
                horizonMask = satlink::HorizonMask::load(config.getHorizonMaskFile());
            }

            satlink::LinkPlanner planner;
            satlink::TimeWindow window{
                config.getTime(),
                config.getTime() + std::chrono::hours(config.getHours())
            };

            for (auto noradID : passesIDs) {
                auto elements = findElements(satellites, noradID);
                if (!elements) {
                    continue;
                }
                auto prediction = planner.predictPasses(*elements, config.getGroundStation(), window,
                    config.getMask(), config.getStep(), config.getMaxPasses(), horizonMask);
                if (config.getJSON()) {
                    printPassesJSON(*elements, prediction);
                } else {
                    printPasses(*elements, prediction);
                }
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    marginCommand->final_callback([marginCommand, &config, &marginIDs](void) {
        try {
            if (marginIDs.empty()) {
                std::cerr << "Please provide at least one satellite's Norad ID." << std::endl;
                std::cerr << marginCommand->help() << std::endl;
                std::exit(1);
            }
            std::map<int, satlink::OrbitalElements> satellites;
            satlink::loadElements(config.getTLEFile(), satellites);

            satlink::LinkPlanner planner;
            satlink::TimeWindow window{
                config.getTime(),
                config.getTime() + std::chrono::hours(config.getHours())
            };
            satlink::MarginOptions options{
                .visibleOnly = config.getVisibleOnly(),
                .maskInDegrees = config.getMask()
            };

            for (auto noradID : marginIDs) {
                auto elements = findElements(satellites, noradID);
                if (!elements) {
                    continue;
                }
                auto series = planner.computeMarginSeries(*elements, config.getGroundStation(), window,
                    config.getStep(), config.getRFConfiguration(), options);
                if (config.getJSON()) {
                    printMarginJSON(*elements, series);
                } else {
                    printMargin(*elements, series);
                }
            }
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
