/**
 * AGL Check - Runtime component inspection tool
 *
 * Prints the detected runtime environment, catalog groups, downloaded
 * runners and Steam-managed Proton builds.
 *
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <filesystem>
#include <iostream>
#include <memory>
#include <vector>

#include <QCoreApplication>
#include <QCommandLineParser>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "components/ComponentRegistry.hpp"
#include "core/Errors.hpp"
#include "core/platform/Platform.hpp"
#include "core/platform/RuntimeEnvironment.hpp"
#include "steam/ProtonDiscovery.hpp"

namespace {

void setupLogging(const std::filesystem::path& cachePath, bool verbose) {
    // Listings go to stdout, keep logs off it
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    auto logPath = cachePath / "logs" / "agl-check.log";

    try {
        std::filesystem::create_directories(logPath.parent_path());

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 1024 * 1024 * 5, 3);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    } catch (const std::exception& e) {
        std::cerr << "Can't open log file " << logPath.string() << ": " << e.what() << std::endl;
    }

    auto logger = std::make_shared<spdlog::logger>("agl", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);

    spdlog::set_default_logger(logger);
    spdlog::info("AGL check starting up...");
}

void printEnvironment(const agl::RuntimeEnvironment& env) {
    auto size = env.defaultWindowSize();

    std::cout << "Environment:      " << agl::toString(env.kind()) << "\n"
              << "Steam runners:    " << (env.prefersSteamRunners() ? "preferred" : "not used") << "\n"
              << "Window size:      " << size.width << "x" << size.height << "\n"
              << "Launcher folder:  " << agl::Platform::getLauncherPath(env).string() << "\n"
              << "Cache folder:     " << agl::Platform::getCachePath(env).string() << "\n"
              << "Config file:      " << agl::Platform::getConfigFile(env).string() << "\n";

    if (auto driveRoot = agl::Platform::getCompatDataDriveRoot(env)) {
        std::cout << "Compat drive C:   " << driveRoot->string() << "\n";
    }
}

void printGroups(const std::vector<agl::ComponentGroup>& groups) {
    for (const auto& group : groups) {
        std::cout << group.title << " (" << group.name << ")"
                  << (group.managed ? " [managed]" : "") << "\n";

        for (const auto& version : group.versions) {
            std::cout << "    " << version.name;
            if (version.title != version.name) {
                std::cout << " - " << version.title;
            }
            std::cout << "\n";
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("agl-check");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("agl-launcher");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Inspect runner and DXVK components");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption componentsOption(
        QStringList() << "c" << "components",
        "Components catalog directory",
        "path"
    );
    parser.addOption(componentsOption);

    QCommandLineOption kindOption(
        QStringList() << "k" << "kind",
        "Component kind (wine, dxvk)",
        "kind",
        "wine"
    );
    parser.addOption(kindOption);

    QCommandLineOption downloadedOption(
        QStringList() << "d" << "downloaded",
        "Only list versions downloaded in this folder",
        "folder"
    );
    parser.addOption(downloadedOption);

    QCommandLineOption findOption(
        QStringList() << "f" << "find",
        "Find a group by its name or one of its versions' names",
        "name"
    );
    parser.addOption(findOption);

    QCommandLineOption protonOption(
        QStringList() << "p" << "discover-proton",
        "List Proton builds installed through Steam"
    );
    parser.addOption(protonOption);

    QCommandLineOption environmentOption(
        QStringList() << "e" << "environment",
        "Print the detected runtime environment"
    );
    parser.addOption(environmentOption);

    QCommandLineOption verboseOption(
        QStringList() << "v" << "verbose",
        "Print debug logs"
    );
    parser.addOption(verboseOption);

    parser.process(app);

    auto env = agl::RuntimeEnvironment::fromSystem();

    setupLogging(agl::Platform::getCachePath(env), parser.isSet(verboseOption));

    if (parser.isSet(environmentOption)) {
        printEnvironment(env);
        return 0;
    }

    if (parser.isSet(protonOption)) {
        try {
            printGroups(agl::ProtonDiscovery(env).discoverProtonInstalls());
        } catch (const agl::DiscoveryError& e) {
            spdlog::error("Proton discovery failed: {}", e.what());
            return 1;
        }
        return 0;
    }

    std::filesystem::path catalogPath;
    if (parser.isSet(componentsOption)) {
        catalogPath = parser.value(componentsOption).toStdString();
    } else {
        catalogPath = agl::Platform::getLauncherPath(env) / "components";
    }

    agl::ComponentKind kind;
    auto kindName = parser.value(kindOption);
    if (kindName == "wine") {
        kind = agl::ComponentKind::Wine;
    } else if (kindName == "dxvk") {
        kind = agl::ComponentKind::Dxvk;
    } else {
        spdlog::error("Unknown component kind: {}", kindName.toStdString());
        return 2;
    }

    agl::ComponentRegistry registry(env);

    try {
        if (parser.isSet(findOption)) {
            auto name = parser.value(findOption).toStdString();
            auto group = registry.findGroup(catalogPath, name, kind);
            if (!group) {
                spdlog::error("Nothing named {} in {}", name, catalogPath.string());
                return 1;
            }

            printGroups({*group});

            auto features = group->features.value_or(agl::Features{});
            if (const auto* version = group->findVersion(name)) {
                features = group->featuresOf(*version);
            }
            std::cout << "Features: " << features.toJson().dump(4) << "\n";
            return 0;
        }

        if (parser.isSet(downloadedOption)) {
            std::filesystem::path folder = parser.value(downloadedOption).toStdString();
            printGroups(registry.listDownloaded(catalogPath, folder, kind));
            return 0;
        }

        if (kind == agl::ComponentKind::Wine) {
            printGroups(registry.runnerGroups(catalogPath));
        } else {
            printGroups(*registry.loadGroups(catalogPath, kind));
        }
    } catch (const agl::StructuralConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
