/**
 * AGL Core - Runner Command Builder
 *
 * Constructs the command line and environment for running a game
 * through a resolved runner.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <QProcessEnvironment>
#include <QStringList>

#include "wine/RunnerLayout.hpp"

namespace agl {

/**
 * Runner command builder
 *
 * Expands the runner features' command template and environment
 * placeholders (%build%, %prefix%, %temp%, %launcher%, %game%) and
 * assembles them for QProcess.
 */
class RunnerCommandBuilder {
public:
    explicit RunnerCommandBuilder(RunnerLayout layout);

    /**
     * Set the base wine prefix (%prefix%)
     *
     * WINEPREFIX gets the runner's prefix subfolder appended.
     */
    RunnerCommandBuilder& setPrefix(const std::filesystem::path& path);

    /**
     * Set the temp folder (%temp%)
     */
    RunnerCommandBuilder& setTempFolder(const std::filesystem::path& path);

    /**
     * Set the launcher folder (%launcher%)
     */
    RunnerCommandBuilder& setLauncherFolder(const std::filesystem::path& path);

    /**
     * Set the game folder (%game%), also the working directory
     */
    RunnerCommandBuilder& setGamePath(const std::filesystem::path& path);

    /**
     * Set the Windows executable to run, relative to the game folder
     * unless absolute
     */
    RunnerCommandBuilder& setExecutable(const std::filesystem::path& path);

    RunnerCommandBuilder& addArgument(const QString& arg);
    RunnerCommandBuilder& addArguments(const QStringList& args);

    /**
     * Set WINEDEBUG level
     */
    RunnerCommandBuilder& setDebugLevel(const std::string& level);

    /**
     * Add a custom environment variable, applied after the runner's own
     */
    RunnerCommandBuilder& setEnvironment(const std::string& name, const std::string& value);

    /**
     * Replace placeholders in a template with configured paths
     */
    std::string expand(const std::string& value) const;

    /**
     * Build the command line arguments for QProcess
     *
     * With a command template: the expanded template split into
     * arguments, followed by the executable and its arguments. Without
     * one: the wine binary, the executable and its arguments.
     */
    QStringList buildCommandLine() const;

    /**
     * Build the process environment
     */
    QProcessEnvironment buildEnvironment() const;

    /**
     * Get the working directory (the game folder)
     */
    QString workingDirectory() const;

    const RunnerLayout& layout() const { return m_layout; }

private:
    std::filesystem::path executablePath() const;

    RunnerLayout m_layout;

    std::filesystem::path m_prefix;
    std::filesystem::path m_temp;
    std::filesystem::path m_launcher;
    std::filesystem::path m_game;
    std::filesystem::path m_executable;
    QStringList m_args;

    std::string m_debugLevel = "-all";

    std::vector<std::pair<std::string, std::string>> m_customEnv;
};

/**
 * Split a command into arguments
 *
 * Whitespace separates arguments; single and double quotes group them.
 */
QStringList splitCommand(const std::string& command);

} // namespace agl
