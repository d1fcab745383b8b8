/**
 * AGL Core - Runner Command Builder Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "RunnerCommandBuilder.hpp"

#include <spdlog/spdlog.h>

namespace agl {

namespace {

void replaceAll(std::string& value, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // anonymous namespace

QStringList splitCommand(const std::string& command) {
    QStringList args;
    std::string current;
    bool inToken = false;
    char quote = 0;

    for (char c : command) {
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else {
                current += c;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
            inToken = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (inToken) {
                args << QString::fromStdString(current);
                current.clear();
                inToken = false;
            }
        } else {
            current += c;
            inToken = true;
        }
    }

    if (inToken) {
        args << QString::fromStdString(current);
    }

    return args;
}

RunnerCommandBuilder::RunnerCommandBuilder(RunnerLayout layout)
    : m_layout(std::move(layout))
{
}

RunnerCommandBuilder& RunnerCommandBuilder::setPrefix(const std::filesystem::path& path) {
    m_prefix = path;
    return *this;
}

RunnerCommandBuilder& RunnerCommandBuilder::setTempFolder(const std::filesystem::path& path) {
    m_temp = path;
    return *this;
}

RunnerCommandBuilder& RunnerCommandBuilder::setLauncherFolder(const std::filesystem::path& path) {
    m_launcher = path;
    return *this;
}

RunnerCommandBuilder& RunnerCommandBuilder::setGamePath(const std::filesystem::path& path) {
    m_game = path;
    return *this;
}

RunnerCommandBuilder& RunnerCommandBuilder::setExecutable(const std::filesystem::path& path) {
    m_executable = path;
    return *this;
}

RunnerCommandBuilder& RunnerCommandBuilder::addArgument(const QString& arg) {
    m_args.append(arg);
    return *this;
}

RunnerCommandBuilder& RunnerCommandBuilder::addArguments(const QStringList& args) {
    m_args.append(args);
    return *this;
}

RunnerCommandBuilder& RunnerCommandBuilder::setDebugLevel(const std::string& level) {
    m_debugLevel = level;
    return *this;
}

RunnerCommandBuilder& RunnerCommandBuilder::setEnvironment(const std::string& name, const std::string& value) {
    m_customEnv.emplace_back(name, value);
    return *this;
}

std::string RunnerCommandBuilder::expand(const std::string& value) const {
    std::string result = value;
    replaceAll(result, "%build%", m_layout.buildDir.string());
    replaceAll(result, "%prefix%", m_prefix.string());
    replaceAll(result, "%temp%", m_temp.string());
    replaceAll(result, "%launcher%", m_launcher.string());
    replaceAll(result, "%game%", m_game.string());
    return result;
}

std::filesystem::path RunnerCommandBuilder::executablePath() const {
    if (m_executable.empty() || m_executable.is_absolute()) {
        return m_executable;
    }
    return m_game / m_executable;
}

QStringList RunnerCommandBuilder::buildCommandLine() const {
    QStringList args;

    if (m_layout.features.command) {
        args = splitCommand(expand(*m_layout.features.command));
    } else {
        args << QString::fromStdString(m_layout.wine.string());
    }

    if (!m_executable.empty()) {
        args << QString::fromStdString(executablePath().string());
    }

    args.append(m_args);

    spdlog::debug("Runner command line: {}", args.join(' ').toStdString());

    return args;
}

QProcessEnvironment RunnerCommandBuilder::buildEnvironment() const {
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();

    // WINEPREFIX
    if (!m_prefix.empty()) {
        env.insert("WINEPREFIX", QString::fromStdString(m_layout.prefixPath(m_prefix).string()));
    }

    env.insert("WINEARCH", QString::fromStdString(toString(m_layout.arch)));

    // WINEDEBUG
    if (!m_debugLevel.empty()) {
        env.insert("WINEDEBUG", QString::fromStdString(m_debugLevel));
    }

    // Runner features
    for (const auto& [name, value] : m_layout.features.env) {
        env.insert(QString::fromStdString(name), QString::fromStdString(expand(value)));
    }

    // Custom environment variables
    for (const auto& [name, value] : m_customEnv) {
        env.insert(QString::fromStdString(name), QString::fromStdString(expand(value)));
    }

    return env;
}

QString RunnerCommandBuilder::workingDirectory() const {
    if (m_game.empty()) {
        // Default to executable's directory
        return QString::fromStdString(executablePath().parent_path().string());
    }
    return QString::fromStdString(m_game.string());
}

} // namespace agl
