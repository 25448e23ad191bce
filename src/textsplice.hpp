#pragma once

#include "Config.hpp"

#include <QDir>
#include <QString>
#include <argparse/argparse.hpp>
#include <string>

class textsplice
{
public:
    textsplice() noexcept;

    // Runs the command line; the return value is the process exit code
    int Run(argparse::ArgumentParser &argparser) noexcept;

    void initConfig() noexcept;

    inline const Config &config() const noexcept
    {
        return m_config;
    }

    inline void setConfigFilePath(const QString &path) noexcept
    {
        m_config_file_path = path;
    }

    inline const QString &configFilePath() const noexcept
    {
        return m_config_file_path;
    }

private:
    bool readFile(const QString &path, std::string &bytes) noexcept;
    bool writeFile(const QString &path, const QByteArray &bytes) noexcept;

    Config m_config;
    QDir m_config_dir;
    QString m_config_file_path;
};
